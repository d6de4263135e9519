//=============================================================================
// NAME:    include/daq/UldaqDriver.hpp
// DESC:    Linux 版驅動 (MCC uldaq)
//=============================================================================
#pragma once

#include "DaqDriver.hpp"
#include <uldaq.h>

namespace Daq
{

    class UldaqDriver : public DaqDriver
    {
    public:
        explicit UldaqDriver(DaqDeviceInterface interfaceType = ANY_IFC);
        virtual ~UldaqDriver();

        UldaqDriver(const UldaqDriver &) = delete;
        UldaqDriver &operator=(const UldaqDriver &) = delete;

        // 實作介面
        std::vector<DeviceDescriptor> ListDevices() override;
        DeviceDescriptor Open(int boardNumber) override;
        void Close() override;
        bool IsOpen() const override;

        int NumAiChannels(Utils::AdcMode mode) override;
        int NumAoChannels() override;
        bool HasPacer() override;
        bool SupportsAiRange(Utils::AdcMode mode, Utils::RangeId range) override;
        bool SupportsAoRange(Utils::RangeId range) override;
        std::vector<Utils::RangeId> AiRanges(Utils::AdcMode mode) override;
        std::vector<Utils::RangeId> AoRanges() override;

        void SetAiMode(Utils::AdcMode mode) override;
        void ConfigurePort(Utils::DigitalPort port, Utils::DigitalDirection direction) override;

        double AIn(int channel, Utils::AdcMode mode, Utils::RangeId range) override;
        void AOut(int channel, Utils::RangeId range, double value) override;
        uint64_t DIn(Utils::DigitalPort port) override;
        void DOut(Utils::DigitalPort port, uint64_t bits) override;
        void DBitOut(Utils::DigitalPort port, int bit, bool value) override;

        double AInScan(int lowChannel, int highChannel,
                       Utils::AdcMode mode, Utils::RangeId range,
                       int samplesPerChannel, double rate,
                       bool continuous, double *buffer) override;
        ScanProgress GetScanProgress() override;
        void ScanStop() override;

    private:
        // 讀取 inventory (最多 MAX_DEVICE_COUNT 台)
        std::vector<DaqDeviceDescriptor> Inventory();

        // 未開啟時丟 StateError
        void RequireHandle(const char *operation) const;

        DaqDeviceInterface m_interfaceType;
        DaqDeviceHandle m_handle;
        bool m_scanActive;
    };

} // namespace Daq

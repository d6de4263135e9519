//=============================================================================
// NAME:    include/daq/CbwDriver.hpp
// DESC:    Windows 版驅動 (MCC Universal Library, cbw.h)
//=============================================================================
#pragma once

#include "DaqDriver.hpp"
#include <windows.h>
#include <cbw.h>

namespace Daq
{

    class CbwDriver : public DaqDriver
    {
    public:
        CbwDriver();
        virtual ~CbwDriver();

        CbwDriver(const CbwDriver &) = delete;
        CbwDriver &operator=(const CbwDriver &) = delete;

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
        std::vector<DaqDeviceDescriptor> Inventory();
        void RequireOpen(const char *operation) const;

        // UL 的 scan 資料在 HGLOBAL，需複製到呼叫者 buffer
        void CopyScanData();
        void FreeScanBuffer();

        int m_board;
        bool m_open;
        int m_aiMode;

        HGLOBAL m_memHandle;
        double *m_userBuffer;
        long m_totalPoints;
        int m_channelCount;
        bool m_scanActive;
    };

} // namespace Daq

//=============================================================================
// NAME:    test/FakeDriver.hpp
// DESC:    測試用驅動：記錄呼叫並模擬板卡行為
//=============================================================================
#pragma once

#include "daq/DaqDriver.hpp"
#include "daq/DaqError.hpp"
#include "utils/DaqEnums.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace Daq
{

    class FakeDriver : public DaqDriver
    {
    public:
        // --- 可調整的板卡行為 ---
        int numDevices = 1;
        int numAiChannels = 8;
        int numAoChannels = 2;
        bool hasPacer = true;
        bool supportsAiRange = true;
        bool supportsAoRange = true;
        std::vector<Utils::RangeId> aiRanges = {Utils::RangeId::Bip10Volts, Utils::RangeId::Bip5Volts};
        std::vector<Utils::RangeId> aoRanges = {Utils::RangeId::Uni5Volts};
        double aiValue = 1.25;
        uint64_t dinValue = 0xA5;
        unsigned long long scanStep = 10; // 每次輪詢增加的 scan 數
        std::set<std::string> failOn;     // 這些操作丟 IOError

        // --- 觀察結果 ---
        std::vector<std::string> calls;
        std::map<Utils::DigitalPort, Utils::DigitalDirection> directions;
        std::vector<double> aoWrites;
        uint64_t lastDout = 0;
        int closeCount = 0;

        bool Called(const std::string &name) const
        {
            for (const auto &c : calls)
            {
                if (c == name)
                    return true;
            }
            return false;
        }

        int CallCount(const std::string &name) const
        {
            int n = 0;
            for (const auto &c : calls)
            {
                if (c == name)
                    n++;
            }
            return n;
        }

        std::vector<DeviceDescriptor> ListDevices() override
        {
            Record("ListDevices");
            std::vector<DeviceDescriptor> devices;
            for (int i = 0; i < numDevices; i++)
            {
                DeviceDescriptor d;
                d.productName = "USB-1608FS-Plus";
                d.uniqueId = "0000" + std::to_string(i);
                devices.push_back(d);
            }
            return devices;
        }

        DeviceDescriptor Open(int boardNumber) override
        {
            Record("Open");
            if (boardNumber >= numDevices)
                throw HardwareUnavailableError("[fake] Board " + std::to_string(boardNumber) + " not found");
            m_open = true;
            return ListDevices()[boardNumber];
        }

        void Close() override
        {
            calls.push_back("Close");
            closeCount++;
            m_open = false;
            m_scanRunning = false;
        }

        bool IsOpen() const override { return m_open; }

        int NumAiChannels(Utils::AdcMode) override
        {
            Record("NumAiChannels");
            return numAiChannels;
        }

        int NumAoChannels() override
        {
            Record("NumAoChannels");
            return numAoChannels;
        }

        bool HasPacer() override
        {
            Record("HasPacer");
            return hasPacer;
        }

        bool SupportsAiRange(Utils::AdcMode, Utils::RangeId) override
        {
            Record("SupportsAiRange");
            return supportsAiRange;
        }

        bool SupportsAoRange(Utils::RangeId) override
        {
            Record("SupportsAoRange");
            return supportsAoRange;
        }

        std::vector<Utils::RangeId> AiRanges(Utils::AdcMode) override
        {
            Record("AiRanges");
            return aiRanges;
        }

        std::vector<Utils::RangeId> AoRanges() override
        {
            Record("AoRanges");
            return aoRanges;
        }

        void SetAiMode(Utils::AdcMode mode) override
        {
            Record("SetAiMode");
            aiMode = mode;
        }

        void ConfigurePort(Utils::DigitalPort port, Utils::DigitalDirection direction) override
        {
            Record("ConfigurePort");
            directions[port] = direction;
        }

        double AIn(int, Utils::AdcMode, Utils::RangeId) override
        {
            Record("AIn");
            return aiValue;
        }

        void AOut(int, Utils::RangeId, double value) override
        {
            Record("AOut");
            aoWrites.push_back(value);
        }

        uint64_t DIn(Utils::DigitalPort) override
        {
            Record("DIn");
            return dinValue;
        }

        void DOut(Utils::DigitalPort, uint64_t bits) override
        {
            Record("DOut");
            lastDout = bits;
        }

        void DBitOut(Utils::DigitalPort, int bit, bool value) override
        {
            Record("DBitOut");
            if (value)
                lastDout |= (1ull << bit);
            else
                lastDout &= ~(1ull << bit);
        }

        double AInScan(int lowChannel, int highChannel,
                       Utils::AdcMode, Utils::RangeId,
                       int samplesPerChannel, double rate,
                       bool continuous, double *buffer) override
        {
            Record("AInScan");
            const int channels = highChannel - lowChannel + 1;
            // 樣本值 = 通道 + row / 1000
            for (int row = 0; row < samplesPerChannel; row++)
            {
                for (int ch = 0; ch < channels; ch++)
                    buffer[row * channels + ch] = (lowChannel + ch) + row / 1000.0;
            }
            m_scanRunning = true;
            m_continuous = continuous;
            m_samplesPerChannel = samplesPerChannel;
            m_channels = channels;
            m_scanCount = 0;
            return rate;
        }

        ScanProgress GetScanProgress() override
        {
            Record("GetScanProgress");
            if (m_scanRunning)
            {
                m_scanCount += scanStep;
                if (!m_continuous && m_scanCount >= static_cast<unsigned long long>(m_samplesPerChannel))
                {
                    m_scanCount = m_samplesPerChannel;
                    m_scanRunning = false;
                }
            }
            ScanProgress progress;
            progress.running = m_scanRunning;
            progress.scanCount = m_scanCount;
            progress.totalCount = m_scanCount * m_channels;
            progress.index = m_scanCount > 0 ? static_cast<long long>(m_scanCount * m_channels) - 1 : -1;
            return progress;
        }

        void ScanStop() override
        {
            Record("ScanStop");
            m_scanRunning = false;
        }

        bool ScanRunning() const { return m_scanRunning; }

        Utils::AdcMode aiMode = Utils::AdcMode::Differential;

    private:
        void Record(const std::string &name)
        {
            calls.push_back(name);
            if (failOn.count(name))
                throw IOError("[fake] " + name + " failed", 42);
        }

        bool m_open = false;
        bool m_scanRunning = false;
        bool m_continuous = false;
        int m_samplesPerChannel = 0;
        int m_channels = 0;
        unsigned long long m_scanCount = 0;
    };

} // namespace Daq

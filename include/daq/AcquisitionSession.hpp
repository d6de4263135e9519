//=============================================================================
// NAME:    include/daq/AcquisitionSession.hpp
// DESC:    依設定檔操作單一 MCC 板卡 (單執行緒、輪詢式 scan)
//=============================================================================
#pragma once

#include "DaqDriver.hpp"
#include "utils/DaqStructs.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Daq
{

    // Uninitialized -> Configured -> Scanning <-> Idle -> Closed
    enum class SessionState
    {
        Uninitialized,
        Configured,
        Scanning,
        Idle,
        Closed
    };

    // StartScan 回傳的 scan 資訊
    struct ScanHandle
    {
        int id = 0;
        int lowChannel = 0;
        int highChannel = 0;
        int channelCount = 0;
        int samplesPerChannel = 0;
        double actualRate = 0.0;
        bool continuous = false;
    };

    // Scan buffer 複本，row-major (samples x channels)
    struct ScanData
    {
        int channelCount = 0;
        int rows = 0;
        unsigned long long completedScans = 0;
        std::vector<double> samples;

        double At(int row, int channel) const { return samples[row * channelCount + channel]; }
    };

    class AcquisitionSession
    {
    public:
        /**
         * @brief 建立 session (尚未開啟硬體)
         * @param config 驗證過的設定，session 保存一份不可變的複本
         * @param driver 廠商驅動，session 獨佔其生命週期
         */
        AcquisitionSession(const Utils::AcquisitionConfig &config, std::unique_ptr<DaqDriver> driver);
        ~AcquisitionSession();

        AcquisitionSession(const AcquisitionSession &) = delete;
        AcquisitionSession &operator=(const AcquisitionSession &) = delete;

        /**
         * @brief 開啟板卡並套用 AI mode、量程、數位埠方向
         * 任何失敗都會釋放 handle 並維持 Uninitialized
         * @throws HardwareUnavailableError, IOError, StateError
         */
        void Open();

        // 停止 scan 並釋放 handle；可重複呼叫，不丟例外
        void Close();

        // --- 類比 I/O ---

        double ReadAnalogInput(int channel);

        /**
         * @brief 單次類比輸出
         * @throws RangeError 超出 [-DACrange, DACrange] (bipolar) 或 [0, DACrange] (unipolar)，
         *         此時不會呼叫硬體
         */
        void WriteAnalogOutput(int channel, double volts);

        // --- Scan ---

        /**
         * @brief 啟動背景 scan (lowChannel..highChannel)
         * @throws StateError 若已在 scanning
         */
        ScanHandle StartScan(int lowChannel, int highChannel, double sampleRate,
                             int samplesPerChannel, bool continuous = false);

        // 查詢一次 scan 狀態；硬體已停止時進入 Idle
        ScanProgress PollScan();

        /**
         * @brief 每 pollIntervalSeconds 輪詢一次，直到完成、停止或逾時
         * @param timeoutSeconds 負值代表不設逾時
         * @param shouldStop 每次輪詢前檢查，回傳 true 時停止 scan
         */
        ScanProgress WaitForScan(double timeoutSeconds = -1.0,
                                 const std::function<bool()> &shouldStop = std::function<bool()>());

        // 停止 scan (非 scanning 時不做事)
        void StopScan();

        ScanData ReadScanData() const;

        // Start + Wait + Stop + Read
        ScanData AcquireScan(int lowChannel, int highChannel, double sampleRate,
                             int samplesPerChannel, double timeoutSeconds = -1.0,
                             const std::function<bool()> &shouldStop = std::function<bool()>());

        // --- 數位 I/O ---

        uint64_t ReadDigital();
        uint64_t ReadDigital(Utils::DigitalPort port);
        void WriteDigital(uint64_t bits);
        void WriteDigital(Utils::DigitalPort port, uint64_t bits);
        void WriteDigitalBit(Utils::DigitalPort port, int bit, bool value);

        // --- 狀態 ---

        SessionState State() const { return m_state; }
        const Utils::AcquisitionConfig &GetConfig() const { return m_config; }
        const DeviceDescriptor &Device() const { return m_device; }
        std::string DeviceName() const { return m_device.productName; }
        int NumChannels() const { return m_numAiChannels; }

        static std::string StateName(SessionState state);

    private:
        void RequireOpen(const char *operation) const;
        void RequireAiChannel(int channel) const;
        void EnsureDirection(Utils::DigitalPort port, Utils::DigitalDirection direction);

        const Utils::AcquisitionConfig m_config;
        std::unique_ptr<DaqDriver> m_driver;
        SessionState m_state;

        DeviceDescriptor m_device;
        int m_numAiChannels;
        int m_numAoChannels;
        std::map<Utils::DigitalPort, Utils::DigitalDirection> m_portDirections;

        // Scan
        std::vector<double> m_scanBuffer;
        ScanHandle m_scan;
        ScanProgress m_lastProgress;
        bool m_hasScan;
        int m_nextScanId;
    };

} // namespace Daq

/**
 * @file AcquisitionSession.cpp
 * @brief 擷取 session 實作 (狀態機、範圍檢查、scan 輪詢)
 */
#include "daq/AcquisitionSession.hpp"
#include "daq/DaqError.hpp"
#include "utils/DaqEnums.hpp"
#include <chrono>
#include <iostream>
#include <new>
#include <sstream>
#include <thread>
#include <utility>

namespace Daq
{
    // 單次 scan buffer 上限 (樣本數，約 512 MB)
    static const size_t MAX_SCAN_SAMPLES = 64u * 1024u * 1024u;

    namespace
    {
        std::string RangeList(const std::vector<Utils::RangeId> &ranges)
        {
            if (ranges.empty())
                return "none";
            std::string text;
            for (size_t i = 0; i < ranges.size(); i++)
                text += (i ? ", " : "") + Utils::ToString(ranges[i]);
            return text;
        }
    }

    AcquisitionSession::AcquisitionSession(const Utils::AcquisitionConfig &config,
                                           std::unique_ptr<DaqDriver> driver)
        : m_config(config), m_driver(std::move(driver)), m_state(SessionState::Uninitialized),
          m_numAiChannels(0), m_numAoChannels(0), m_hasScan(false), m_nextScanId(1) {}

    AcquisitionSession::~AcquisitionSession() { Close(); }

    std::string AcquisitionSession::StateName(SessionState state)
    {
        switch (state)
        {
        case SessionState::Uninitialized:
            return "Uninitialized";
        case SessionState::Configured:
            return "Configured";
        case SessionState::Scanning:
            return "Scanning";
        case SessionState::Idle:
            return "Idle";
        case SessionState::Closed:
            return "Closed";
        }
        return "Unknown";
    }

    void AcquisitionSession::Open()
    {
        if (m_state == SessionState::Closed)
            throw StateError("[Session] Open: session is closed");
        if (m_state != SessionState::Uninitialized)
            throw StateError("[Session] Open: session is already open");
        if (!m_driver)
            throw HardwareUnavailableError("[Session] Open: no driver");

        try
        {
            m_device = m_driver->Open(m_config.boardNumber);

            // 1. AI mode / 量程
            m_driver->SetAiMode(m_config.adcMode);
            m_numAiChannels = m_driver->NumAiChannels(m_config.adcMode);
            if (!m_driver->SupportsAiRange(m_config.adcMode, m_config.adcRangeId))
            {
                throw HardwareUnavailableError("[Session] " + m_device.productName + " does not support ADC range " +
                                               Utils::ToString(m_config.adcRangeId) + " in " +
                                               Utils::ToString(m_config.adcMode) + " mode (supported: " +
                                               RangeList(m_driver->AiRanges(m_config.adcMode)) + ")");
            }

            // 2. AO 量程 (沒有 AO 的板卡略過)
            m_numAoChannels = m_driver->NumAoChannels();
            if (m_numAoChannels > 0 && !m_driver->SupportsAoRange(m_config.dacRangeId))
            {
                throw HardwareUnavailableError("[Session] " + m_device.productName + " does not support DAC range " +
                                               Utils::ToString(m_config.dacRangeId) + " (supported: " +
                                               RangeList(m_driver->AoRanges()) + ")");
            }

            // 3. 數位埠方向
            m_portDirections.clear();
            EnsureDirection(m_config.digitalOutputPort, Utils::DigitalDirection::Output);
            EnsureDirection(m_config.digitalInputPort, Utils::DigitalDirection::Input);
        }
        catch (...)
        {
            m_portDirections.clear();
            m_numAiChannels = 0;
            m_numAoChannels = 0;
            m_driver->Close();
            throw;
        }

        m_state = SessionState::Configured;
        std::cout << "[Session] Configured " << m_device.productName
                  << " (board " << m_config.boardNumber << ", " << m_numAiChannels << " "
                  << Utils::ToString(m_config.adcMode) << " channels)" << std::endl;
    }

    void AcquisitionSession::Close()
    {
        if (m_state == SessionState::Closed)
            return;

        if (m_state == SessionState::Scanning)
        {
            try
            {
                m_driver->ScanStop();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Session] Stop scan on close failed: " << e.what() << std::endl;
            }
        }

        if (m_driver)
        {
            try
            {
                m_driver->Close();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Session] Release failed: " << e.what() << std::endl;
            }
        }

        const bool wasOpen = (m_state != SessionState::Uninitialized);
        m_scanBuffer.clear();
        m_hasScan = false;
        m_portDirections.clear();
        m_state = SessionState::Closed;

        if (wasOpen)
            std::cout << "[Session] Closed board " << m_config.boardNumber << std::endl;
    }

    void AcquisitionSession::RequireOpen(const char *operation) const
    {
        if (m_state == SessionState::Uninitialized)
            throw StateError(std::string("[Session] ") + operation + ": session is not open");
        if (m_state == SessionState::Closed)
            throw StateError(std::string("[Session] ") + operation + ": session is closed");
    }

    void AcquisitionSession::RequireAiChannel(int channel) const
    {
        if (channel < 0 || channel >= m_numAiChannels)
        {
            std::ostringstream msg;
            msg << "[Session] AI channel " << channel << " out of range [0, " << m_numAiChannels - 1 << "]";
            throw RangeError(msg.str());
        }
    }

    void AcquisitionSession::EnsureDirection(Utils::DigitalPort port, Utils::DigitalDirection direction)
    {
        auto it = m_portDirections.find(port);
        if (it != m_portDirections.end() && it->second == direction)
            return;

        m_driver->ConfigurePort(port, direction);
        m_portDirections[port] = direction;
    }

    double AcquisitionSession::ReadAnalogInput(int channel)
    {
        RequireOpen("ReadAnalogInput");
        RequireAiChannel(channel);
        return m_driver->AIn(channel, m_config.adcMode, m_config.adcRangeId);
    }

    void AcquisitionSession::WriteAnalogOutput(int channel, double volts)
    {
        RequireOpen("WriteAnalogOutput");

        if (channel < 0 || channel >= m_numAoChannels)
        {
            std::ostringstream msg;
            msg << "[Session] AO channel " << channel << " out of range (" << m_numAoChannels << " channel(s))";
            throw RangeError(msg.str());
        }

        const double high = m_config.dacRange;
        const double low = (m_config.dacPolarity == Utils::Polarity::Bipolar) ? -high : 0.0;
        // NaN 也會落在這裡
        if (!(volts >= low && volts <= high))
        {
            std::ostringstream msg;
            msg << "[Session] AO value " << volts << " V outside [" << low << ", " << high << "]";
            throw RangeError(msg.str());
        }

        m_driver->AOut(channel, m_config.dacRangeId, volts);
    }

    ScanHandle AcquisitionSession::StartScan(int lowChannel, int highChannel, double sampleRate,
                                             int samplesPerChannel, bool continuous)
    {
        RequireOpen("StartScan");
        if (m_state == SessionState::Scanning)
            throw StateError("[Session] StartScan: a scan is already running");

        RequireAiChannel(lowChannel);
        RequireAiChannel(highChannel);
        if (highChannel < lowChannel)
            throw RangeError("[Session] StartScan: highChannel < lowChannel");
        if (!(sampleRate > 0.0))
            throw RangeError("[Session] StartScan: sample rate must be positive");
        if (samplesPerChannel <= 0)
            throw RangeError("[Session] StartScan: samples per channel must be positive");

        if (!m_driver->HasPacer())
            throw HardwareUnavailableError("[Session] " + m_device.productName +
                                           " does not support hardware paced analog input");

        ScanHandle scan;
        scan.id = m_nextScanId;
        scan.lowChannel = lowChannel;
        scan.highChannel = highChannel;
        scan.channelCount = highChannel - lowChannel + 1;
        scan.samplesPerChannel = samplesPerChannel;
        scan.continuous = continuous;

        const size_t totalSamples = static_cast<size_t>(scan.channelCount) * static_cast<size_t>(samplesPerChannel);
        if (totalSamples > MAX_SCAN_SAMPLES)
        {
            std::ostringstream msg;
            msg << "[Session] StartScan: " << scan.channelCount << " x " << samplesPerChannel
                << " samples exceeds the scan buffer limit of " << MAX_SCAN_SAMPLES;
            throw RangeError(msg.str());
        }

        // buffer 必須在 scan 停止前保持有效
        try
        {
            m_scanBuffer.assign(totalSamples, 0.0);
        }
        catch (const std::bad_alloc &)
        {
            m_scanBuffer.clear();
            throw RangeError("[Session] StartScan: cannot allocate scan buffer of " +
                             std::to_string(totalSamples) + " samples");
        }
        scan.actualRate = m_driver->AInScan(lowChannel, highChannel, m_config.adcMode, m_config.adcRangeId,
                                            samplesPerChannel, sampleRate, continuous, m_scanBuffer.data());

        ++m_nextScanId;
        m_scan = scan;
        m_hasScan = true;
        m_lastProgress = ScanProgress();
        m_lastProgress.running = true;
        m_state = SessionState::Scanning;

        std::cout << "[Session] Scan " << scan.id << " started: ch" << lowChannel << "-ch" << highChannel
                  << " x " << samplesPerChannel << " @ " << scan.actualRate << " Hz" << std::endl;
        return scan;
    }

    ScanProgress AcquisitionSession::PollScan()
    {
        RequireOpen("PollScan");
        if (!m_hasScan)
            throw StateError("[Session] PollScan: no scan has been started");
        if (m_state != SessionState::Scanning)
            return m_lastProgress;

        m_lastProgress = m_driver->GetScanProgress();
        if (!m_lastProgress.running)
            m_state = SessionState::Idle;
        return m_lastProgress;
    }

    ScanProgress AcquisitionSession::WaitForScan(double timeoutSeconds, const std::function<bool()> &shouldStop)
    {
        RequireOpen("WaitForScan");
        if (!m_hasScan)
            throw StateError("[Session] WaitForScan: no scan has been started");

        const auto start = std::chrono::steady_clock::now();
        const auto interval = std::chrono::duration<double>(m_config.pollIntervalSeconds);

        while (true)
        {
            ScanProgress progress = PollScan();
            if (!progress.running)
                break;

            // 每通道樣本數已滿
            if (progress.scanCount >= static_cast<unsigned long long>(m_scan.samplesPerChannel))
                break;

            if (shouldStop && shouldStop())
            {
                std::cout << "[Session] Scan " << m_scan.id << " stop requested" << std::endl;
                StopScan();
                break;
            }

            if (timeoutSeconds >= 0.0)
            {
                std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
                if (elapsed.count() >= timeoutSeconds)
                    break;
            }

            std::this_thread::sleep_for(interval);
        }
        return m_lastProgress;
    }

    void AcquisitionSession::StopScan()
    {
        if (m_state != SessionState::Scanning)
            return;

        m_driver->ScanStop();
        m_lastProgress.running = false;
        m_state = SessionState::Idle;
    }

    ScanData AcquisitionSession::ReadScanData() const
    {
        RequireOpen("ReadScanData");
        if (!m_hasScan)
            throw StateError("[Session] ReadScanData: no scan has been started");

        ScanData data;
        data.channelCount = m_scan.channelCount;
        data.rows = m_scan.samplesPerChannel;
        data.completedScans = m_lastProgress.scanCount;
        data.samples = m_scanBuffer;
        return data;
    }

    ScanData AcquisitionSession::AcquireScan(int lowChannel, int highChannel, double sampleRate,
                                             int samplesPerChannel, double timeoutSeconds,
                                             const std::function<bool()> &shouldStop)
    {
        StartScan(lowChannel, highChannel, sampleRate, samplesPerChannel, false);
        try
        {
            WaitForScan(timeoutSeconds, shouldStop);
        }
        catch (...)
        {
            // 仍在執行就先停止，再把原本的錯誤往上丟
            try
            {
                StopScan();
            }
            catch (const DaqError &e)
            {
                std::cerr << "[Session] Stop scan after failure: " << e.what() << std::endl;
            }
            throw;
        }

        StopScan();
        return ReadScanData();
    }

    uint64_t AcquisitionSession::ReadDigital()
    {
        return ReadDigital(m_config.digitalInputPort);
    }

    uint64_t AcquisitionSession::ReadDigital(Utils::DigitalPort port)
    {
        RequireOpen("ReadDigital");
        EnsureDirection(port, Utils::DigitalDirection::Input);
        return m_driver->DIn(port);
    }

    void AcquisitionSession::WriteDigital(uint64_t bits)
    {
        WriteDigital(m_config.digitalOutputPort, bits);
    }

    void AcquisitionSession::WriteDigital(Utils::DigitalPort port, uint64_t bits)
    {
        RequireOpen("WriteDigital");
        EnsureDirection(port, Utils::DigitalDirection::Output);
        m_driver->DOut(port, bits);
    }

    void AcquisitionSession::WriteDigitalBit(Utils::DigitalPort port, int bit, bool value)
    {
        RequireOpen("WriteDigitalBit");
        if (bit < 0)
            throw RangeError("[Session] WriteDigitalBit: bit number must be non-negative");
        EnsureDirection(port, Utils::DigitalDirection::Output);
        m_driver->DBitOut(port, bit, value);
    }

} // namespace Daq

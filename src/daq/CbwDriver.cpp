/**
 * @file CbwDriver.cpp
 * @brief MCC Universal Library 實作 (Windows)
 */
#include "daq/CbwDriver.hpp"
#include "daq/DaqError.hpp"
#include "utils/DaqEnums.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace Daq
{
    // inventory 上限
    static const int MAX_DEVICE_COUNT = 100;

    namespace
    {
        std::string ErrorText(int err)
        {
            char msg[ERRSTRLEN];
            msg[0] = '\0';
            cbGetErrMsg(err, msg);
            return std::string(msg);
        }

        void Check(int err, const std::string &operation)
        {
            if (err != NOERRORS)
                throw IOError("[UL] " + operation + " failed: " + ErrorText(err), err);
        }

        int ToUlMode(Utils::AdcMode mode)
        {
            return mode == Utils::AdcMode::Differential ? DIFFERENTIAL : SINGLE_ENDED;
        }

        int ToUlPort(Utils::DigitalPort port)
        {
            switch (port)
            {
            case Utils::DigitalPort::AuxPort:
                return AUXPORT;
            case Utils::DigitalPort::FirstPortA:
                return FIRSTPORTA;
            case Utils::DigitalPort::FirstPortB:
                return FIRSTPORTB;
            case Utils::DigitalPort::FirstPortCL:
                return FIRSTPORTCL;
            case Utils::DigitalPort::FirstPortCH:
                return FIRSTPORTCH;
            case Utils::DigitalPort::SecondPortA:
                return SECONDPORTA;
            case Utils::DigitalPort::SecondPortB:
                return SECONDPORTB;
            }
            return FIRSTPORTA;
        }

        // UL 沒有對應的量程回傳 -1
        int ToUlRange(Utils::RangeId id)
        {
            switch (id)
            {
            case Utils::RangeId::Bip60Volts:
                return BIP60VOLTS;
            case Utils::RangeId::Bip30Volts:
                return BIP30VOLTS;
            case Utils::RangeId::Bip20Volts:
                return BIP20VOLTS;
            case Utils::RangeId::Bip15Volts:
                return BIP15VOLTS;
            case Utils::RangeId::Bip10Volts:
                return BIP10VOLTS;
            case Utils::RangeId::Bip5Volts:
                return BIP5VOLTS;
            case Utils::RangeId::Bip4Volts:
                return BIP4VOLTS;
            case Utils::RangeId::Bip2Pt5Volts:
                return BIP2PT5VOLTS;
            case Utils::RangeId::Bip2Volts:
                return BIP2VOLTS;
            case Utils::RangeId::Bip1Pt25Volts:
                return BIP1PT25VOLTS;
            case Utils::RangeId::Bip1Volts:
                return BIP1VOLTS;
            case Utils::RangeId::BipPt625Volts:
                return BIPPT625VOLTS;
            case Utils::RangeId::BipPt5Volts:
                return BIPPT5VOLTS;
            case Utils::RangeId::BipPt312Volts:
                return BIPPT312VOLTS;
            case Utils::RangeId::BipPt25Volts:
                return BIPPT25VOLTS;
            case Utils::RangeId::BipPt2Volts:
                return BIPPT2VOLTS;
            case Utils::RangeId::BipPt156Volts:
                return BIPPT156VOLTS;
            case Utils::RangeId::BipPt125Volts:
                return BIPPT125VOLTS;
            case Utils::RangeId::BipPt1Volts:
                return BIPPT1VOLTS;
            case Utils::RangeId::BipPt078Volts:
                return BIPPT078VOLTS;
            case Utils::RangeId::BipPt05Volts:
                return BIPPT05VOLTS;
            case Utils::RangeId::BipPt01Volts:
                return BIPPT01VOLTS;
            case Utils::RangeId::BipPt005Volts:
                return BIPPT005VOLTS;
            case Utils::RangeId::Uni10Volts:
                return UNI10VOLTS;
            case Utils::RangeId::Uni5Volts:
                return UNI5VOLTS;
            case Utils::RangeId::Uni4Volts:
                return UNI4VOLTS;
            case Utils::RangeId::Uni2Pt5Volts:
                return UNI2PT5VOLTS;
            case Utils::RangeId::Uni2Volts:
                return UNI2VOLTS;
            case Utils::RangeId::Uni1Pt25Volts:
                return UNI1PT25VOLTS;
            case Utils::RangeId::Uni1Volts:
                return UNI1VOLTS;
            case Utils::RangeId::UniPt5Volts:
                return UNIPT5VOLTS;
            case Utils::RangeId::UniPt25Volts:
                return UNIPT25VOLTS;
            case Utils::RangeId::UniPt2Volts:
                return UNIPT2VOLTS;
            case Utils::RangeId::UniPt1Volts:
                return UNIPT1VOLTS;
            case Utils::RangeId::UniPt05Volts:
                return UNIPT05VOLTS;
            case Utils::RangeId::UniPt01Volts:
                return UNIPT01VOLTS;
            case Utils::RangeId::Ma0To20:
                return MA0TO20;
            // cbw.h 沒有這些量程
            case Utils::RangeId::Bip3Volts:
            case Utils::RangeId::Uni60Volts:
            case Utils::RangeId::Uni30Volts:
            case Utils::RangeId::Uni20Volts:
            case Utils::RangeId::Uni15Volts:
            case Utils::RangeId::UniPt625Volts:
            case Utils::RangeId::UniPt125Volts:
            case Utils::RangeId::UniPt078Volts:
            case Utils::RangeId::UniPt005Volts:
                return -1;
            }
            return -1;
        }

        bool FromUlRange(int value, Utils::RangeId &id)
        {
            for (const auto &entry : Utils::AllRanges())
            {
                if (ToUlRange(entry.id) >= 0 && ToUlRange(entry.id) == value)
                {
                    id = entry.id;
                    return true;
                }
            }
            return false;
        }

        int RequireUlRange(Utils::RangeId id)
        {
            int range = ToUlRange(id);
            if (range < 0)
                throw HardwareUnavailableError("[UL] Range " + Utils::ToString(id) + " is not available");
            return range;
        }
    }

    CbwDriver::CbwDriver()
        : m_board(-1), m_open(false), m_aiMode(DIFFERENTIAL), m_memHandle(NULL),
          m_userBuffer(NULL), m_totalPoints(0), m_channelCount(0), m_scanActive(false)
    {
        // 錯誤一律由回傳值處理，不讓 UL 跳出訊息視窗
        cbErrHandling(DONTPRINT, DONTSTOP);
    }

    CbwDriver::~CbwDriver() { Close(); }

    std::vector<DaqDeviceDescriptor> CbwDriver::Inventory()
    {
        std::vector<DaqDeviceDescriptor> descriptors(MAX_DEVICE_COUNT);
        int numDevs = MAX_DEVICE_COUNT;
        Check(cbGetDaqDeviceInventory(ANY_IFC, descriptors.data(), &numDevs), "cbGetDaqDeviceInventory");
        descriptors.resize(numDevs);
        return descriptors;
    }

    std::vector<DeviceDescriptor> CbwDriver::ListDevices()
    {
        cbIgnoreInstaCal();
        std::vector<DeviceDescriptor> devices;
        for (const auto &d : Inventory())
        {
            DeviceDescriptor dev;
            dev.productName = d.ProductName;
            dev.uniqueId = d.UniqueID;
            devices.push_back(dev);
        }
        return devices;
    }

    DeviceDescriptor CbwDriver::Open(int boardNumber)
    {
        if (m_open)
            Close();

        cbIgnoreInstaCal();
        std::vector<DaqDeviceDescriptor> descriptors = Inventory();
        if (descriptors.empty())
            throw HardwareUnavailableError("[UL] No DAQ devices found");
        if (boardNumber < 0 || boardNumber >= static_cast<int>(descriptors.size()))
        {
            throw HardwareUnavailableError("[UL] Board " + std::to_string(boardNumber) +
                                           " not found (" + std::to_string(descriptors.size()) + " device(s))");
        }

        const DaqDeviceDescriptor &desc = descriptors[boardNumber];
        int err = cbCreateDaqDevice(boardNumber, desc);
        if (err != NOERRORS)
        {
            throw HardwareUnavailableError(std::string("[UL] Cannot create device for ") + desc.ProductName +
                                           ": " + ErrorText(err));
        }

        m_board = boardNumber;
        m_open = true;
        std::cout << "[UL] Connected to " << desc.ProductName << " " << desc.UniqueID << std::endl;

        DeviceDescriptor dev;
        dev.productName = desc.ProductName;
        dev.uniqueId = desc.UniqueID;
        return dev;
    }

    void CbwDriver::Close()
    {
        if (!m_open)
            return;

        if (m_scanActive)
        {
            int err = cbStopBackground(m_board, AIFUNCTION);
            if (err != NOERRORS)
                std::cerr << "[UL] cbStopBackground failed: " << ErrorText(err) << std::endl;
            m_scanActive = false;
        }
        FreeScanBuffer();

        int err = cbReleaseDaqDevice(m_board);
        if (err != NOERRORS)
            std::cerr << "[UL] cbReleaseDaqDevice failed: " << ErrorText(err) << std::endl;

        m_open = false;
        m_board = -1;
        std::cout << "[UL] Device released" << std::endl;
    }

    bool CbwDriver::IsOpen() const
    {
        return m_open;
    }

    void CbwDriver::RequireOpen(const char *operation) const
    {
        if (!m_open)
            throw StateError(std::string("[UL] ") + operation + ": device is not connected");
    }

    int CbwDriver::NumAiChannels(Utils::AdcMode mode)
    {
        RequireOpen("NumAiChannels");
        // BINUMADCHANS 依目前的 input mode 回報
        Check(cbAInputMode(m_board, ToUlMode(mode)), "cbAInputMode");
        int value = 0;
        Check(cbGetConfig(BOARDINFO, m_board, 0, BINUMADCHANS, &value), "cbGetConfig(BINUMADCHANS)");
        Check(cbAInputMode(m_board, m_aiMode), "cbAInputMode");
        return value;
    }

    int CbwDriver::NumAoChannels()
    {
        RequireOpen("NumAoChannels");
        int value = 0;
        Check(cbGetConfig(BOARDINFO, m_board, 0, BINUMDACHANS, &value), "cbGetConfig(BINUMDACHANS)");
        return value;
    }

    bool CbwDriver::HasPacer()
    {
        // UL 沒有 pacer 資訊項目；不支援背景 AI 的板卡 cbGetStatus(AIFUNCTION) 會回傳錯誤
        RequireOpen("HasPacer");
        short status = IDLE;
        long curCount = 0;
        long curIndex = 0;
        return cbGetStatus(m_board, &status, &curCount, &curIndex, AIFUNCTION) == NOERRORS;
    }

    std::vector<Utils::RangeId> CbwDriver::AiRanges(Utils::AdcMode mode)
    {
        RequireOpen("AiRanges");
        std::vector<Utils::RangeId> ranges;
        Utils::RangeId id;

        // 量程由跳線/開關固定的板卡直接回報 BIRANGE
        int fixedRange = -1;
        Check(cbGetConfig(BOARDINFO, m_board, 0, BIRANGE, &fixedRange), "cbGetConfig(BIRANGE)");
        if (fixedRange >= 0)
        {
            if (FromUlRange(fixedRange, id))
                ranges.push_back(id);
            return ranges;
        }

        int resolution = 16;
        Check(cbGetConfig(BOARDINFO, m_board, 0, BIADRES, &resolution), "cbGetConfig(BIADRES)");

        // 其餘逐一試讀 channel 0，UL 不接受的量程回傳 BADRANGE
        const int previousMode = m_aiMode;
        Check(cbAInputMode(m_board, ToUlMode(mode)), "cbAInputMode");
        for (const auto &entry : Utils::AllRanges())
        {
            const int range = ToUlRange(entry.id);
            if (range < 0)
                continue;
            int err;
            if (resolution > 16)
            {
                ULONG data = 0;
                err = cbAIn32(m_board, 0, range, &data, 0);
            }
            else
            {
                USHORT data = 0;
                err = cbAIn(m_board, 0, range, &data);
            }
            if (err == NOERRORS)
                ranges.push_back(entry.id);
        }
        Check(cbAInputMode(m_board, previousMode), "cbAInputMode");
        return ranges;
    }

    std::vector<Utils::RangeId> CbwDriver::AoRanges()
    {
        RequireOpen("AoRanges");
        std::vector<Utils::RangeId> ranges;
        if (NumAoChannels() <= 0)
            return ranges;

        // 不合法的 range code 也能轉換，代表板卡忽略軟體量程，改讀 BIDACRANGE
        USHORT data = 0;
        if (cbFromEngUnits(m_board, -5, 0.0f, &data) == NOERRORS)
        {
            int dacRange = -1;
            Check(cbGetConfig(BOARDINFO, m_board, 0, BIDACRANGE, &dacRange), "cbGetConfig(BIDACRANGE)");
            Utils::RangeId id;
            if (FromUlRange(dacRange, id))
                ranges.push_back(id);
            return ranges;
        }

        for (const auto &entry : Utils::AllRanges())
        {
            const int range = ToUlRange(entry.id);
            if (range >= 0 && cbFromEngUnits(m_board, range, 0.0f, &data) == NOERRORS)
                ranges.push_back(entry.id);
        }
        return ranges;
    }

    bool CbwDriver::SupportsAiRange(Utils::AdcMode mode, Utils::RangeId range)
    {
        if (ToUlRange(range) < 0)
            return false;
        const std::vector<Utils::RangeId> ranges = AiRanges(mode);
        return std::find(ranges.begin(), ranges.end(), range) != ranges.end();
    }

    bool CbwDriver::SupportsAoRange(Utils::RangeId range)
    {
        if (ToUlRange(range) < 0)
            return false;
        const std::vector<Utils::RangeId> ranges = AoRanges();
        return std::find(ranges.begin(), ranges.end(), range) != ranges.end();
    }

    void CbwDriver::SetAiMode(Utils::AdcMode mode)
    {
        RequireOpen("SetAiMode");
        Check(cbAInputMode(m_board, ToUlMode(mode)), "cbAInputMode");
        m_aiMode = ToUlMode(mode);
    }

    void CbwDriver::ConfigurePort(Utils::DigitalPort port, Utils::DigitalDirection direction)
    {
        RequireOpen("ConfigurePort");
        int dir = (direction == Utils::DigitalDirection::Output) ? DIGITALOUT : DIGITALIN;
        Check(cbDConfigPort(m_board, ToUlPort(port), dir), "cbDConfigPort(" + Utils::ToString(port) + ")");
    }

    double CbwDriver::AIn(int channel, Utils::AdcMode mode, Utils::RangeId range)
    {
        RequireOpen("AIn");
        if (ToUlMode(mode) != m_aiMode)
            SetAiMode(mode);
        float data = 0.0f;
        Check(cbVIn(m_board, channel, RequireUlRange(range), &data, DEFAULTOPTION), "cbVIn");
        return static_cast<double>(data);
    }

    void CbwDriver::AOut(int channel, Utils::RangeId range, double value)
    {
        RequireOpen("AOut");
        Check(cbVOut(m_board, channel, RequireUlRange(range), static_cast<float>(value), DEFAULTOPTION), "cbVOut");
    }

    uint64_t CbwDriver::DIn(Utils::DigitalPort port)
    {
        RequireOpen("DIn");
        USHORT data = 0;
        Check(cbDIn(m_board, ToUlPort(port), &data), "cbDIn(" + Utils::ToString(port) + ")");
        return static_cast<uint64_t>(data);
    }

    void CbwDriver::DOut(Utils::DigitalPort port, uint64_t bits)
    {
        RequireOpen("DOut");
        Check(cbDOut(m_board, ToUlPort(port), static_cast<USHORT>(bits)), "cbDOut(" + Utils::ToString(port) + ")");
    }

    void CbwDriver::DBitOut(Utils::DigitalPort port, int bit, bool value)
    {
        RequireOpen("DBitOut");
        Check(cbDBitOut(m_board, ToUlPort(port), bit, value ? 1 : 0), "cbDBitOut(" + Utils::ToString(port) + ")");
    }

    double CbwDriver::AInScan(int lowChannel, int highChannel,
                              Utils::AdcMode mode, Utils::RangeId range,
                              int samplesPerChannel, double rate,
                              bool continuous, double *buffer)
    {
        RequireOpen("AInScan");
        if (ToUlMode(mode) != m_aiMode)
            SetAiMode(mode);

        FreeScanBuffer();
        m_channelCount = highChannel - lowChannel + 1;
        m_totalPoints = static_cast<long>(m_channelCount) * samplesPerChannel;
        m_memHandle = cbScaledWinBufAlloc(m_totalPoints);
        if (m_memHandle == NULL)
            throw IOError("[UL] cbScaledWinBufAlloc failed", -1);
        m_userBuffer = buffer;

        long actualRate = static_cast<long>(rate);
        int options = BACKGROUND | SCALEDATA;
        if (continuous)
            options |= CONTINUOUS;

        int err = cbAInScan(m_board, lowChannel, highChannel, m_totalPoints, &actualRate,
                            RequireUlRange(range), m_memHandle, options);
        if (err != NOERRORS)
        {
            FreeScanBuffer();
            Check(err, "cbAInScan");
        }

        m_scanActive = true;
        std::cout << "[UL] Scan started. Requested: " << rate << " Hz, Actual: " << actualRate << " Hz" << std::endl;
        return static_cast<double>(actualRate);
    }

    void CbwDriver::CopyScanData()
    {
        if (m_memHandle == NULL || m_userBuffer == NULL)
            return;
        Check(cbScaledWinBufToArray(m_memHandle, m_userBuffer, 0, m_totalPoints), "cbScaledWinBufToArray");
    }

    void CbwDriver::FreeScanBuffer()
    {
        if (m_memHandle != NULL)
        {
            cbWinBufFree(m_memHandle);
            m_memHandle = NULL;
        }
        m_userBuffer = NULL;
        m_totalPoints = 0;
    }

    ScanProgress CbwDriver::GetScanProgress()
    {
        RequireOpen("GetScanProgress");
        short status = IDLE;
        long curCount = 0;
        long curIndex = -1;
        Check(cbGetStatus(m_board, &status, &curCount, &curIndex, AIFUNCTION), "cbGetStatus");
        CopyScanData();

        ScanProgress progress;
        progress.running = (status == RUNNING);
        progress.totalCount = static_cast<unsigned long long>(curCount);
        progress.scanCount = m_channelCount > 0 ? progress.totalCount / m_channelCount : 0;
        progress.index = curIndex;
        if (!progress.running)
            m_scanActive = false;
        return progress;
    }

    void CbwDriver::ScanStop()
    {
        RequireOpen("ScanStop");
        Check(cbStopBackground(m_board, AIFUNCTION), "cbStopBackground");
        m_scanActive = false;
        CopyScanData();
    }
}

/**
 * @file UldaqDriver.cpp
 * @brief MCC uldaq 實作 (Linux)
 */
#include "daq/UldaqDriver.hpp"
#include "daq/DaqError.hpp"
#include "utils/DaqEnums.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace Daq
{
    // inventory 上限
    static const unsigned int MAX_DEVICE_COUNT = 100;

    namespace
    {
        std::string ErrorText(UlError err)
        {
            char msg[ERR_MSG_LEN];
            msg[0] = '\0';
            ulGetErrMsg(err, msg);
            return std::string(msg);
        }

        void Check(UlError err, const std::string &operation)
        {
            if (err != ERR_NO_ERROR)
                throw IOError("[uldaq] " + operation + " failed: " + ErrorText(err), static_cast<int>(err));
        }

        AiInputMode ToUlMode(Utils::AdcMode mode)
        {
            return mode == Utils::AdcMode::Differential ? AI_DIFFERENTIAL : AI_SINGLE_ENDED;
        }

        DigitalPortType ToUlPort(Utils::DigitalPort port)
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

        // 解析 RangeId 轉為 SDK 參數
        Range ToUlRange(Utils::RangeId id)
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
            case Utils::RangeId::Bip3Volts:
                return BIP3VOLTS;
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
            case Utils::RangeId::Uni60Volts:
                return UNI60VOLTS;
            case Utils::RangeId::Uni30Volts:
                return UNI30VOLTS;
            case Utils::RangeId::Uni20Volts:
                return UNI20VOLTS;
            case Utils::RangeId::Uni15Volts:
                return UNI15VOLTS;
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
            case Utils::RangeId::UniPt625Volts:
                return UNIPT625VOLTS;
            case Utils::RangeId::UniPt5Volts:
                return UNIPT5VOLTS;
            case Utils::RangeId::UniPt25Volts:
                return UNIPT25VOLTS;
            case Utils::RangeId::UniPt2Volts:
                return UNIPT2VOLTS;
            case Utils::RangeId::UniPt125Volts:
                return UNIPT125VOLTS;
            case Utils::RangeId::UniPt1Volts:
                return UNIPT1VOLTS;
            case Utils::RangeId::UniPt078Volts:
                return UNIPT078VOLTS;
            case Utils::RangeId::UniPt05Volts:
                return UNIPT05VOLTS;
            case Utils::RangeId::UniPt01Volts:
                return UNIPT01VOLTS;
            case Utils::RangeId::UniPt005Volts:
                return UNIPT005VOLTS;
            case Utils::RangeId::Ma0To20:
                return MA0TO20;
            }
            return BIP10VOLTS;
        }

        // SDK Range 轉回 RangeId；不在表內時回傳 false
        bool FromUlRange(long long value, Utils::RangeId &id)
        {
            for (const auto &entry : Utils::AllRanges())
            {
                if (static_cast<long long>(ToUlRange(entry.id)) == value)
                {
                    id = entry.id;
                    return true;
                }
            }
            return false;
        }
    }

    UldaqDriver::UldaqDriver(DaqDeviceInterface interfaceType)
        : m_interfaceType(interfaceType), m_handle(0), m_scanActive(false) {}

    UldaqDriver::~UldaqDriver() { Close(); }

    std::vector<DaqDeviceDescriptor> UldaqDriver::Inventory()
    {
        std::vector<DaqDeviceDescriptor> descriptors(MAX_DEVICE_COUNT);
        unsigned int numDevs = MAX_DEVICE_COUNT;
        Check(ulGetDaqDeviceInventory(m_interfaceType, descriptors.data(), &numDevs),
              "ulGetDaqDeviceInventory");
        descriptors.resize(numDevs);
        return descriptors;
    }

    std::vector<DeviceDescriptor> UldaqDriver::ListDevices()
    {
        std::vector<DeviceDescriptor> devices;
        for (const auto &d : Inventory())
        {
            DeviceDescriptor dev;
            dev.productName = d.productName;
            dev.uniqueId = d.uniqueId;
            devices.push_back(dev);
        }
        return devices;
    }

    DeviceDescriptor UldaqDriver::Open(int boardNumber)
    {
        if (m_handle)
            Close();

        std::vector<DaqDeviceDescriptor> descriptors = Inventory();
        if (descriptors.empty())
            throw HardwareUnavailableError("[uldaq] No DAQ devices found");
        if (boardNumber < 0 || boardNumber >= static_cast<int>(descriptors.size()))
        {
            throw HardwareUnavailableError("[uldaq] Board " + std::to_string(boardNumber) +
                                           " not found (" + std::to_string(descriptors.size()) + " device(s))");
        }

        const DaqDeviceDescriptor &desc = descriptors[boardNumber];
        DaqDeviceHandle handle = ulCreateDaqDevice(desc);
        if (handle == 0)
            throw HardwareUnavailableError(std::string("[uldaq] Cannot create device for ") + desc.productName);

        UlError err = ulConnectDaqDevice(handle);
        if (err != ERR_NO_ERROR)
        {
            ulReleaseDaqDevice(handle);
            throw HardwareUnavailableError(std::string("[uldaq] Cannot connect to ") + desc.productName +
                                           " (" + desc.uniqueId + "): " + ErrorText(err));
        }

        m_handle = handle;
        std::cout << "[uldaq] Connected to " << desc.productName << " " << desc.uniqueId << std::endl;

        DeviceDescriptor dev;
        dev.productName = desc.productName;
        dev.uniqueId = desc.uniqueId;
        return dev;
    }

    void UldaqDriver::Close()
    {
        if (!m_handle)
            return;

        if (m_scanActive)
        {
            UlError err = ulAInScanStop(m_handle);
            if (err != ERR_NO_ERROR)
                std::cerr << "[uldaq] ulAInScanStop failed: " << ErrorText(err) << std::endl;
            m_scanActive = false;
        }

        UlError err = ulDisconnectDaqDevice(m_handle);
        if (err != ERR_NO_ERROR)
            std::cerr << "[uldaq] ulDisconnectDaqDevice failed: " << ErrorText(err) << std::endl;
        err = ulReleaseDaqDevice(m_handle);
        if (err != ERR_NO_ERROR)
            std::cerr << "[uldaq] ulReleaseDaqDevice failed: " << ErrorText(err) << std::endl;

        m_handle = 0;
        std::cout << "[uldaq] Device released" << std::endl;
    }

    bool UldaqDriver::IsOpen() const
    {
        return m_handle != 0;
    }

    void UldaqDriver::RequireHandle(const char *operation) const
    {
        if (!m_handle)
            throw StateError(std::string("[uldaq] ") + operation + ": device is not connected");
    }

    int UldaqDriver::NumAiChannels(Utils::AdcMode mode)
    {
        RequireHandle("NumAiChannels");
        long long value = 0;
        Check(ulAIGetInfo(m_handle, AI_INFO_NUM_CHANS_BY_MODE, ToUlMode(mode), &value),
              "ulAIGetInfo(AI_INFO_NUM_CHANS_BY_MODE)");
        return static_cast<int>(value);
    }

    int UldaqDriver::NumAoChannels()
    {
        RequireHandle("NumAoChannels");
        long long value = 0;
        Check(ulAOGetInfo(m_handle, AO_INFO_NUM_CHANS, 0, &value), "ulAOGetInfo(AO_INFO_NUM_CHANS)");
        return static_cast<int>(value);
    }

    bool UldaqDriver::HasPacer()
    {
        RequireHandle("HasPacer");
        long long value = 0;
        Check(ulAIGetInfo(m_handle, AI_INFO_HAS_PACER, 0, &value), "ulAIGetInfo(AI_INFO_HAS_PACER)");
        return value != 0;
    }

    std::vector<Utils::RangeId> UldaqDriver::AiRanges(Utils::AdcMode mode)
    {
        RequireHandle("AiRanges");
        const bool diff = (mode == Utils::AdcMode::Differential);
        long long numRanges = 0;
        Check(ulAIGetInfo(m_handle, diff ? AI_INFO_NUM_DIFF_RANGES : AI_INFO_NUM_SE_RANGES, 0, &numRanges),
              "ulAIGetInfo(AI_INFO_NUM_RANGES)");

        std::vector<Utils::RangeId> ranges;
        for (long long i = 0; i < numRanges; i++)
        {
            long long value = 0;
            Check(ulAIGetInfo(m_handle, diff ? AI_INFO_DIFF_RANGE : AI_INFO_SE_RANGE,
                              static_cast<unsigned int>(i), &value),
                  "ulAIGetInfo(AI_INFO_RANGE)");
            Utils::RangeId id;
            if (FromUlRange(value, id))
                ranges.push_back(id);
        }
        return ranges;
    }

    std::vector<Utils::RangeId> UldaqDriver::AoRanges()
    {
        RequireHandle("AoRanges");
        long long numRanges = 0;
        Check(ulAOGetInfo(m_handle, AO_INFO_NUM_RANGES, 0, &numRanges), "ulAOGetInfo(AO_INFO_NUM_RANGES)");

        std::vector<Utils::RangeId> ranges;
        for (long long i = 0; i < numRanges; i++)
        {
            long long value = 0;
            Check(ulAOGetInfo(m_handle, AO_INFO_RANGE, static_cast<unsigned int>(i), &value),
                  "ulAOGetInfo(AO_INFO_RANGE)");
            Utils::RangeId id;
            if (FromUlRange(value, id))
                ranges.push_back(id);
        }
        return ranges;
    }

    bool UldaqDriver::SupportsAiRange(Utils::AdcMode mode, Utils::RangeId range)
    {
        const std::vector<Utils::RangeId> ranges = AiRanges(mode);
        return std::find(ranges.begin(), ranges.end(), range) != ranges.end();
    }

    bool UldaqDriver::SupportsAoRange(Utils::RangeId range)
    {
        const std::vector<Utils::RangeId> ranges = AoRanges();
        return std::find(ranges.begin(), ranges.end(), range) != ranges.end();
    }

    void UldaqDriver::SetAiMode(Utils::AdcMode mode)
    {
        // uldaq 在每次呼叫時指定 input mode，這裡只確認板卡支援
        if (NumAiChannels(mode) <= 0)
            throw HardwareUnavailableError("[uldaq] Board has no " + Utils::ToString(mode) + " inputs");
    }

    void UldaqDriver::ConfigurePort(Utils::DigitalPort port, Utils::DigitalDirection direction)
    {
        RequireHandle("ConfigurePort");
        DigitalDirection dir = (direction == Utils::DigitalDirection::Output) ? DD_OUTPUT : DD_INPUT;
        Check(ulDConfigPort(m_handle, ToUlPort(port), dir),
              "ulDConfigPort(" + Utils::ToString(port) + ")");
    }

    double UldaqDriver::AIn(int channel, Utils::AdcMode mode, Utils::RangeId range)
    {
        RequireHandle("AIn");
        double data = 0.0;
        Check(ulAIn(m_handle, channel, ToUlMode(mode), ToUlRange(range), AIN_FF_DEFAULT, &data), "ulAIn");
        return data;
    }

    void UldaqDriver::AOut(int channel, Utils::RangeId range, double value)
    {
        RequireHandle("AOut");
        Check(ulAOut(m_handle, channel, ToUlRange(range), AOUT_FF_DEFAULT, value), "ulAOut");
    }

    uint64_t UldaqDriver::DIn(Utils::DigitalPort port)
    {
        RequireHandle("DIn");
        unsigned long long data = 0;
        Check(ulDIn(m_handle, ToUlPort(port), &data), "ulDIn(" + Utils::ToString(port) + ")");
        return static_cast<uint64_t>(data);
    }

    void UldaqDriver::DOut(Utils::DigitalPort port, uint64_t bits)
    {
        RequireHandle("DOut");
        Check(ulDOut(m_handle, ToUlPort(port), static_cast<unsigned long long>(bits)),
              "ulDOut(" + Utils::ToString(port) + ")");
    }

    void UldaqDriver::DBitOut(Utils::DigitalPort port, int bit, bool value)
    {
        RequireHandle("DBitOut");
        Check(ulDBitOut(m_handle, ToUlPort(port), bit, value ? 1u : 0u),
              "ulDBitOut(" + Utils::ToString(port) + ")");
    }

    double UldaqDriver::AInScan(int lowChannel, int highChannel,
                                Utils::AdcMode mode, Utils::RangeId range,
                                int samplesPerChannel, double rate,
                                bool continuous, double *buffer)
    {
        RequireHandle("AInScan");
        double actualRate = rate; // SDK 會寫回實際頻率
        ScanOption options = continuous ? SO_CONTINUOUS : SO_DEFAULTIO;
        Check(ulAInScan(m_handle, lowChannel, highChannel, ToUlMode(mode), ToUlRange(range),
                        samplesPerChannel, &actualRate, options, AINSCAN_FF_DEFAULT, buffer),
              "ulAInScan");
        m_scanActive = true;
        std::cout << "[uldaq] Scan started. Requested: " << rate << " Hz, Actual: " << actualRate << " Hz" << std::endl;
        return actualRate;
    }

    ScanProgress UldaqDriver::GetScanProgress()
    {
        RequireHandle("GetScanProgress");
        ScanStatus status = SS_IDLE;
        TransferStatus xfer;
        Check(ulAInScanStatus(m_handle, &status, &xfer), "ulAInScanStatus");

        ScanProgress progress;
        progress.running = (status == SS_RUNNING);
        progress.scanCount = xfer.currentScanCount;
        progress.totalCount = xfer.currentTotalCount;
        progress.index = xfer.currentIndex;
        if (!progress.running)
            m_scanActive = false;
        return progress;
    }

    void UldaqDriver::ScanStop()
    {
        RequireHandle("ScanStop");
        Check(ulAInScanStop(m_handle), "ulAInScanStop");
        m_scanActive = false;
    }
}

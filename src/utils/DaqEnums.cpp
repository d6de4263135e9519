//=============================================================================
// NAME:    src/utils/DaqEnums.cpp
//=============================================================================
#include "utils/DaqEnums.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace Utils
{

    namespace
    {
        std::string ToUpper(const std::string &text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        const std::vector<RangeSpec> &RangeTable()
        {
            // PT312/PT156/PT078 的滿刻度為 0.3125/0.15625/0.078125 V
            static const std::vector<RangeSpec> table = {
                {RangeId::Bip60Volts, Polarity::Bipolar, 60.0},
                {RangeId::Bip30Volts, Polarity::Bipolar, 30.0},
                {RangeId::Bip20Volts, Polarity::Bipolar, 20.0},
                {RangeId::Bip15Volts, Polarity::Bipolar, 15.0},
                {RangeId::Bip10Volts, Polarity::Bipolar, 10.0},
                {RangeId::Bip5Volts, Polarity::Bipolar, 5.0},
                {RangeId::Bip4Volts, Polarity::Bipolar, 4.0},
                {RangeId::Bip3Volts, Polarity::Bipolar, 3.0},
                {RangeId::Bip2Pt5Volts, Polarity::Bipolar, 2.5},
                {RangeId::Bip2Volts, Polarity::Bipolar, 2.0},
                {RangeId::Bip1Pt25Volts, Polarity::Bipolar, 1.25},
                {RangeId::Bip1Volts, Polarity::Bipolar, 1.0},
                {RangeId::BipPt625Volts, Polarity::Bipolar, 0.625},
                {RangeId::BipPt5Volts, Polarity::Bipolar, 0.5},
                {RangeId::BipPt312Volts, Polarity::Bipolar, 0.3125},
                {RangeId::BipPt25Volts, Polarity::Bipolar, 0.25},
                {RangeId::BipPt2Volts, Polarity::Bipolar, 0.2},
                {RangeId::BipPt156Volts, Polarity::Bipolar, 0.15625},
                {RangeId::BipPt125Volts, Polarity::Bipolar, 0.125},
                {RangeId::BipPt1Volts, Polarity::Bipolar, 0.1},
                {RangeId::BipPt078Volts, Polarity::Bipolar, 0.078125},
                {RangeId::BipPt05Volts, Polarity::Bipolar, 0.05},
                {RangeId::BipPt01Volts, Polarity::Bipolar, 0.01},
                {RangeId::BipPt005Volts, Polarity::Bipolar, 0.005},
                {RangeId::Uni60Volts, Polarity::Unipolar, 60.0},
                {RangeId::Uni30Volts, Polarity::Unipolar, 30.0},
                {RangeId::Uni20Volts, Polarity::Unipolar, 20.0},
                {RangeId::Uni15Volts, Polarity::Unipolar, 15.0},
                {RangeId::Uni10Volts, Polarity::Unipolar, 10.0},
                {RangeId::Uni5Volts, Polarity::Unipolar, 5.0},
                {RangeId::Uni4Volts, Polarity::Unipolar, 4.0},
                {RangeId::Uni2Pt5Volts, Polarity::Unipolar, 2.5},
                {RangeId::Uni2Volts, Polarity::Unipolar, 2.0},
                {RangeId::Uni1Pt25Volts, Polarity::Unipolar, 1.25},
                {RangeId::Uni1Volts, Polarity::Unipolar, 1.0},
                {RangeId::UniPt625Volts, Polarity::Unipolar, 0.625},
                {RangeId::UniPt5Volts, Polarity::Unipolar, 0.5},
                {RangeId::UniPt25Volts, Polarity::Unipolar, 0.25},
                {RangeId::UniPt2Volts, Polarity::Unipolar, 0.2},
                {RangeId::UniPt125Volts, Polarity::Unipolar, 0.125},
                {RangeId::UniPt1Volts, Polarity::Unipolar, 0.1},
                {RangeId::UniPt078Volts, Polarity::Unipolar, 0.078125},
                {RangeId::UniPt05Volts, Polarity::Unipolar, 0.05},
                {RangeId::UniPt01Volts, Polarity::Unipolar, 0.01},
                {RangeId::UniPt005Volts, Polarity::Unipolar, 0.005},
                {RangeId::Ma0To20, Polarity::Milliamp, 20.0},
            };
            return table;
        }
    }

    bool ParseAdcMode(const std::string &text, AdcMode &mode)
    {
        const std::string key = ToUpper(text);
        if (key == "DIFFERENTIAL")
        {
            mode = AdcMode::Differential;
            return true;
        }
        if (key == "SINGLE_ENDED" || key == "SINGLEENDED" || key == "SINGLE-ENDED")
        {
            mode = AdcMode::SingleEnded;
            return true;
        }
        return false;
    }

    bool ParsePolarity(const std::string &text, Polarity &polarity)
    {
        const std::string key = ToUpper(text);
        if (key == "BIPOLAR")
            polarity = Polarity::Bipolar;
        else if (key == "UNIPOLAR")
            polarity = Polarity::Unipolar;
        else if (key == "MILLIAMP" || key == "MA")
            polarity = Polarity::Milliamp;
        else
            return false;
        return true;
    }

    bool ParseDigitalPort(const std::string &text, DigitalPort &port)
    {
        const std::string key = ToUpper(text);
        if (key == "AUXPORT")
            port = DigitalPort::AuxPort;
        else if (key == "FIRSTPORTA")
            port = DigitalPort::FirstPortA;
        else if (key == "FIRSTPORTB")
            port = DigitalPort::FirstPortB;
        else if (key == "FIRSTPORTCL")
            port = DigitalPort::FirstPortCL;
        else if (key == "FIRSTPORTCH")
            port = DigitalPort::FirstPortCH;
        else if (key == "SECONDPORTA")
            port = DigitalPort::SecondPortA;
        else if (key == "SECONDPORTB")
            port = DigitalPort::SecondPortB;
        else
            return false;
        return true;
    }

    std::string ToString(AdcMode mode)
    {
        return mode == AdcMode::Differential ? "differential" : "single_ended";
    }

    std::string ToString(Polarity polarity)
    {
        switch (polarity)
        {
        case Polarity::Bipolar:
            return "bipolar";
        case Polarity::Unipolar:
            return "unipolar";
        case Polarity::Milliamp:
            return "milliamp";
        }
        return "unknown";
    }

    std::string ToString(DigitalPort port)
    {
        switch (port)
        {
        case DigitalPort::AuxPort:
            return "AUXPORT";
        case DigitalPort::FirstPortA:
            return "FIRSTPORTA";
        case DigitalPort::FirstPortB:
            return "FIRSTPORTB";
        case DigitalPort::FirstPortCL:
            return "FIRSTPORTCL";
        case DigitalPort::FirstPortCH:
            return "FIRSTPORTCH";
        case DigitalPort::SecondPortA:
            return "SECONDPORTA";
        case DigitalPort::SecondPortB:
            return "SECONDPORTB";
        }
        return "UNKNOWN";
    }

    std::string ToString(DigitalDirection direction)
    {
        return direction == DigitalDirection::Input ? "input" : "output";
    }

    std::string ToString(RangeId id)
    {
        const RangeSpec &spec = GetRangeSpec(id);
        std::string prefix;
        switch (spec.polarity)
        {
        case Polarity::Bipolar:
            prefix = "BIP";
            break;
        case Polarity::Unipolar:
            prefix = "UNI";
            break;
        case Polarity::Milliamp:
            return "MA0TO20";
        }
        std::string value = std::to_string(spec.maximum);
        // 去掉尾端的 0 與小數點
        value.erase(value.find_last_not_of('0') + 1);
        if (!value.empty() && value.back() == '.')
            value.pop_back();
        return prefix + value + "V";
    }

    bool FindRange(Polarity polarity, double maximum, RangeSpec &spec)
    {
        for (const auto &entry : RangeTable())
        {
            if (entry.polarity == polarity && std::fabs(entry.maximum - maximum) < 1e-9)
            {
                spec = entry;
                return true;
            }
        }
        return false;
    }

    const RangeSpec &GetRangeSpec(RangeId id)
    {
        for (const auto &entry : RangeTable())
        {
            if (entry.id == id)
                return entry;
        }
        // RangeTable 涵蓋所有 RangeId
        throw std::logic_error("[Range] Unknown RangeId");
    }

    const std::vector<RangeSpec> &AllRanges()
    {
        return RangeTable();
    }

} // namespace Utils

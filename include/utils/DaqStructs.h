//=============================================================================
// NAME:    include/utils/DaqStructs.h
//=============================================================================
#pragma once

#include <string>

namespace Utils
{

    // 類比輸入接線模式
    enum class AdcMode
    {
        Differential,
        SingleEnded
    };

    // ADC/DAC 量程極性 (Milliamp 僅用於 ADC 電流模式)
    enum class Polarity
    {
        Bipolar,
        Unipolar,
        Milliamp
    };

    // 數位埠 (對應 MCC UL 的符號名稱)
    enum class DigitalPort
    {
        AuxPort,
        FirstPortA,
        FirstPortB,
        FirstPortCL,
        FirstPortCH,
        SecondPortA,
        SecondPortB
    };

    enum class DigitalDirection
    {
        Input,
        Output
    };

    // 合法量程，與 uldaq Range 列舉一一對應 (驅動層再轉成 SDK 的 Range code)
    enum class RangeId
    {
        Bip60Volts,
        Bip30Volts,
        Bip20Volts,
        Bip15Volts,
        Bip10Volts,
        Bip5Volts,
        Bip4Volts,
        Bip3Volts,
        Bip2Pt5Volts,
        Bip2Volts,
        Bip1Pt25Volts,
        Bip1Volts,
        BipPt625Volts,
        BipPt5Volts,
        BipPt312Volts,
        BipPt25Volts,
        BipPt2Volts,
        BipPt156Volts,
        BipPt125Volts,
        BipPt1Volts,
        BipPt078Volts,
        BipPt05Volts,
        BipPt01Volts,
        BipPt005Volts,
        Uni60Volts,
        Uni30Volts,
        Uni20Volts,
        Uni15Volts,
        Uni10Volts,
        Uni5Volts,
        Uni4Volts,
        Uni2Pt5Volts,
        Uni2Volts,
        Uni1Pt25Volts,
        Uni1Volts,
        UniPt625Volts,
        UniPt5Volts,
        UniPt25Volts,
        UniPt2Volts,
        UniPt125Volts,
        UniPt1Volts,
        UniPt078Volts,
        UniPt05Volts,
        UniPt01Volts,
        UniPt005Volts,
        Ma0To20
    };

    // 單一量程：極性 + 滿刻度
    struct RangeSpec
    {
        RangeId id;
        Polarity polarity;
        double maximum; // V, Milliamp 時為 mA
    };

    // 擷取設定 (載入後不可變更，由 AcquisitionSession 獨佔)
    struct AcquisitionConfig
    {
        int boardNumber = 0;

        // 類比輸出
        double dacRange = 5.0;
        Polarity dacPolarity = Polarity::Unipolar;
        RangeId dacRangeId = RangeId::Uni5Volts;

        // 類比輸入
        AdcMode adcMode = AdcMode::Differential;
        Polarity adcPolarity = Polarity::Bipolar;
        double adcRange = 5.0;
        RangeId adcRangeId = RangeId::Bip5Volts;

        // 數位 I/O
        DigitalPort digitalOutputPort = DigitalPort::FirstPortA;
        DigitalPort digitalInputPort = DigitalPort::FirstPortB;

        // Scan 狀態輪詢間隔
        double pollIntervalSeconds = 0.002;
    };

} // namespace Utils

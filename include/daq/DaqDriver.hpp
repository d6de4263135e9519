//=============================================================================
// NAME:    include/daq/DaqDriver.hpp
// DESC:    廠商 SDK 的抽象介面 (uldaq / Universal Library 皆實作此類別)
//=============================================================================
#pragma once

#include "utils/DaqStructs.h"
#include <cstdint>
#include <string>
#include <vector>

namespace Daq
{

    // 裝置清單中的一筆資料
    struct DeviceDescriptor
    {
        std::string productName;
        std::string uniqueId;
    };

    // Scan 背景傳輸狀態
    struct ScanProgress
    {
        bool running = false;
        unsigned long long scanCount = 0;  // 已完成的 scan 數 (每通道樣本數)
        unsigned long long totalCount = 0; // 已傳輸的樣本總數 (所有通道)
        long long index = -1;              // buffer 中最新樣本的位置
    };

    /**
     * @brief 廠商 SDK 能力集合
     *
     * 所有失敗都以例外回報：
     *  - HardwareUnavailableError: 找不到板卡或無法佔用
     *  - IOError: SDK 呼叫回傳錯誤碼
     * 實作類別獨佔硬體 handle，解構時必須釋放。
     */
    class DaqDriver
    {
    public:
        virtual ~DaqDriver() {}

        // --- 裝置 ---

        virtual std::vector<DeviceDescriptor> ListDevices() = 0;

        /**
         * @brief 依 inventory 索引開啟並連線板卡
         * @return 已開啟板卡的描述
         */
        virtual DeviceDescriptor Open(int boardNumber) = 0;

        // 釋放 handle；未開啟時不做事
        virtual void Close() = 0;

        virtual bool IsOpen() const = 0;

        // --- 查詢 ---

        virtual int NumAiChannels(Utils::AdcMode mode) = 0;
        virtual int NumAoChannels() = 0;
        virtual bool HasPacer() = 0;
        virtual bool SupportsAiRange(Utils::AdcMode mode, Utils::RangeId range) = 0;
        virtual bool SupportsAoRange(Utils::RangeId range) = 0;

        // 板卡支援的量程 (SDK 有、但不在 RangeId 內的量程略過)
        virtual std::vector<Utils::RangeId> AiRanges(Utils::AdcMode mode) = 0;
        virtual std::vector<Utils::RangeId> AoRanges() = 0;

        // --- 設定 ---

        virtual void SetAiMode(Utils::AdcMode mode) = 0;
        virtual void ConfigurePort(Utils::DigitalPort port, Utils::DigitalDirection direction) = 0;

        // --- Single-shot I/O ---

        virtual double AIn(int channel, Utils::AdcMode mode, Utils::RangeId range) = 0;
        virtual void AOut(int channel, Utils::RangeId range, double value) = 0;
        virtual uint64_t DIn(Utils::DigitalPort port) = 0;
        virtual void DOut(Utils::DigitalPort port, uint64_t bits) = 0;
        virtual void DBitOut(Utils::DigitalPort port, int bit, bool value) = 0;

        // --- Scan ---

        /**
         * @brief 啟動背景類比輸入 scan
         * @param buffer 呼叫者配置的 buffer，大小 = 通道數 * samplesPerChannel，
         *               scan 停止前必須保持有效
         * @return 硬體實際的取樣率
         */
        virtual double AInScan(int lowChannel, int highChannel,
                               Utils::AdcMode mode, Utils::RangeId range,
                               int samplesPerChannel, double rate,
                               bool continuous, double *buffer) = 0;

        virtual ScanProgress GetScanProgress() = 0;

        virtual void ScanStop() = 0;
    };

} // namespace Daq

//=============================================================================
// NAME:    include/daq/DaqError.hpp
// DESC:    DAQ 錯誤分類 (全部繼承 std::runtime_error)
//=============================================================================
#pragma once

#include <stdexcept>
#include <string>

namespace Daq
{

    class DaqError : public std::runtime_error
    {
    public:
        explicit DaqError(const std::string &what) : std::runtime_error(what) {}
    };

    // 設定檔欄位缺少、型別錯誤或不在合法集合內
    class ConfigurationError : public DaqError
    {
    public:
        explicit ConfigurationError(const std::string &what) : DaqError(what) {}
    };

    // 找不到板卡、板卡已被佔用、或缺少必要功能 (例如 pacer)
    class HardwareUnavailableError : public DaqError
    {
    public:
        explicit HardwareUnavailableError(const std::string &what) : DaqError(what) {}
    };

    // 數值超出設定的 DAC/ADC 範圍 (不會自動 clamp)
    class RangeError : public DaqError
    {
    public:
        explicit RangeError(const std::string &what) : DaqError(what) {}
    };

    // 底層 SDK 呼叫失敗
    class IOError : public DaqError
    {
    public:
        IOError(const std::string &what, int code)
            : DaqError(what + " (error " + std::to_string(code) + ")"), m_code(code) {}

        int Code() const { return m_code; }

    private:
        int m_code;
    };

    // 目前狀態不允許此操作 (未開啟、已關閉、重複 scan)
    class StateError : public DaqError
    {
    public:
        explicit StateError(const std::string &what) : DaqError(what) {}
    };

} // namespace Daq

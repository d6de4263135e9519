//=============================================================================
// NAME:    include/utils/ConfigLoader.hpp
//=============================================================================
#pragma once

#include "utils/DaqStructs.h"
#include <string>

namespace Utils
{

    class ConfigLoader
    {
    public:
        /**
         * @brief 載入並解析 DAQ 設定檔 (JSON，可含註解)
         * * @param filePath 設定檔路徑 (e.g., "config/daq-default.json")
         * @return AcquisitionConfig 驗證過的擷取設定
         * @throws Daq::ConfigurationError 若檔案不存在、格式錯誤或欄位不合法
         */
        static AcquisitionConfig load(const std::string &filePath);

        /**
         * @brief 解析設定檔內容 (不讀檔)
         * @throws Daq::ConfigurationError
         */
        static AcquisitionConfig parse(const std::string &text);

        // 內建預設值 (與 config/daq-default.json 相同)
        static AcquisitionConfig defaults();

        /**
         * @brief 移除 '#' 與 '//' 行註解以及區塊註解
         * 字串常值內的字元保持不變
         */
        static std::string stripComments(const std::string &text);
    };

} // namespace Utils

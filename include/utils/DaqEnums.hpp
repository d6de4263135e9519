//=============================================================================
// NAME:    include/utils/DaqEnums.hpp
// DESC:    設定檔字串 <-> 列舉 轉換，以及合法量程查表
//=============================================================================
#pragma once

#include "utils/DaqStructs.h"
#include <string>
#include <vector>

namespace Utils
{

    /**
     * @brief 字串轉列舉 (不分大小寫)
     * @return false 表示字串不在合法集合內
     */
    bool ParseAdcMode(const std::string &text, AdcMode &mode);
    bool ParsePolarity(const std::string &text, Polarity &polarity);
    bool ParseDigitalPort(const std::string &text, DigitalPort &port);

    std::string ToString(AdcMode mode);
    std::string ToString(Polarity polarity);
    std::string ToString(DigitalPort port);
    std::string ToString(DigitalDirection direction);
    std::string ToString(RangeId id);

    /**
     * @brief 依極性與滿刻度查詢量程 (類似 SDK 依名稱前綴 + range_max 查 enum)
     * @param polarity 極性
     * @param maximum 滿刻度值
     * @param spec [out] 找到的量程
     * @return true 找到, false 不是合法量程
     */
    bool FindRange(Polarity polarity, double maximum, RangeSpec &spec);

    // 依 RangeId 取回完整量程資訊
    const RangeSpec &GetRangeSpec(RangeId id);

    // 全部合法量程
    const std::vector<RangeSpec> &AllRanges();

} // namespace Utils

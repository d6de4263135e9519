//=============================================================================
// NAME:    src/utils/ConfigLoader.cpp
//=============================================================================
#include "utils/ConfigLoader.hpp"
#include "utils/DaqEnums.hpp"
#include "daq/DaqError.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <limits>

// 為了方便使用 JSON 物件
using json = nlohmann::json;

namespace Utils
{

    namespace
    {
        const json &Require(const json &j, const std::string &key)
        {
            auto it = j.find(key);
            if (it == j.end())
                throw Daq::ConfigurationError("[Config] Missing required key: " + key);
            return *it;
        }

        double RequireNumber(const json &j, const std::string &key)
        {
            const json &value = Require(j, key);
            if (!value.is_number())
                throw Daq::ConfigurationError("[Config] " + key + " must be a number");
            return value.get<double>();
        }

        std::string RequireString(const json &j, const std::string &key)
        {
            const json &value = Require(j, key);
            if (!value.is_string())
                throw Daq::ConfigurationError("[Config] " + key + " must be a string");
            return value.get<std::string>();
        }

        RangeId LookUpRange(const std::string &key, double maximum, Polarity polarity)
        {
            RangeSpec spec;
            if (!FindRange(polarity, maximum, spec))
            {
                std::ostringstream msg;
                msg << "[Config] " << key << " " << maximum
                    << " is not a legal " << ToString(polarity) << " range (legal:";
                for (const auto &entry : AllRanges())
                {
                    if (entry.polarity == polarity)
                        msg << " " << entry.maximum;
                }
                msg << ")";
                throw Daq::ConfigurationError(msg.str());
            }
            return spec.id;
        }

        DigitalPort LookUpPort(const json &j, const std::string &key)
        {
            const std::string name = RequireString(j, key);
            DigitalPort port;
            if (!ParseDigitalPort(name, port))
                throw Daq::ConfigurationError("[Config] " + key + ": unknown digital port '" + name + "'");
            return port;
        }
    }

    AcquisitionConfig ConfigLoader::load(const std::string &filePath)
    {
        std::ifstream file(filePath);
        if (!file.is_open())
        {
            // 嘗試從上層目錄尋找 (相容 build 資料夾執行情況)
            file.open("../" + filePath);
            if (!file.is_open())
            {
                throw Daq::ConfigurationError("[Config] Cannot open config file: " + filePath);
            }
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        AcquisitionConfig config = parse(buffer.str());

        std::cout << "[Config] Successfully loaded: " << filePath
                  << " (board " << config.boardNumber
                  << ", ADC " << ToString(config.adcRangeId)
                  << " " << ToString(config.adcMode) << ")" << std::endl;

        return config;
    }

    AcquisitionConfig ConfigLoader::parse(const std::string &text)
    {
        json j;
        try
        {
            j = json::parse(stripComments(text));
        }
        catch (const json::exception &e)
        {
            throw Daq::ConfigurationError("[Config] JSON Parse Error: " + std::string(e.what()));
        }

        if (!j.is_object())
            throw Daq::ConfigurationError("[Config] Top level must be an object");

        AcquisitionConfig config;

        // 板卡編號
        const json &board = Require(j, "boardnum");
        if (!board.is_number_integer())
            throw Daq::ConfigurationError("[Config] boardnum must be an integer");
        // 非負整數一律解析為 unsigned，先檢查上限再轉成 int
        if (!board.is_number_unsigned())
            throw Daq::ConfigurationError("[Config] boardnum must be non-negative");
        if (board.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
            throw Daq::ConfigurationError("[Config] boardnum " + board.dump() + " is out of range");
        config.boardNumber = static_cast<int>(board.get<unsigned long long>());

        // 1. DAC (預設 unipolar，與 SDK 查表方式一致)
        config.dacRange = RequireNumber(j, "DACrange");
        if (config.dacRange <= 0.0)
            throw Daq::ConfigurationError("[Config] DACrange must be positive");
        config.dacPolarity = Polarity::Unipolar;
        if (j.contains("DACpolarity"))
        {
            const std::string dacPolarity = RequireString(j, "DACpolarity");
            if (!ParsePolarity(dacPolarity, config.dacPolarity))
                throw Daq::ConfigurationError("[Config] DACpolarity: unknown polarity '" + dacPolarity + "'");
            if (config.dacPolarity == Polarity::Milliamp)
                throw Daq::ConfigurationError("[Config] DACpolarity: analog output has no milliamp mode");
        }
        config.dacRangeId = LookUpRange("DACrange", config.dacRange, config.dacPolarity);

        // 2. ADC
        const std::string mode = RequireString(j, "ADCmode");
        if (!ParseAdcMode(mode, config.adcMode))
            throw Daq::ConfigurationError("[Config] ADCmode: unknown mode '" + mode + "'");

        const std::string polarity = RequireString(j, "ADCpolarity");
        if (!ParsePolarity(polarity, config.adcPolarity))
            throw Daq::ConfigurationError("[Config] ADCpolarity: unknown polarity '" + polarity + "'");

        config.adcRange = RequireNumber(j, "ADCrange");
        if (config.adcRange <= 0.0)
            throw Daq::ConfigurationError("[Config] ADCrange must be positive");
        config.adcRangeId = LookUpRange("ADCrange", config.adcRange, config.adcPolarity);

        // 3. Digital ports
        config.digitalOutputPort = LookUpPort(j, "DOutPort");
        config.digitalInputPort = LookUpPort(j, "DInPort");
        if (config.digitalOutputPort == config.digitalInputPort)
            throw Daq::ConfigurationError("[Config] DOutPort and DInPort must be different ports");

        // 4. Poll interval (舊版設定檔使用 sleep_time)
        if (j.contains("sleepTime"))
            config.pollIntervalSeconds = RequireNumber(j, "sleepTime");
        else if (j.contains("sleep_time"))
            config.pollIntervalSeconds = RequireNumber(j, "sleep_time");
        else
            throw Daq::ConfigurationError("[Config] Missing required key: sleepTime");
        if (config.pollIntervalSeconds < 0.0)
            throw Daq::ConfigurationError("[Config] sleepTime must be non-negative");

        return config;
    }

    AcquisitionConfig ConfigLoader::defaults()
    {
        AcquisitionConfig config;
        config.boardNumber = 0;
        config.dacRange = 5.0;
        config.dacPolarity = Polarity::Unipolar;
        config.dacRangeId = RangeId::Uni5Volts;
        config.adcMode = AdcMode::Differential;
        config.adcPolarity = Polarity::Bipolar;
        config.adcRange = 5.0;
        config.adcRangeId = RangeId::Bip5Volts;
        config.digitalOutputPort = DigitalPort::FirstPortA;
        config.digitalInputPort = DigitalPort::FirstPortB;
        config.pollIntervalSeconds = 0.002;
        return config;
    }

    std::string ConfigLoader::stripComments(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());

        bool inString = false;
        char quote = '\0';
        size_t i = 0;
        while (i < text.size())
        {
            const char c = text[i];
            const char next = (i + 1 < text.size()) ? text[i + 1] : '\0';

            if (inString)
            {
                out += c;
                if (c == '\\' && next != '\0')
                {
                    out += next;
                    i += 2;
                    continue;
                }
                if (c == quote)
                    inString = false;
                ++i;
                continue;
            }

            if (c == '"' || c == '\'')
            {
                inString = true;
                quote = c;
                out += c;
                ++i;
            }
            else if (c == '#' || (c == '/' && next == '/'))
            {
                // 行註解：保留換行讓錯誤訊息的行號不變
                while (i < text.size() && text[i] != '\n')
                    ++i;
            }
            else if (c == '/' && next == '*')
            {
                i += 2;
                while (i < text.size() && !(text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/'))
                {
                    if (text[i] == '\n')
                        out += '\n';
                    ++i;
                }
                if (i >= text.size())
                    throw Daq::ConfigurationError("[Config] Unterminated block comment");
                i += 2;
            }
            else
            {
                out += c;
                ++i;
            }
        }
        return out;
    }

} // namespace Utils

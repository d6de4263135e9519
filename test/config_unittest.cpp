#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "utils/ConfigLoader.hpp"
#include "utils/DaqEnums.hpp"
#include "daq/DaqError.hpp"

using namespace Utils;

namespace
{
    const char *EXAMPLE_CONFIG =
        "{\n"
        "  \"boardnum\": 0,\n"
        "  \"DACrange\": 5.0,\n"
        "  \"ADCmode\": \"differential\",\n"
        "  \"ADCpolarity\": \"bipolar\",\n"
        "  \"ADCrange\": 5,\n"
        "  \"DOutPort\": \"FIRSTPORTA\",\n"
        "  \"DInPort\": \"FIRSTPORTB\",\n"
        "  \"sleepTime\": 0.002\n"
        "}\n";

    std::string MakeConfig(const std::string &mode, const std::string &polarity, double range)
    {
        return "{\"boardnum\": 1, \"DACrange\": 10, \"ADCmode\": \"" + mode +
               "\", \"ADCpolarity\": \"" + polarity + "\", \"ADCrange\": " + std::to_string(range) +
               ", \"DOutPort\": \"FIRSTPORTA\", \"DInPort\": \"FIRSTPORTB\", \"sleepTime\": 0.01}";
    }

    // 移除指定 key 那一行
    std::string WithoutKey(const std::string &key)
    {
        std::string text(EXAMPLE_CONFIG);
        size_t pos = text.find("\"" + key + "\"");
        size_t end = text.find('\n', pos);
        text.erase(pos, end - pos + 1);
        // 刪掉最後一個欄位時，前一行多出的逗號也要處理
        size_t lastComma = text.rfind(',');
        size_t closing = text.rfind('}');
        if (text.find_first_not_of(" \n", lastComma + 1) == closing)
            text.erase(lastComma, 1);
        return text;
    }
}

TEST(TestConfigLoader, EXAMPLE_FIELDS)
{
    AcquisitionConfig config = ConfigLoader::parse(EXAMPLE_CONFIG);

    EXPECT_EQ(0, config.boardNumber);
    EXPECT_DOUBLE_EQ(5.0, config.dacRange);
    EXPECT_EQ(Polarity::Unipolar, config.dacPolarity);
    EXPECT_EQ(RangeId::Uni5Volts, config.dacRangeId);
    EXPECT_EQ(AdcMode::Differential, config.adcMode);
    EXPECT_EQ(Polarity::Bipolar, config.adcPolarity);
    EXPECT_DOUBLE_EQ(5.0, config.adcRange);
    EXPECT_EQ(RangeId::Bip5Volts, config.adcRangeId);
    EXPECT_EQ(DigitalPort::FirstPortA, config.digitalOutputPort);
    EXPECT_EQ(DigitalPort::FirstPortB, config.digitalInputPort);
    EXPECT_DOUBLE_EQ(0.002, config.pollIntervalSeconds);
}

TEST(TestConfigLoader, ALL_MODE_POLARITY_COMBINATIONS)
{
    const std::vector<std::string> modes = {"differential", "single_ended"};
    const std::vector<std::string> polarities = {"bipolar", "unipolar", "milliamp"};

    for (const auto &mode : modes)
    {
        for (const auto &polarity : polarities)
        {
            double range = (polarity == "milliamp") ? 20.0 : 10.0;
            AcquisitionConfig config;
            ASSERT_NO_THROW(config = ConfigLoader::parse(MakeConfig(mode, polarity, range)))
                << mode << " / " << polarity;
            EXPECT_EQ(mode, ToString(config.adcMode));
            EXPECT_EQ(polarity, ToString(config.adcPolarity));
        }
    }
}

TEST(TestConfigLoader, ENUMS_CASE_INSENSITIVE)
{
    AcquisitionConfig config = ConfigLoader::parse(MakeConfig("SINGLE_ENDED", "Unipolar", 2.5));
    EXPECT_EQ(AdcMode::SingleEnded, config.adcMode);
    EXPECT_EQ(RangeId::Uni2Pt5Volts, config.adcRangeId);

    config = ConfigLoader::parse(MakeConfig("Differential", "ma", 20));
    EXPECT_EQ(Polarity::Milliamp, config.adcPolarity);
    EXPECT_EQ(RangeId::Ma0To20, config.adcRangeId);
}

TEST(TestConfigLoader, UNKNOWN_MODE)
{
    const std::vector<std::string> bad = {"", "diff", "pseudo_differential", "single", "bipolar"};
    for (const auto &mode : bad)
    {
        EXPECT_THROW(ConfigLoader::parse(MakeConfig(mode, "bipolar", 5)), Daq::ConfigurationError) << mode;
    }
}

TEST(TestConfigLoader, UNKNOWN_POLARITY)
{
    const std::vector<std::string> bad = {"", "bi", "uni", "amps", "differential", "voltage"};
    for (const auto &polarity : bad)
    {
        EXPECT_THROW(ConfigLoader::parse(MakeConfig("differential", polarity, 5)), Daq::ConfigurationError)
            << polarity;
    }
}

TEST(TestConfigLoader, MISSING_KEYS)
{
    const std::vector<std::string> keys = {"boardnum", "DACrange", "ADCmode", "ADCpolarity",
                                           "ADCrange", "DOutPort", "DInPort", "sleepTime"};
    for (const auto &key : keys)
    {
        try
        {
            ConfigLoader::parse(WithoutKey(key));
            ADD_FAILURE() << "missing " << key << " was accepted";
        }
        catch (const Daq::ConfigurationError &e)
        {
            EXPECT_NE(std::string::npos, std::string(e.what()).find(key)) << e.what();
        }
    }
}

TEST(TestConfigLoader, ILLEGAL_VALUES)
{
    // 沒有任何 SDK 量程的滿刻度是 7 V 或 0.3 V
    EXPECT_THROW(ConfigLoader::parse(MakeConfig("differential", "bipolar", 7)), Daq::ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse(MakeConfig("differential", "unipolar", 0.3)), Daq::ConfigurationError);
    // milliamp 只有 0-20 mA
    EXPECT_THROW(ConfigLoader::parse(MakeConfig("differential", "milliamp", 10)), Daq::ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse(MakeConfig("differential", "bipolar", -5)), Daq::ConfigurationError);

    std::string text(EXAMPLE_CONFIG);

    std::string negativeBoard = text;
    negativeBoard.replace(negativeBoard.find("\"boardnum\": 0"), 13, "\"boardnum\": -1");
    EXPECT_THROW(ConfigLoader::parse(negativeBoard), Daq::ConfigurationError);

    // 超出 int 的板卡編號不可被截斷成其他板卡
    const char *hugeBoards[] = {"2147483648", "4294967296", "18446744073709551615", "-2147483649"};
    for (const char *value : hugeBoards)
    {
        std::string hugeBoard = text;
        hugeBoard.replace(hugeBoard.find("\"boardnum\": 0"), 13, std::string("\"boardnum\": ") + value);
        EXPECT_THROW(ConfigLoader::parse(hugeBoard), Daq::ConfigurationError) << value;
    }

    std::string maxBoard = text;
    maxBoard.replace(maxBoard.find("\"boardnum\": 0"), 13, "\"boardnum\": 2147483647");
    EXPECT_EQ(2147483647, ConfigLoader::parse(maxBoard).boardNumber);

    std::string fractionalBoard = text;
    fractionalBoard.replace(fractionalBoard.find("\"boardnum\": 0"), 13, "\"boardnum\": 0.5");
    EXPECT_THROW(ConfigLoader::parse(fractionalBoard), Daq::ConfigurationError);

    std::string negativeSleep = text;
    negativeSleep.replace(negativeSleep.find("0.002"), 5, "-0.002");
    EXPECT_THROW(ConfigLoader::parse(negativeSleep), Daq::ConfigurationError);

    std::string badPort = text;
    badPort.replace(badPort.find("FIRSTPORTB"), 10, "THIRDPORTZ");
    EXPECT_THROW(ConfigLoader::parse(badPort), Daq::ConfigurationError);

    std::string samePort = text;
    samePort.replace(samePort.find("FIRSTPORTB"), 10, "FIRSTPORTA");
    EXPECT_THROW(ConfigLoader::parse(samePort), Daq::ConfigurationError);

    std::string stringRange = text;
    stringRange.replace(stringRange.find("\"ADCrange\": 5"), 13, "\"ADCrange\": \"5\"");
    EXPECT_THROW(ConfigLoader::parse(stringRange), Daq::ConfigurationError);
}

TEST(TestConfigLoader, EVERY_SDK_RANGE_LOADS)
{
    struct Case
    {
        const char *polarity;
        double range;
        RangeId expected;
    };
    const Case cases[] = {
        {"bipolar", 60, RangeId::Bip60Volts},
        {"bipolar", 15, RangeId::Bip15Volts},
        {"bipolar", 3, RangeId::Bip3Volts},
        {"bipolar", 0.3125, RangeId::BipPt312Volts},
        {"bipolar", 0.15625, RangeId::BipPt156Volts},
        {"bipolar", 0.125, RangeId::BipPt125Volts},
        {"bipolar", 0.078125, RangeId::BipPt078Volts},
        {"unipolar", 30, RangeId::Uni30Volts},
        {"unipolar", 0.125, RangeId::UniPt125Volts},
        {"unipolar", 0.078125, RangeId::UniPt078Volts},
    };
    for (const Case &c : cases)
    {
        AcquisitionConfig config = ConfigLoader::parse(MakeConfig("single_ended", c.polarity, c.range));
        EXPECT_EQ(c.expected, config.adcRangeId) << c.polarity << " " << c.range;
    }

    // DAC 也使用同一張表
    std::string text(EXAMPLE_CONFIG);
    text.replace(text.find("\"DACrange\": 5.0"), 15, "\"DACrange\": 15");
    EXPECT_EQ(RangeId::Uni15Volts, ConfigLoader::parse(text).dacRangeId);
}

TEST(TestConfigLoader, ILLEGAL_RANGE_MESSAGE_LISTS_LEGAL_VALUES)
{
    try
    {
        ConfigLoader::parse(MakeConfig("differential", "milliamp", 10));
        FAIL() << "milliamp 10 accepted";
    }
    catch (const Daq::ConfigurationError &e)
    {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("ADCrange"));
        EXPECT_NE(std::string::npos, std::string(e.what()).find("(legal: 20)"));
    }
}

TEST(TestConfigLoader, DAC_POLARITY)
{
    std::string text(EXAMPLE_CONFIG);
    text.insert(text.find("\"DACrange\""), "\"DACpolarity\": \"bipolar\",\n  ");
    AcquisitionConfig config = ConfigLoader::parse(text);
    EXPECT_EQ(Polarity::Bipolar, config.dacPolarity);
    EXPECT_EQ(RangeId::Bip5Volts, config.dacRangeId);

    std::string milliamp(EXAMPLE_CONFIG);
    milliamp.insert(milliamp.find("\"DACrange\""), "\"DACpolarity\": \"milliamp\",\n  ");
    EXPECT_THROW(ConfigLoader::parse(milliamp), Daq::ConfigurationError);
}

TEST(TestConfigLoader, SLEEP_TIME_ALIAS)
{
    std::string text(EXAMPLE_CONFIG);
    text.replace(text.find("sleepTime"), 9, "sleep_time");
    AcquisitionConfig config = ConfigLoader::parse(text);
    EXPECT_DOUBLE_EQ(0.002, config.pollIntervalSeconds);
}

TEST(TestConfigLoader, COMMENTS)
{
    const std::string text =
        "# header comment\n"
        "{\n"
        "  \"boardnum\": 2, // trailing\n"
        "  /* block\n"
        "     comment */\n"
        "  \"DACrange\": 10,\n"
        "  \"ADCmode\": \"single_ended\", # hash comment\n"
        "  \"ADCpolarity\": \"unipolar\",\n"
        "  \"ADCrange\": 1,\n"
        "  \"DOutPort\": \"AUXPORT\",\n"
        "  \"DInPort\": \"SECONDPORTA\",\n"
        "  \"sleepTime\": 0\n"
        "}\n";

    AcquisitionConfig config = ConfigLoader::parse(text);
    EXPECT_EQ(2, config.boardNumber);
    EXPECT_EQ(RangeId::Uni10Volts, config.dacRangeId);
    EXPECT_EQ(AdcMode::SingleEnded, config.adcMode);
    EXPECT_EQ(RangeId::Uni1Volts, config.adcRangeId);
    EXPECT_EQ(DigitalPort::AuxPort, config.digitalOutputPort);
    EXPECT_EQ(DigitalPort::SecondPortA, config.digitalInputPort);
    EXPECT_DOUBLE_EQ(0.0, config.pollIntervalSeconds);
}

TEST(TestConfigLoader, STRIP_COMMENTS_KEEPS_STRINGS)
{
    EXPECT_EQ("{\"a\": \"x#y//z\"} ", ConfigLoader::stripComments("{\"a\": \"x#y//z\"} # tail"));
    EXPECT_EQ("{\"a\": \"q\\\"#\"}\n", ConfigLoader::stripComments("{\"a\": \"q\\\"#\"}// c\n"));
    EXPECT_EQ("{\n}", ConfigLoader::stripComments("{/* a\n b */}"));
    EXPECT_THROW(ConfigLoader::stripComments("{ /* open"), Daq::ConfigurationError);
}

TEST(TestConfigLoader, MALFORMED)
{
    EXPECT_THROW(ConfigLoader::parse("{ \"boardnum\": 0, "), Daq::ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse("[1, 2, 3]"), Daq::ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse(""), Daq::ConfigurationError);
}

TEST(TestConfigLoader, LOAD_FILE)
{
    // 測試在 source tree 根目錄執行
    AcquisitionConfig fromFile = ConfigLoader::load("config/daq-default.json");
    AcquisitionConfig defaults = ConfigLoader::defaults();

    EXPECT_EQ(defaults.boardNumber, fromFile.boardNumber);
    EXPECT_EQ(defaults.dacRangeId, fromFile.dacRangeId);
    EXPECT_EQ(defaults.adcMode, fromFile.adcMode);
    EXPECT_EQ(defaults.adcRangeId, fromFile.adcRangeId);
    EXPECT_EQ(defaults.digitalOutputPort, fromFile.digitalOutputPort);
    EXPECT_EQ(defaults.digitalInputPort, fromFile.digitalInputPort);
    EXPECT_DOUBLE_EQ(defaults.pollIntervalSeconds, fromFile.pollIntervalSeconds);

    EXPECT_THROW(ConfigLoader::load("config/does-not-exist.json"), Daq::ConfigurationError);
}

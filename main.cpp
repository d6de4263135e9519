/**
 * @file main.cpp
 * @brief mccdaq 命令列工具：依設定檔開啟板卡並執行單次 I/O 或 scan
 */
#include <csignal>
#include <stdexcept>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "utils/ConfigLoader.hpp"
#include "utils/DaqEnums.hpp"
#include "daq/AcquisitionSession.hpp"
#include "daq/DaqError.hpp"
#ifdef _WIN32
#include "daq/CbwDriver.hpp"
#else
#include "daq/UldaqDriver.hpp"
#endif

volatile sig_atomic_t g_stop = 0;
void signal_handler(int) { g_stop = 1; }

namespace
{
    void PrintUsage()
    {
        std::cerr << "Usage: mccdaq [--config FILE] <command> [args]\n"
                  << "  list                                   list DAQ devices and ranges\n"
                  << "  ain <ch>                               read one analog input\n"
                  << "  aout <ch> <volts>                      write one analog output\n"
                  << "  din [port]                             read a digital port\n"
                  << "  dout <bits> [port]                     write a digital port\n"
                  << "  dbit <bit> <0|1> [port]                write one digital bit\n"
                  << "  scan <low> <high> <rate> <samples> [timeout]\n"
                  << "                                         hardware paced analog input scan"
                  << std::endl;
    }

    std::unique_ptr<Daq::DaqDriver> CreateDriver()
    {
#ifdef _WIN32
        return std::unique_ptr<Daq::DaqDriver>(new Daq::CbwDriver());
#else
        return std::unique_ptr<Daq::DaqDriver>(new Daq::UldaqDriver());
#endif
    }

    int ToInt(const std::string &text, const char *what)
    {
        size_t used = 0;
        int value = 0;
        try
        {
            value = std::stoi(text, &used, 0);
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
        }
        if (used != text.size())
            throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
        return value;
    }

    double ToDouble(const std::string &text, const char *what)
    {
        size_t used = 0;
        double value = 0.0;
        try
        {
            value = std::stod(text, &used);
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
        }
        if (used != text.size())
            throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
        return value;
    }

    Utils::DigitalPort ToPort(const std::string &text)
    {
        Utils::DigitalPort port;
        if (!Utils::ParseDigitalPort(text, port))
            throw std::invalid_argument("unknown digital port: " + text);
        return port;
    }

    void RequireArgs(const std::vector<std::string> &args, size_t count)
    {
        if (args.size() < count)
            throw std::invalid_argument("missing arguments for '" + args[0] + "'");
    }

    std::string RangeNames(const std::vector<Utils::RangeId> &ranges)
    {
        if (ranges.empty())
            return "-";
        std::string text;
        for (size_t i = 0; i < ranges.size(); i++)
            text += (i ? " " : "") + Utils::ToString(ranges[i]);
        return text;
    }

    int ListDevices()
    {
        std::unique_ptr<Daq::DaqDriver> driver = CreateDriver();
        std::vector<Daq::DeviceDescriptor> devices = driver->ListDevices();
        std::cout << "Found " << devices.size() << " DAQ device(s):" << std::endl;
        for (size_t i = 0; i < devices.size(); i++)
        {
            std::cout << "    [" << i << "] " << devices[i].productName << " (" << devices[i].uniqueId << ")" << std::endl;

            // 列出板卡支援的量程，方便對照設定檔的 ADCrange / DACrange
            try
            {
                driver->Open(static_cast<int>(i));
                std::cout << "        AI differential: " << RangeNames(driver->AiRanges(Utils::AdcMode::Differential)) << std::endl;
                std::cout << "        AI single_ended: " << RangeNames(driver->AiRanges(Utils::AdcMode::SingleEnded)) << std::endl;
                std::cout << "        AO:              " << RangeNames(driver->AoRanges()) << std::endl;
            }
            catch (const Daq::DaqError &e)
            {
                std::cerr << "[CLI] Cannot query ranges of board " << i << ": " << e.what() << std::endl;
            }
            driver->Close();
        }
        return devices.empty() ? 1 : 0;
    }

    int RunCommand(Daq::AcquisitionSession &session, const std::vector<std::string> &args)
    {
        const std::string &cmd = args[0];
        const Utils::AcquisitionConfig &config = session.GetConfig();

        if (cmd == "ain")
        {
            RequireArgs(args, 2);
            double value = session.ReadAnalogInput(ToInt(args[1], "channel"));
            std::cout << std::fixed << std::setprecision(6) << value << std::endl;
        }
        else if (cmd == "aout")
        {
            RequireArgs(args, 3);
            session.WriteAnalogOutput(ToInt(args[1], "channel"), ToDouble(args[2], "voltage"));
        }
        else if (cmd == "din")
        {
            Utils::DigitalPort port = args.size() > 1 ? ToPort(args[1]) : config.digitalInputPort;
            std::cout << "0x" << std::hex << session.ReadDigital(port) << std::dec << std::endl;
        }
        else if (cmd == "dout")
        {
            RequireArgs(args, 2);
            Utils::DigitalPort port = args.size() > 2 ? ToPort(args[2]) : config.digitalOutputPort;
            session.WriteDigital(port, static_cast<uint64_t>(ToInt(args[1], "bits")));
        }
        else if (cmd == "dbit")
        {
            RequireArgs(args, 3);
            Utils::DigitalPort port = args.size() > 3 ? ToPort(args[3]) : config.digitalOutputPort;
            session.WriteDigitalBit(port, ToInt(args[1], "bit"), ToInt(args[2], "value") != 0);
        }
        else if (cmd == "scan")
        {
            RequireArgs(args, 5);
            double timeout = args.size() > 5 ? ToDouble(args[5], "timeout") : -1.0;
            Daq::ScanData data = session.AcquireScan(ToInt(args[1], "low channel"),
                                                     ToInt(args[2], "high channel"),
                                                     ToDouble(args[3], "rate"),
                                                     ToInt(args[4], "samples"),
                                                     timeout,
                                                     []() { return g_stop != 0; });
            std::cout << std::fixed << std::setprecision(6);
            for (int row = 0; row < data.rows; row++)
            {
                for (int ch = 0; ch < data.channelCount; ch++)
                    std::cout << (ch ? "\t" : "") << data.At(row, ch);
                std::cout << "\n";
            }
            std::cout << std::flush;
            std::cerr << "[CLI] " << data.completedScans << " scan(s) completed" << std::endl;
        }
        else
        {
            throw std::invalid_argument("unknown command: " + cmd);
        }
        return 0;
    }
}

int main(int argc, char *argv[])
{
    signal(SIGINT, signal_handler);

    std::string configFile;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc)
            configFile = argv[++i];
        else if (arg == "-h" || arg == "--help")
        {
            PrintUsage();
            return 0;
        }
        else
            args.push_back(arg);
    }

    if (args.empty())
    {
        PrintUsage();
        return 1;
    }

    try
    {
        if (args[0] == "list")
            return ListDevices();

        Utils::AcquisitionConfig config =
            configFile.empty() ? Utils::ConfigLoader::defaults() : Utils::ConfigLoader::load(configFile);

        Daq::AcquisitionSession session(config, CreateDriver());
        session.Open();
        int ret = RunCommand(session, args);
        session.Close();
        return ret;
    }
    catch (const Daq::DaqError &e)
    {
        std::cerr << "[CLI] " << e.what() << std::endl;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "[CLI] " << e.what() << std::endl;
        PrintUsage();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[CLI] Unexpected error: " << e.what() << std::endl;
    }
    return 1;
}

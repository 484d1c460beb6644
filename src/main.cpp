#include <iostream>
#include "logger.hpp"
#include "legato_pump.hpp"
#include "parameter_validator.hpp"
#include "pump_config.hpp"
#include "pump_errors.hpp"
#include "reply_parser.hpp"
#include <string>
#include <vector>

namespace
{
    struct RateAction
    {
        RunDirection direction = INFUSE;
        bool symbolic = false;
        RateBound bound = RATE_MIN;
        int64_t rate = 0;
        std::string unit;
    };

    // DIR:min | DIR:max | DIR:VALUE:UNIT
    RateAction parseRateAction(const std::string &text)
    {
        std::vector<std::string> parts = splitOn(text, ":");
        if (parts.size() < 2)
        {
            throw ValidationError("invalid --rate value: " + text);
        }
        RateAction action;
        action.direction = ParameterValidator::parseRunDirection(parts[0]);
        if (parts[1] == "min" || parts[1] == "max")
        {
            if (parts.size() != 2)
            {
                throw ValidationError("for 'min' or 'max' flow rate, do not give a unit");
            }
            action.symbolic = true;
            action.bound = parts[1] == "min" ? RATE_MIN : RATE_MAX;
            return action;
        }
        if (parts.size() != 3 || !parseInt64(parts[1], action.rate))
        {
            throw ValidationError("flow rate must be an integer with a unit: " + text);
        }
        action.unit = parts[2];
        return action;
    }

    void printSnapshot(const PumpSnapshot &s)
    {
        std::cout << "Syringe pump:        " << s.version << std::endl;
        std::cout << "Syringe type:        " << s.syringe_type << std::endl;
        std::cout << "Target volume:       " << s.target_volume << std::endl;
        std::cout << "Run direction:       " << runDirectionToString(s.run_direction) << std::endl;
        std::cout << "Flow rate:           " << (s.run_direction == WITHDRAW ? s.withdraw_rate : s.infuse_rate) << std::endl;
        std::cout << "Estimated time (s):  "
                  << (s.run_direction == WITHDRAW ? s.withdraw_run_time_s : s.infuse_run_time_s) << std::endl;
        std::cout << "Running:             " << (s.running ? "yes" : "no") << std::endl;
    }
}

// 显示帮助信息
void showHelp(const char *programName) {
    std::cout << "用法: " << programName << " [选项]" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  --config=FILE           JSON 配置文件" << std::endl;
    std::cout << "  --port=DEVICE           串口设备 (默认: /dev/ttyACM0)" << std::endl;
    std::cout << "  --log-level=LEVEL       设置日志级别 (trace, debug, info, warn, error, critical)" << std::endl;
    std::cout << "  --log-file=FILE         设置日志文件名 (默认: legato_pump.log)" << std::endl;
    std::cout << "  --console-only          只输出日志到控制台" << std::endl;
    std::cout << "  --file-only             只输出日志到文件" << std::endl;
    std::cout << "  --rate=DIR:min|max      把流量设为限值 (DIR: withdraw, infuse)" << std::endl;
    std::cout << "  --rate=DIR:VALUE:UNIT   设置整数流量，例如 infuse:9:ul/min" << std::endl;
    std::cout << "  --volume=VALUE:UNIT     设置目标体积，例如 1:ul" << std::endl;
    std::cout << "  --direction=DIR         设置运行方向" << std::endl;
    std::cout << "  --run                   运行当前程序" << std::endl;
    std::cout << "  --no-block              运行后不等待完成" << std::endl;
    std::cout << "  --stop                  停止运行" << std::endl;
    std::cout << "  --help, -h              显示帮助信息" << std::endl;
}

int main(int argc, char *argv[]) {
    std::string configFile;
    std::string port;
    std::string logLevelName;
    std::string logFile;
    bool consoleOnly = false;
    bool fileOnly = false;

    std::vector<RateAction> rateActions;
    bool setVolume = false;
    double volume = 0.0;
    std::string volumeUnit;
    bool setDirection = false;
    RunDirection direction = INFUSE;
    bool doRun = false;
    bool block = true;
    bool doStop = false;

    // 解析命令行参数
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                showHelp(argv[0]);
                return 0;
            }

            if (arg.find("--config=") == 0) {
                configFile = arg.substr(9);
            }
            else if (arg.find("--port=") == 0) {
                port = arg.substr(7);
            }
            else if (arg.find("--log-level=") == 0) {
                logLevelName = arg.substr(12);
            }
            else if (arg.find("--log-file=") == 0) {
                logFile = arg.substr(11);
            }
            else if (arg == "--console-only") {
                consoleOnly = true;
                fileOnly = false;
            }
            else if (arg == "--file-only") {
                fileOnly = true;
                consoleOnly = false;
            }
            else if (arg.find("--rate=") == 0) {
                rateActions.push_back(parseRateAction(arg.substr(7)));
            }
            else if (arg.find("--volume=") == 0) {
                std::vector<std::string> parts = splitOn(arg.substr(9), ":");
                if (parts.size() != 2 || !parseDouble(parts[0], volume)) {
                    throw ValidationError("invalid --volume value: " + arg.substr(9));
                }
                volumeUnit = parts[1];
                setVolume = true;
            }
            else if (arg.find("--direction=") == 0) {
                direction = ParameterValidator::parseRunDirection(arg.substr(12));
                setDirection = true;
            }
            else if (arg == "--run") {
                doRun = true;
            }
            else if (arg == "--no-block") {
                block = false;
            }
            else if (arg == "--stop") {
                doStop = true;
            }
            else {
                std::cerr << "未知选项: " << arg << std::endl;
                showHelp(argv[0]);
                return 1;
            }
        }
    }
    catch (const ValidationError &e) {
        std::cerr << "参数错误: " << e.what() << std::endl;
        showHelp(argv[0]);
        return 1;
    }

    PumpConfig config;
    try {
        if (!configFile.empty()) {
            config = PumpConfig::loadFromFile(configFile);
        }
        if (!port.empty()) {
            config.port = port;
        }
        if (!logLevelName.empty()) {
            config.log_level = logLevelName;
        }
        if (!logFile.empty()) {
            config.log_file = logFile;
        }
        config.validate();
    }
    catch (const ValidationError &e) {
        std::cerr << "配置错误: " << e.what() << std::endl;
        return 1;
    }

    LegatoLogger::LogLevel logLevel = LegatoLogger::LogLevel::INFO;
    if (!LegatoLogger::levelFromString(config.log_level, logLevel)) {
        std::cerr << "无效的日志级别: " << config.log_level << std::endl;
        return 1;
    }

    // 初始化日志系统
    LegatoLogger::init(config.log_file, logLevel, 1048576 * 5, 3, consoleOnly, fileOnly);
    LegatoLogger::info("注射泵控制程序启动");
    LegatoLogger::info("当前日志级别: {}", LegatoLogger::levelToString(logLevel));
    LegatoLogger::debug("日志配置 - 文件: {}, 仅控制台: {}, 仅文件: {}",
                        config.log_file, consoleOnly ? "是" : "否", fileOnly ? "是" : "否");

    try {
        LegatoPump pump(config);

        for (const auto &action : rateActions) {
            if (action.symbolic) {
                pump.setFlowRate(action.direction, action.bound);
            } else {
                pump.setFlowRate(action.direction, action.rate, action.unit);
            }
        }
        if (setVolume) {
            pump.setTargetVolume(volume, volumeUnit);
        }
        if (setDirection) {
            pump.setRunDirection(direction);
        }
        if (doRun) {
            pump.estimateRunTime();
            pump.run(block);
        }
        if (doStop) {
            pump.stop();
        }

        printSnapshot(pump.snapshot());
        pump.close();
    }
    catch (const ConnectivityError &e) {
        LegatoLogger::error("无法连接注射泵: {}", e.what());
        LegatoLogger::flush();
        return 2;
    }
    catch (const ValidationError &e) {
        LegatoLogger::error("参数错误: {}", e.what());
        LegatoLogger::flush();
        return 3;
    }
    catch (const std::exception &e) {
        LegatoLogger::critical("程序运行时出现异常: {}", e.what());
        LegatoLogger::flush();
        return 4;
    }

    LegatoLogger::info("程序已退出");
    LegatoLogger::flush();
    return 0;
}

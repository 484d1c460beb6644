#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace LegatoLogger {

// 日志级别
enum LogLevel {
    TRACE = spdlog::level::trace,
    DEBUG = spdlog::level::debug,
    INFO = spdlog::level::info,
    WARN = spdlog::level::warn,
    ERROR = spdlog::level::err,
    CRITICAL = spdlog::level::critical,
    OFF = spdlog::level::off
};

// 将日志级别转换为字符串
inline std::string levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
        default: return "unknown";
    }
}

/**
 * @brief 将字符串解析为日志级别
 * @param name 级别名称 (trace, debug, info, warn, error, critical, off)
 * @param level 输出的日志级别
 * @return 是否识别成功
 */
inline bool levelFromString(const std::string& name, LogLevel& level) {
    static const std::vector<std::pair<std::string, LogLevel>> levels = {
            {"trace",    LogLevel::TRACE},
            {"debug",    LogLevel::DEBUG},
            {"info",     LogLevel::INFO},
            {"warn",     LogLevel::WARN},
            {"error",    LogLevel::ERROR},
            {"critical", LogLevel::CRITICAL},
            {"off",      LogLevel::OFF}
    };
    for (const auto& entry : levels) {
        if (entry.first == name) {
            level = entry.second;
            return true;
        }
    }
    return false;
}

/**
 * @brief 将串口收发的原始字节转为可读形式
 *
 * 回车、换行和其他控制字符以转义形式输出，例如 "\nT*" -> "\\nT*"。
 */
inline std::string escapeBytes(const std::string& bytes) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size());
    for (unsigned char c : bytes) {
        switch (c) {
            case '\r': out += "\\r"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    out += "\\x";
                    out += hex[c >> 4];
                    out += hex[c & 0x0f];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

// 初始化日志系统
inline void init(const std::string& log_file = "legato_pump.log",
                LogLevel level = LogLevel::INFO,
                size_t max_file_size = 1048576 * 5,
                size_t max_files = 3,
                bool console_only = false,
                bool file_only = false) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!file_only) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(console_sink);
        }

        if (!console_only) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_file_size, max_files);
            file_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(file_sink);
        }

        // 两个选项同时关闭时仍保留控制台输出
        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("legato_logger", sinks.begin(), sinks.end());
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "日志初始化失败: " << ex.what() << std::endl;
    }
}

inline void trace(const std::string& msg) { spdlog::trace(msg); }
inline void debug(const std::string& msg) { spdlog::debug(msg); }
inline void info(const std::string& msg) { spdlog::info(msg); }
inline void warn(const std::string& msg) { spdlog::warn(msg); }
inline void error(const std::string& msg) { spdlog::error(msg); }
inline void critical(const std::string& msg) { spdlog::critical(msg); }

// 支持格式化日志
template<typename... Args>
inline void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::trace(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::debug(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::info(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::warn(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::error(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::critical(fmt, std::forward<Args>(args)...);
}

// 串口收发跟踪，仅在 trace 级别输出
inline void wire(const std::string& device, const char* direction, const std::string& bytes) {
    if (spdlog::should_log(spdlog::level::trace)) {
        spdlog::trace("{}: {} \"{}\"", device, direction, escapeBytes(bytes));
    }
}

inline void flush() {
    spdlog::default_logger()->flush();
}

} // namespace LegatoLogger

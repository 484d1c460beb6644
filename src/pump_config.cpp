#include "pump_config.hpp"
#include "logger.hpp"
#include "parameter_validator.hpp"
#include "posix_serial_link.hpp"
#include "pump_errors.hpp"
#include <fstream>
#include <iomanip>

PumpConfig PumpConfig::loadFromFile(const std::string &file_name)
{
    std::ifstream ifs(file_name);
    if (!ifs.is_open())
    {
        throw ValidationError("Failed to open config file: " + file_name);
    }

    json j;
    try
    {
        ifs >> j;
    }
    catch (const json::parse_error &e)
    {
        throw ValidationError("Invalid JSON in " + file_name + ": " + e.what());
    }

    PumpConfig config = loadFromJson(j);
    LegatoLogger::info("已加载配置文件: {}", file_name);
    return config;
}

PumpConfig PumpConfig::loadFromJson(const json &j)
{
    if (!j.is_object())
    {
        throw ValidationError("config must be a JSON object");
    }

    PumpConfig config;
    try
    {
        config.name = j.value("name", config.name);
        config.port = j.value("port", config.port);
        config.baud = j.value("baud", config.baud);
        config.timeout_ms = j.value("timeout_ms", config.timeout_ms);
        config.model_prefix = j.value("model_prefix", config.model_prefix);
        if (j.contains("footswitch_mode"))
        {
            config.footswitch_mode = ParameterValidator::parseFootswitchMode(j["footswitch_mode"].get<std::string>());
        }
        config.force_pct = j.value("force_pct", config.force_pct);
        config.direction_settle_ms = j.value("direction_settle_ms", config.direction_settle_ms);
        config.log_file = j.value("log_file", config.log_file);
        config.log_level = j.value("log_level", config.log_level);
    }
    catch (const json::type_error &e)
    {
        throw ValidationError(std::string("wrong type in config: ") + e.what());
    }

    config.validate();
    return config;
}

json PumpConfig::toJson() const
{
    json j;
    j["name"] = name;
    j["port"] = port;
    j["baud"] = baud;
    j["timeout_ms"] = timeout_ms;
    j["model_prefix"] = model_prefix;
    j["footswitch_mode"] = footswitchModeToString(footswitch_mode);
    j["force_pct"] = force_pct;
    j["direction_settle_ms"] = direction_settle_ms;
    j["log_file"] = log_file;
    j["log_level"] = log_level;
    return j;
}

void PumpConfig::saveToFile(const std::string &file_name) const
{
    std::ofstream ofs(file_name);
    if (!ofs.is_open())
    {
        throw ValidationError("Failed to write config file: " + file_name);
    }
    ofs << std::setw(4) << toJson() << std::endl;
}

void PumpConfig::validate() const
{
    if (port.empty())
    {
        throw ValidationError("config: port must not be empty");
    }
    if (!PosixSerialLink::isSupportedBaud(baud))
    {
        throw ValidationError("config: unsupported baud rate " + std::to_string(baud));
    }
    if (timeout_ms <= 0)
    {
        throw ValidationError("config: timeout_ms must be positive");
    }
    if (model_prefix.empty())
    {
        throw ValidationError("config: model_prefix must not be empty");
    }
    ParameterValidator::validateForce(force_pct);
    if (direction_settle_ms < 0)
    {
        throw ValidationError("config: direction_settle_ms must not be negative");
    }
    LegatoLogger::LogLevel level;
    if (!LegatoLogger::levelFromString(log_level, level))
    {
        throw ValidationError("config: unknown log level " + log_level);
    }
}

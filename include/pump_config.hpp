#ifndef PUMP_CONFIG_HPP
#define PUMP_CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "pump_common.hpp"

using json = nlohmann::json;

/**
 * @brief 驱动配置，可从 JSON 文件加载，缺少的键保留默认值
 */
struct PumpConfig
{
    std::string name = "Legato110";          // 日志和异常中的设备名
    std::string port = "/dev/ttyACM0";       // 串口设备
    int baud = 115200;
    int timeout_ms = 1000;                   // 普通命令的读超时
    std::string model_prefix = "Legato 110"; // ver 应答必须以此开头

    // 设备相关的安全默认值
    FootswitchMode footswitch_mode = FOOTSWITCH_FALL; // 5V TTL 下降沿触发 run
    int force_pct = 50;                               // 适用于玻璃注射器

    int direction_settle_ms = 200; // 切换方向后设备需要的额外时间

    std::string log_file = "legato_pump.log";
    std::string log_level = "info";

    /**
     * @brief 从文件加载
     * @throws ValidationError 文件无法打开、JSON 无效或取值非法
     */
    static PumpConfig loadFromFile(const std::string &file_name);

    /**
     * @brief 从 JSON 对象加载
     * @throws ValidationError 取值非法
     */
    static PumpConfig loadFromJson(const json &j);

    json toJson() const;

    void saveToFile(const std::string &file_name) const;

    /**
     * @brief 检查取值范围
     * @throws ValidationError
     */
    void validate() const;
};

#endif // PUMP_CONFIG_HPP

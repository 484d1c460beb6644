// 存储泵的提示符、运行状态和参数类型
#ifndef PUMP_COMMON_HPP
#define PUMP_COMMON_HPP
#include <stdint.h>
#include <string>
#include <vector>

/**
 * @brief 泵在每次应答末尾附带的提示符
 */
enum PumpPrompt
{
    PROMPT_IDLE,           // ':' 空闲
    PROMPT_INFUSING,       // '>' 正在注射
    PROMPT_WITHDRAWING,    // '<' 正在抽取
    PROMPT_STALLED,        // '*' 电机堵转
    PROMPT_TARGET_REACHED, // 'T*' 已达到目标体积
};

/**
 * @brief 运行生命周期状态
 */
enum RunState
{
    RUN_IDLE,           // 未运行
    RUN_RUNNING,        // 已发送 run 命令，等待完成
    RUN_PENDING_FINISH, // 正在等待完成提示符（内部瞬态）
};

enum RunDirection
{
    WITHDRAW,
    INFUSE,
};

enum FootswitchMode
{
    FOOTSWITCH_MOMENTARY, // "mom"  -> "Momentary"
    FOOTSWITCH_RISE,      // "rise" -> "Active high"
    FOOTSWITCH_FALL,      // "fall" -> "Active low"
};

/**
 * @brief 符号化流量请求，对应设备报告的限值
 */
enum RateBound
{
    RATE_MIN,
    RATE_MAX,
};

/**
 * @brief 一个方向上的流量限值
 */
struct RateLimits
{
    std::string raw;       // 设备原始应答，例如 "1.14 nl/min to 1.5 ml/min"
    double min = 0.0;      // 下限数值（min_unit 单位）
    std::string min_unit;
    double max = 0.0;      // 上限数值（max_unit 单位）
    std::string max_unit;
    int64_t min_plps = 0;  // 下限 (pl/s)
    int64_t max_plps = 0;  // 上限 (pl/s)
};

/**
 * @brief status 命令的解析结果
 */
struct PumpStatus
{
    int64_t rate_flps = 0;       // 当前流量 (fl/s)
    int64_t time_ms = 0;         // 运行时间 (ms)
    int64_t volume_fl = 0;       // 已输送体积 (fl)
    char motor_direction = ' ';
    char limit_switch = ' ';
    char stall = ' ';
    char trigger_input = ' ';
    char direction_port = ' ';
    char target_reached = ' ';
};

/**
 * @brief 提供给前端显示的只读快照
 */
struct PumpSnapshot
{
    std::string version;
    std::vector<std::string> version_long;
    std::string syringe_type;
    std::string target_volume;        // 设备原始字符串
    bool target_volume_set = false;
    double target_volume_pl = 0.0;
    RunDirection run_direction = INFUSE;
    std::string withdraw_rate;
    std::string infuse_rate;
    int64_t withdraw_rate_plps = 0;
    int64_t infuse_rate_plps = 0;
    RateLimits withdraw_limits;
    RateLimits infuse_limits;
    int force_pct = 0;
    FootswitchMode footswitch_mode = FOOTSWITCH_FALL;
    double withdraw_run_time_s = 0.0;
    double infuse_run_time_s = 0.0;
    bool running = false;
};

std::string runDirectionToString(RunDirection direction);
std::string footswitchModeToString(FootswitchMode mode);

#endif // PUMP_COMMON_HPP

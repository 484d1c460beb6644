#ifndef PARAMETER_VALIDATOR_HPP
#define PARAMETER_VALIDATOR_HPP

#include <stdint.h>
#include <string>
#include "pump_common.hpp"

/**
 * @brief 参数检查与限值约束，在任何数据发往设备之前执行
 *
 * 所有检查失败均抛出 ValidationError。
 */
class ParameterValidator
{
public:
    /**
     * @brief "withdraw" / "infuse"
     */
    static RunDirection parseRunDirection(const std::string &text);

    /**
     * @brief "mom" / "rise" / "fall"
     */
    static FootswitchMode parseFootswitchMode(const std::string &text);

    /**
     * @brief 力度百分比必须在 [1, 100]
     */
    static void validateForce(int force_pct);

    /**
     * @brief 体积不能为零，单位必须是 ml/ul/nl/pl
     */
    static void validateVolume(double volume, const std::string &unit);

    /**
     * @brief 流量不能为零，单位必须在流量单位表中
     */
    static void validateRate(int64_t rate, const std::string &unit);

    /**
     * @brief 把 min/max 请求换成整数流量和单位
     *
     * 限值不是整数时改用更小的体积单位表示（1.14 nl/min -> 1140 pl/min），
     * 到 pl 仍不是整数时，下限向上取整、上限向下取整，保证结果在限值内。
     */
    static void resolveRateBound(RateBound bound, const RateLimits &limits, int64_t &rate, std::string &unit);

    /**
     * @brief 检查流量是否在限值内
     * @return 换算后的 pl/s
     * @throws ValidationError 超出限值，信息中给出越过的边界
     */
    static int64_t checkRateWithinLimits(RunDirection direction, int64_t rate, const std::string &unit,
                                         const RateLimits &limits);

    /**
     * @brief 解析 "wrate lim" / "irate lim" 的应答，例如 "1.14 nl/min to 1.5 ml/min"
     * @throws ProtocolViolation 应答格式不符
     */
    static RateLimits parseRateLimits(const std::string &raw);
};

#endif // PARAMETER_VALIDATOR_HPP

#ifndef UNIT_CONVERTER_HPP
#define UNIT_CONVERTER_HPP

#include <stdint.h>
#include <string>
#include <vector>

/**
 * @brief 设备单位与内部规范单位之间的换算
 *
 * 流量的规范单位为 pl/s，体积的规范单位为 pl。
 * 流量换算结果四舍五入为整数，避免多次往返换算累积浮点误差。
 */
class UnitConverter
{
public:
    /**
     * @brief 复合流量单位，例如 "ul/min"
     */
    struct RateUnit
    {
        const char *name;
        int64_t pl_per_volume;    // 每个体积单位对应的 pl
        int64_t seconds_per_time; // 每个时间单位对应的秒数
    };

    /**
     * @brief 体积单位，例如 "ul"
     */
    struct VolumeUnit
    {
        const char *name;
        int64_t pl;
    };

    /**
     * @brief 换算流量到 pl/s
     * @param value 流量数值
     * @param unit 流量单位，必须在单位表中
     * @return 四舍五入后的 pl/s
     * @throws ValidationError 未知单位
     */
    static int64_t toCanonicalRate(double value, const std::string &unit);

    /**
     * @brief 把 pl/s 换算回指定单位
     */
    static double fromCanonicalRate(int64_t plps, const std::string &unit);

    /**
     * @brief 换算体积到 pl，保留小数部分
     * @throws ValidationError 未知单位
     */
    static double toCanonicalVolume(double value, const std::string &unit);

    static bool isRateUnit(const std::string &unit);
    static bool isVolumeUnit(const std::string &unit);

    static std::vector<std::string> rateUnits();
    static std::vector<std::string> volumeUnits();

    /**
     * @brief 取同一时间单位下更小一级体积单位，例如 "ml/min" -> "ul/min"
     * @return 已经是 pl 时返回 false
     */
    static bool finerRateUnit(const std::string &unit, std::string &finer);

    /**
     * @brief 检查流量单位表覆盖全部 体积 x 时间 组合且没有重复
     * @throws InvariantViolation 单位表不完整
     */
    static void verifyUnitTables();

private:
    static const RateUnit *findRateUnit(const std::string &unit);
    static const VolumeUnit *findVolumeUnit(const std::string &unit);
};

#endif // UNIT_CONVERTER_HPP

#ifndef REPLY_PARSER_HPP
#define REPLY_PARSER_HPP

#include <stdint.h>
#include <string>
#include <vector>

/**
 * @brief 去掉首尾空白字符（空格、\r、\n、\t）
 */
std::string strip(const std::string &text);

/**
 * @brief 按空白字符切分
 */
std::vector<std::string> splitWhitespace(const std::string &text);

/**
 * @brief 按分隔串切分，例如 "a to b" 按 " to " 切分
 */
std::vector<std::string> splitOn(const std::string &text, const std::string &separator);

/**
 * @brief 把整个字符串解析为数值，有多余字符时返回 false
 */
bool parseDouble(const std::string &text, double &value);
bool parseInt64(const std::string &text, int64_t &value);

/**
 * @brief 以定点小数输出数值，去掉末尾的零，不使用指数形式
 * @param decimals 最多保留的小数位数
 */
std::string formatDecimal(double value, int decimals = 9);

#endif // REPLY_PARSER_HPP

#ifndef PROMPT_HPP
#define PROMPT_HPP

#include <string>
#include "pump_common.hpp"

/**
 * @brief 提示符首字节为 'T' 时需要再读一个字节
 */
bool promptNeedsLookahead(char first);

/**
 * @brief 把提示符字节解码为泵状态
 * @param bytes 一个字节 (":" ">" "<" "*") 或两个字节 ("T*")
 * @param prompt 解码结果
 * @return 不在提示符字母表中时返回 false
 */
bool decodePrompt(const std::string &bytes, PumpPrompt &prompt);

/**
 * @brief 提示符原始字节，例如 PROMPT_TARGET_REACHED -> "T*"
 */
std::string promptToString(PumpPrompt prompt);

/**
 * @brief 提示符含义，用于日志
 */
std::string promptMessage(PumpPrompt prompt);

#endif // PROMPT_HPP

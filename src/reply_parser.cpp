#include "reply_parser.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

std::string strip(const std::string &text)
{
    const char *whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> splitWhitespace(const std::string &text)
{
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> splitOn(const std::string &text, const std::string &separator)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (true)
    {
        size_t pos = text.find(separator, start);
        if (pos == std::string::npos)
        {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

bool parseDouble(const std::string &text, double &value)
{
    try
    {
        size_t used = 0;
        double parsed = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(parsed))
        {
            return false;
        }
        value = parsed;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parseInt64(const std::string &text, int64_t &value)
{
    try
    {
        size_t used = 0;
        long long parsed = std::stoll(text, &used);
        if (used != text.size())
        {
            return false;
        }
        value = static_cast<int64_t>(parsed);
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

std::string formatDecimal(double value, int decimals)
{
    std::string text = fmt::format("{:.{}f}", value, decimals);
    if (text.find('.') != std::string::npos)
    {
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.')
        {
            text.pop_back();
        }
    }
    if (text == "-0")
    {
        text = "0";
    }
    return text;
}

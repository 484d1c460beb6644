#include "prompt.hpp"

namespace
{
    struct PromptEntry
    {
        const char *bytes;
        PumpPrompt prompt;
        const char *message;
    };

    const PromptEntry kPromptTable[] = {
        {":", PROMPT_IDLE, "The pump is idle"},
        {">", PROMPT_INFUSING, "The pump is infusing"},
        {"<", PROMPT_WITHDRAWING, "The pump is withdrawing"},
        {"*", PROMPT_STALLED, "The pump stalled"},
        {"T*", PROMPT_TARGET_REACHED, "The target was reached"},
    };
}

bool promptNeedsLookahead(char first)
{
    return first == 'T';
}

bool decodePrompt(const std::string &bytes, PumpPrompt &prompt)
{
    for (const auto &entry : kPromptTable)
    {
        if (bytes == entry.bytes)
        {
            prompt = entry.prompt;
            return true;
        }
    }
    return false;
}

std::string promptToString(PumpPrompt prompt)
{
    for (const auto &entry : kPromptTable)
    {
        if (entry.prompt == prompt)
        {
            return entry.bytes;
        }
    }
    return "?";
}

std::string promptMessage(PumpPrompt prompt)
{
    for (const auto &entry : kPromptTable)
    {
        if (entry.prompt == prompt)
        {
            return entry.message;
        }
    }
    return "Unknown prompt";
}

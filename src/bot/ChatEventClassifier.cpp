#include "brazier/ChatEvent.h"

#include <array>
#include <cctype>

namespace brazier {

namespace {

// Broadcast at the end of every round; letter case varies between messages.
constexpr std::string_view kRoundEndWord = "subdued";

constexpr std::string_view kBrazierOut    = "The brazier has gone out";
constexpr std::string_view kBrazierBroken = "The brazier is broken and shrapnel";

constexpr std::array<std::string_view, 2> kDamagePhrases = {
    "The cold of",
    "The freezing cold attack",
};

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix) noexcept
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool ContainsI(std::string_view haystack, std::string_view needle) noexcept
{
    if (needle.empty())
        return true;
    if (haystack.size() < needle.size())
        return false;

    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i)
    {
        std::size_t k = 0;
        for (; k < needle.size(); ++k)
        {
            const auto a = static_cast<unsigned char>(haystack[i + k]);
            const auto b = static_cast<unsigned char>(needle[k]);
            if (std::tolower(a) != std::tolower(b))
                break;
        }
        if (k == needle.size())
            return true;
    }
    return false;
}

} // namespace

const char* ChatEventName(ChatEvent e) noexcept
{
    switch (e)
    {
    case ChatEvent::None: return "none";
    case ChatEvent::RoundEnd: return "round-end";
    case ChatEvent::HazardSourceOut: return "brazier-out";
    case ChatEvent::HazardSourceBroken: return "brazier-broken";
    case ChatEvent::Damaged: return "damaged";
    }
    return "?";
}

ChatEvent MatchChatPhrase(std::string_view line) noexcept
{
    if (ContainsI(line, kRoundEndWord))
        return ChatEvent::RoundEnd;

    if (StartsWith(line, kBrazierOut))
        return ChatEvent::HazardSourceOut;

    if (StartsWith(line, kBrazierBroken))
        return ChatEvent::HazardSourceBroken;

    for (const auto phrase : kDamagePhrases)
    {
        if (StartsWith(line, phrase))
            return ChatEvent::Damaged;
    }

    return ChatEvent::None;
}

ChatClassification ClassifyChatLine(std::string_view rawLine, std::string_view lastSeenLine)
{
    ChatClassification out;
    if (rawLine.empty() || rawLine == lastSeenLine)
    {
        out.lastSeenLine = std::string(lastSeenLine);
        return out;
    }

    out.lastSeenLine = std::string(rawLine);
    out.event = MatchChatPhrase(rawLine);
    return out;
}

} // namespace brazier

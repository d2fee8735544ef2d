#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace brazier {

enum class ChatEvent : std::uint8_t
{
    None = 0,
    RoundEnd,
    HazardSourceOut,
    HazardSourceBroken,
    Damaged,
};

[[nodiscard]] const char* ChatEventName(ChatEvent e) noexcept;

struct ChatClassification
{
    ChatEvent   event = ChatEvent::None;
    std::string lastSeenLine;
};

// Classifies the newest chat line.
//
// Each distinct line is classified at most once: an empty line or a repeat of
// `lastSeenLine` yields None and leaves the memory untouched. Any other line
// replaces the memory, even when it matches no known phrase.
[[nodiscard]] ChatClassification ClassifyChatLine(std::string_view rawLine,
                                                  std::string_view lastSeenLine);

// Phrase matching only, without de-duplication.
[[nodiscard]] ChatEvent MatchChatPhrase(std::string_view line) noexcept;

} // namespace brazier

#pragma once

// Small wrappers around the game client shared by the controller, the
// production pipeline and the gear bootstrap. Every query here swallows a
// throwing collaborator and returns the documented safe default, so one bad
// sample never corrupts the round state.

#include "brazier/GameClient.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brazier::bot {

// nullopt on failure. An unreadable inventory is not an empty one: callers
// skip the decision instead of acting on zero counts.
[[nodiscard]] std::optional<std::vector<int>> SafeInventory(GameClient& c);

// false on failure.
[[nodiscard]] bool SafeInventoryFull(GameClient& c);

// "idle" on failure, so waits end instead of spinning.
[[nodiscard]] bool SafeIsIdle(GameClient& c);

// Empty line on failure (classifies as no event).
[[nodiscard]] std::string SafeChatLine(GameClient& c);

[[nodiscard]] bool SafeIsEquipped(GameClient& c, int itemId);

[[nodiscard]] bool SafeBankOpen(GameClient& c);

// Nearest tagged candidate, or nullopt when none is visible / the query fails.
[[nodiscard]] std::optional<Target> FindNearest(GameClient& c, TargetCategory category);

[[nodiscard]] bool AnyVisible(GameClient& c, TargetCategory category);

// Current mouseover text contains `action`.
[[nodiscard]] bool HoverShows(GameClient& c, std::string_view action);

// Moves onto the nearest tagged candidate. Logs a perception miss and backs
// off for `missBackoffSeconds` when nothing is tagged.
[[nodiscard]] std::optional<Target> HoverNearest(GameClient& c, TargetCategory category,
                                                 double missBackoffSeconds = 2.0);

// Opens the bank at the nearest tagged deposit point. Requires a
// "Bank"/"Use" mouseover before clicking.
[[nodiscard]] bool OpenBank(GameClient& c);

// Escape closes the bank panel.
void CloseBank(GameClient& c);

// Opens the bank search box and types `text` into it.
void SearchBank(GameClient& c, std::string_view text);

// First slot holding `itemId`.
[[nodiscard]] std::optional<int> FirstSlotOf(const std::vector<int>& inventory, int itemId);

} // namespace brazier::bot

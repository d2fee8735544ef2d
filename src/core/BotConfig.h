#pragma once

#include "brazier/Survival.h"

#include <filesystem>
#include <string>

namespace brazier::core {

// Operator options for one run. Every field is clamped on load, so the
// controller can use the values without further validation.
//
// Stored as JSON, e.g. brazier.json:
//   {
//     "version": 1,
//     "run":      { "minutes": 60, "takeBreaks": false, "seed": 0 },
//     "survival": { "strategy": "crafted", "damageThreshold": 3, "targetCount": 4,
//                   "lowWaterMark": 2, "stockedItemName": "Salmon" },
//     "gather":   { "convertEnabled": false },
//     "timing":   { "respawnSeconds": 60, "respawnMarginSeconds": 5, "roundSettleSeconds": 3 }
//   }
struct BotConfig
{
    int  runMinutes = 60;
    bool takeBreaks = false;
    unsigned seed = 0;

    SurvivalStrategy strategy = SurvivalStrategy::Crafted;

    // Damage events tolerated before eating/drinking.
    int damageThreshold = 3;

    // Stocked: food items to carry. Crafted: finished potions to keep on hand.
    int targetCount = 4;

    // Doses required to stay in the arena for another round.
    int lowWaterMark = 2;

    // Bank search text used when restocking food.
    std::string stockedItemName = "Salmon";

    // Fletch roots into kindling before feeding.
    bool convertEnabled = false;

    double respawnSeconds = 60.0;
    double respawnMarginSeconds = 5.0;
    double roundSettleSeconds = 3.0;
};

// Returns true if `path` existed and was parsed. On failure `out` is left
// unchanged (callers initialize defaults first). Never throws.
[[nodiscard]] bool LoadBotConfig(BotConfig& out, const std::filesystem::path& path) noexcept;

// Returns true on success.
[[nodiscard]] bool SaveBotConfig(const BotConfig& cfg, const std::filesystem::path& path) noexcept;

// Re-applies the clamping rules (used after command-line overrides).
void ClampBotConfig(BotConfig& cfg) noexcept;

} // namespace brazier::core

// include/brazier/Survival.h
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace brazier {

// Where the survival consumable comes from.
//   Stocked: food withdrawn from the bank before entering the arena.
//   Crafted: rejuvenation potions brewed inside the arena between rounds.
enum class SurvivalStrategy : std::uint8_t
{
    Stocked = 0,
    Crafted,
};

[[nodiscard]] const char* SurvivalStrategyName(SurvivalStrategy s) noexcept;
[[nodiscard]] std::optional<SurvivalStrategy> ParseSurvivalStrategy(std::string_view s) noexcept;

// Doses carried by one unit of `itemId` under `strategy` (0 if not a consumable).
[[nodiscard]] int DoseValue(int itemId, SurvivalStrategy strategy) noexcept;

// Dose value of a full unit: what one "finished unit" of the target is worth.
[[nodiscard]] int FullDoseValue(SurvivalStrategy strategy) noexcept;

// Sum over slots of DoseValue(). Linear in the inventory contents.
[[nodiscard]] int TotalDoses(std::span<const int> inventory, SurvivalStrategy strategy) noexcept;

[[nodiscard]] int CountItem(std::span<const int> inventory, int itemId) noexcept;

// Slot of the highest-value survival unit (first such slot on ties).
[[nodiscard]] std::optional<int> BestSurvivalUnitSlot(std::span<const int> inventory,
                                                      SurvivalStrategy strategy) noexcept;

// Per-decision snapshot of the inventory. Never cached across ticks.
struct ResourceState
{
    int  rawMaterial   = 0; // bruma roots
    int  intermediate  = 0; // bruma kindling
    int  survivalUnits = 0; // food items or potion units
    int  doses         = 0;
    int  containers    = 0; // unfinished potions
    int  ingredients   = 0; // bruma herbs
    int  freeSlots     = 0;
    bool inventoryFull = false;
    bool hasLoot       = false; // anything not protected
    int  rewardItems   = 0;     // loot other than roots and kindling
};

[[nodiscard]] ResourceState ReadResourceState(std::span<const int> inventory,
                                              bool inventoryFull,
                                              SurvivalStrategy strategy) noexcept;

enum class WarmthAction : std::uint8_t
{
    NoneNeeded = 0,
    Consume,
    Exhausted,
};

[[nodiscard]] const char* WarmthActionName(WarmthAction a) noexcept;

// Consume once `damageCounter` reaches `threshold`; Exhausted if nothing is
// left to consume at that point.
[[nodiscard]] WarmthAction ShouldDrinkOrEat(int damageCounter, int threshold, bool hasResource) noexcept;

} // namespace brazier

#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace brazier::items {

inline constexpr int kEmptySlot = -1;
inline constexpr int kInventorySlots = 28;

// Minigame materials
inline constexpr int kBrumaRoot     = 20695;
inline constexpr int kBrumaKindling = 20696;

// Round reward
inline constexpr int kSupplyCrate = 20703;

// Potion production
inline constexpr int kRejuvenationUnf = 20697;
inline constexpr int kBrumaHerb       = 20698;
inline constexpr int kRejuvenation4   = 20699;
inline constexpr int kRejuvenation3   = 20700;
inline constexpr int kRejuvenation2   = 20701;
inline constexpr int kRejuvenation1   = 20702;

// Tools
inline constexpr int kKnife     = 946;
inline constexpr int kTinderbox = 590;
inline constexpr int kHammer    = 2347;

inline constexpr std::array<int, 10> kAxes = {
    1351,  // bronze
    1349,  // iron
    1353,  // steel
    1361,  // black
    1355,  // mithril
    1357,  // adamant
    1359,  // rune
    6739,  // dragon
    13241, // infernal
    23673, // crystal
};

// Equipment that reduces cold damage.
inline constexpr std::array<int, 12> kWarmthItems = {
    20704, // pyromancer garb
    20706, // pyromancer robe
    20708, // pyromancer hood
    20710, // pyromancer boots
    20712, // warm gloves
    20714, // tome of fire
    20720, // bruma torch
    1050,  // santa hat
    6570,  // fire cape
    21295, // infernal cape
    9069,  // moonclan hat
    10069, // spotted cape
};

inline constexpr std::array<int, 9> kFood = {
    329,  // salmon
    333,  // trout
    361,  // tuna
    373,  // swordfish
    379,  // lobster
    385,  // shark
    1891, // cake
    1993, // jug of wine
    7946, // monkfish
};

struct DoseUnit
{
    int id = kEmptySlot;
    int doses = 0;
};

// Highest-dose unit first.
inline constexpr std::array<DoseUnit, 4> kPotionDoses = {{
    {kRejuvenation4, 4},
    {kRejuvenation3, 3},
    {kRejuvenation2, 2},
    {kRejuvenation1, 1},
}};

inline constexpr int kPotionFullDose = 4;

template <std::size_t N>
[[nodiscard]] constexpr bool Contains(const std::array<int, N>& set, int id) noexcept
{
    return std::find(set.begin(), set.end(), id) != set.end();
}

[[nodiscard]] constexpr bool IsAxe(int id) noexcept { return Contains(kAxes, id); }
[[nodiscard]] constexpr bool IsFood(int id) noexcept { return Contains(kFood, id); }
[[nodiscard]] constexpr bool IsWarmthItem(int id) noexcept { return Contains(kWarmthItems, id); }

[[nodiscard]] constexpr bool IsPotion(int id) noexcept
{
    return id >= kRejuvenation4 && id <= kRejuvenation1;
}

[[nodiscard]] constexpr bool IsTool(int id) noexcept
{
    return id == kKnife || id == kTinderbox || id == kHammer || IsAxe(id);
}

// Items that are never deposited as loot.
[[nodiscard]] constexpr bool IsProtected(int id) noexcept
{
    return IsTool(id) || IsFood(id) || IsPotion(id) || IsWarmthItem(id)
        || id == kRejuvenationUnf || id == kBrumaHerb;
}

// Display names, as matched by the bank search box.
[[nodiscard]] std::string_view ItemName(int id) noexcept;

} // namespace brazier::items

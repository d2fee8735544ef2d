#include "brazier/Survival.h"

#include "brazier/Items.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace brazier {

const char* SurvivalStrategyName(SurvivalStrategy s) noexcept
{
    switch (s)
    {
    case SurvivalStrategy::Stocked: return "stocked";
    case SurvivalStrategy::Crafted: return "crafted";
    }
    return "?";
}

std::optional<SurvivalStrategy> ParseSurvivalStrategy(std::string_view s) noexcept
{
    std::string lowered;
    lowered.reserve(s.size());
    for (const char c : s)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "stocked" || lowered == "food")
        return SurvivalStrategy::Stocked;
    if (lowered == "crafted" || lowered == "potions")
        return SurvivalStrategy::Crafted;
    return std::nullopt;
}

int DoseValue(int itemId, SurvivalStrategy strategy) noexcept
{
    if (strategy == SurvivalStrategy::Stocked)
        return items::IsFood(itemId) ? 1 : 0;

    for (const auto& unit : items::kPotionDoses)
    {
        if (unit.id == itemId)
            return unit.doses;
    }
    return 0;
}

int FullDoseValue(SurvivalStrategy strategy) noexcept
{
    return strategy == SurvivalStrategy::Stocked ? 1 : items::kPotionFullDose;
}

int TotalDoses(std::span<const int> inventory, SurvivalStrategy strategy) noexcept
{
    int total = 0;
    for (const int id : inventory)
        total += DoseValue(id, strategy);
    return total;
}

int CountItem(std::span<const int> inventory, int itemId) noexcept
{
    return static_cast<int>(std::count(inventory.begin(), inventory.end(), itemId));
}

std::optional<int> BestSurvivalUnitSlot(std::span<const int> inventory, SurvivalStrategy strategy) noexcept
{
    std::optional<int> best;
    int bestDoses = 0;
    for (std::size_t slot = 0; slot < inventory.size(); ++slot)
    {
        const int doses = DoseValue(inventory[slot], strategy);
        if (doses > bestDoses)
        {
            bestDoses = doses;
            best = static_cast<int>(slot);
        }
    }
    return best;
}

ResourceState ReadResourceState(std::span<const int> inventory, bool inventoryFull, SurvivalStrategy strategy) noexcept
{
    ResourceState rs;
    rs.inventoryFull = inventoryFull;

    for (const int id : inventory)
    {
        if (id == items::kEmptySlot)
        {
            ++rs.freeSlots;
            continue;
        }

        const int doses = DoseValue(id, strategy);
        if (doses > 0)
        {
            ++rs.survivalUnits;
            rs.doses += doses;
        }

        if (id == items::kBrumaRoot) ++rs.rawMaterial;
        else if (id == items::kBrumaKindling) ++rs.intermediate;
        else if (id == items::kRejuvenationUnf) ++rs.containers;
        else if (id == items::kBrumaHerb) ++rs.ingredients;

        if (!items::IsProtected(id))
        {
            rs.hasLoot = true;
            if (id != items::kBrumaRoot && id != items::kBrumaKindling)
                ++rs.rewardItems;
        }
    }

    return rs;
}

const char* WarmthActionName(WarmthAction a) noexcept
{
    switch (a)
    {
    case WarmthAction::NoneNeeded: return "none-needed";
    case WarmthAction::Consume: return "consume";
    case WarmthAction::Exhausted: return "exhausted";
    }
    return "?";
}

WarmthAction ShouldDrinkOrEat(int damageCounter, int threshold, bool hasResource) noexcept
{
    if (damageCounter < std::max(1, threshold))
        return WarmthAction::NoneNeeded;
    return hasResource ? WarmthAction::Consume : WarmthAction::Exhausted;
}

} // namespace brazier

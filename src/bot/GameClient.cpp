#include "brazier/GameClient.h"

#include <algorithm>

namespace brazier {

const char* TargetCategoryName(TargetCategory c) noexcept
{
    switch (c)
    {
    case TargetCategory::HazardSource: return "brazier";
    case TargetCategory::RawMaterialSource: return "bruma roots";
    case TargetCategory::Passage: return "doors";
    case TargetCategory::DepositPoint: return "bank chest";
    case TargetCategory::IngredientSource: return "sprouting roots";
    case TargetCategory::SupplySource: return "potion crate";
    }
    return "?";
}

std::optional<Target> Nearest(const std::vector<Target>& candidates)
{
    if (candidates.empty())
        return std::nullopt;

    const auto it = std::min_element(candidates.begin(), candidates.end(),
        [](const Target& a, const Target& b) { return a.distance < b.distance; });
    return *it;
}

} // namespace brazier

#include "brazier/ActionPlanner.h"

namespace brazier {

const char* PlannerActionName(PlannerAction a) noexcept
{
    switch (a)
    {
    case PlannerAction::Gather: return "gather";
    case PlannerAction::Convert: return "convert";
    case PlannerAction::Deposit: return "deposit";
    }
    return "?";
}

PlannerAction NextResourceAction(bool hasRawMaterial,
                                 bool hasIntermediate,
                                 bool inventoryFull,
                                 bool convertEnabled) noexcept
{
    if (inventoryFull || hasIntermediate || (hasRawMaterial && !convertEnabled))
        return PlannerAction::Deposit;
    if (convertEnabled && hasRawMaterial)
        return PlannerAction::Convert;
    return PlannerAction::Gather;
}

} // namespace brazier

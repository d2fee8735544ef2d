#pragma once

#include <cstdint>

namespace brazier {

enum class PlannerAction : std::uint8_t
{
    Gather = 0,  // chop roots
    Convert,     // fletch roots into kindling
    Deposit,     // feed the brazier
};

[[nodiscard]] const char* PlannerActionName(PlannerAction a) noexcept;

// Fixed decision tree. Only consulted while the player is idle.
//   1. full inventory, any kindling, or roots that will not be fletched -> Deposit
//   2. roots and fletching enabled                                       -> Convert
//   3. otherwise                                                         -> Gather
// Never returns Gather on a full inventory.
[[nodiscard]] PlannerAction NextResourceAction(bool hasRawMaterial,
                                               bool hasIntermediate,
                                               bool inventoryFull,
                                               bool convertEnabled) noexcept;

} // namespace brazier

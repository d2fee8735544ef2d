#include "bot/WarmthManager.h"

#include "bot/ClientOps.h"
#include "brazier/Items.h"

#include <spdlog/spdlog.h>

namespace brazier::bot {

bool WarmthManager::consumeBest()
{
    const auto sample = SafeInventory(client_);
    if (!sample)
        return false;
    const auto& inv = *sample;
    const auto slot = BestSurvivalUnitSlot(inv, strategy_);
    if (!slot)
        return false;

    const int item = inv[static_cast<std::size_t>(*slot)];
    spdlog::info("{} {} (slot {}, {} doses left before)",
                 strategy_ == SurvivalStrategy::Crafted ? "Drinking" : "Eating",
                 items::ItemName(item), *slot, TotalDoses(inv, strategy_));

    client_.input.clickInventorySlot(*slot);
    client_.clock.sleep(1.5);
    ++consumed_;
    return true;
}

} // namespace brazier::bot

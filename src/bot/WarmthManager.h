#pragma once

#include "brazier/GameClient.h"
#include "brazier/Survival.h"

namespace brazier::bot {

// Carries out a Consume directive: uses the best survival unit in the pack.
// The decision itself is ShouldDrinkOrEat(); this class only acts on it.
class WarmthManager {
public:
    WarmthManager(GameClient& client, SurvivalStrategy strategy) noexcept
        : client_(client), strategy_(strategy) {}

    // false when nothing consumable is carried.
    [[nodiscard]] bool consumeBest();

    [[nodiscard]] int unitsConsumed() const noexcept { return consumed_; }

private:
    GameClient&      client_;
    SurvivalStrategy strategy_;
    int              consumed_ = 0;
};

} // namespace brazier::bot

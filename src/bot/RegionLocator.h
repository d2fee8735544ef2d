#pragma once

#include "brazier/GameClient.h"
#include "brazier/Zone.h"

namespace brazier::bot {

// Classifies the player's current zone from the client's world position.
class RegionLocator {
public:
    explicit RegionLocator(IGameState& state) noexcept : state_(state) {}

    // Zone::Unknown when the position query fails.
    [[nodiscard]] Zone locate() noexcept;

    [[nodiscard]] int lastRegionId() const noexcept { return lastRegionId_; }

private:
    IGameState& state_;
    int         lastRegionId_ = -1;
};

} // namespace brazier::bot

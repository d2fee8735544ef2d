#pragma once

// In-arena production of rejuvenation potions.
//
//   1. take unfinished potions from the crate until enough are on hand
//   2. pick bruma herbs, one at a time, up to the containers on hand
//   3. combine herb with unfinished potion once; the game pairs the rest
//
// Every stage re-reads the inventory, is a no-op when its precondition is
// already met, and gives up after a bounded number of attempts.

#include "brazier/GameClient.h"

namespace brazier::bot {

// Finished units still missing: ceil((targetUnits * 4 - doses) / 4), in [0, targetUnits].
[[nodiscard]] int ShortfallUnits(int currentDoses, int targetUnits) noexcept;

// Unfinished potions worth holding for a shortfall.
[[nodiscard]] int ContainersWanted(int shortfallUnits, int targetUnits) noexcept;

// Herbs worth picking: never more than there are containers to put them in.
[[nodiscard]] int IngredientsWanted(int containersOnHand, int shortfallUnits) noexcept;

// Leaves a free slot for the herb of every container still without one.
[[nodiscard]] bool RoomForAnotherContainer(int freeSlots, int containers, int ingredients) noexcept;

struct PipelineResult
{
    int  dosesBefore = 0;
    int  dosesAfter  = 0;
    bool complete    = false; // target reached
};

class PotionCraftingPipeline {
public:
    PotionCraftingPipeline(GameClient& client, int targetUnits) noexcept
        : client_(client), targetUnits_(targetUnits) {}

    PipelineResult run();

    // Individual stages; true when the stage's goal holds on return.
    bool acquireContainers();
    bool acquireIngredients();
    bool combine();

private:
    [[nodiscard]] int maxAttempts() const noexcept { return targetUnits_ + 3; }

    GameClient& client_;
    int         targetUnits_;
};

} // namespace brazier::bot

#include "bot/PotionCraftingPipeline.h"

#include "bot/ClientOps.h"
#include "brazier/Items.h"
#include "brazier/Retry.h"
#include "brazier/Survival.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace brazier::bot {

namespace {

constexpr double kCrateSettleSeconds     = 0.6;
constexpr double kHarvestTimeoutSeconds  = 10.0;
constexpr double kCombineSecondsPerUnit  = 1.2;

struct Counts
{
    int doses = 0;
    int containers = 0;
    int ingredients = 0;
    int freeSlots = 0;
};

std::optional<Counts> ReadCounts(GameClient& c)
{
    const auto inv = SafeInventory(c);
    if (!inv)
        return std::nullopt;
    const auto rs = ReadResourceState(*inv, SafeInventoryFull(c), SurvivalStrategy::Crafted);
    return Counts{ rs.doses, rs.containers, rs.ingredients, rs.freeSlots };
}

} // namespace

int ShortfallUnits(int currentDoses, int targetUnits) noexcept
{
    if (targetUnits <= 0)
        return 0;
    const int missing = targetUnits * items::kPotionFullDose - std::max(0, currentDoses);
    if (missing <= 0)
        return 0;
    const int units = (missing + items::kPotionFullDose - 1) / items::kPotionFullDose;
    return std::min(units, targetUnits);
}

int ContainersWanted(int shortfallUnits, int targetUnits) noexcept
{
    return std::clamp(shortfallUnits, 0, std::max(0, targetUnits));
}

int IngredientsWanted(int containersOnHand, int shortfallUnits) noexcept
{
    return std::max(0, std::min(containersOnHand, shortfallUnits));
}

bool RoomForAnotherContainer(int freeSlots, int containers, int ingredients) noexcept
{
    return freeSlots >= 2 + std::max(0, containers - ingredients);
}

bool PotionCraftingPipeline::acquireContainers()
{
    for (int attempt = 0;; ++attempt)
    {
        const auto counts = ReadCounts(client_);
        if (!counts)
            return false;
        const Counts& now = *counts;
        const int want = ContainersWanted(ShortfallUnits(now.doses, targetUnits_), targetUnits_);
        if (now.containers >= want)
            return true;

        if (!RoomForAnotherContainer(now.freeSlots, now.containers, now.ingredients))
        {
            spdlog::info("No room for more unfinished potions ({} on hand, {} wanted).", now.containers, want);
            return false;
        }
        if (attempt >= maxAttempts())
        {
            spdlog::warn("Gave up taking unfinished potions after {} attempts.", attempt);
            return false;
        }

        if (!HoverNearest(client_, TargetCategory::SupplySource))
            return false;
        if (!HoverShows(client_, "Take"))
        {
            client_.clock.sleep(0.5);
            continue;
        }
        client_.input.click();

        const int before = now.containers;
        const RetryPolicy settle{ 3, kCrateSettleSeconds };
        if (!RetryUntil(client_.clock, settle, [&] {
                const auto c = ReadCounts(client_);
                return c && c->containers > before;
            }))
            spdlog::debug("Crate click produced nothing.");
    }
}

bool PotionCraftingPipeline::acquireIngredients()
{
    for (int attempt = 0;; ++attempt)
    {
        const auto counts = ReadCounts(client_);
        if (!counts)
            return false;
        const Counts& now = *counts;
        const int want = IngredientsWanted(now.containers, ShortfallUnits(now.doses, targetUnits_));
        if (now.ingredients >= want)
            return true;

        if (now.freeSlots <= 0)
        {
            spdlog::info("Inventory full while picking herbs ({} of {}).", now.ingredients, want);
            return false;
        }
        if (attempt >= maxAttempts())
        {
            spdlog::warn("Gave up picking herbs after {} attempts.", attempt);
            return false;
        }

        if (!HoverNearest(client_, TargetCategory::IngredientSource))
            return false;
        if (!HoverShows(client_, "Pick"))
        {
            client_.clock.sleep(0.5);
            continue;
        }
        client_.input.click();
        client_.clock.sleep(0.6);

        // One harvest at a time: let it finish before the next click.
        const auto policy = RetryPolicy::ForTimeout(kHarvestTimeoutSeconds, 1.0);
        if (!RetryUntil(client_.clock, policy, [&] { return SafeIsIdle(client_); }))
            spdlog::debug("Harvest still running after {:.0f}s.", kHarvestTimeoutSeconds);
    }
}

bool PotionCraftingPipeline::combine()
{
    const auto sample = SafeInventory(client_);
    if (!sample)
        return false;
    const auto& inv = *sample;
    const auto herbSlot = FirstSlotOf(inv, items::kBrumaHerb);
    const auto unfSlot = FirstSlotOf(inv, items::kRejuvenationUnf);
    if (!herbSlot || !unfSlot)
        return CountItem(inv, items::kBrumaHerb) == 0;

    const int batch = std::min(CountItem(inv, items::kBrumaHerb), CountItem(inv, items::kRejuvenationUnf));
    spdlog::info("Mixing {} rejuvenation potion(s).", batch);

    client_.input.clickInventorySlot(*herbSlot);
    client_.clock.sleep(0.3);
    client_.input.clickInventorySlot(*unfSlot);
    client_.clock.sleep(kCombineSecondsPerUnit * batch + 0.6);

    const auto after = ReadCounts(client_);
    return after && (after->ingredients == 0 || after->containers == 0);
}

PipelineResult PotionCraftingPipeline::run()
{
    PipelineResult r;
    const auto before = ReadCounts(client_);
    if (!before)
    {
        spdlog::warn("Inventory unreadable; skipping potion production this time.");
        return r;
    }
    r.dosesBefore = before->doses;

    if (ShortfallUnits(r.dosesBefore, targetUnits_) == 0)
    {
        r.dosesAfter = r.dosesBefore;
        r.complete = true;
        return r;
    }

    // Later stages still run on a partial result: a short batch beats none.
    if (!acquireContainers())
        spdlog::debug("Container stage incomplete.");
    if (!acquireIngredients())
        spdlog::debug("Herb stage incomplete.");
    if (!combine())
        spdlog::debug("Combine stage incomplete.");

    const auto after = ReadCounts(client_);
    r.dosesAfter = after ? after->doses : r.dosesBefore;
    r.complete = after && ShortfallUnits(r.dosesAfter, targetUnits_) == 0;
    spdlog::info("Potion doses {} -> {} (target {}).", r.dosesBefore, r.dosesAfter,
                 targetUnits_ * items::kPotionFullDose);
    return r;
}

} // namespace brazier::bot

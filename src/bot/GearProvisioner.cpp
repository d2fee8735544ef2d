#include "bot/GearProvisioner.h"

#include "bot/ClientOps.h"
#include "brazier/Items.h"
#include "brazier/Retry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace brazier::bot {

std::vector<GearRequirement> DefaultGearRequirements(bool convertEnabled)
{
    std::vector<GearRequirement> reqs;
    reqs.push_back({ "axe", "axe", std::vector<int>(items::kAxes.begin(), items::kAxes.end()), true });
    reqs.push_back({ "tinderbox", "Tinderbox", { items::kTinderbox }, false });
    reqs.push_back({ "hammer", "Hammer", { items::kHammer }, false });
    if (convertEnabled)
        reqs.push_back({ "knife", "Knife", { items::kKnife }, false });
    return reqs;
}

int GearProvisioner::countWarmthEquipped()
{
    return static_cast<int>(std::count_if(items::kWarmthItems.begin(), items::kWarmthItems.end(),
                                          [&](int id) { return SafeIsEquipped(client_, id); }));
}

bool GearProvisioner::satisfied(const GearRequirement& req, const std::vector<int>& inventory)
{
    for (const int id : req.acceptableIds)
    {
        if (std::find(inventory.begin(), inventory.end(), id) != inventory.end())
            return true;
        if (req.equippedCounts && SafeIsEquipped(client_, id))
            return true;
    }
    return false;
}

std::vector<const GearRequirement*> GearProvisioner::check()
{
    // A single unreadable sample would make every requirement look unmet.
    std::optional<std::vector<int>> inv;
    const RetryPolicy policy{ 3, 0.6 };
    if (!RetryUntil(client_.clock, policy, [&] { return (inv = SafeInventory(client_)).has_value(); }))
        spdlog::error("Cannot read the inventory to check gear.");

    std::vector<const GearRequirement*> unmet;
    missing_.clear();
    for (const auto& req : requirements_)
    {
        if (!inv || !satisfied(req, *inv))
        {
            unmet.push_back(&req);
            missing_.push_back(req.name);
        }
    }
    return unmet;
}

void GearProvisioner::withdraw(const std::vector<const GearRequirement*>& wanted)
{
    if (!OpenBank(client_))
    {
        spdlog::warn("Could not open the bank to fetch missing gear.");
        return;
    }

    for (const auto* req : wanted)
    {
        spdlog::info("Withdrawing {} from the bank.", req->name);
        SearchBank(client_, req->searchText);
        client_.bank.withdrawFirstMatch(1);
        client_.clock.sleep(0.6);
        client_.bank.closeSearch();
        client_.clock.sleep(0.3);
    }
    CloseBank(client_);
}

bool GearProvisioner::ensureReady()
{
    const int warmth = countWarmthEquipped();
    if (warmth < kRecommendedWarmthItems)
        spdlog::warn("Only {} warm clothing item(s) equipped; {} recommended.", warmth, kRecommendedWarmthItems);

    auto unmet = check();
    if (unmet.empty())
        return true;

    for (const auto* req : unmet)
        spdlog::info("Missing {}; trying the bank.", req->name);
    withdraw(unmet);

    unmet = check();
    for (const auto& name : missing_)
        spdlog::error("Required gear still missing: {}", name);
    return unmet.empty();
}

} // namespace brazier::bot

#pragma once

#include "brazier/GameClient.h"

#include <string>
#include <utility>
#include <vector>

namespace brazier::bot {

// One capability the bot needs before the first round.
struct GearRequirement
{
    std::string      name;             // for logs
    std::string      searchText;       // bank search box
    std::vector<int> acceptableIds;    // any of these satisfies it
    bool             equippedCounts = false; // weapons: equipped or carried
};

// Axe, tinderbox, hammer, plus a knife when roots are fletched.
[[nodiscard]] std::vector<GearRequirement> DefaultGearRequirements(bool convertEnabled);

// Checks the hard requirements, fetches missing ones from the bank once and
// checks again. Too little warm clothing only warns.
class GearProvisioner {
public:
    static constexpr int kRecommendedWarmthItems = 4;

    GearProvisioner(GameClient& client, std::vector<GearRequirement> requirements) noexcept
        : client_(client), requirements_(std::move(requirements)) {}

    [[nodiscard]] bool ensureReady();

    // Names of unmet requirements as of the last check.
    [[nodiscard]] const std::vector<std::string>& missing() const noexcept { return missing_; }

    [[nodiscard]] int countWarmthEquipped();

private:
    [[nodiscard]] bool satisfied(const GearRequirement& req, const std::vector<int>& inventory);
    std::vector<const GearRequirement*> check();
    void withdraw(const std::vector<const GearRequirement*>& wanted);

    GameClient&                  client_;
    std::vector<GearRequirement> requirements_;
    std::vector<std::string>     missing_;
};

} // namespace brazier::bot

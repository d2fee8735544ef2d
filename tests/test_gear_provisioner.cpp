// tests/test_gear_provisioner.cpp
//
// Coverage for bot::GearProvisioner against the simulator's camp and bank.

#include <doctest/doctest.h>

#include "bot/GearProvisioner.h"
#include "brazier/Clock.h"
#include "brazier/Items.h"
#include "brazier/Survival.h"
#include "sim/SimulatedWintertodt.h"

#include <algorithm>
#include <string>
#include <vector>

namespace items = brazier::items;
using brazier::bot::DefaultGearRequirements;
using brazier::bot::GearProvisioner;

namespace {

constexpr int kRuneAxe = 1359;

bool Carries(brazier::sim::SimulatedWintertodt& world, int id)
{
    return brazier::CountItem(world.inventory(), id) > 0;
}

} // namespace

TEST_CASE("DefaultGearRequirements adds the knife only when fletching")
{
    const auto without = DefaultGearRequirements(false);
    const auto with = DefaultGearRequirements(true);

    CHECK(without.size() == 3);
    CHECK(with.size() == 4);
    CHECK(with.back().name == "knife");

    REQUIRE_FALSE(without.empty());
    CHECK(without.front().name == "axe");
    CHECK(without.front().equippedCounts);
    CHECK(without.front().acceptableIds.size() == items::kAxes.size());
}

TEST_CASE("GearProvisioner passes with a complete kit and touches nothing")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    brazier::GameClient client = world.client();

    GearProvisioner gear(client, DefaultGearRequirements(true));
    CHECK(gear.ensureReady());
    CHECK(gear.missing().empty());
    CHECK(gear.countWarmthEquipped() == 4);
    CHECK(world.bankCount(items::kHammer) == 1);
}

TEST_CASE("GearProvisioner fetches a missing tool from the bank")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    world.setInventory({ items::kTinderbox, items::kKnife });
    brazier::GameClient client = world.client();

    GearProvisioner gear(client, DefaultGearRequirements(false));
    CHECK(gear.ensureReady());
    CHECK(gear.missing().empty());
    CHECK(Carries(world, items::kHammer));
    CHECK(world.bankCount(items::kHammer) == 0);
    CHECK_FALSE(world.isOpen());
}

TEST_CASE("GearProvisioner accepts a carried axe fetched by name")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    world.unequip(kRuneAxe);
    brazier::GameClient client = world.client();

    GearProvisioner gear(client, DefaultGearRequirements(false));
    CHECK(gear.ensureReady());
    CHECK(Carries(world, kRuneAxe));
    CHECK_FALSE(world.isEquipped(kRuneAxe));
}

TEST_CASE("GearProvisioner fails and names the capability the bank cannot supply")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    world.setInventory({ items::kTinderbox });
    world.setBankStock(items::kHammer, 0);
    brazier::GameClient client = world.client();

    GearProvisioner gear(client, DefaultGearRequirements(false));
    CHECK_FALSE(gear.ensureReady());

    const auto& missing = gear.missing();
    REQUIRE(missing.size() == 1);
    CHECK(missing.front() == "hammer");
}

TEST_CASE("GearProvisioner only warns about too little warm clothing")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    for (int id : items::kWarmthItems)
        world.unequip(id);
    brazier::GameClient client = world.client();

    GearProvisioner gear(client, DefaultGearRequirements(false));
    CHECK(gear.countWarmthEquipped() == 0);
    CHECK(gear.ensureReady());
}

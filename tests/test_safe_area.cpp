// tests/test_safe_area.cpp
//
// Staging-area behaviour: PlanSafeArea() on plain values, then the controller
// ticking through camp -> camp -> arena on the simulator.

#include <doctest/doctest.h>

#include "bot/WintertodtBot.h"
#include "brazier/Clock.h"
#include "brazier/Items.h"
#include "brazier/Lifecycle.h"
#include "core/BotConfig.h"
#include "sim/SimulatedWintertodt.h"

namespace items = brazier::items;
using brazier::SafeAreaAction;
using brazier::Zone;

TEST_CASE("PlanSafeArea: loot first, then restock, then enter")
{
    brazier::SafeAreaSnapshot s;
    s.targetUnits = 4;
    s.restockAtBank = true;

    s.hasLoot = true;
    s.survivalUnits = 0;
    CHECK(brazier::PlanSafeArea(s) == SafeAreaAction::DepositLoot);

    s.hasLoot = false;
    CHECK(brazier::PlanSafeArea(s) == SafeAreaAction::Restock);

    s.survivalUnits = 4;
    CHECK(brazier::PlanSafeArea(s) == SafeAreaAction::EnterArena);

    // Crafted runs never restock at the bank.
    s.survivalUnits = 0;
    s.restockAtBank = false;
    CHECK(brazier::PlanSafeArea(s) == SafeAreaAction::EnterArena);
}

TEST_CASE("WintertodtBot deposits loot on the first camp tick and enters on the second")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);
    world.setInventory({ items::kTinderbox, items::kHammer, items::kKnife,
                         items::kSupplyCrate, items::kBrumaRoot, items::kBrumaRoot });

    brazier::core::BotConfig cfg;
    cfg.strategy = brazier::SurvivalStrategy::Crafted;

    brazier::GameClient client = world.client();
    brazier::bot::WintertodtBot bot(client, cfg);

    // Tick 1: still in camp, loot goes into the bank.
    bot.tick();
    CHECK(world.zone() == Zone::SafeArea);
    CHECK(world.bankCount(items::kSupplyCrate) == 1);
    CHECK(world.bankCount(items::kBrumaRoot) == 2);
    CHECK_FALSE(world.isOpen());

    // Tick 2: nothing left to bank, through the doors.
    bot.tick();
    CHECK(world.zone() == Zone::Arena);
    CHECK(bot.lastZone() == Zone::Arena);
    CHECK(bot.roundState().phase == brazier::RoundPhase::AwaitingRound);

    // Tick 3: the arena handler takes over.
    bot.tick();
    CHECK(world.zone() == Zone::Arena);
}

TEST_CASE("WintertodtBot restocks food before entering with the stocked strategy")
{
    brazier::ManualClock clock;
    brazier::sim::SimulatedWintertodt world(clock);

    brazier::core::BotConfig cfg;
    cfg.strategy = brazier::SurvivalStrategy::Stocked;
    cfg.targetCount = 5;

    brazier::GameClient client = world.client();
    brazier::bot::WintertodtBot bot(client, cfg);

    bot.tick();
    CHECK(world.zone() == Zone::SafeArea);
    CHECK(world.bankCount(329) == 95);

    bot.tick();
    CHECK(world.zone() == Zone::Arena);
}

// tests/test_integration.cpp
//
// Whole runs on simulated time: bootstrap, staging area, rounds, survival.

#include <doctest/doctest.h>

#include "bot/WintertodtBot.h"
#include "brazier/Clock.h"
#include "brazier/Items.h"
#include "core/BotConfig.h"
#include "sim/SimulatedWintertodt.h"

#include <algorithm>

using brazier::SurvivalStrategy;
using brazier::bot::RunOutcome;

namespace {

struct RunSummary
{
    RunOutcome outcome = RunOutcome::Stopped;
    int roundsCompleted = 0;
    int roundsWitnessed = 0;
    int unitsConsumed = 0;
    int totalPoints = 0;
    int bankedFood = 0;
    int cratesAwarded = 0;
    int cratesBanked = 0;
    int cratesCarried = 0;
};

RunSummary SimulateRun(SurvivalStrategy strategy, int minutes, unsigned seed, int cratePoints = 500)
{
    brazier::ManualClock clock;
    brazier::sim::SimSettings settings;
    settings.seed = seed;
    settings.supplyCratePoints = cratePoints;
    brazier::sim::SimulatedWintertodt world(clock, settings);

    brazier::core::BotConfig cfg;
    cfg.strategy = strategy;
    cfg.runMinutes = minutes;
    cfg.seed = seed;
    cfg.takeBreaks = true;

    brazier::GameClient client = world.client();
    brazier::bot::WintertodtBot bot(client, cfg);

    RunSummary s;
    s.outcome = bot.run();
    s.roundsCompleted = bot.roundState().roundsCompleted;
    s.roundsWitnessed = world.roundsWitnessed();
    s.unitsConsumed = world.unitsConsumed();
    s.totalPoints = world.totalPoints();
    s.bankedFood = world.bankCount(329);
    s.cratesAwarded = world.rewardCrates();
    s.cratesBanked = world.bankCount(brazier::items::kSupplyCrate);

    const auto inv = world.inventory();
    s.cratesCarried = static_cast<int>(std::count(inv.begin(), inv.end(), brazier::items::kSupplyCrate));
    return s;
}

} // namespace

TEST_CASE("Integration/CraftedRunBrewsPotionsAndCompletesRounds")
{
    const RunSummary s = SimulateRun(SurvivalStrategy::Crafted, 20, 7);

    CHECK(s.outcome == RunOutcome::Completed);
    CHECK(s.roundsCompleted >= 3);
    CHECK(s.roundsCompleted <= s.roundsWitnessed);
    CHECK(s.unitsConsumed > 0);
    CHECK(s.totalPoints > 0);
    CHECK(s.bankedFood == 100); // never touches the bank for food
}

TEST_CASE("Integration/StockedRunEatsBankedFood")
{
    const RunSummary s = SimulateRun(SurvivalStrategy::Stocked, 20, 11);

    CHECK(s.outcome == RunOutcome::Completed);
    CHECK(s.roundsCompleted >= 2);
    CHECK(s.roundsCompleted <= s.roundsWitnessed);
    CHECK(s.unitsConsumed > 0);
    CHECK(s.bankedFood < 100);
}

TEST_CASE("Integration/SameSeedReplaysIdentically")
{
    const RunSummary a = SimulateRun(SurvivalStrategy::Crafted, 8, 3);
    const RunSummary b = SimulateRun(SurvivalStrategy::Crafted, 8, 3);

    CHECK(a.outcome == b.outcome);
    CHECK(a.roundsCompleted == b.roundsCompleted);
    CHECK(a.unitsConsumed == b.unitsConsumed);
    CHECK(a.totalPoints == b.totalPoints);
}

TEST_CASE("Integration/CraftedRunBanksRewardCrates")
{
    // Every round with any feeding earns a crate.
    const RunSummary s = SimulateRun(SurvivalStrategy::Crafted, 90, 5, 50);

    CHECK(s.outcome == RunOutcome::Completed);
    REQUIRE(s.cratesAwarded >= 3);
    CHECK(s.cratesCarried <= 1);
    CHECK(s.cratesBanked >= s.cratesAwarded - 1);
    CHECK(s.cratesBanked + s.cratesCarried == s.cratesAwarded);
    CHECK(s.roundsCompleted >= 10);
}

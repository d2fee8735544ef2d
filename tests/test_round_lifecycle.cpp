// tests/test_round_lifecycle.cpp
//
// Coverage for the pure round lifecycle: StepArena(), RespawnTimerElapsed(),
// OnArenaEntered(). No client, no clock: every case feeds plain ArenaTick
// values and inspects the returned state and directive.

#include <doctest/doctest.h>

#include "brazier/Lifecycle.h"

using brazier::ArenaDirective;
using brazier::ArenaTick;
using brazier::ChatEvent;
using brazier::RoundPhase;
using brazier::RoundRules;
using brazier::RoundState;

namespace {

RoundRules StockedRules()
{
    RoundRules r;
    r.damageThreshold = 3;
    r.lowWaterMark = 2;
    r.targetDoses = 4;
    r.respawnSeconds = 60.0;
    r.respawnMarginSeconds = 5.0;
    r.settleSeconds = 3.0;
    r.canResupplyInArena = false;
    return r;
}

RoundRules CraftedRules()
{
    RoundRules r = StockedRules();
    r.targetDoses = 16;
    r.canResupplyInArena = true;
    return r;
}

ArenaTick Tick(double now, ChatEvent e = ChatEvent::None, int doses = 8, bool visible = false)
{
    ArenaTick t;
    t.now = now;
    t.event = e;
    t.doses = doses;
    t.hazardVisible = visible;
    return t;
}

} // namespace

TEST_CASE("Respawn timer keeps the phase until interval plus margin has passed")
{
    const RoundRules rules = StockedRules();

    RoundState s;
    s.phase = RoundPhase::AwaitingRound;
    s.roundEndTime = 0.0;

    for (double t : { 1.0, 30.0, 60.0, 64.0, 64.9 })
    {
        CAPTURE(t);
        const auto step = brazier::StepArena(s, Tick(t), rules);
        CHECK(step.state.phase == RoundPhase::AwaitingRound);
        CHECK(step.directive == ArenaDirective::Wait);
    }

    const auto flipped = brazier::StepArena(s, Tick(65.0), rules);
    CHECK(flipped.state.phase == RoundPhase::RoundActive);
    CHECK(flipped.directive == ArenaDirective::Work);
}

TEST_CASE("RespawnTimerElapsed is false before the first round ends")
{
    const RoundRules rules = StockedRules();
    RoundState s;
    CHECK_FALSE(brazier::RespawnTimerElapsed(s, 1e6, rules));

    s.roundEndTime = 100.0;
    CHECK_FALSE(brazier::RespawnTimerElapsed(s, 164.0, rules));
    CHECK(brazier::RespawnTimerElapsed(s, 165.0, rules));
}

TEST_CASE("Visible hazard source starts the round before the timer")
{
    RoundState s;
    s.roundEndTime = 0.0;

    const auto step = brazier::StepArena(s, Tick(10.0, ChatEvent::None, 8, /*visible=*/true), StockedRules());
    CHECK(step.state.phase == RoundPhase::RoundActive);
    CHECK(step.directive == ArenaDirective::Work);
}

TEST_CASE("Three damage events trigger exactly one Consume at the threshold")
{
    const RoundRules rules = StockedRules();
    RoundState s;
    s.phase = RoundPhase::RoundActive;

    auto step = brazier::StepArena(s, Tick(1.0, ChatEvent::Damaged), rules);
    CHECK(step.state.damageCounter == 1);
    CHECK(step.directive == ArenaDirective::Work);

    step = brazier::StepArena(step.state, Tick(2.0, ChatEvent::Damaged), rules);
    CHECK(step.state.damageCounter == 2);
    CHECK(step.directive == ArenaDirective::Work);

    step = brazier::StepArena(step.state, Tick(3.0, ChatEvent::Damaged), rules);
    CHECK(step.directive == ArenaDirective::Consume);
    CHECK(step.state.damageCounter == 0);
    REQUIRE(step.state.lastConsumeTime.has_value());
    CHECK(*step.state.lastConsumeTime == doctest::Approx(3.0));

    // Quiet tick afterwards: back to work, no second Consume.
    step = brazier::StepArena(step.state, Tick(4.0), rules);
    CHECK(step.directive == ArenaDirective::Work);
    CHECK(step.state.damageCounter == 0);
}

TEST_CASE("Damage while awaiting the round proves the round is active")
{
    RoundState s; // AwaitingRound, no timer
    const auto step = brazier::StepArena(s, Tick(5.0, ChatEvent::Damaged), StockedRules());
    CHECK(step.state.phase == RoundPhase::RoundActive);
    CHECK(step.state.damageCounter == 1);
    CHECK(step.directive == ArenaDirective::Work);
}

TEST_CASE("Brazier events map to relight and repair")
{
    RoundState s;
    s.phase = RoundPhase::RoundActive;

    const auto out = brazier::StepArena(s, Tick(1.0, ChatEvent::HazardSourceOut), StockedRules());
    CHECK(out.directive == ArenaDirective::Relight);
    CHECK(out.state.damageCounter == 0);

    const auto broken = brazier::StepArena(s, Tick(1.0, ChatEvent::HazardSourceBroken), StockedRules());
    CHECK(broken.directive == ArenaDirective::Repair);
    CHECK(broken.state.damageCounter == 1);
}

TEST_CASE("Exhaustion exits the arena with stocked food and resupplies with crafted potions")
{
    RoundState s;
    s.phase = RoundPhase::RoundActive;
    s.damageCounter = 3;

    const auto stocked = brazier::StepArena(s, Tick(1.0, ChatEvent::None, /*doses=*/0), StockedRules());
    CHECK(stocked.directive == ArenaDirective::ExitArena);
    CHECK(stocked.state.phase == RoundPhase::AwaitingRound);

    const auto crafted = brazier::StepArena(s, Tick(1.0, ChatEvent::None, /*doses=*/0), CraftedRules());
    CHECK(crafted.directive == ArenaDirective::Resupply);
    CHECK(crafted.state.phase == RoundPhase::RoundActive);
    CHECK(crafted.state.damageCounter == 3); // reset only by consuming
}

TEST_CASE("Round end settles, then stays, leaves or resupplies")
{
    const RoundRules rules = StockedRules();
    RoundState s;
    s.phase = RoundPhase::RoundActive;
    s.damageCounter = 2;

    auto step = brazier::StepArena(s, Tick(100.0, ChatEvent::RoundEnd), rules);
    CHECK(step.directive == ArenaDirective::SettleRound);
    CHECK(step.state.phase == RoundPhase::RoundEnding);
    CHECK(step.state.roundsCompleted == 1);
    REQUIRE(step.state.roundEndTime.has_value());
    CHECK(*step.state.roundEndTime == doctest::Approx(100.0));

    const RoundState ending = step.state;

    SUBCASE("settle delay not elapsed")
    {
        const auto w = brazier::StepArena(ending, Tick(101.0), rules);
        CHECK(w.directive == ArenaDirective::Wait);
        CHECK(w.state.phase == RoundPhase::RoundEnding);
    }
    SUBCASE("enough doses for another round")
    {
        const auto w = brazier::StepArena(ending, Tick(103.0, ChatEvent::None, 2), rules);
        CHECK(w.directive == ArenaDirective::Wait);
        CHECK(w.state.phase == RoundPhase::AwaitingRound);
    }
    SUBCASE("below the low-water mark")
    {
        const auto w = brazier::StepArena(ending, Tick(103.0, ChatEvent::None, 1), rules);
        CHECK(w.directive == ArenaDirective::ExitArena);
        CHECK(w.state.phase == RoundPhase::AwaitingRound);
    }
    SUBCASE("reward loot is banked before the next round")
    {
        ArenaTick t = Tick(103.0, ChatEvent::None, 16);
        t.rewardItems = 1;
        const auto w = brazier::StepArena(ending, t, CraftedRules());
        CHECK(w.directive == ArenaDirective::ExitArena);
        CHECK(w.state.phase == RoundPhase::AwaitingRound);
        CHECK(w.state.roundsCompleted == 1);
    }
    SUBCASE("reward loot waits for the settle delay")
    {
        ArenaTick t = Tick(101.0, ChatEvent::None, 16);
        t.rewardItems = 1;
        CHECK(brazier::StepArena(ending, t, CraftedRules()).directive == ArenaDirective::Wait);
    }
    SUBCASE("crafted strategy tops up between rounds")
    {
        const auto w = brazier::StepArena(ending, Tick(103.0, ChatEvent::None, 9), CraftedRules());
        CHECK(w.directive == ArenaDirective::Resupply);
        CHECK(w.state.phase == RoundPhase::AwaitingRound);
    }
}

TEST_CASE("Awaiting the round: stocked leaves when empty, crafted resupplies")
{
    RoundState s; // AwaitingRound, nothing visible, no timer

    CHECK(brazier::StepArena(s, Tick(1.0, ChatEvent::None, 0), StockedRules()).directive == ArenaDirective::ExitArena);
    CHECK(brazier::StepArena(s, Tick(1.0, ChatEvent::None, 1), StockedRules()).directive == ArenaDirective::Wait);
    CHECK(brazier::StepArena(s, Tick(1.0, ChatEvent::None, 12), CraftedRules()).directive == ArenaDirective::Resupply);
    CHECK(brazier::StepArena(s, Tick(1.0, ChatEvent::None, 16), CraftedRules()).directive == ArenaDirective::Wait);
}

TEST_CASE("Carried rewards do not pull the bot out of a live round")
{
    RoundState s;
    s.phase = RoundPhase::RoundActive;

    ArenaTick t = Tick(10.0, ChatEvent::None, 8);
    t.rewardItems = 2;
    const auto step = brazier::StepArena(s, t, CraftedRules());
    CHECK(step.directive == ArenaDirective::Work);
    CHECK(step.state.phase == RoundPhase::RoundActive);
}

TEST_CASE("OnArenaEntered resets only the phase")
{
    RoundState s;
    s.phase = RoundPhase::RoundActive;
    s.damageCounter = 2;
    s.roundsCompleted = 4;
    s.lastSeenChatLine = "The brazier has gone out.";

    const RoundState entered = brazier::OnArenaEntered(s);
    CHECK(entered.phase == RoundPhase::AwaitingRound);
    CHECK(entered.damageCounter == 2);
    CHECK(entered.roundsCompleted == 4);
    CHECK(entered.lastSeenChatLine == "The brazier has gone out.");
}

#include "brazier/Lifecycle.h"

#include "brazier/Survival.h"

#include <utility>

namespace brazier {

const char* RoundPhaseName(RoundPhase p) noexcept
{
    switch (p)
    {
    case RoundPhase::AwaitingRound: return "awaiting-round";
    case RoundPhase::RoundActive: return "round-active";
    case RoundPhase::RoundEnding: return "round-ending";
    }
    return "?";
}

const char* ArenaDirectiveName(ArenaDirective d) noexcept
{
    switch (d)
    {
    case ArenaDirective::Wait: return "wait";
    case ArenaDirective::SettleRound: return "settle-round";
    case ArenaDirective::Relight: return "relight";
    case ArenaDirective::Repair: return "repair";
    case ArenaDirective::Consume: return "consume";
    case ArenaDirective::Resupply: return "resupply";
    case ArenaDirective::ExitArena: return "exit-arena";
    case ArenaDirective::Work: return "work";
    }
    return "?";
}

const char* SafeAreaActionName(SafeAreaAction a) noexcept
{
    switch (a)
    {
    case SafeAreaAction::DepositLoot: return "deposit-loot";
    case SafeAreaAction::Restock: return "restock";
    case SafeAreaAction::EnterArena: return "enter-arena";
    }
    return "?";
}

bool RespawnTimerElapsed(const RoundState& state, double now, const RoundRules& rules) noexcept
{
    if (!state.roundEndTime)
        return false;
    return now - *state.roundEndTime >= rules.respawnSeconds + rules.respawnMarginSeconds;
}

RoundState OnArenaEntered(RoundState state) noexcept
{
    state.phase = RoundPhase::AwaitingRound;
    return state;
}

namespace {

[[nodiscard]] ArenaStep Emit(RoundState state, ArenaDirective d)
{
    return ArenaStep{ std::move(state), d };
}

// Round is live: decide between self-preservation and work.
[[nodiscard]] ArenaStep StepActive(RoundState state, const ArenaTick& tick, const RoundRules& rules)
{
    switch (ShouldDrinkOrEat(state.damageCounter, rules.damageThreshold, tick.doses > 0))
    {
    case WarmthAction::Consume:
        state.damageCounter = 0;
        state.lastConsumeTime = tick.now;
        return Emit(std::move(state), ArenaDirective::Consume);

    case WarmthAction::Exhausted:
        if (rules.canResupplyInArena)
            return Emit(std::move(state), ArenaDirective::Resupply);
        state.phase = RoundPhase::AwaitingRound;
        return Emit(std::move(state), ArenaDirective::ExitArena);

    case WarmthAction::NoneNeeded:
        break;
    }
    return Emit(std::move(state), ArenaDirective::Work);
}

} // namespace

ArenaStep StepArena(RoundState state, const ArenaTick& tick, const RoundRules& rules)
{
    switch (tick.event)
    {
    case ChatEvent::RoundEnd:
        state.phase = RoundPhase::RoundEnding;
        ++state.roundsCompleted;
        state.roundEndTime = tick.now;
        return Emit(std::move(state), ArenaDirective::SettleRound);

    case ChatEvent::HazardSourceOut:
        return Emit(std::move(state), ArenaDirective::Relight);

    case ChatEvent::HazardSourceBroken:
        // Shrapnel from the broken brazier hurts as well.
        ++state.damageCounter;
        return Emit(std::move(state), ArenaDirective::Repair);

    case ChatEvent::Damaged:
        // Taking damage is the strongest proof that a round is running.
        ++state.damageCounter;
        state.phase = RoundPhase::RoundActive;
        break;

    case ChatEvent::None:
        break;
    }

    if (state.phase == RoundPhase::RoundEnding)
    {
        if (state.roundEndTime && tick.now - *state.roundEndTime < rules.settleSeconds)
            return Emit(std::move(state), ArenaDirective::Wait);

        state.phase = RoundPhase::AwaitingRound;
        // Rewards are banked during the respawn gap.
        if (tick.rewardItems > 0)
            return Emit(std::move(state), ArenaDirective::ExitArena);
        if (rules.canResupplyInArena && tick.doses < rules.targetDoses)
            return Emit(std::move(state), ArenaDirective::Resupply);
        if (tick.doses >= rules.lowWaterMark)
            return Emit(std::move(state), ArenaDirective::Wait);
        return Emit(std::move(state), ArenaDirective::ExitArena);
    }

    if (state.phase == RoundPhase::AwaitingRound)
    {
        // Visual check first, then the timer: first true wins.
        if (tick.hazardVisible || RespawnTimerElapsed(state, tick.now, rules))
        {
            state.phase = RoundPhase::RoundActive;
        }
        else
        {
            if (rules.canResupplyInArena && tick.doses < rules.targetDoses)
                return Emit(std::move(state), ArenaDirective::Resupply);
            if (!rules.canResupplyInArena && tick.doses == 0)
                return Emit(std::move(state), ArenaDirective::ExitArena);
            return Emit(std::move(state), ArenaDirective::Wait);
        }
    }

    return StepActive(std::move(state), tick, rules);
}

SafeAreaAction PlanSafeArea(const SafeAreaSnapshot& s) noexcept
{
    if (s.hasLoot)
        return SafeAreaAction::DepositLoot;
    if (s.restockAtBank && s.survivalUnits < s.targetUnits)
        return SafeAreaAction::Restock;
    return SafeAreaAction::EnterArena;
}

} // namespace brazier

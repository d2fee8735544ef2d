// include/brazier/Lifecycle.h
//
// Round lifecycle as a pure transition function.
//
// The controller owns one RoundState per run and feeds it an ArenaTick every
// loop iteration spent inside the arena. StepArena() returns the next state
// plus a single directive for the controller to carry out. Nothing here
// touches the game client, so the whole state machine is testable on plain
// values.
#pragma once

#include "brazier/ChatEvent.h"

#include <cstdint>
#include <optional>
#include <string>

namespace brazier {

enum class RoundPhase : std::uint8_t
{
    AwaitingRound = 0,
    RoundActive,
    RoundEnding,
};

[[nodiscard]] const char* RoundPhaseName(RoundPhase p) noexcept;

// Run-scoped; reset only when a new run starts.
struct RoundState
{
    RoundPhase            phase = RoundPhase::AwaitingRound;
    int                   damageCounter = 0;
    std::optional<double> roundEndTime;
    std::optional<double> lastConsumeTime;
    std::string           lastSeenChatLine;
    int                   roundsCompleted = 0;
};

struct RoundRules
{
    int    damageThreshold      = 3;
    int    lowWaterMark         = 2;    // doses needed to stay for another round
    int    targetDoses          = 16;   // fully supplied
    double respawnSeconds       = 60.0;
    double respawnMarginSeconds = 5.0;
    double settleSeconds        = 3.0;
    bool   canResupplyInArena   = false;
};

struct ArenaTick
{
    double    now = 0.0;
    ChatEvent event = ChatEvent::None;
    bool      hazardVisible = false; // tagged brazier/roots on screen
    int       doses = 0;
    int       rewardItems = 0;       // crates and other loot waiting for the bank
};

enum class ArenaDirective : std::uint8_t
{
    Wait = 0,     // nothing to do this tick
    SettleRound,  // round just ended: summarise and let rewards resolve
    Relight,
    Repair,
    Consume,      // use the best survival unit (counter already reset)
    Resupply,     // run the production pipeline
    ExitArena,
    Work,         // consult the resource planner
};

[[nodiscard]] const char* ArenaDirectiveName(ArenaDirective d) noexcept;

struct ArenaStep
{
    RoundState     state;
    ArenaDirective directive = ArenaDirective::Wait;
};

[[nodiscard]] ArenaStep StepArena(RoundState state, const ArenaTick& tick, const RoundRules& rules);

// Fixed-period fallback for the round start.
[[nodiscard]] bool RespawnTimerElapsed(const RoundState& state, double now, const RoundRules& rules) noexcept;

// Entering the arena always starts a fresh wait for the round.
[[nodiscard]] RoundState OnArenaEntered(RoundState state) noexcept;

// ---------------------------------------------------------------------------
// Staging area (outside the arena)
// ---------------------------------------------------------------------------

struct SafeAreaSnapshot
{
    bool hasLoot       = false;
    int  survivalUnits = 0;
    int  targetUnits   = 0;
    bool restockAtBank = false; // stocked strategy only
};

enum class SafeAreaAction : std::uint8_t
{
    DepositLoot = 0,
    Restock,
    EnterArena,
};

[[nodiscard]] const char* SafeAreaActionName(SafeAreaAction a) noexcept;

[[nodiscard]] SafeAreaAction PlanSafeArea(const SafeAreaSnapshot& s) noexcept;

} // namespace brazier

#pragma once

// Main controller. Owns the run-scoped RoundState and executes the
// directives the pure lifecycle functions hand back.

#include "bot/GearProvisioner.h"
#include "bot/PotionCraftingPipeline.h"
#include "bot/RegionLocator.h"
#include "bot/WarmthManager.h"
#include "brazier/ChatEvent.h"
#include "brazier/GameClient.h"
#include "brazier/Lifecycle.h"
#include "core/BotConfig.h"
#include "core/Rng.h"

#include <cstdint>
#include <optional>

namespace brazier::bot {

enum class RunOutcome : std::uint8_t
{
    Completed = 0,        // run time elapsed
    GearBootstrapFailed,  // a hard requirement could not be met
    OutOfSupplies,        // restocking keeps coming back empty
    Stopped,              // requestStop()
};

[[nodiscard]] const char* RunOutcomeName(RunOutcome o) noexcept;

// Process exit code for the executable.
[[nodiscard]] int ExitCodeFor(RunOutcome o) noexcept;

[[nodiscard]] RoundRules RoundRulesFromConfig(const core::BotConfig& cfg) noexcept;

class WintertodtBot {
public:
    static constexpr double kLoopTickSeconds     = 0.6;
    static constexpr int    kMaxRestockFailures  = 3;

    WintertodtBot(GameClient& client, const core::BotConfig& cfg);

    // Gear bootstrap, then ticks until the run time has elapsed.
    RunOutcome run();

    // One loop iteration without the pacing sleep. Exposed for tests.
    void tick();

    void requestStop() noexcept { stopRequested_ = true; }

    [[nodiscard]] const RoundState& roundState() const noexcept { return state_; }
    [[nodiscard]] const RoundRules& rules() const noexcept { return rules_; }
    [[nodiscard]] std::optional<RunOutcome> fatalOutcome() const noexcept { return fatal_; }
    [[nodiscard]] Zone lastZone() const noexcept { return lastZone_; }

private:
    ChatEvent pollChat();

    void handleArena();
    void handleSafeArea();

    // Arena directives
    void settleRound();
    void relight();
    void repair();
    void consume();
    void resupply();
    void work();

    // Planner actions
    void gather();
    void convert();
    void deposit();

    // Staging area
    void depositLoot();
    void restock();

    bool crossPassage(bool intoArena);

    // Bounded wait for an action to finish. Stops early on idle or on a
    // classified chat event, which is kept for the next tick.
    bool waitWhileBusy(double timeoutSeconds);

    void maybeTakeBreak();

    // nullopt when the inventory cannot be read this sample.
    [[nodiscard]] std::optional<ResourceState> readResources();

    GameClient&           client_;
    core::BotConfig       cfg_;
    RoundRules            rules_;
    RegionLocator         locator_;
    WarmthManager         warmth_;
    PotionCraftingPipeline pipeline_;
    GearProvisioner       gear_;

    RoundState                state_;
    std::optional<ChatEvent>  deferred_;
    Zone                      lastZone_ = Zone::Unknown;
    double                    runStart_ = 0.0;

    int  restockFailures_ = 0;
    bool skipRestock_ = false;
    bool stopRequested_ = false;
    std::optional<RunOutcome> fatal_;

    rng::Pcg32 rng_;
};

} // namespace brazier::bot

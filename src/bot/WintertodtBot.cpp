#include "bot/WintertodtBot.h"

#include "bot/ClientOps.h"
#include "brazier/ActionPlanner.h"
#include "brazier/Items.h"
#include "brazier/Retry.h"
#include "brazier/Survival.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <string>

namespace brazier::bot {

namespace {

constexpr double kGatherTimeoutSeconds  = 15.0;
constexpr double kConvertTimeoutSeconds = 30.0;
constexpr double kDepositTimeoutSeconds = 30.0;
constexpr double kLightSeconds          = 3.0;
constexpr double kRepairSeconds         = 3.0;
constexpr double kPassageSettleSeconds  = 3.0;
constexpr double kWaitDirectiveSeconds  = 2.0;
constexpr double kBreakChance           = 0.02;
constexpr double kMaxBreakSeconds       = 15.0;
constexpr double kUnreadableBackoff     = 1.0;

std::string FormatElapsed(double seconds)
{
    const int total = static_cast<int>(std::max(0.0, seconds));
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

} // namespace

const char* RunOutcomeName(RunOutcome o) noexcept
{
    switch (o)
    {
    case RunOutcome::Completed: return "completed";
    case RunOutcome::GearBootstrapFailed: return "gear-bootstrap-failed";
    case RunOutcome::OutOfSupplies: return "out-of-supplies";
    case RunOutcome::Stopped: return "stopped";
    }
    return "?";
}

int ExitCodeFor(RunOutcome o) noexcept
{
    switch (o)
    {
    case RunOutcome::Completed: return 0;
    case RunOutcome::GearBootstrapFailed: return 2;
    case RunOutcome::OutOfSupplies: return 3;
    case RunOutcome::Stopped: return 0;
    }
    return 1;
}

RoundRules RoundRulesFromConfig(const core::BotConfig& cfg) noexcept
{
    RoundRules r;
    r.damageThreshold = cfg.damageThreshold;
    r.lowWaterMark = cfg.lowWaterMark;
    r.targetDoses = cfg.targetCount * FullDoseValue(cfg.strategy);
    r.respawnSeconds = cfg.respawnSeconds;
    r.respawnMarginSeconds = cfg.respawnMarginSeconds;
    r.settleSeconds = cfg.roundSettleSeconds;
    r.canResupplyInArena = cfg.strategy == SurvivalStrategy::Crafted;
    return r;
}

WintertodtBot::WintertodtBot(GameClient& client, const core::BotConfig& cfg)
    : client_(client)
    , cfg_(cfg)
    , rules_(RoundRulesFromConfig(cfg))
    , locator_(client.state)
    , warmth_(client, cfg.strategy)
    , pipeline_(client, cfg.targetCount)
    , gear_(client, DefaultGearRequirements(cfg.convertEnabled))
    , rng_(cfg.seed, rng::Stream::Breaks)
{
}

// ---------------------------------------------------------------------------
// Run loop
// ---------------------------------------------------------------------------

RunOutcome WintertodtBot::run()
{
    spdlog::info("Starting run: {} min, strategy {}, threshold {}, target {}, fletching {}",
                 cfg_.runMinutes, SurvivalStrategyName(cfg_.strategy), cfg_.damageThreshold,
                 cfg_.targetCount, cfg_.convertEnabled ? "on" : "off");

    if (!gear_.ensureReady())
    {
        spdlog::critical("Gear bootstrap failed; stopping.");
        return RunOutcome::GearBootstrapFailed;
    }

    state_ = RoundState{};
    runStart_ = client_.clock.now();
    const double end = runStart_ + cfg_.runMinutes * 60.0;

    while (!stopRequested_ && client_.clock.now() < end)
    {
        tick();
        if (fatal_)
        {
            spdlog::critical("Run stopped: {}", RunOutcomeName(*fatal_));
            return *fatal_;
        }
        maybeTakeBreak();
        client_.clock.sleep(kLoopTickSeconds);
    }

    spdlog::info("Finished after {}. Rounds completed: {}",
                 FormatElapsed(client_.clock.now() - runStart_), state_.roundsCompleted);
    return stopRequested_ ? RunOutcome::Stopped : RunOutcome::Completed;
}

void WintertodtBot::tick()
{
    const Zone zone = locator_.locate();
    const bool inArena = IsArena(zone);

    if (inArena && !IsArena(lastZone_))
    {
        state_ = OnArenaEntered(std::move(state_));
        skipRestock_ = false;
    }
    if (!inArena)
        deferred_.reset();
    lastZone_ = zone;

    if (inArena)
        handleArena();
    else
        handleSafeArea();
}

ChatEvent WintertodtBot::pollChat()
{
    auto c = ClassifyChatLine(SafeChatLine(client_), state_.lastSeenChatLine);
    state_.lastSeenChatLine = std::move(c.lastSeenLine);
    if (c.event != ChatEvent::None)
        spdlog::debug("Chat event: {}", ChatEventName(c.event));
    return c.event;
}

std::optional<ResourceState> WintertodtBot::readResources()
{
    const auto inv = SafeInventory(client_);
    if (!inv)
        return std::nullopt;
    return ReadResourceState(*inv, SafeInventoryFull(client_), cfg_.strategy);
}

bool WintertodtBot::waitWhileBusy(double timeoutSeconds)
{
    const auto policy = RetryPolicy::ForTimeout(timeoutSeconds, 1.0);
    return RetryUntil(client_.clock, policy, [&] {
        if (SafeIsIdle(client_))
            return true;
        const ChatEvent e = pollChat();
        if (e != ChatEvent::None)
        {
            deferred_ = e;
            return true;
        }
        return false;
    });
}

void WintertodtBot::maybeTakeBreak()
{
    if (!cfg_.takeBreaks || state_.phase == RoundPhase::RoundActive)
        return;

    if (!rng_.chance(kBreakChance))
        return;

    const double secs = rng_.uniform(1.0, kMaxBreakSeconds);
    spdlog::info("Taking a {:.1f}s break.", secs);
    client_.clock.sleep(secs);
}

// ---------------------------------------------------------------------------
// Arena
// ---------------------------------------------------------------------------

void WintertodtBot::handleArena()
{
    // Without a trustworthy inventory the dose count would read as zero;
    // hold the round state until the next sample.
    const auto rs = readResources();
    if (!rs)
    {
        spdlog::warn("Inventory unreadable; holding the round state this tick.");
        client_.clock.sleep(kUnreadableBackoff);
        return;
    }

    ArenaTick t;
    t.now = client_.clock.now();
    if (deferred_)
    {
        t.event = *deferred_;
        deferred_.reset();
    }
    else
    {
        t.event = pollChat();
    }

    t.doses = rs->doses;
    t.rewardItems = rs->rewardItems;
    if (state_.phase == RoundPhase::AwaitingRound)
    {
        t.hazardVisible = AnyVisible(client_, TargetCategory::HazardSource)
                       || AnyVisible(client_, TargetCategory::RawMaterialSource);
    }

    const RoundPhase before = state_.phase;
    ArenaStep step = StepArena(std::move(state_), t, rules_);
    state_ = std::move(step.state);

    if (state_.phase != before)
        spdlog::info("Round phase: {} -> {}", RoundPhaseName(before), RoundPhaseName(state_.phase));

    switch (step.directive)
    {
    case ArenaDirective::Wait:
        client_.clock.sleep(kWaitDirectiveSeconds);
        break;
    case ArenaDirective::SettleRound: settleRound(); break;
    case ArenaDirective::Relight: relight(); break;
    case ArenaDirective::Repair: repair(); break;
    case ArenaDirective::Consume: consume(); break;
    case ArenaDirective::Resupply: resupply(); break;
    case ArenaDirective::ExitArena:
        spdlog::info("Leaving the arena ({} doses left).", t.doses);
        crossPassage(false);
        break;
    case ArenaDirective::Work: work(); break;
    }
}

void WintertodtBot::settleRound()
{
    spdlog::info("Round complete! Total rounds: {} (run time {})",
                 state_.roundsCompleted, FormatElapsed(client_.clock.now() - runStart_));
    client_.clock.sleep(rules_.settleSeconds);
}

void WintertodtBot::relight()
{
    if (!HoverNearest(client_, TargetCategory::HazardSource, 1.0))
        return;

    if (HoverShows(client_, "Light"))
    {
        client_.input.click();
        spdlog::info("Relighting the brazier.");
        client_.clock.sleep(kLightSeconds);
    }
    else if (HoverShows(client_, "Feed"))
    {
        spdlog::info("Brazier already relit; feeding instead.");
        client_.input.click();
        client_.clock.sleep(0.5);
        waitWhileBusy(kDepositTimeoutSeconds);
    }
    else
    {
        client_.clock.sleep(1.0);
    }
}

void WintertodtBot::repair()
{
    if (!HoverNearest(client_, TargetCategory::HazardSource, 1.0))
        return;

    if (!HoverShows(client_, "Fix"))
    {
        client_.clock.sleep(1.0);
        return;
    }
    client_.input.click();
    spdlog::info("Repairing the brazier.");
    client_.clock.sleep(kRepairSeconds);
}

void WintertodtBot::consume()
{
    if (!warmth_.consumeBest())
        spdlog::warn("Nothing to eat or drink.");
}

void WintertodtBot::resupply()
{
    const auto rs = readResources();
    if (!rs)
        return;
    if (rs->freeSlots < 2 && (rs->rawMaterial > 0 || rs->intermediate > 0))
    {
        spdlog::info("Making room for potion ingredients.");
        deposit();
        return;
    }

    const PipelineResult r = pipeline_.run();
    if (r.dosesAfter <= r.dosesBefore && !r.complete)
    {
        spdlog::warn("Potion production made no progress.");
        client_.clock.sleep(kWaitDirectiveSeconds);
    }
}

void WintertodtBot::work()
{
    if (!SafeIsIdle(client_))
    {
        client_.clock.sleep(1.0);
        return;
    }

    const auto rs = readResources();
    if (!rs)
        return;
    const PlannerAction action = NextResourceAction(rs->rawMaterial > 0, rs->intermediate > 0,
                                                    rs->inventoryFull, cfg_.convertEnabled);
    switch (action)
    {
    case PlannerAction::Gather: gather(); break;
    case PlannerAction::Convert: convert(); break;
    case PlannerAction::Deposit: deposit(); break;
    }
}

void WintertodtBot::gather()
{
    if (!HoverNearest(client_, TargetCategory::RawMaterialSource))
        return;
    if (!HoverShows(client_, "Chop"))
        return;

    client_.input.click();
    client_.clock.sleep(0.5);
    waitWhileBusy(kGatherTimeoutSeconds);
}

void WintertodtBot::convert()
{
    const auto inv = SafeInventory(client_);
    if (!inv)
        return;
    const auto knife = FirstSlotOf(*inv, items::kKnife);
    const auto root = FirstSlotOf(*inv, items::kBrumaRoot);
    if (!knife || !root)
    {
        spdlog::warn("Cannot fletch: {}", knife ? "no roots" : "no knife");
        return;
    }

    client_.input.clickInventorySlot(*knife);
    client_.clock.sleep(0.3);
    client_.input.clickInventorySlot(*root);
    client_.clock.sleep(0.5);
    waitWhileBusy(kConvertTimeoutSeconds);
}

void WintertodtBot::deposit()
{
    const auto rs = readResources();
    if (!rs)
        return;
    if (rs->rawMaterial == 0 && rs->intermediate == 0)
    {
        spdlog::info("No roots or kindling to feed.");
        return;
    }

    if (!HoverNearest(client_, TargetCategory::HazardSource))
        return;

    if (HoverShows(client_, "Feed"))
    {
        client_.input.click();
        client_.clock.sleep(0.5);
        waitWhileBusy(kDepositTimeoutSeconds);
    }
    else if (HoverShows(client_, "Light"))
    {
        client_.input.click();
        spdlog::info("Lighting the brazier.");
        client_.clock.sleep(kLightSeconds);
    }
    else if (HoverShows(client_, "Fix"))
    {
        // Broken without us seeing the message.
        client_.input.click();
        spdlog::info("Repairing the brazier.");
        client_.clock.sleep(kRepairSeconds);
    }
}

// ---------------------------------------------------------------------------
// Staging area
// ---------------------------------------------------------------------------

void WintertodtBot::handleSafeArea()
{
    const auto rs = readResources();
    if (!rs)
    {
        spdlog::warn("Inventory unreadable; waiting before the next staging step.");
        client_.clock.sleep(kUnreadableBackoff);
        return;
    }

    SafeAreaSnapshot s;
    s.hasLoot = rs->hasLoot;
    s.survivalUnits = rs->survivalUnits;
    s.targetUnits = cfg_.targetCount;
    s.restockAtBank = cfg_.strategy == SurvivalStrategy::Stocked && !skipRestock_;

    const SafeAreaAction action = PlanSafeArea(s);
    spdlog::debug("Staging area: {}", SafeAreaActionName(action));
    switch (action)
    {
    case SafeAreaAction::DepositLoot: depositLoot(); break;
    case SafeAreaAction::Restock: restock(); break;
    case SafeAreaAction::EnterArena: crossPassage(true); break;
    }
}

void WintertodtBot::depositLoot()
{
    if (!OpenBank(client_))
        return;

    const auto inv = SafeInventory(client_);
    if (!inv)
    {
        CloseBank(client_);
        return;
    }

    std::set<int> loot;
    for (const int id : *inv)
    {
        if (id != items::kEmptySlot && !items::IsProtected(id))
            loot.insert(id);
    }

    for (const int id : loot)
    {
        spdlog::info("Depositing {}.", items::ItemName(id));
        client_.bank.depositAll(id);
        client_.clock.sleep(0.3);
    }
    CloseBank(client_);
}

void WintertodtBot::restock()
{
    const auto sampled = readResources();
    if (!sampled)
        return;
    const int before = sampled->survivalUnits;
    const int wanted = cfg_.targetCount - before;
    if (wanted <= 0)
        return;

    if (!OpenBank(client_))
        return;

    spdlog::info("Withdrawing {} x {}.", wanted, cfg_.stockedItemName);
    SearchBank(client_, cfg_.stockedItemName);
    client_.bank.withdrawFirstMatch(wanted);
    client_.clock.sleep(0.6);
    client_.bank.closeSearch();
    CloseBank(client_);

    const auto checked = readResources();
    if (!checked)
    {
        spdlog::warn("Could not check the restock; trying again next tick.");
        return;
    }
    const int after = checked->survivalUnits;
    if (after > before)
    {
        restockFailures_ = 0;
        if (after < cfg_.targetCount)
            spdlog::warn("Only {} of {} {} available.", after, cfg_.targetCount, cfg_.stockedItemName);
        return;
    }

    ++restockFailures_;
    spdlog::warn("Restock attempt {} withdrew nothing.", restockFailures_);
    if (restockFailures_ < kMaxRestockFailures)
        return;

    if (after == 0)
    {
        spdlog::critical("No {} left in the bank.", cfg_.stockedItemName);
        fatal_ = RunOutcome::OutOfSupplies;
        return;
    }

    spdlog::warn("Entering with {} {} instead of {}.", after, cfg_.stockedItemName, cfg_.targetCount);
    restockFailures_ = 0;
    skipRestock_ = true;
}

bool WintertodtBot::crossPassage(bool intoArena)
{
    if (!HoverNearest(client_, TargetCategory::Passage))
        return false;

    client_.input.click();
    client_.clock.sleep(kPassageSettleSeconds);

    const RetryPolicy policy{ 10, 1.0 };
    const bool flipped = RetryUntil(client_.clock, policy, [&] {
        return IsArena(locator_.locate()) == intoArena;
    });

    if (!flipped)
    {
        spdlog::warn("Failed to {} the arena.", intoArena ? "enter" : "leave");
        return false;
    }

    spdlog::info("{} the arena.", intoArena ? "Entered" : "Left");
    if (intoArena)
    {
        state_ = OnArenaEntered(std::move(state_));
        skipRestock_ = false;
        lastZone_ = Zone::Arena;
    }
    else
    {
        deferred_.reset();
        lastZone_ = Zone::SafeArea;
    }
    return true;
}

} // namespace brazier::bot

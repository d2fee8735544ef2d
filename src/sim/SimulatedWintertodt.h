#pragma once

// Deterministic in-memory Wintertodt.
//
// Implements every client seam over a ManualClock (or any IClock): rounds on a
// fixed schedule, periodic cold damage while a round runs, brazier outages and
// breakage, roots/kindling/herbs/crate/potions, bank, equipment and the doors
// between the camp and the arena. State catches up with clock.now() lazily on
// every query, so the controller drives time purely through its sleeps.

#include "brazier/GameClient.h"
#include "brazier/Zone.h"
#include "core/Rng.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace brazier::sim {

struct SimSettings
{
    double firstRoundDelaySeconds = 20.0;
    double roundSeconds           = 150.0;
    double respawnSeconds         = 60.0;
    double coldIntervalSeconds    = 20.0;
    double coldJitterSeconds      = 2.0;
    double doorSeconds            = 2.0;

    double chopSeconds   = 2.4;
    double fletchSeconds = 1.8;
    double feedSeconds   = 1.2;
    double pickSeconds   = 1.8;
    double mixSeconds    = 1.2;

    int  supplyCratePoints = 500;  // points needed for a reward crate
    bool startInArena = false;
    bool startWithGear = true;     // rune axe equipped, tools carried, warm clothing
    int  bankFood = 100;           // salmon in the bank
    std::uint64_t seed = 0;
};

class SimulatedWintertodt final : public IGameState
                                , public ITargetFinder
                                , public IActuator
                                , public IBankPanel {
public:
    SimulatedWintertodt(IClock& clock, SimSettings settings = {});

    // Non-owning bundle over this simulator and its clock.
    [[nodiscard]] GameClient client() noexcept;

    // IGameState
    Position         playerPosition() override;
    std::string      latestChatLine() override;
    bool             isIdle() override;
    std::vector<int> inventory() override;
    bool             isInventoryFull() override;
    bool             isEquipped(int itemId) override;
    std::string      mouseoverText() override;

    // ITargetFinder
    std::vector<Target> find(TargetCategory category) override;

    // IActuator
    void moveTo(const Target& target) override;
    void click() override;
    void clickInventorySlot(int slot) override;
    void pressKey(std::string_view key) override;
    void typeText(std::string_view text) override;

    // IBankPanel
    bool isOpen() override;
    void depositAll(int itemId) override;
    void openSearch() override;
    void withdrawFirstMatch(int quantity) override;
    void closeSearch() override;

    // --- Inspection and setup (tests, demo summary) ---
    void setInventory(std::vector<int> slots);
    void equip(int itemId) { equipped_.insert(itemId); }
    void unequip(int itemId) { equipped_.erase(itemId); }
    void setBankStock(int itemId, int quantity);
    [[nodiscard]] int bankCount(int itemId) const;

    // Next `count` position queries throw.
    void failPositionQueries(int count) noexcept { positionFailures_ = count; }

    [[nodiscard]] Zone zone() const noexcept { return zone_; }
    [[nodiscard]] bool roundActive() const noexcept { return roundActive_; }
    [[nodiscard]] int  roundsSubdued() const noexcept { return roundsSubdued_; }
    [[nodiscard]] int  roundsWitnessed() const noexcept { return roundsWitnessed_; }
    [[nodiscard]] int  coldHits() const noexcept { return coldHits_; }
    [[nodiscard]] int  unitsConsumed() const noexcept { return unitsConsumed_; }
    [[nodiscard]] int  knockouts() const noexcept { return knockouts_; }
    [[nodiscard]] int  warmth() const noexcept { return warmth_; }
    [[nodiscard]] int  totalPoints() const noexcept { return totalPoints_; }
    [[nodiscard]] int  rewardCrates() const noexcept { return rewardCrates_; }

private:
    enum class Brazier : std::uint8_t { Unlit, Lit, Broken };
    enum class Activity : std::uint8_t { None, Chop, Fletch, Feed, Pick, Mix };

    void advance();
    void startRound();
    void endRound();
    void coldStrike();
    void stepActivity();
    void finishDoor();

    void startActivity(Activity a, double seconds);
    void hurt(int amount);
    void say(std::string line) { chat_ = std::move(line); }

    [[nodiscard]] bool targetPresent(TargetCategory c) const noexcept;
    [[nodiscard]] int  freeSlots() const noexcept;
    [[nodiscard]] int  firstSlot(int itemId) const noexcept;
    [[nodiscard]] bool carries(int itemId) const noexcept;
    [[nodiscard]] bool hasAxe() const noexcept;
    [[nodiscard]] int  warmthItemsWorn() const noexcept;
    bool addItem(int itemId);

    void clickHazard();

    IClock&     clock_;
    SimSettings s_;
    rng::Pcg32  rng_;

    Zone             zone_ = Zone::SafeArea;
    std::vector<int> inv_;
    std::set<int>    equipped_;
    std::vector<std::pair<int, int>> bank_; // item, quantity (bank order)
    bool             bankOpen_ = false;
    bool             searchOpen_ = false;
    std::string      bankFilter_;

    std::string                   chat_;
    std::optional<TargetCategory> hovered_;
    std::optional<int>            selectedSlot_;

    Brazier  brazier_ = Brazier::Unlit;
    Activity activity_ = Activity::None;
    double   activityNext_ = 0.0;
    double   activityPeriod_ = 0.0;
    std::optional<double> doorAt_;

    bool   roundActive_ = false;
    double roundStart_ = 0.0;
    double roundEnd_ = 0.0;
    double nextCold_ = 0.0;
    int    coldEvents_ = 0;
    int    roundPoints_ = 0;

    int warmth_ = 100;
    int positionFailures_ = 0;

    int roundsSubdued_ = 0;
    int roundsWitnessed_ = 0;
    int coldHits_ = 0;
    int unitsConsumed_ = 0;
    int knockouts_ = 0;
    int totalPoints_ = 0;
    int rewardCrates_ = 0;
};

} // namespace brazier::sim

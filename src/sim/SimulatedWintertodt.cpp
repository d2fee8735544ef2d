#include "sim/SimulatedWintertodt.h"

#include "brazier/Items.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace brazier::sim {

namespace {

constexpr Position kCampSpot{ 1630, 3958, 0 };   // region 6461
constexpr Position kArenaSpot{ 1630, 3990, 0 };  // region 6462

constexpr double kNever = std::numeric_limits<double>::infinity();

constexpr int kPotionWarmth = 15;
constexpr int kFoodWarmth = 12;
constexpr int kRootPoints = 10;
constexpr int kKindlingPoints = 25;
constexpr int kLightPoints = 25;
constexpr int kFixPoints = 25;

std::string Lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// One dose fewer; empty vial is dropped.
int Sip(int potion) noexcept
{
    switch (potion)
    {
    case items::kRejuvenation4: return items::kRejuvenation3;
    case items::kRejuvenation3: return items::kRejuvenation2;
    case items::kRejuvenation2: return items::kRejuvenation1;
    default: return items::kEmptySlot;
    }
}

} // namespace

SimulatedWintertodt::SimulatedWintertodt(IClock& clock, SimSettings settings)
    : clock_(clock)
    , s_(settings)
    , rng_(settings.seed, rng::Stream::Cold)
    , zone_(settings.startInArena ? Zone::Arena : Zone::SafeArea)
    , inv_(items::kInventorySlots, items::kEmptySlot)
{
    roundStart_ = clock_.now() + s_.firstRoundDelaySeconds;

    if (s_.startWithGear)
    {
        equipped_ = { 1359, 20704, 20706, 20708, 20710 }; // rune axe, pyromancer outfit
        inv_[0] = items::kTinderbox;
        inv_[1] = items::kHammer;
        inv_[2] = items::kKnife;
    }

    bank_ = {
        { 329, s_.bankFood },           // salmon
        { 1359, 1 },                    // rune axe
        { items::kTinderbox, 1 },
        { items::kHammer, 1 },
        { items::kKnife, 1 },
    };
}

GameClient SimulatedWintertodt::client() noexcept
{
    return GameClient{ *this, *this, *this, *this, clock_ };
}

// ---------------------------------------------------------------------------
// Event processing
// ---------------------------------------------------------------------------

void SimulatedWintertodt::advance()
{
    const double now = clock_.now();

    for (;;)
    {
        const double tDoor = doorAt_.value_or(kNever);
        const double tAct = activity_ != Activity::None ? activityNext_ : kNever;
        const double tRound = roundActive_ ? std::min(roundEnd_, nextCold_) : roundStart_;

        const double t = std::min({ tDoor, tAct, tRound });
        if (t > now)
            break;

        if (t == tDoor)
            finishDoor();
        else if (t == tAct)
            stepActivity();
        else if (!roundActive_)
            startRound();
        else if (nextCold_ < roundEnd_)
            coldStrike();
        else
            endRound();
    }
}

void SimulatedWintertodt::startRound()
{
    roundActive_ = true;
    roundEnd_ = roundStart_ + s_.roundSeconds;
    nextCold_ = roundStart_ + s_.coldIntervalSeconds;
    roundPoints_ = 0;
    brazier_ = Brazier::Unlit;
    spdlog::debug("[sim] round starts at {:.1f}", roundStart_);
}

void SimulatedWintertodt::endRound()
{
    roundActive_ = false;
    ++roundsSubdued_;

    if (zone_ == Zone::Arena)
    {
        ++roundsWitnessed_;
        say(fmt::format("The Wintertodt has been subdued! Your subdued Wintertodt count is: {}.", roundsSubdued_));
        if (activity_ == Activity::Feed)
            activity_ = Activity::None;
        if (roundPoints_ >= s_.supplyCratePoints && addItem(items::kSupplyCrate))
            ++rewardCrates_;
    }

    totalPoints_ += roundPoints_;
    roundStart_ = roundEnd_ + s_.respawnSeconds;
}

void SimulatedWintertodt::coldStrike()
{
    ++coldEvents_;
    const double jitter = rng_.uniform(-s_.coldJitterSeconds, s_.coldJitterSeconds);
    nextCold_ += std::max(1.0, s_.coldIntervalSeconds + jitter);

    if (zone_ != Zone::Arena)
        return;

    const int n = coldEvents_;
    const int hit = std::max(2, 12 - 2 * warmthItemsWorn());

    if (n % 5 == 0 && brazier_ == Brazier::Lit)
    {
        brazier_ = Brazier::Unlit;
        if (activity_ == Activity::Feed)
            activity_ = Activity::None;
        say("The brazier has gone out.");
        return;
    }
    if (n % 4 == 0 && brazier_ == Brazier::Lit)
    {
        brazier_ = Brazier::Broken;
        activity_ = Activity::None;
        say("The brazier is broken and shrapnel damages you.");
        hurt(hit);
        return;
    }

    activity_ = Activity::None;
    say(n % 2 == 1 ? "The cold of the Wintertodt seeps into your bones."
                   : "The freezing cold attack of the Wintertodt's magic hits you.");
    hurt(hit);
}

void SimulatedWintertodt::hurt(int amount)
{
    ++coldHits_;
    warmth_ -= amount;
    if (warmth_ > 0)
        return;

    // Carried out of the arena; the round's materials are lost.
    ++knockouts_;
    warmth_ = 100;
    for (int& id : inv_)
    {
        if (id == items::kBrumaRoot || id == items::kBrumaKindling)
            id = items::kEmptySlot;
    }
    zone_ = Zone::SafeArea;
    activity_ = Activity::None;
    hovered_.reset();
    say("You have been overwhelmed by the cold.");
}

void SimulatedWintertodt::startActivity(Activity a, double seconds)
{
    activity_ = a;
    activityPeriod_ = seconds;
    activityNext_ = clock_.now() + seconds;
}

void SimulatedWintertodt::stepActivity()
{
    activityNext_ += activityPeriod_;

    switch (activity_)
    {
    case Activity::Chop:
        if (!addItem(items::kBrumaRoot) || freeSlots() == 0)
        {
            activity_ = Activity::None;
            say("Your inventory is too full to hold any more roots.");
        }
        break;

    case Activity::Fletch:
    {
        const int slot = firstSlot(items::kBrumaRoot);
        if (slot >= 0)
            inv_[slot] = items::kBrumaKindling;
        if (firstSlot(items::kBrumaRoot) < 0)
            activity_ = Activity::None;
        break;
    }

    case Activity::Feed:
    {
        if (brazier_ != Brazier::Lit || !roundActive_)
        {
            activity_ = Activity::None;
            break;
        }
        int slot = firstSlot(items::kBrumaKindling);
        int points = kKindlingPoints;
        if (slot < 0)
        {
            slot = firstSlot(items::kBrumaRoot);
            points = kRootPoints;
        }
        if (slot < 0)
        {
            activity_ = Activity::None;
            break;
        }
        inv_[slot] = items::kEmptySlot;
        roundPoints_ += points;
        if (firstSlot(items::kBrumaKindling) < 0 && firstSlot(items::kBrumaRoot) < 0)
            activity_ = Activity::None;
        break;
    }

    case Activity::Pick:
        addItem(items::kBrumaHerb);
        activity_ = Activity::None;
        break;

    case Activity::Mix:
    {
        const int herb = firstSlot(items::kBrumaHerb);
        const int unf = firstSlot(items::kRejuvenationUnf);
        if (herb >= 0 && unf >= 0)
        {
            inv_[herb] = items::kEmptySlot;
            inv_[unf] = items::kRejuvenation4;
        }
        if (firstSlot(items::kBrumaHerb) < 0 || firstSlot(items::kRejuvenationUnf) < 0)
            activity_ = Activity::None;
        break;
    }

    case Activity::None:
        break;
    }
}

void SimulatedWintertodt::finishDoor()
{
    doorAt_.reset();
    zone_ = zone_ == Zone::Arena ? Zone::SafeArea : Zone::Arena;
    hovered_.reset();
    bankOpen_ = false;
}

// ---------------------------------------------------------------------------
// Inventory helpers
// ---------------------------------------------------------------------------

int SimulatedWintertodt::freeSlots() const noexcept
{
    return static_cast<int>(std::count(inv_.begin(), inv_.end(), items::kEmptySlot));
}

int SimulatedWintertodt::firstSlot(int itemId) const noexcept
{
    const auto it = std::find(inv_.begin(), inv_.end(), itemId);
    return it == inv_.end() ? -1 : static_cast<int>(it - inv_.begin());
}

bool SimulatedWintertodt::carries(int itemId) const noexcept
{
    return firstSlot(itemId) >= 0;
}

bool SimulatedWintertodt::hasAxe() const noexcept
{
    return std::any_of(items::kAxes.begin(), items::kAxes.end(),
                       [&](int id) { return equipped_.count(id) > 0 || carries(id); });
}

int SimulatedWintertodt::warmthItemsWorn() const noexcept
{
    return static_cast<int>(std::count_if(equipped_.begin(), equipped_.end(), items::IsWarmthItem));
}

bool SimulatedWintertodt::addItem(int itemId)
{
    const int slot = firstSlot(items::kEmptySlot);
    if (slot < 0)
        return false;
    inv_[slot] = itemId;
    return true;
}

void SimulatedWintertodt::setInventory(std::vector<int> slots)
{
    slots.resize(items::kInventorySlots, items::kEmptySlot);
    inv_ = std::move(slots);
}

void SimulatedWintertodt::setBankStock(int itemId, int quantity)
{
    for (auto& [id, qty] : bank_)
    {
        if (id == itemId)
        {
            qty = quantity;
            return;
        }
    }
    bank_.emplace_back(itemId, quantity);
}

int SimulatedWintertodt::bankCount(int itemId) const
{
    for (const auto& [id, qty] : bank_)
    {
        if (id == itemId)
            return qty;
    }
    return 0;
}

// ---------------------------------------------------------------------------
// IGameState
// ---------------------------------------------------------------------------

Position SimulatedWintertodt::playerPosition()
{
    advance();
    if (positionFailures_ > 0)
    {
        --positionFailures_;
        throw std::runtime_error("client position unavailable");
    }
    return zone_ == Zone::Arena ? kArenaSpot : kCampSpot;
}

std::string SimulatedWintertodt::latestChatLine()
{
    advance();
    return chat_;
}

bool SimulatedWintertodt::isIdle()
{
    advance();
    return activity_ == Activity::None && !doorAt_;
}

std::vector<int> SimulatedWintertodt::inventory()
{
    advance();
    return inv_;
}

bool SimulatedWintertodt::isInventoryFull()
{
    advance();
    return freeSlots() == 0;
}

bool SimulatedWintertodt::isEquipped(int itemId)
{
    return equipped_.count(itemId) > 0;
}

std::string SimulatedWintertodt::mouseoverText()
{
    advance();
    if (!hovered_ || !targetPresent(*hovered_))
        return {};

    switch (*hovered_)
    {
    case TargetCategory::HazardSource:
        switch (brazier_)
        {
        case Brazier::Lit: return "Feed Burning brazier";
        case Brazier::Unlit: return "Light Brazier";
        case Brazier::Broken: return "Fix Brazier";
        }
        break;
    case TargetCategory::RawMaterialSource: return "Chop Bruma roots";
    case TargetCategory::Passage: return "Enter Doors of Dinh";
    case TargetCategory::DepositPoint: return "Bank Bank chest";
    case TargetCategory::IngredientSource: return "Pick Sprouting roots";
    case TargetCategory::SupplySource: return "Take-from Crate";
    }
    return {};
}

// ---------------------------------------------------------------------------
// ITargetFinder
// ---------------------------------------------------------------------------

bool SimulatedWintertodt::targetPresent(TargetCategory c) const noexcept
{
    if (c == TargetCategory::Passage)
        return true;
    if (zone_ == Zone::Arena)
        return c != TargetCategory::DepositPoint;
    return c == TargetCategory::DepositPoint;
}

std::vector<Target> SimulatedWintertodt::find(TargetCategory category)
{
    advance();
    if (!targetPresent(category))
        return {};

    switch (category)
    {
    case TargetCategory::HazardSource: return { { category, 412, 220, 80.0 } };
    case TargetCategory::RawMaterialSource: return { { category, 470, 260, 150.0 }, { category, 120, 90, 310.0 } };
    case TargetCategory::Passage: return { { category, 330, 420, zone_ == Zone::Arena ? 300.0 : 200.0 } };
    case TargetCategory::DepositPoint: return { { category, 300, 180, 120.0 } };
    case TargetCategory::IngredientSource: return { { category, 520, 300, 220.0 } };
    case TargetCategory::SupplySource: return { { category, 200, 330, 260.0 } };
    }
    return {};
}

// ---------------------------------------------------------------------------
// IActuator
// ---------------------------------------------------------------------------

void SimulatedWintertodt::moveTo(const Target& target)
{
    advance();
    hovered_ = targetPresent(target.category) ? std::optional<TargetCategory>(target.category) : std::nullopt;
}

void SimulatedWintertodt::clickHazard()
{
    switch (brazier_)
    {
    case Brazier::Lit:
        if (roundActive_ && (carries(items::kBrumaKindling) || carries(items::kBrumaRoot)))
            startActivity(Activity::Feed, s_.feedSeconds);
        break;
    case Brazier::Unlit:
        if (!roundActive_)
        {
            say("The brazier is too cold to light right now.");
        }
        else if (carries(items::kTinderbox))
        {
            brazier_ = Brazier::Lit;
            roundPoints_ += kLightPoints;
            say("You light the brazier.");
        }
        break;
    case Brazier::Broken:
        if (carries(items::kHammer))
        {
            brazier_ = Brazier::Unlit;
            roundPoints_ += kFixPoints;
            say("You fix the brazier.");
        }
        break;
    }
}

void SimulatedWintertodt::click()
{
    advance();
    selectedSlot_.reset();
    if (!hovered_ || !targetPresent(*hovered_) || doorAt_)
        return;

    switch (*hovered_)
    {
    case TargetCategory::DepositPoint:
        bankOpen_ = true;
        break;

    case TargetCategory::Passage:
        activity_ = Activity::None;
        bankOpen_ = false;
        doorAt_ = clock_.now() + s_.doorSeconds;
        break;

    case TargetCategory::HazardSource:
        clickHazard();
        break;

    case TargetCategory::RawMaterialSource:
        if (hasAxe() && freeSlots() > 0)
            startActivity(Activity::Chop, s_.chopSeconds);
        break;

    case TargetCategory::IngredientSource:
        if (freeSlots() > 0)
            startActivity(Activity::Pick, s_.pickSeconds);
        break;

    case TargetCategory::SupplySource:
        activity_ = Activity::None;
        if (!addItem(items::kRejuvenationUnf))
            say("You don't have enough inventory space.");
        break;
    }
}

void SimulatedWintertodt::clickInventorySlot(int slot)
{
    advance();
    if (slot < 0 || slot >= static_cast<int>(inv_.size()) || bankOpen_)
        return;

    const int id = inv_[slot];

    if (selectedSlot_)
    {
        const int a = inv_[*selectedSlot_];
        selectedSlot_.reset();
        const auto pair = [&](int x, int y) { return (a == x && id == y) || (a == y && id == x); };
        if (pair(items::kKnife, items::kBrumaRoot))
            startActivity(Activity::Fletch, s_.fletchSeconds);
        else if (pair(items::kBrumaHerb, items::kRejuvenationUnf))
            startActivity(Activity::Mix, s_.mixSeconds);
        else
            say("Nothing interesting happens.");
        return;
    }

    if (id == items::kEmptySlot)
        return;

    if (items::IsPotion(id))
    {
        activity_ = Activity::None;
        inv_[slot] = Sip(id);
        warmth_ = std::min(100, warmth_ + kPotionWarmth);
        ++unitsConsumed_;
        say("You drink some of your rejuvenation potion.");
    }
    else if (items::IsFood(id))
    {
        activity_ = Activity::None;
        inv_[slot] = items::kEmptySlot;
        warmth_ = std::min(100, warmth_ + kFoodWarmth);
        ++unitsConsumed_;
        say(fmt::format("You eat the {}.", Lower(items::ItemName(id))));
    }
    else
    {
        selectedSlot_ = slot;
    }
}

void SimulatedWintertodt::pressKey(std::string_view key)
{
    advance();
    if (Lower(key) == "escape")
    {
        bankOpen_ = false;
        searchOpen_ = false;
        bankFilter_.clear();
        selectedSlot_.reset();
    }
}

void SimulatedWintertodt::typeText(std::string_view text)
{
    advance();
    if (bankOpen_ && searchOpen_)
        bankFilter_ = Lower(text);
}

// ---------------------------------------------------------------------------
// IBankPanel
// ---------------------------------------------------------------------------

bool SimulatedWintertodt::isOpen()
{
    advance();
    return bankOpen_;
}

void SimulatedWintertodt::depositAll(int itemId)
{
    advance();
    if (!bankOpen_)
        return;

    int moved = 0;
    for (int& id : inv_)
    {
        if (id == itemId)
        {
            id = items::kEmptySlot;
            ++moved;
        }
    }
    if (moved > 0)
        setBankStock(itemId, bankCount(itemId) + moved);
}

void SimulatedWintertodt::openSearch()
{
    advance();
    if (!bankOpen_)
        return;
    searchOpen_ = true;
    bankFilter_.clear();
}

void SimulatedWintertodt::withdrawFirstMatch(int quantity)
{
    advance();
    if (!bankOpen_ || quantity <= 0)
        return;

    for (auto& [id, qty] : bank_)
    {
        if (qty <= 0)
            continue;
        if (!bankFilter_.empty() && Lower(items::ItemName(id)).find(bankFilter_) == std::string::npos)
            continue;

        const int n = std::min({ quantity, qty, freeSlots() });
        for (int i = 0; i < n; ++i)
            addItem(id);
        qty -= n;
        return;
    }
}

void SimulatedWintertodt::closeSearch()
{
    advance();
    searchOpen_ = false;
    bankFilter_.clear();
}

} // namespace brazier::sim

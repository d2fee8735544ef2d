// include/brazier/GameClient.h
#pragma once

#include "brazier/Clock.h"
#include "brazier/Zone.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brazier {

// Categories of on-screen objects the operator tags in the client.
enum class TargetCategory : std::uint8_t
{
    HazardSource = 0,   // brazier
    RawMaterialSource,  // bruma roots
    Passage,            // doors of Dinh
    DepositPoint,       // bank chest
    IngredientSource,   // sprouting roots (bruma herb)
    SupplySource,       // crate of unfinished potions
};

[[nodiscard]] const char* TargetCategoryName(TargetCategory c) noexcept;

struct Target
{
    TargetCategory category = TargetCategory::HazardSource;
    int            x = 0;          // screen coordinates
    int            y = 0;
    double         distance = 0.0; // from the centre of the game view
};

[[nodiscard]] std::optional<Target> Nearest(const std::vector<Target>& candidates);

// Status queries. Any call may throw; callers substitute a safe default.
class IGameState {
public:
    virtual ~IGameState() = default;

    virtual Position         playerPosition() = 0;
    virtual std::string      latestChatLine() = 0;  // empty when nothing new is shown
    virtual bool             isIdle() = 0;
    virtual std::vector<int> inventory() = 0;        // slot order, items::kEmptySlot for empty
    virtual bool             isInventoryFull() = 0;
    virtual bool             isEquipped(int itemId) = 0;
    virtual std::string      mouseoverText() = 0;
};

class ITargetFinder {
public:
    virtual ~ITargetFinder() = default;

    virtual std::vector<Target> find(TargetCategory category) = 0;
};

// Fire-and-forget input; success is only visible through later queries.
class IActuator {
public:
    virtual ~IActuator() = default;

    virtual void moveTo(const Target& target) = 0;
    virtual void click() = 0;
    virtual void clickInventorySlot(int slot) = 0;
    virtual void pressKey(std::string_view key) = 0;
    virtual void typeText(std::string_view text) = 0;
};

// Operations on an open bank panel.
class IBankPanel {
public:
    virtual ~IBankPanel() = default;

    virtual bool isOpen() = 0;
    virtual void depositAll(int itemId) = 0;
    virtual void openSearch() = 0;    // text goes in through IActuator::typeText
    virtual void withdrawFirstMatch(int quantity) = 0;
    virtual void closeSearch() = 0;
};

// Everything the controller talks to. Non-owning.
struct GameClient
{
    IGameState&    state;
    ITargetFinder& targets;
    IActuator&     input;
    IBankPanel&    bank;
    IClock&        clock;
};

} // namespace brazier

#include "bot/ClientOps.h"

#include "brazier/Retry.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace brazier::bot {

std::optional<std::vector<int>> SafeInventory(GameClient& c)
{
    try
    {
        return c.state.inventory();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Inventory query failed: {}", e.what());
        return std::nullopt;
    }
}

bool SafeInventoryFull(GameClient& c)
{
    try
    {
        return c.state.isInventoryFull();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Inventory-full query failed: {}", e.what());
        return false;
    }
}

bool SafeIsIdle(GameClient& c)
{
    try
    {
        return c.state.isIdle();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Idle query failed: {}", e.what());
        return true;
    }
}

std::string SafeChatLine(GameClient& c)
{
    try
    {
        return c.state.latestChatLine();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Chat query failed: {}", e.what());
        return {};
    }
}

bool SafeIsEquipped(GameClient& c, int itemId)
{
    try
    {
        return c.state.isEquipped(itemId);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Equipment query failed: {}", e.what());
        return false;
    }
}

bool SafeBankOpen(GameClient& c)
{
    try
    {
        return c.bank.isOpen();
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Bank state query failed: {}", e.what());
        return false;
    }
}

std::optional<Target> FindNearest(GameClient& c, TargetCategory category)
{
    try
    {
        return Nearest(c.targets.find(category));
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Target query for {} failed: {}", TargetCategoryName(category), e.what());
        return std::nullopt;
    }
}

bool AnyVisible(GameClient& c, TargetCategory category)
{
    return FindNearest(c, category).has_value();
}

bool HoverShows(GameClient& c, std::string_view action)
{
    try
    {
        return c.state.mouseoverText().find(action) != std::string::npos;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Mouseover query failed: {}", e.what());
        return false;
    }
}

std::optional<Target> HoverNearest(GameClient& c, TargetCategory category, double missBackoffSeconds)
{
    const auto target = FindNearest(c, category);
    if (!target)
    {
        spdlog::warn("No tagged {} found. Tag it in the client.", TargetCategoryName(category));
        c.clock.sleep(missBackoffSeconds);
        return std::nullopt;
    }
    c.input.moveTo(*target);
    return target;
}

bool OpenBank(GameClient& c)
{
    if (SafeBankOpen(c))
        return true;

    if (!HoverNearest(c, TargetCategory::DepositPoint))
        return false;

    if (!HoverShows(c, "Bank") && !HoverShows(c, "Use"))
    {
        c.clock.sleep(0.5);
        return false;
    }
    c.input.click();
    c.clock.sleep(1.5);

    const RetryPolicy policy{ 3, 0.6 };
    if (!RetryUntil(c.clock, policy, [&] { return SafeBankOpen(c); }))
    {
        spdlog::warn("Bank did not open.");
        return false;
    }
    return true;
}

void CloseBank(GameClient& c)
{
    c.input.pressKey("escape");
    c.clock.sleep(0.8);
}

void SearchBank(GameClient& c, std::string_view text)
{
    c.bank.openSearch();
    c.clock.sleep(0.6);
    c.input.typeText(text);
    c.clock.sleep(0.6);
}

std::optional<int> FirstSlotOf(const std::vector<int>& inventory, int itemId)
{
    for (std::size_t i = 0; i < inventory.size(); ++i)
    {
        if (inventory[i] == itemId)
            return static_cast<int>(i);
    }
    return std::nullopt;
}

} // namespace brazier::bot

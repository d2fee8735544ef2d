#include "bot/RegionLocator.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace brazier::bot {

Zone RegionLocator::locate() noexcept
{
    try
    {
        const Position pos = state_.playerPosition();
        lastRegionId_ = RegionIdFromPosition(pos);
        return ZoneFromRegionId(lastRegionId_);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("Position query failed: {}", e.what());
        lastRegionId_ = -1;
        return Zone::Unknown;
    }
}

} // namespace brazier::bot

#pragma once

#include <cstdint>

namespace brazier {

enum class Zone : std::uint8_t
{
    Unknown = 0,
    Arena,
    SafeArea,
};

[[nodiscard]] inline const char* ZoneName(Zone z) noexcept
{
    switch (z)
    {
    case Zone::Unknown: return "unknown";
    case Zone::Arena: return "arena";
    case Zone::SafeArea: return "safe-area";
    }
    return "?";
}

// Raw world position as reported by the client.
struct Position
{
    int x = 0;
    int y = 0;
    int plane = 0;
};

// Map regions are 64x64 tiles:
//   regionId = ((x >> 6) << 8) | (y >> 6)
// The doors at y=3968 split the camp region from the arena region.
inline constexpr int kArenaRegionId = 6462;
inline constexpr int kCampRegionId  = 6461;

[[nodiscard]] constexpr int RegionIdFromPosition(const Position& p) noexcept
{
    return ((p.x >> 6) << 8) | (p.y >> 6);
}

[[nodiscard]] constexpr Zone ZoneFromRegionId(int regionId) noexcept
{
    if (regionId == kArenaRegionId) return Zone::Arena;
    if (regionId == kCampRegionId) return Zone::SafeArea;
    return Zone::Unknown;
}

// Unknown never counts as the arena.
[[nodiscard]] constexpr bool IsArena(Zone z) noexcept { return z == Zone::Arena; }

} // namespace brazier

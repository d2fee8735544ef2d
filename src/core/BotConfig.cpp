#include "core/BotConfig.h"

#include "core/AtomicFile.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace brazier::core {

namespace {
    // Settings JSON schema version.
    //
    // NOTE: SaveBotConfig always writes the latest schema version. Version 0
    // files (flat keys from early scripts) are migrated on load.
    constexpr int kBotConfigSchemaVersion = 1;

    constexpr int kMinRunMinutes = 1;
    constexpr int kMaxRunMinutes = 500;

    constexpr int kMinDamageThreshold = 1;
    constexpr int kMaxDamageThreshold = 20;

    constexpr int kMinTargetCount = 1;
    constexpr int kMaxTargetCount = 20;

    constexpr int kMaxLowWaterMark = 20;

    constexpr std::size_t kMaxConfigBytes = 1u * 1024u * 1024u; // 1 MiB guardrail

    int ClampInt(int v, int lo, int hi) noexcept { return std::clamp(v, lo, hi); }

    double ClampSeconds(double v, double lo, double hi) noexcept
    {
        if (!(v == v)) return lo; // NaN
        return std::clamp(v, lo, hi);
    }

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(p, ec))
            return false;
        const auto size = std::filesystem::file_size(p, ec);
        if (ec || size > kMaxConfigBytes)
            return false;

        std::string err;
        if (!io::read_all(p, out, &err))
        {
            spdlog::warn("LoadBotConfig: failed to read {} ({})", p.string(), err);
            return false;
        }

        // Treat empty files as "no config".
        if (out.empty())
            return false;

        // Strip a UTF-8 BOM left behind by some editors.
        if (out.size() >= 3 && static_cast<unsigned char>(out[0]) == 0xEF
            && static_cast<unsigned char>(out[1]) == 0xBB && static_cast<unsigned char>(out[2]) == 0xBF)
            out.erase(0, 3);

        return true;
    }

    int ReadConfigVersion(const nlohmann::json& j) noexcept
    {
        if (auto it = j.find("version"); it != j.end() && it->is_number_integer())
            return it->get<int>();
        return 0;
    }

    nlohmann::json& EnsureObject(nlohmann::json& j, const char* key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_object())
        {
            j[key] = nlohmann::json::object();
            return j[key];
        }
        return *it;
    }

    // Early configs were flat option dictionaries (running_time, hp_threshold, ...).
    // Copy those into the nested layout unless the nested key already exists.
    void NormalizeLegacyConfigJson(nlohmann::json& j, int fileVersion)
    {
        if (!j.is_object() || fileVersion >= kBotConfigSchemaVersion)
            return;

        auto& run      = EnsureObject(j, "run");
        auto& survival = EnsureObject(j, "survival");
        auto& gather   = EnsureObject(j, "gather");

        auto copy_if_missing = [&](const char* legacyKey, nlohmann::json& dst, const char* dstKey)
        {
            if (dst.contains(dstKey))
                return;
            auto it = j.find(legacyKey);
            if (it != j.end())
                dst[dstKey] = *it;
        };

        copy_if_missing("running_time", run, "minutes");
        copy_if_missing("take_breaks", run, "takeBreaks");
        copy_if_missing("damage_threshold", survival, "damageThreshold");
        copy_if_missing("food_count", survival, "targetCount");
        copy_if_missing("potion_count", survival, "targetCount");
        copy_if_missing("fletch_roots", gather, "convertEnabled");
    }

    template <class T>
    void ReadInt(const nlohmann::json& obj, const char* key, T& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_number_integer())
        {
            const auto v = it->get<std::int64_t>();
            dst = static_cast<T>(std::clamp<std::int64_t>(v,
                std::numeric_limits<T>::min(), std::numeric_limits<T>::max()));
        }
    }

    void ReadBool(const nlohmann::json& obj, const char* key, bool& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_boolean())
            dst = it->get<bool>();
    }

    void ReadSeconds(const nlohmann::json& obj, const char* key, double& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_number())
            dst = it->get<double>();
    }
}

void ClampBotConfig(BotConfig& cfg) noexcept
{
    cfg.runMinutes = ClampInt(cfg.runMinutes, kMinRunMinutes, kMaxRunMinutes);
    cfg.damageThreshold = ClampInt(cfg.damageThreshold, kMinDamageThreshold, kMaxDamageThreshold);
    cfg.targetCount = ClampInt(cfg.targetCount, kMinTargetCount, kMaxTargetCount);
    cfg.lowWaterMark = ClampInt(cfg.lowWaterMark, 0, kMaxLowWaterMark);
    cfg.respawnSeconds = ClampSeconds(cfg.respawnSeconds, 1.0, 600.0);
    cfg.respawnMarginSeconds = ClampSeconds(cfg.respawnMarginSeconds, 0.0, 120.0);
    cfg.roundSettleSeconds = ClampSeconds(cfg.roundSettleSeconds, 0.0, 30.0);
}

bool LoadBotConfig(BotConfig& out, const std::filesystem::path& path) noexcept
{
    std::string text;
    if (!ReadFileToString(path, text))
        return false;

    // Allow // comments, and avoid exceptions.
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        spdlog::warn("LoadBotConfig: {} is not a JSON object", path.string());
        return false;
    }

    BotConfig tmp = out;
    try
    {
        const int fileVersion = ReadConfigVersion(j);
        NormalizeLegacyConfigJson(j, fileVersion);

        if (const auto it = j.find("run"); it != j.end() && it->is_object())
        {
            ReadInt(*it, "minutes", tmp.runMinutes);
            ReadBool(*it, "takeBreaks", tmp.takeBreaks);
            if (auto s = it->find("seed"); s != it->end() && s->is_number_unsigned())
                tmp.seed = static_cast<unsigned>(s->get<std::uint64_t>());
        }

        if (const auto it = j.find("survival"); it != j.end() && it->is_object())
        {
            if (auto s = it->find("strategy"); s != it->end() && s->is_string())
            {
                if (const auto parsed = ParseSurvivalStrategy(s->get<std::string>()))
                    tmp.strategy = *parsed;
            }
            ReadInt(*it, "damageThreshold", tmp.damageThreshold);
            ReadInt(*it, "targetCount", tmp.targetCount);
            ReadInt(*it, "lowWaterMark", tmp.lowWaterMark);
            if (auto n = it->find("stockedItemName"); n != it->end() && n->is_string() && !n->get<std::string>().empty())
                tmp.stockedItemName = n->get<std::string>();
        }

        if (const auto it = j.find("gather"); it != j.end() && it->is_object())
            ReadBool(*it, "convertEnabled", tmp.convertEnabled);

        if (const auto it = j.find("timing"); it != j.end() && it->is_object())
        {
            ReadSeconds(*it, "respawnSeconds", tmp.respawnSeconds);
            ReadSeconds(*it, "respawnMarginSeconds", tmp.respawnMarginSeconds);
            ReadSeconds(*it, "roundSettleSeconds", tmp.roundSettleSeconds);
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        spdlog::warn("LoadBotConfig: {} has unexpected layout ({})", path.string(), e.what());
        return false;
    }

    ClampBotConfig(tmp);
    out = tmp;
    return true;
}

bool SaveBotConfig(const BotConfig& cfg, const std::filesystem::path& path) noexcept
{
    BotConfig c = cfg;
    ClampBotConfig(c);

    nlohmann::json j;
    j["version"] = kBotConfigSchemaVersion;
    j["run"] = {
        {"minutes", c.runMinutes},
        {"takeBreaks", c.takeBreaks},
        {"seed", c.seed},
    };
    j["survival"] = {
        {"strategy", SurvivalStrategyName(c.strategy)},
        {"damageThreshold", c.damageThreshold},
        {"targetCount", c.targetCount},
        {"lowWaterMark", c.lowWaterMark},
        {"stockedItemName", c.stockedItemName},
    };
    j["gather"] = {
        {"convertEnabled", c.convertEnabled},
    };
    j["timing"] = {
        {"respawnSeconds", c.respawnSeconds},
        {"respawnMarginSeconds", c.respawnMarginSeconds},
        {"roundSettleSeconds", c.roundSettleSeconds},
    };

    std::string payload;
    try
    {
        payload = j.dump(4);
    }
    catch (const nlohmann::json::exception& e)
    {
        spdlog::warn("SaveBotConfig: cannot serialize config ({})", e.what());
        return false;
    }
    payload.push_back('\n');

    std::string err;
    if (!io::write_atomic(path, payload, &err))
    {
        spdlog::warn("SaveBotConfig: failed to write {} ({})", path.string(), err);
        return false;
    }
    return true;
}

} // namespace brazier::core

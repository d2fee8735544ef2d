#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace brazier::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Accept either:
//   --opt=value
//   --opt:value
[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Option names are case-insensitive; values (paths) keep their case.
        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        auto addUnknown = [&]() { out.unknown.emplace_back(raw); };

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

        // Simple flags
        if (arg == "--write-config") { out.writeConfig = true; continue; }
        if (arg == "--realtime") { out.realtime = true; continue; }
        if (arg == "--fletch") { out.convertEnabled = true; continue; }
        if (arg == "--no-fletch") { out.convertEnabled = false; continue; }
        if (arg == "--breaks") { out.takeBreaks = true; continue; }
        if (arg == "--no-breaks") { out.takeBreaks = false; continue; }

        // Options with values. The value either follows the separator inside
        // the same argument or is the next argument.
        auto valueFor = [&](std::string_view name, std::string_view& value) -> bool {
            std::string_view inlineValue;
            if (ConsumeValue(arg, name, inlineValue)) {
                value = raw.substr(name.size() + 1);
                return true;
            }
            if (arg != name)
                return false;
            if (i + 1 >= argc) {
                value = {};
                return true;
            }
            value = argv[++i];
            return true;
        };

        std::string_view value;

        if (valueFor("--config", value)) {
            if (value.empty()) addUnknown(); else out.configPath = std::string(value);
            continue;
        }
        if (valueFor("--log-dir", value)) {
            if (value.empty()) addUnknown(); else out.logDir = std::string(value);
            continue;
        }
        if (valueFor("--strategy", value)) {
            if (const auto s = ParseSurvivalStrategy(value)) out.strategy = *s; else addUnknown();
            continue;
        }

        const auto parseIntInto = [&](std::optional<int>& dst) {
            if (const auto parsed = ParseInt(value)) dst = *parsed; else addUnknown();
        };

        if (valueFor("--minutes", value) || valueFor("-m", value)) { parseIntInto(out.minutes); continue; }
        if (valueFor("--threshold", value)) { parseIntInto(out.damageThreshold); continue; }
        if (valueFor("--target", value)) { parseIntInto(out.targetCount); continue; }
        if (valueFor("--seed", value)) {
            // The simulator seed is unsigned.
            if (const auto parsed = ParseInt(value); parsed && *parsed >= 0) out.seed = *parsed; else addUnknown();
            continue;
        }

        addUnknown();
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream ss;
    ss << "Usage: brazier [options]\n\n"
       << "  --help, -h             Show this help.\n"
       << "  --config <path>        JSON config file (default: brazier.json).\n"
       << "  --write-config         Write the effective config to --config and exit.\n"
       << "  --log-dir <path>       Directory for brazier.log (default: logs).\n"
       << "  --minutes, -m <N>      Run length in minutes (1..500).\n"
       << "  --threshold <N>        Damage events before eating/drinking (1..20).\n"
       << "  --target <N>           Survival units to keep on hand (1..20).\n"
       << "  --strategy <s>         stocked (bank food) or crafted (brew potions).\n"
       << "  --fletch, --no-fletch  Fletch roots into kindling before feeding.\n"
       << "  --breaks, --no-breaks  Take short breaks between rounds.\n"
       << "  --seed <N>             Simulator seed.\n"
       << "  --realtime             Run the simulator on the wall clock.\n";
    return ss.str();
}

} // namespace brazier::app

// src/app/main.cpp
//
// Runs the controller against the headless simulator. Simulated time by
// default (a one-hour run finishes in well under a second); --realtime paces
// it on the wall clock instead.

#include "app/CommandLineArgs.h"

#include "bot/WintertodtBot.h"
#include "brazier/Clock.h"
#include "core/BotConfig.h"
#include "core/Log.h"
#include "sim/SimulatedWintertodt.h"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace
{
    constexpr const char* kDefaultConfigFile = "brazier.json";
    constexpr const char* kDefaultLogDir = "logs";

    void ApplyOverrides(brazier::core::BotConfig& cfg, const brazier::app::CommandLineArgs& args)
    {
        if (args.minutes) cfg.runMinutes = *args.minutes;
        if (args.damageThreshold) cfg.damageThreshold = *args.damageThreshold;
        if (args.targetCount) cfg.targetCount = *args.targetCount;
        if (args.seed) cfg.seed = static_cast<unsigned>(*args.seed);
        if (args.convertEnabled) cfg.convertEnabled = *args.convertEnabled;
        if (args.takeBreaks) cfg.takeBreaks = *args.takeBreaks;
        if (args.strategy) cfg.strategy = *args.strategy;

        brazier::core::ClampBotConfig(cfg);
    }
} // anonymous namespace

int main(int argc, char** argv)
{
    const brazier::app::CommandLineArgs args = brazier::app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::fputs(brazier::app::BuildCommandLineHelpText().c_str(), stdout);
        return 0;
    }

    if (!args.unknown.empty())
    {
        std::string msg = "Unknown command line option(s):\n";
        for (const auto& u : args.unknown)
            msg += "  " + u + "\n";
        msg += "\n";
        msg += brazier::app::BuildCommandLineHelpText();
        std::fputs(msg.c_str(), stderr);
        return 1;
    }

    brazier::logsys::Init(args.logDir ? fs::path(*args.logDir) : fs::path(kDefaultLogDir));

    // ----- Configuration -----
    const fs::path configPath = args.configPath ? fs::path(*args.configPath) : fs::path(kDefaultConfigFile);

    brazier::core::BotConfig cfg;
    if (brazier::core::LoadBotConfig(cfg, configPath))
        spdlog::info("Loaded config from {}", configPath.string());
    else
        spdlog::info("Using default config ({} not loaded)", configPath.string());

    ApplyOverrides(cfg, args);

    if (args.writeConfig)
    {
        const bool ok = brazier::core::SaveBotConfig(cfg, configPath);
        if (ok)
            spdlog::info("Wrote config to {}", configPath.string());
        else
            spdlog::error("Failed to write config to {}", configPath.string());
        brazier::logsys::Shutdown();
        return ok ? 0 : 1;
    }

    // ----- Run -----
    std::unique_ptr<brazier::IClock> clock;
    if (args.realtime)
        clock = std::make_unique<brazier::SteadyClock>();
    else
        clock = std::make_unique<brazier::ManualClock>();

    brazier::sim::SimSettings simSettings;
    simSettings.seed = cfg.seed;
    brazier::sim::SimulatedWintertodt world(*clock, simSettings);
    brazier::GameClient client = world.client();

    brazier::bot::WintertodtBot bot(client, cfg);
    const brazier::bot::RunOutcome outcome = bot.run();

    spdlog::info("Outcome: {} | rounds completed {} | rounds held {} | units consumed {} | knockouts {} | points {}",
                 brazier::bot::RunOutcomeName(outcome),
                 bot.roundState().roundsCompleted,
                 world.roundsSubdued(),
                 world.unitsConsumed(),
                 world.knockouts(),
                 world.totalPoints());

    const int code = brazier::bot::ExitCodeFor(outcome);
    brazier::logsys::Shutdown();
    return code;
}

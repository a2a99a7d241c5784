// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <tailview/Config.hpp>
#include <tailview/Viewer.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "tailview - follow an agent event stream in a scrollable terminal transcript" };

    auto eventsPath = std::string { "-" };
    auto configPath = std::string {};
    auto follow = false;
    auto replayDelayMs = -1;
    auto sessionsDir = std::string {};
    auto theme = std::string {};
    auto noAutoScroll = false;
    auto verbose = false;

    app.add_option("events", eventsPath, "JSON Lines event file ('-' reads stdin)");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-f,--follow", follow, "Keep waiting for new events at end of file");
    app.add_option("--replay-delay", replayDelayMs, "Delay in milliseconds between replayed events")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--sessions-dir", sessionsDir, "Directory holding subagent session logs");
    app.add_option("--theme", theme, "Color theme")->check(CLI::IsMember({ "dark", "light", "mono" }));
    app.add_flag("--no-auto-scroll", noAutoScroll, "Start with auto-scroll disabled");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? tailview::loadConfig() : tailview::loadConfigFromFile(configPath);
    if (!configResult)
    {
        tailview::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;

    if (auto level = tailview::log::parseLevel(config.log.level))
        tailview::log::setLevel(*level);
    if (verbose)
        tailview::log::setLevel(tailview::log::Level::Debug);

    // Apply CLI overrides
    if (follow)
        config.reader.follow = true;
    if (replayDelayMs >= 0)
        config.reader.replayDelayMs = replayDelayMs;
    if (!sessionsDir.empty())
        config.reader.sessionsDir = sessionsDir;
    if (!theme.empty())
        config.view.theme = theme;
    if (noAutoScroll)
        config.view.autoScroll = false;

    auto viewer = tailview::Viewer(std::move(config), eventsPath);
    if (auto initResult = viewer.initialize(); !initResult)
    {
        tailview::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return viewer.run();
}

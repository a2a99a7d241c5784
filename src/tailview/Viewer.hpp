// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <tailview/Config.hpp>

#include <memory>
#include <string>

namespace tailview
{

/// @brief Full-screen viewer that follows an agent event stream.
///
/// Owns the terminal session, the reader thread feeding the transcript and the
/// optional subagent overlay.
class Viewer
{
  public:
    /// @param config Effective configuration (file values with CLI overrides applied).
    /// @param eventsPath JSON Lines file to display, "-" for stdin.
    Viewer(AppConfig config, std::string eventsPath);
    ~Viewer();

    Viewer(Viewer const&) = delete;
    auto operator=(Viewer const&) -> Viewer& = delete;

    /// @brief Applies the theme, routes log output and starts reading events.
    ///
    /// Log messages go to the configured log file (if any) from here on, and
    /// warnings and errors are kept for the status row.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive loop until the user quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tailview

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stream/EventQueue.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace tailview::stream
{

/// @brief Configuration for reading a JSON Lines event stream.
struct EventReaderConfig
{
    std::string path = "-";                    ///< File path, or "-" for stdin.
    bool follow = false;                       ///< Keep polling for appended lines at end of file.
    std::chrono::milliseconds replayDelay {};  ///< Pause after each event (replays recorded sessions).
};

/// @brief Background producer that decodes an event stream into an EventQueue.
///
/// Runs on its own thread; malformed lines are logged and skipped. stop() only
/// ends production, events already queued stay queued.
class EventReader
{
  public:
    EventReader(EventReaderConfig config, EventQueue& queue);
    ~EventReader();

    EventReader(EventReader const&) = delete;
    auto operator=(EventReader const&) -> EventReader& = delete;

    /// @brief Opens the input and starts the reader thread.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the reader thread and waits for it. Idempotent.
    void stop();

    /// @brief True once the input reached its end (without follow) or the reader stopped.
    [[nodiscard]] auto finished() const noexcept -> bool;

    /// @brief Number of events successfully decoded so far.
    [[nodiscard]] auto eventCount() const noexcept -> std::size_t;

    /// @brief Number of lines skipped as malformed.
    [[nodiscard]] auto skippedCount() const noexcept -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tailview::stream

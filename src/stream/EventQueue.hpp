// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stream/AgentEvent.hpp>

#include <deque>
#include <mutex>
#include <vector>

namespace tailview::stream
{

/// @brief Hands events from producer threads to the UI thread.
///
/// Producers push; the UI thread drains once per tick and applies the events
/// in order. After close() further pushes are dropped.
class EventQueue
{
  public:
    /// @brief Enqueues an event. Returns false if the queue is closed.
    auto push(AgentEvent event) -> bool;

    /// @brief Removes and returns everything queued so far, oldest first.
    [[nodiscard]] auto drain() -> std::vector<AgentEvent>;

    void close();
    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

  private:
    mutable std::mutex _mutex;
    std::deque<AgentEvent> _events;
    bool _closed = false;
};

} // namespace tailview::stream

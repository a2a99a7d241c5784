// SPDX-License-Identifier: Apache-2.0
#include <stream/EventQueue.hpp>

namespace tailview::stream
{

auto EventQueue::push(AgentEvent event) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (_closed)
        return false;
    _events.push_back(std::move(event));
    return true;
}

auto EventQueue::drain() -> std::vector<AgentEvent>
{
    auto const lock = std::lock_guard(_mutex);
    auto result = std::vector<AgentEvent> {};
    result.reserve(_events.size());
    for (auto& event: _events)
        result.push_back(std::move(event));
    _events.clear();
    return result;
}

void EventQueue::close()
{
    auto const lock = std::lock_guard(_mutex);
    _closed = true;
}

auto EventQueue::closed() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _closed;
}

auto EventQueue::size() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _events.size();
}

} // namespace tailview::stream

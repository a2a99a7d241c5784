// SPDX-License-Identifier: Apache-2.0
#include <stream/EventReader.hpp>

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace tailview::stream
{

namespace
{
    constexpr auto PollIntervalMs = 100;
} // namespace

struct EventReader::Impl
{
    EventReaderConfig config;
    EventQueue& queue;
    int fd = -1;
    bool ownsFd = false;
    std::string readBuffer;
    std::thread thread;
    std::atomic<bool> stopRequested { false };
    std::atomic<bool> finished { false };
    std::atomic<std::size_t> eventCount { 0 };
    std::atomic<std::size_t> skippedCount { 0 };
    std::size_t lineNumber = 0;

    Impl(EventReaderConfig c, EventQueue& q): config(std::move(c)), queue(q) {}

    void handleLine(std::string_view line)
    {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.find_first_not_of(" \t") == std::string_view::npos)
            return;

        auto event = parseAgentEventLine(line);
        if (!event)
        {
            ++skippedCount;
            log::warning("{}:{}: skipping malformed event: {}", config.path, lineNumber, event.error().message);
            return;
        }

        log::trace("{}:{}: {}", config.path, lineNumber, eventTypeName(*event));
        if (!queue.push(std::move(*event)))
        {
            stopRequested = true;
            return;
        }
        ++eventCount;

        if (config.replayDelay.count() > 0)
            sleepInterruptibly(config.replayDelay);
    }

    void sleepInterruptibly(std::chrono::milliseconds duration)
    {
        auto const deadline = std::chrono::steady_clock::now() + duration;
        while (!stopRequested && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::min(duration, std::chrono::milliseconds(PollIntervalMs)));
    }

    void drainLines()
    {
        auto newlinePos = readBuffer.find('\n');
        while (newlinePos != std::string::npos && !stopRequested)
        {
            auto const line = readBuffer.substr(0, newlinePos);
            readBuffer.erase(0, newlinePos + 1);
            handleLine(line);
            newlinePos = readBuffer.find('\n');
        }
    }

    void run()
    {
        auto buf = std::array<char, 4096> {};
        while (!stopRequested)
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, PollIntervalMs);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                log::error("{}: poll failed: {}", config.path, std::strerror(errno));
                break;
            }
            if (ready == 0)
                continue;

            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                log::error("{}: read failed: {}", config.path, std::strerror(errno));
                break;
            }
            if (bytesRead == 0)
            {
                if (!config.follow)
                    break;
                // Regular files report readable at EOF; wait before retrying.
                std::this_thread::sleep_for(std::chrono::milliseconds(PollIntervalMs));
                continue;
            }

            readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
            drainLines();
        }

        // A final record without a trailing newline still counts.
        if (!stopRequested && !readBuffer.empty())
        {
            auto const line = std::move(readBuffer);
            readBuffer.clear();
            handleLine(line);
        }

        log::debug("{}: reader finished ({} events, {} skipped)", config.path, eventCount.load(), skippedCount.load());
        finished = true;
    }

    void closeFd()
    {
        if (ownsFd && fd >= 0)
            ::close(fd);
        fd = -1;
        ownsFd = false;
    }
};

EventReader::EventReader(EventReaderConfig config, EventQueue& queue):
    _impl(std::make_unique<Impl>(std::move(config), queue))
{
}

EventReader::~EventReader()
{
    stop();
}

auto EventReader::start() -> VoidResult
{
    if (_impl->thread.joinable())
        return makeError(ErrorCode::InvalidArgument, "Event reader already started");

    if (_impl->config.path == "-")
    {
        _impl->fd = STDIN_FILENO;
        _impl->ownsFd = false;
    }
    else
    {
        auto const fd = ::open(_impl->config.path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
            return makeError(ErrorCode::IoError,
                             std::format("Cannot open '{}': {}", _impl->config.path, std::strerror(errno)));
        _impl->fd = fd;
        _impl->ownsFd = true;
    }

    _impl->stopRequested = false;
    _impl->finished = false;
    _impl->thread = std::thread([impl = _impl.get()] { impl->run(); });
    log::info("Reading events from {}{}", _impl->config.path, _impl->config.follow ? " (follow)" : "");
    return {};
}

void EventReader::stop()
{
    _impl->stopRequested = true;
    if (_impl->thread.joinable())
        _impl->thread.join();
    _impl->closeFd();
    _impl->finished = true;
}

auto EventReader::finished() const noexcept -> bool
{
    return _impl->finished;
}

auto EventReader::eventCount() const noexcept -> std::size_t
{
    return _impl->eventCount;
}

auto EventReader::skippedCount() const noexcept -> std::size_t
{
    return _impl->skippedCount;
}

} // namespace tailview::stream

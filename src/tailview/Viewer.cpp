// SPDX-License-Identifier: Apache-2.0
#include "Viewer.hpp"

#include <core/Log.hpp>
#include <stream/EventQueue.hpp>
#include <stream/EventReader.hpp>
#include <stream/Transcript.hpp>
#include <tailview/ModalFrame.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <variant>

#include <tui/Terminal.hpp>
#include <tui/Text.hpp>
#include <tui/Theme.hpp>

namespace tailview
{

namespace
{
    constexpr auto PollTimeoutMs = 50;
    constexpr auto StatusRows = 1;

    auto listFor(AppConfig const& config, int width, int height) -> tui::ScrollList
    {
        auto list = tui::ScrollList(width, height);
        list.setItemGap(config.view.itemGap);
        list.setAutoScroll(config.view.autoScroll);
        list.setSelectionMarker(config.view.selectionMarker);
        list.setFocused(true);
        return list;
    }
} // namespace

/// @brief A transcript source: reader thread, hand-off queue, list and producer.
struct EventSource
{
    stream::EventQueue queue;
    tui::ScrollList list;
    stream::Transcript transcript;
    std::unique_ptr<stream::EventReader> reader;

    EventSource(AppConfig const& config, stream::EventReaderConfig readerConfig, int width, int height):
        list(listFor(config, width, height)),
        transcript(list),
        reader(std::make_unique<stream::EventReader>(std::move(readerConfig), queue))
    {
    }

    EventSource(EventSource const&) = delete;
    auto operator=(EventSource const&) -> EventSource& = delete;

    /// @brief Applies every queued event. Returns true if anything was applied.
    auto pump() -> bool
    {
        auto events = queue.drain();
        for (auto const& event: events)
            transcript.apply(event);
        return !events.empty();
    }

    void stop()
    {
        queue.close();
        reader->stop();
    }
};

struct Viewer::Impl
{
    AppConfig config;
    std::string eventsPath;
    tui::Terminal terminal;
    std::unique_ptr<EventSource> main;

    struct Modal
    {
        std::string title;
        std::unique_ptr<EventSource> source;
    };
    std::unique_ptr<Modal> modal;

    // Written by the log callback from any thread.
    std::mutex logMutex;
    std::ofstream logFile;
    std::string lastProblem;
    bool problemChanged = false;

    Impl(AppConfig c, std::string path): config(std::move(c)), eventsPath(std::move(path)) {}

    [[nodiscard]] auto readerConfig(std::string path) const -> stream::EventReaderConfig
    {
        return stream::EventReaderConfig {
            .path = std::move(path),
            .follow = config.reader.follow,
            .replayDelay = std::chrono::milliseconds(config.reader.replayDelayMs),
        };
    }

    [[nodiscard]] auto listHeight() const -> int { return std::max(terminal.rows() - StatusRows, 0); }

    [[nodiscard]] auto sessionsDir() const -> std::filesystem::path
    {
        if (!config.reader.sessionsDir.empty())
            return config.reader.sessionsDir;
        if (eventsPath == "-")
            return std::filesystem::current_path();
        return std::filesystem::path(eventsPath).parent_path();
    }

    void installLogCallback()
    {
        if (!config.log.file.empty())
        {
            logFile.open(config.log.file, std::ios::app);
            if (!logFile.is_open())
                std::println(stderr, "Cannot open log file {}, file logging disabled", config.log.file);
        }

        log::setCallback([this](log::Level level, std::string_view message) {
            auto const lock = std::lock_guard(logMutex);
            if (logFile.is_open())
                logFile << std::format("[{}] {}\n", log::levelTag(level), message) << std::flush;
            if (level == log::Level::Error || level == log::Level::Warning)
            {
                lastProblem = std::string(message);
                problemChanged = true;
            }
        });
    }

    auto takeProblemChanged() -> bool
    {
        auto const lock = std::lock_guard(logMutex);
        return std::exchange(problemChanged, false);
    }

    auto problemText() -> std::string
    {
        auto const lock = std::lock_guard(logMutex);
        return lastProblem;
    }

    // =========================================================================
    // Subagent modal
    // =========================================================================

    void openModal(std::string const& sessionId)
    {
        auto const path = sessionsDir() / std::format("{}.jsonl", sessionId);
        auto source = std::make_unique<EventSource>(
            config, readerConfig(path.string()), modalFrame().innerWidth, modalFrame().innerHeight);
        if (auto result = source->reader->start(); !result)
        {
            log::warning("Cannot open subagent session {}: {}", sessionId, result.error().message);
            return;
        }
        log::debug("Opened subagent session {}", path.string());
        modal = std::make_unique<Modal>(
            Modal { .title = std::format("Subagent {}", sessionId), .source = std::move(source) });
        main->list.setFocused(false);
    }

    void closeModal()
    {
        if (!modal)
            return;
        modal->source->stop();
        modal.reset();
        main->list.setFocused(true);
    }

    [[nodiscard]] auto modalFrame() const -> ModalFrame
    {
        return ModalFrame::forScreen(terminal.columns(), listHeight());
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    void renderStatusBar()
    {
        auto& out = terminal.output();
        auto const& theme = tui::currentTheme();
        auto& list = modal ? modal->source->list : main->list;
        auto const cols = out.columns();

        auto line = tui::TextLine::plain(
            std::format(" {:3}% ", static_cast<int>(list.scrollPercent() * 100.0 + 0.5)), theme.statusBackground);
        if (list.autoScroll())
            line.append("FOLLOW ", theme.statusKey);
        if (modal)
        {
            line.append("Esc", theme.statusKey);
            line.append(" Close ", theme.statusAction);
        }
        line.append("PgUp/PgDn", theme.statusKey);
        line.append(" Scroll ", theme.statusAction);
        line.append("q", theme.statusKey);
        line.append(" Quit ", theme.statusAction);
        if (auto const problem = problemText(); !problem.empty())
        {
            auto const room = cols - line.width() - 1;
            if (room > 3)
                line.append(" " + tui::truncate(problem, room), theme.statusWarning);
        }

        out.moveTo(out.rows(), 1);
        auto used = 0;
        for (auto const& span: line.spans)
        {
            auto const text = tui::takeColumns(span.text, cols - used);
            out.write(text, span.style);
            used += tui::displayWidth(text);
        }
        if (used < cols)
            out.write(std::string(static_cast<std::size_t>(cols - used), ' '), theme.statusBackground);
    }

    void renderModal()
    {
        auto& out = terminal.output();
        auto const& theme = tui::currentTheme();
        auto const frame = modalFrame();
        auto const top = frame.top;
        auto const left = frame.left;
        auto const innerWidth = frame.innerWidth;
        auto const innerHeight = frame.innerHeight;
        auto const frameWidth = frame.frameWidth();

        auto const title = tui::takeColumns(std::format(" {} ", modal->title), std::max(frameWidth - 4, 0));
        out.moveTo(top, left);
        out.write("╭─" + title + tui::repeat("─", frameWidth - 3 - tui::displayWidth(title)) + "╮",
                  theme.subagentBorder);
        for (auto r = 0; r < innerHeight; ++r)
        {
            out.moveTo(top + 1 + r, left);
            out.write("│ ", theme.subagentBorder);
            out.moveTo(top + 1 + r, left + 2 + innerWidth);
            out.write(" │", theme.subagentBorder);
        }
        out.moveTo(top + 1 + innerHeight, left);
        out.write("╰" + tui::repeat("─", frameWidth - 2) + "╯", theme.subagentBorder);

        modal->source->list.setSize(innerWidth, innerHeight);
        modal->source->list.render(out, frame.contentTop(), frame.contentLeft());
    }

    void renderFullScreen()
    {
        auto& out = terminal.output();
        auto sync = out.syncGuard();
        main->list.render(out, 1, 1);
        if (modal)
            renderModal();
        renderStatusBar();
        out.flush();
    }

    void handleResize()
    {
        auto& out = terminal.output();
        out.updateDimensions();
        out.clearScreen();
        main->list.setSize(out.columns(), listHeight());
        if (main->list.autoScroll())
            main->list.gotoBottom();
        if (modal)
        {
            auto const frame = modalFrame();
            modal->source->list.setSize(frame.innerWidth, frame.innerHeight);
            if (modal->source->list.autoScroll())
                modal->source->list.gotoBottom();
        }
    }

    // =========================================================================
    // Input
    // =========================================================================

    /// @brief Returns false when the user asked to quit.
    auto handleKey(tui::KeyEvent const& key, bool& dirty) -> bool
    {
        auto& source = modal ? *modal->source : *main;
        auto const ctrl = tui::hasModifier(key.modifiers, tui::Modifier::Ctrl);

        if (ctrl && key.codepoint == U'c')
            return false;
        if (!ctrl && key.codepoint == U'q')
        {
            if (!modal)
                return false;
            closeModal();
            dirty = true;
            return true;
        }
        if (key.key == tui::KeyCode::Escape)
        {
            if (modal)
            {
                closeModal();
                dirty = true;
            }
            return true;
        }
        if (key.key == tui::KeyCode::Up || key.key == tui::KeyCode::Down)
        {
            source.transcript.scrollViewport(key.key == tui::KeyCode::Up ? -1 : 1);
            dirty = true;
            return true;
        }
        if (source.list.processEvent(key) == tui::ScrollListAction::Changed)
            dirty = true;
        return true;
    }

    void handleMouse(tui::MouseEvent const& mouse, bool& dirty)
    {
        auto& source = modal ? *modal->source : *main;
        switch (mouse.type)
        {
            case tui::MouseEvent::Type::ScrollUp:
                source.transcript.scrollViewport(-config.view.wheelStep);
                dirty = true;
                break;
            case tui::MouseEvent::Type::ScrollDown:
                source.transcript.scrollViewport(config.view.wheelStep);
                dirty = true;
                break;
            case tui::MouseEvent::Type::Press: {
                if (mouse.button != 0)
                    break;
                auto row = std::optional<int>(mouse.y - 1);
                if (modal)
                    row = modalFrame().contentRowAt(mouse.x, mouse.y);
                if (!row)
                    break;
                auto const click = source.transcript.clickAtRow(*row);
                if (click.changed)
                    dirty = true;
                if (click.sessionId && !modal)
                {
                    openModal(*click.sessionId);
                    dirty = true;
                }
                break;
            }
            case tui::MouseEvent::Type::Release: break;
        }
    }
};

Viewer::Viewer(AppConfig config, std::string eventsPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(eventsPath)))
{
}

Viewer::~Viewer()
{
    if (_impl->modal)
        _impl->closeModal();
    if (_impl->main)
        _impl->main->stop();
    log::setCallback(nullptr);
}

auto Viewer::initialize() -> VoidResult
{
    auto theme = tui::themeByName(_impl->config.view.theme);
    if (!theme)
        return std::unexpected(theme.error());
    tui::ThemeManager::instance().setCurrent(std::move(*theme));

    // The reader logs from its own thread as soon as it starts.
    _impl->installLogCallback();

    _impl->main = std::make_unique<EventSource>(_impl->config, _impl->readerConfig(_impl->eventsPath), 80, 24);
    return _impl->main->reader->start();
}

auto Viewer::run() -> int
{
    if (auto result = _impl->terminal.initialize(); !result)
    {
        // No screen to show it on; report to stderr instead.
        log::setCallback(nullptr);
        log::error("Failed to initialize terminal: {}", result.error().message);
        return 1;
    }

    auto& output = _impl->terminal.output();
    _impl->main->list.setSize(output.columns(), _impl->listHeight());
    _impl->main->pump();
    _impl->renderFullScreen();

    auto running = true;
    while (running)
    {
        auto dirty = false;
        for (auto const& event: _impl->terminal.poll(PollTimeoutMs))
        {
            if (std::holds_alternative<tui::ResizeEvent>(event))
            {
                _impl->handleResize();
                dirty = true;
            }
            else if (auto const* mouse = std::get_if<tui::MouseEvent>(&event))
                _impl->handleMouse(*mouse, dirty);
            else if (auto const* key = std::get_if<tui::KeyEvent>(&event))
                running = _impl->handleKey(*key, dirty) && running;
        }

        dirty = _impl->main->pump() || dirty;
        if (_impl->modal)
            dirty = _impl->modal->source->pump() || dirty;
        dirty = _impl->takeProblemChanged() || dirty;

        if (dirty && running)
            _impl->renderFullScreen();
    }

    _impl->closeModal();
    _impl->main->stop();
    log::setCallback(nullptr);
    _impl->terminal.shutdown();
    return 0;
}

} // namespace tailview

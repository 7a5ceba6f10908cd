#include "watcher_controller.hpp"
#include "inotify_source.hpp"
#include "polling_source.hpp"
#include "../logger/Mylogger.hpp"

#include <cerrno>
#include <exception>
#include <stdexcept>

namespace watcher
{
    const char *modeName(WatchMode mode)
    {
        return mode == WatchMode::Native ? "native" : "polling";
    }

    WatcherController::WatcherController(fs::path root,
                                         pathUtils::IgnoreRegistry &ignores,
                                         indexer::LiveIndex &index,
                                         std::chrono::milliseconds pollInterval)
        : WatcherController(root, ignores, index,
                            [root, &ignores, pollInterval](WatchMode mode, EventQueue &queue, std::uint64_t generation)
                                -> std::unique_ptr<EventSource>
                            {
                                if (mode == WatchMode::Native)
                                    return std::make_unique<InotifySource>(root, ignores, queue, generation);
                                return std::make_unique<PollingSource>(root, ignores, queue, generation, pollInterval);
                            })
    {
    }

    WatcherController::WatcherController(fs::path root,
                                         pathUtils::IgnoreRegistry &ignores,
                                         indexer::LiveIndex &index,
                                         SourceFactory factory)
        : root_(std::move(root)), ignores_(ignores), index_(index), factory_(std::move(factory))
    {
    }

    WatcherController::~WatcherController()
    {
        stop();
    }

    bool WatcherController::isLimitError(const std::error_code &ec)
    {
        return ec == std::errc::no_space_on_device || ec == std::errc::too_many_files_open;
    }

    void WatcherController::start(WatchMode mode)
    {
        stopped_ = false;
        if (!consumer_.joinable())
            consumer_ = std::thread(&WatcherController::consume, this);
        switchMode(mode).get();
    }

    void WatcherController::stop()
    {
        if (stopped_.exchange(true))
            return;
        std::unique_ptr<EventSource> old;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            old = std::move(source_);
            mode_.reset();
        }
        ++generation_;
        if (old)
            old->stop();
        queue_.close();
        if (consumer_.joinable())
            consumer_.join();
        MyLogger::info("Watcher stopped");
    }

    std::optional<WatchMode> WatcherController::mode() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return mode_;
    }

    std::shared_future<void> WatcherController::switchMode(WatchMode mode)
    {
        std::promise<void> promise;
        std::shared_future<void> future = promise.get_future().share();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (switching_)
                return *switching_;
            if ((mode_ == mode && source_) || stopped_)
            {
                promise.set_value();
                return future;
            }
            if (mode == WatchMode::Native && degraded_)
            {
                MyLogger::warning("Watcher already fell back to polling; staying in polling mode.");
                promise.set_value();
                return future;
            }
            switching_ = future;
        }

        try
        {
            performSwitch(mode);
            promise.set_value();
        }
        catch (const std::exception &e)
        {
            MyLogger::error(std::string("Failed to switch watcher mode: ") + e.what());
            promise.set_exception(std::current_exception());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        switching_.reset();
        return future;
    }

    void WatcherController::performSwitch(WatchMode mode)
    {
        std::unique_ptr<EventSource> old;
        std::optional<WatchMode> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            old = std::move(source_);
            previous = mode_;
        }

        // Retire the old generation first so its queued events are dropped.
        std::uint64_t generation = ++generation_;
        if (old)
            old->stop();

        std::unique_ptr<EventSource> next = factory_(mode, queue_, generation);
        if (!next)
            throw std::runtime_error(std::string("no event source for mode ") + modeName(mode));
        next->start();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            source_ = std::move(next);
            mode_ = mode;
            if (previous == WatchMode::Native && mode == WatchMode::Polling)
                degraded_ = true;
        }

        if (mode == WatchMode::Polling)
            MyLogger::warning("Watcher running in polling mode. Consider raising the file descriptor limit for better performance.");
        else
            MyLogger::info("Watcher running in native mode");
    }

    void WatcherController::consume()
    {
        while (auto event = queue_.pop())
        {
            if (event->generation != generation_.load())
            {
                MyLogger::debug(std::string("Dropping ") + kindName(event->kind) + " from retired watcher: " + event->absolutePath);
                continue;
            }
            try
            {
                dispatch(*event);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Failed to apply " + std::string(kindName(event->kind)) + " for " +
                                event->absolutePath + ": " + e.what());
            }
            ++processed_;
        }
    }

    void WatcherController::dispatch(const FsEvent &event)
    {
        const fs::path path(event.absolutePath);
        switch (event.kind)
        {
        case FsEventKind::AddFile:
        case FsEventKind::AddDirectory:
            index_.pathAdded(path);
            break;
        case FsEventKind::ChangeFile:
            index_.pathChanged(path);
            break;
        case FsEventKind::RemoveFile:
        case FsEventKind::RemoveDirectory:
            index_.pathRemoved(path);
            break;
        case FsEventKind::Error:
            handleError(event);
            break;
        }
    }

    void WatcherController::handleError(const FsEvent &event)
    {
        if (!error_diagnostics_logged_.exchange(true))
        {
            MyLogger::warning("File watcher encountered an error: code=" + std::to_string(event.errorCode.value()) +
                              " message=" + event.errorCode.message() + " path=" + event.absolutePath);
        }

        if (pathUtils::IgnoreRegistry::isUnsupportedError(event.errorCode))
        {
            if (!event.absolutePath.empty())
                ignores_.markUnsupported(event.absolutePath);
            return;
        }

        if (isLimitError(event.errorCode))
        {
            bool polling;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                polling = mode_ == WatchMode::Polling || degraded_;
            }
            if (polling)
            {
                MyLogger::warning("File watcher limit reached even in polling mode. Consider increasing the file descriptor limit.");
                return;
            }
            MyLogger::warning("File watcher limit reached; switching to polling mode.");
            // A switch already in flight may be the one that produced this error.
            for (int attempt = 0; attempt < 2; ++attempt)
            {
                switchMode(WatchMode::Polling).wait();
                if (stopped_ || mode() == WatchMode::Polling)
                    break;
            }
            return;
        }

        MyLogger::error("File watcher error on " + event.absolutePath + ": " + event.errorCode.message());
    }
}

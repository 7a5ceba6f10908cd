#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "event_source.hpp"
#include "fs_event.hpp"
#include "../indexer/live_index.hpp"

namespace watcher
{
    // Owns the active event source and the consumer thread that feeds its
    // events into the live index.
    //
    // Native watching degrades to polling at most once, when the OS runs out
    // of watches or descriptors. Events stamped with the generation of a
    // retired source are dropped.
    class WatcherController
    {
    public:
        using SourceFactory = std::function<std::unique_ptr<EventSource>(
            WatchMode mode, EventQueue &queue, std::uint64_t generation)>;

        WatcherController(fs::path root,
                          pathUtils::IgnoreRegistry &ignores,
                          indexer::LiveIndex &index,
                          std::chrono::milliseconds pollInterval);
        // For tests: sources come from 'factory' instead.
        WatcherController(fs::path root,
                          pathUtils::IgnoreRegistry &ignores,
                          indexer::LiveIndex &index,
                          SourceFactory factory);
        ~WatcherController();

        WatcherController(const WatcherController &) = delete;
        WatcherController &operator=(const WatcherController &) = delete;

        // Starts the consumer thread and a source in 'mode'.
        void start(WatchMode mode);
        void stop();

        // Replaces the active source. A caller arriving while a switch is in
        // flight gets the in-flight switch's future instead of starting another.
        std::shared_future<void> switchMode(WatchMode mode);

        std::optional<WatchMode> mode() const;
        std::uint64_t generation() const { return generation_.load(); }
        EventQueue &queue() { return queue_; }

        // Number of events applied to the index so far.
        std::uint64_t processedCount() const { return processed_.load(); }

        static bool isLimitError(const std::error_code &ec);

    private:
        void consume();
        void dispatch(const FsEvent &event);
        void handleError(const FsEvent &event);
        void performSwitch(WatchMode mode);

        fs::path root_;
        pathUtils::IgnoreRegistry &ignores_;
        indexer::LiveIndex &index_;
        SourceFactory factory_;

        EventQueue queue_;
        std::thread consumer_;

        mutable std::mutex mutex_;
        std::unique_ptr<EventSource> source_;
        std::optional<WatchMode> mode_;
        std::optional<std::shared_future<void>> switching_;
        bool degraded_ = false;

        std::atomic<std::uint64_t> generation_{0};
        std::atomic<std::uint64_t> processed_{0};
        std::atomic<bool> error_diagnostics_logged_{false};
        std::atomic<bool> stopped_{false};
    };
}

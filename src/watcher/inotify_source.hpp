#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "event_source.hpp"

namespace watcher
{
    // Native source: one inotify watch per directory below the root.
    // Running out of watches (ENOSPC) or descriptors (EMFILE) is reported as
    // an Error event; the controller decides what to do about it.
    class InotifySource : public EventSource
    {
    public:
        using EventSource::EventSource;
        ~InotifySource() override;

        void start() override;
        void stop() override;
        WatchMode mode() const override { return WatchMode::Native; }

    private:
        void run();
        // Adds watches for 'dir' and every directory below it. When
        // 'announce' is set the contents are reported as added.
        void watchTree(const fs::path &dir, bool announce);
        bool addWatch(const fs::path &dir);
        void forgetWatchesUnder(const std::string &dir);
        void handleEvent(int wd, std::uint32_t mask, const std::string &name);

        int fd_ = -1;
        std::atomic<bool> running_{false};
        std::atomic<bool> limit_reached_{false};
        std::thread thread_;
        std::mutex watches_mutex_;
        std::unordered_map<int, std::string> wd_to_path_;
    };
}

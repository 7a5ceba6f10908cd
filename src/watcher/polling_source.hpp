#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include "event_source.hpp"

namespace watcher
{
    // Fallback source: rescans the tree every interval and reports the
    // difference to the previous scan. The first scan only sets the baseline.
    class PollingSource : public EventSource
    {
    public:
        PollingSource(fs::path root,
                      pathUtils::IgnoreRegistry &ignores,
                      EventQueue &queue,
                      std::uint64_t generation,
                      std::chrono::milliseconds interval);
        ~PollingSource() override;

        void start() override;
        void stop() override;
        WatchMode mode() const override { return WatchMode::Polling; }

        struct NodeState
        {
            bool isDirectory = false;
            std::int64_t mtime = 0;
            std::uintmax_t size = 0;
        };
        using TreeState = std::map<std::string, NodeState>;

        // One rescan; exposed for tests.
        TreeState takeSnapshot();
        void diff(const TreeState &before, const TreeState &after);

    private:
        void run();
        void collect(const fs::path &dir, TreeState &state);

        std::chrono::milliseconds interval_;
        std::atomic<bool> running_{false};
        std::thread thread_;
        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;
    };
}

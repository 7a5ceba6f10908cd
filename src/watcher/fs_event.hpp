#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace watcher
{
    enum class FsEventKind
    {
        AddFile,
        ChangeFile,
        RemoveFile,
        AddDirectory,
        RemoveDirectory,
        Error
    };

    const char *kindName(FsEventKind kind);

    struct FsEvent
    {
        FsEventKind kind;
        std::string absolutePath;
        std::error_code errorCode; // Error events only
        std::uint64_t generation = 0;
    };

    // FIFO shared by the event sources and the single consumer thread.
    class EventQueue
    {
    public:
        void push(FsEvent event);

        // Blocks until an event arrives. std::nullopt once closed and drained.
        std::optional<FsEvent> pop();

        void close();
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<FsEvent> events_;
        bool closed_ = false;
    };
}

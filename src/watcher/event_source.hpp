#pragma once

#include <cstdint>
#include <filesystem>
#include "fs_event.hpp"
#include "../pathUtils/ignoreRegistry.hpp"

namespace fs = std::filesystem;

namespace watcher
{
    enum class WatchMode
    {
        Native,
        Polling
    };

    const char *modeName(WatchMode mode);

    // Producer of filesystem events for one root. Every event it pushes is
    // stamped with the generation it was created with.
    class EventSource
    {
    public:
        EventSource(fs::path root, pathUtils::IgnoreRegistry &ignores, EventQueue &queue, std::uint64_t generation)
            : root_(std::move(root)), ignores_(ignores), queue_(queue), generation_(generation)
        {
        }
        virtual ~EventSource() = default;

        EventSource(const EventSource &) = delete;
        EventSource &operator=(const EventSource &) = delete;

        virtual void start() = 0;
        // Stops producing events and joins any worker thread.
        virtual void stop() = 0;
        virtual WatchMode mode() const = 0;

        std::uint64_t generation() const { return generation_; }

    protected:
        void emit(FsEventKind kind, const fs::path &path)
        {
            queue_.push(FsEvent{kind, path.string(), std::error_code(), generation_});
        }

        void emitError(const fs::path &path, std::error_code ec)
        {
            queue_.push(FsEvent{FsEventKind::Error, path.string(), ec, generation_});
        }

        fs::path root_;
        pathUtils::IgnoreRegistry &ignores_;
        EventQueue &queue_;
        std::uint64_t generation_;
    };
}

#include "fs_event.hpp"

namespace watcher
{
    const char *kindName(FsEventKind kind)
    {
        switch (kind)
        {
        case FsEventKind::AddFile:
            return "add";
        case FsEventKind::ChangeFile:
            return "change";
        case FsEventKind::RemoveFile:
            return "unlink";
        case FsEventKind::AddDirectory:
            return "addDir";
        case FsEventKind::RemoveDirectory:
            return "unlinkDir";
        case FsEventKind::Error:
            return "error";
        }
        return "unknown";
    }

    void EventQueue::push(FsEvent event)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return;
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    std::optional<FsEvent> EventQueue::pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]()
                 { return closed_ || !events_.empty(); });
        if (events_.empty())
            return std::nullopt;
        FsEvent event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    void EventQueue::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t EventQueue::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }
}

#include "polling_source.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/pathUtils.hpp"

#include <vector>

namespace watcher
{
    namespace
    {
        std::int64_t ticks(fs::file_time_type time)
        {
            return static_cast<std::int64_t>(time.time_since_epoch().count());
        }

        bool hasRemovedAncestor(const std::string &path, const std::vector<std::string> &removedDirs)
        {
            for (const auto &dir : removedDirs)
            {
                if (path != dir && pathUtils::isSelfOrDescendant(dir, path))
                    return true;
            }
            return false;
        }
    }

    PollingSource::PollingSource(fs::path root,
                                 pathUtils::IgnoreRegistry &ignores,
                                 EventQueue &queue,
                                 std::uint64_t generation,
                                 std::chrono::milliseconds interval)
        : EventSource(std::move(root), ignores, queue, generation), interval_(interval)
    {
    }

    PollingSource::~PollingSource()
    {
        stop();
    }

    void PollingSource::start()
    {
        running_ = true;
        thread_ = std::thread(&PollingSource::run, this);
        MyLogger::info("Polling watcher started on " + root_.string() + " every " +
                       std::to_string(interval_.count()) + " ms");
    }

    void PollingSource::stop()
    {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            running_ = false;
        }
        wait_cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

    void PollingSource::collect(const fs::path &dir, TreeState &state)
    {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
        {
            // Vanished between the listing of its parent and now.
            if (ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
                emitError(dir, ec);
            return;
        }
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            const fs::path child = it->path();
            if (ignores_.shouldIgnore(child.string()))
                continue;

            std::error_code statEc;
            auto status = it->status(statEc);
            if (statEc)
            {
                if (pathUtils::IgnoreRegistry::isUnsupportedError(statEc))
                    emitError(child, statEc);
                continue;
            }
            if (pathUtils::IgnoreRegistry::isSpecialFile(status))
                continue;

            NodeState node;
            node.isDirectory = fs::is_directory(status);
            auto mtime = fs::last_write_time(child, statEc);
            node.mtime = statEc ? 0 : ticks(mtime);
            if (!node.isDirectory)
            {
                auto size = fs::file_size(child, statEc);
                node.size = statEc ? 0 : size;
            }
            state[child.string()] = node;

            // Inside a repository directory only its top level matters.
            if (node.isDirectory && child.filename() != ".git" &&
                !fs::is_symlink(it->symlink_status(statEc)))
            {
                collect(child, state);
            }
        }
    }

    PollingSource::TreeState PollingSource::takeSnapshot()
    {
        TreeState state;
        collect(root_, state);
        return state;
    }

    void PollingSource::diff(const TreeState &before, const TreeState &after)
    {
        // Removals first, reporting only the topmost removed node.
        std::vector<std::string> removedDirs;
        for (const auto &[path, node] : before)
        {
            auto found = after.find(path);
            bool gone = found == after.end() || found->second.isDirectory != node.isDirectory;
            if (!gone || hasRemovedAncestor(path, removedDirs))
                continue;
            if (node.isDirectory)
            {
                removedDirs.push_back(path);
                emit(FsEventKind::RemoveDirectory, path);
            }
            else
            {
                emit(FsEventKind::RemoveFile, path);
            }
        }

        // std::map order puts every directory before its children.
        for (const auto &[path, node] : after)
        {
            auto found = before.find(path);
            if (found == before.end() || found->second.isDirectory != node.isDirectory)
            {
                emit(node.isDirectory ? FsEventKind::AddDirectory : FsEventKind::AddFile, path);
                continue;
            }
            bool repositoryDir = node.isDirectory && fs::path(path).filename() == ".git";
            if (!node.isDirectory || repositoryDir)
            {
                if (found->second.mtime != node.mtime || found->second.size != node.size)
                    emit(FsEventKind::ChangeFile, path);
            }
        }
    }

    void PollingSource::run()
    {
        TreeState previous = takeSnapshot();
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(wait_mutex_);
                wait_cv_.wait_for(lock, interval_, [this]()
                                  { return !running_; });
                if (!running_)
                    return;
            }
            TreeState current = takeSnapshot();
            diff(previous, current);
            previous = std::move(current);
        }
    }
}

#include "inotify_source.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/pathUtils.hpp"

#include <cerrno>
#include <chrono>
#include <limits.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <vector>

namespace watcher
{
    namespace
    {
        const std::uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_MOVED_FROM | IN_MOVED_TO;
    }

    InotifySource::~InotifySource()
    {
        stop();
    }

    void InotifySource::start()
    {
        fd_ = inotify_init1(IN_NONBLOCK);
        if (fd_ == -1)
        {
            emitError(root_, std::error_code(errno, std::generic_category()));
            return;
        }
        running_ = true;
        watchTree(root_, false);
        thread_ = std::thread(&InotifySource::run, this);
        MyLogger::info("Native watcher started on " + root_.string() + " (" +
                       std::to_string(wd_to_path_.size()) + " watches)");
    }

    void InotifySource::stop()
    {
        running_ = false;
        if (thread_.joinable())
            thread_.join();
        if (fd_ != -1)
        {
            close(fd_);
            fd_ = -1;
        }
        std::lock_guard<std::mutex> lock(watches_mutex_);
        wd_to_path_.clear();
    }

    bool InotifySource::addWatch(const fs::path &dir)
    {
        if (limit_reached_)
            return false;
        int wd = inotify_add_watch(fd_, dir.c_str(), kWatchMask);
        if (wd == -1)
        {
            int err = errno;
            if (err == ENOSPC || err == EMFILE)
                limit_reached_ = true;
            emitError(dir, std::error_code(err, std::generic_category()));
            return false;
        }
        std::lock_guard<std::mutex> lock(watches_mutex_);
        wd_to_path_[wd] = dir.string();
        return true;
    }

    void InotifySource::watchTree(const fs::path &dir, bool announce)
    {
        if (ignores_.shouldIgnore(dir.string()))
            return;
        if (!addWatch(dir))
            return;
        // Only the top of a repository directory is watched; that is
        // enough to notice HEAD and ref updates.
        if (dir.filename() == ".git")
            return;

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
        {
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
            auto status = it->symlink_status(statEc);
            if (statEc)
                continue;
            if (fs::is_directory(status))
            {
                if (announce)
                    emit(FsEventKind::AddDirectory, child);
                watchTree(child, announce);
            }
            else if (announce && !pathUtils::IgnoreRegistry::isSpecialFile(status))
            {
                emit(FsEventKind::AddFile, child);
            }
        }
    }

    void InotifySource::forgetWatchesUnder(const std::string &dir)
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        for (auto it = wd_to_path_.begin(); it != wd_to_path_.end();)
        {
            if (pathUtils::isSelfOrDescendant(dir, it->second))
            {
                inotify_rm_watch(fd_, it->first);
                it = wd_to_path_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    void InotifySource::handleEvent(int wd, std::uint32_t mask, const std::string &name)
    {
        if (mask & IN_Q_OVERFLOW)
        {
            MyLogger::warning("inotify queue overflowed; some changes under " + root_.string() + " were missed");
            return;
        }
        if (mask & IN_IGNORED)
        {
            std::lock_guard<std::mutex> lock(watches_mutex_);
            wd_to_path_.erase(wd);
            return;
        }

        std::string dir;
        {
            std::lock_guard<std::mutex> lock(watches_mutex_);
            auto found = wd_to_path_.find(wd);
            if (found == wd_to_path_.end())
                return;
            dir = found->second;
        }
        fs::path fullPath = name.empty() ? fs::path(dir) : fs::path(dir) / name;
        if (ignores_.shouldIgnore(fullPath.string()))
            return;
        const bool isDir = mask & IN_ISDIR;

        if (mask & (IN_CREATE | IN_MOVED_TO))
        {
            if (isDir)
            {
                emit(FsEventKind::AddDirectory, fullPath);
                // Contents may have landed before the watch existed.
                watchTree(fullPath, true);
            }
            else
            {
                emit(FsEventKind::AddFile, fullPath);
            }
        }
        else if (mask & (IN_DELETE | IN_MOVED_FROM))
        {
            if (isDir)
            {
                forgetWatchesUnder(fullPath.string());
                emit(FsEventKind::RemoveDirectory, fullPath);
            }
            else
            {
                emit(FsEventKind::RemoveFile, fullPath);
            }
        }
        else if ((mask & IN_MODIFY) && !isDir)
        {
            emit(FsEventKind::ChangeFile, fullPath);
        }
    }

    void InotifySource::run()
    {
        const size_t buf_len = 10 * (sizeof(struct inotify_event) + NAME_MAX + 1);
        std::vector<char> buffer(buf_len);

        while (running_)
        {
            ssize_t length = read(fd_, buffer.data(), buf_len);
            if (length < 0)
            {
                if (errno == EAGAIN || errno == EINTR)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    continue;
                }
                emitError(root_, std::error_code(errno, std::generic_category()));
                break;
            }

            for (char *ptr = buffer.data(); ptr < buffer.data() + length;)
            {
                auto *event = reinterpret_cast<struct inotify_event *>(ptr);
                std::string name = (event->len > 0) ? event->name : "";
                handleEvent(event->wd, event->mask, name);
                ptr += sizeof(struct inotify_event) + event->len;
            }
        }
    }
}

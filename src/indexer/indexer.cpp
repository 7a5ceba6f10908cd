#include "indexer.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/pathUtils.hpp"

#include <chrono>
#include <system_error>

namespace indexer
{
    Indexer::Indexer(fs::path root,
                     store::EntryStore &store,
                     pathUtils::IgnoreRegistry &ignores,
                     gitmeta::GitMetadataCollector *git)
        : root_(std::move(root)), store_(store), ignores_(ignores), git_(git)
    {
        root_name_ = root_.filename().string();
        if (root_name_.empty())
            root_name_ = root_.parent_path().filename().string();
        if (root_name_.empty())
            root_name_ = "/";
    }

    std::int64_t Indexer::toEpochMillis(fs::file_time_type time)
    {
        auto sys = std::chrono::file_clock::to_sys(time);
        return std::chrono::duration_cast<std::chrono::milliseconds>(sys.time_since_epoch()).count();
    }

    store::Entry Indexer::makeEntry(const std::string &canonicalPath,
                                    const std::string &rootName,
                                    bool isDirectory,
                                    std::optional<std::uint64_t> size,
                                    std::int64_t modifiedAt)
    {
        store::Entry entry;
        entry.path = canonicalPath;
        entry.name = canonicalPath == "/" ? rootName : pathUtils::baseName(canonicalPath);
        entry.parentPath = pathUtils::parentOf(canonicalPath);
        entry.kind = isDirectory ? store::EntryKind::Directory : store::EntryKind::File;
        entry.size = isDirectory ? std::nullopt : size;
        entry.modifiedAt = modifiedAt;
        entry.extension = isDirectory ? "" : pathUtils::extensionOf(canonicalPath);
        entry.depth = pathUtils::depthOf(canonicalPath);
        return entry;
    }

    IndexResult Indexer::indexPath(const fs::path &absolutePath, bool collectGit)
    {
        IndexResult result;
        auto canonical = pathUtils::toCanonical(root_, absolutePath);
        if (!canonical)
        {
            result.outcome = IndexOutcome::Ignored;
            return result;
        }
        result.path = *canonical;

        if (pathUtils::isGitInternal(*canonical))
        {
            result.outcome = IndexOutcome::GitInternal;
            result.repoRoot = pathUtils::repoRootForInternalPath(*canonical);
            if (collectGit && git_ && result.repoRoot)
                git_->refresh(*result.repoRoot);
            return result;
        }

        if (ignores_.shouldIgnore(absolutePath.string()))
        {
            result.outcome = IndexOutcome::Ignored;
            return result;
        }

        std::error_code ec;
        fs::file_status status = fs::status(absolutePath, ec);
        if (ec)
        {
            if (pathUtils::IgnoreRegistry::isUnsupportedError(ec))
            {
                ignores_.markUnsupported(absolutePath);
                result.outcome = IndexOutcome::Ignored;
            }
            else
            {
                result.outcome = IndexOutcome::Missing;
            }
            return result;
        }
        if (!fs::exists(status))
        {
            result.outcome = IndexOutcome::Missing;
            return result;
        }
        if (pathUtils::IgnoreRegistry::isSpecialFile(status))
        {
            MyLogger::debug("Skipping special file " + absolutePath.string());
            result.outcome = IndexOutcome::Ignored;
            return result;
        }

        result.isDirectory = fs::is_directory(status);
        std::optional<std::uint64_t> size;
        if (!result.isDirectory)
        {
            auto bytes = fs::file_size(absolutePath, ec);
            if (!ec)
                size = bytes;
        }
        auto mtime = fs::last_write_time(absolutePath, ec);
        if (ec)
        {
            if (pathUtils::IgnoreRegistry::isUnsupportedError(ec))
            {
                ignores_.markUnsupported(absolutePath);
                result.outcome = IndexOutcome::Ignored;
            }
            else
            {
                result.outcome = IndexOutcome::Missing;
            }
            return result;
        }

        auto entry = makeEntry(*canonical, root_name_, result.isDirectory, size, toEpochMillis(mtime));
        if (!store_.upsertEntry(entry))
        {
            result.outcome = IndexOutcome::Failed;
            return result;
        }

        if (!result.isDirectory)
            store_.deleteGitMetadata(*canonical);
        else if (collectGit && git_)
            git_->refresh(*canonical);

        result.outcome = IndexOutcome::Indexed;
        return result;
    }

    std::optional<std::string> Indexer::removePath(const fs::path &absolutePath)
    {
        auto canonical = pathUtils::toCanonical(root_, absolutePath);
        if (!canonical || pathUtils::isGitInternal(*canonical))
            return std::nullopt;
        if (ignores_.shouldIgnore(absolutePath.string()))
            return std::nullopt;
        if (*canonical == "/")
        {
            MyLogger::warning("Ignoring removal of the monitored root " + root_.string());
            return std::nullopt;
        }
        // Nothing was stored under the path, or the batch failed.
        if (store_.removeBranch(*canonical) == 0)
            return std::nullopt;
        return canonical;
    }

    std::size_t Indexer::scan()
    {
        MyLogger::info("Scanning " + root_.string());
        auto started = std::chrono::steady_clock::now();
        std::size_t written = 0;
        walk(root_, written);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started)
                           .count();
        MyLogger::info("Indexed " + std::to_string(written) + " entries in " + std::to_string(elapsed) + " ms");
        return written;
    }

    void Indexer::walk(const fs::path &absolutePath, std::size_t &written)
    {
        if (absolutePath.filename() == ".git")
            return;

        IndexResult result = indexPath(absolutePath, true);
        if (result.outcome != IndexOutcome::Indexed)
            return;
        ++written;
        if (!result.isDirectory)
            return;

        std::error_code ec;
        // Symlinked directories are indexed but not descended into.
        if (fs::is_symlink(fs::symlink_status(absolutePath, ec)))
            return;

        fs::directory_iterator it(absolutePath, ec);
        if (ec)
        {
            if (pathUtils::IgnoreRegistry::isUnsupportedError(ec))
                ignores_.markUnsupported(absolutePath);
            return;
        }
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            walk(it->path(), written);
        }
        if (ec)
            MyLogger::debug("Listing " + absolutePath.string() + " stopped early: " + ec.message());
    }
}

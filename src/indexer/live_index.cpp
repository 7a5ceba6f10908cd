#include "live_index.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/pathUtils.hpp"

#include <exception>
#include <boost/asio/post.hpp>

namespace indexer
{
    namespace
    {
        // Repository metadata without the collection timestamp.
        nlohmann::json comparable(const std::optional<store::GitMetadata> &meta)
        {
            if (!meta)
                return nullptr;
            nlohmann::json j = *meta;
            j.erase("detected_at");
            return j;
        }
    }

    LiveIndex::LiveIndex(Indexer &indexer,
                         store::EntryStore &store,
                         search::SearchCache &cache,
                         broadcast::ChangeBroadcaster &broadcaster,
                         gitmeta::GitMetadataCollector *git,
                         std::size_t gitThreads)
        : indexer_(indexer),
          store_(store),
          cache_(cache),
          broadcaster_(broadcaster),
          git_(git),
          git_pool_(gitThreads == 0 ? 1 : gitThreads)
    {
    }

    LiveIndex::~LiveIndex()
    {
        // Refreshes that have not started yet are abandoned.
        git_pool_.stop();
        git_pool_.join();
    }

    std::size_t LiveIndex::initialScan()
    {
        std::size_t written = indexer_.scan();
        std::lock_guard<std::mutex> lock(commit_mutex_);
        cache_.rebuild();
        return written;
    }

    void LiveIndex::commit(const nlohmann::json &event)
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        cache_.rebuild();
        broadcaster_.publish(event);
    }

    bool LiveIndex::applyIndex(const fs::path &absolutePath, const char *eventType)
    {
        IndexResult result = indexer_.indexPath(absolutePath, false);
        switch (result.outcome)
        {
        case IndexOutcome::Indexed:
            commit(broadcast::entryEvent(eventType, result.path));
            if (result.isDirectory)
                scheduleGitRefresh(result.path);
            return true;
        case IndexOutcome::GitInternal:
            if (result.repoRoot)
                scheduleGitRefresh(*result.repoRoot);
            return false;
        case IndexOutcome::Failed:
            MyLogger::error("Failed to index " + absolutePath.string());
            return false;
        default:
            return false;
        }
    }

    bool LiveIndex::pathAdded(const fs::path &absolutePath)
    {
        return applyIndex(absolutePath, "entry-added");
    }

    bool LiveIndex::pathChanged(const fs::path &absolutePath)
    {
        return applyIndex(absolutePath, "entry-updated");
    }

    bool LiveIndex::pathRemoved(const fs::path &absolutePath)
    {
        auto canonical = pathUtils::toCanonical(indexer_.root(), absolutePath);
        if (canonical)
        {
            auto repo = pathUtils::repoRootForInternalPath(*canonical);
            if (repo)
            {
                scheduleGitRefresh(*repo);
                return false;
            }
        }

        auto removed = indexer_.removePath(absolutePath);
        if (!removed)
            return false;
        commit(broadcast::entryEvent("entry-removed", *removed));
        return true;
    }

    store::AddTagResult LiveIndex::addTag(const std::string &path, const std::string &key, const std::string &value)
    {
        store::AddTagResult result = store_.addTag(path, key, value);
        if (result == store::AddTagResult::Added)
            commit(broadcast::tagEvent("tag-added", store::Tag{path, key, value}));
        return result;
    }

    bool LiveIndex::removeTag(const std::string &path, const std::string &key, const std::string &value)
    {
        if (!store_.removeTag(path, key, value))
            return false;
        commit(broadcast::tagEvent("tag-removed", store::Tag{path, key, value}));
        return true;
    }

    void LiveIndex::scheduleGitRefresh(const std::string &canonicalDir)
    {
        if (!git_ || !git_->enabled())
            return;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            ++pending_git_;
        }
        boost::asio::post(git_pool_, [this, canonicalDir]()
                          {
            runGitRefresh(canonicalDir);
            std::lock_guard<std::mutex> lock(pending_mutex_);
            --pending_git_;
            pending_cv_.notify_all(); });
    }

    void LiveIndex::runGitRefresh(const std::string &canonicalDir)
    {
        try
        {
            auto before = comparable(store_.gitMetadataFor(canonicalDir));
            git_->refresh(canonicalDir);
            auto after = comparable(store_.gitMetadataFor(canonicalDir));
            if (before == after)
                return;
            if (!store_.getEntry(canonicalDir))
                return;
            commit(broadcast::entryEvent("entry-updated", canonicalDir));
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Repository refresh for " + canonicalDir + " failed: " + e.what());
        }
    }

    void LiveIndex::waitForGitRefreshes()
    {
        std::unique_lock<std::mutex> lock(pending_mutex_);
        pending_cv_.wait(lock, [this]()
                         { return pending_git_ == 0; });
    }
}

#pragma once

#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "nlohmann/json.hpp"
#include "indexer.hpp"
#include "../broadcast/change_broadcaster.hpp"
#include "../search/search_cache.hpp"

namespace fs = std::filesystem;

namespace indexer
{
    // Applies filesystem changes and tag edits to the store, then rebuilds
    // the search cache and broadcasts the change. Readers never observe a
    // broadcast for a change the cache does not contain yet.
    class LiveIndex
    {
    public:
        LiveIndex(Indexer &indexer,
                  store::EntryStore &store,
                  search::SearchCache &cache,
                  broadcast::ChangeBroadcaster &broadcaster,
                  gitmeta::GitMetadataCollector *git,
                  std::size_t gitThreads = 2);
        ~LiveIndex();

        LiveIndex(const LiveIndex &) = delete;
        LiveIndex &operator=(const LiveIndex &) = delete;

        // Full scan followed by one cache rebuild. Nothing is broadcast.
        std::size_t initialScan();

        bool pathAdded(const fs::path &absolutePath);
        bool pathChanged(const fs::path &absolutePath);
        bool pathRemoved(const fs::path &absolutePath);

        store::AddTagResult addTag(const std::string &path, const std::string &key, const std::string &value);
        bool removeTag(const std::string &path, const std::string &key, const std::string &value);

        // Queues a repository metadata refresh for a canonical directory.
        void scheduleGitRefresh(const std::string &canonicalDir);

        // Blocks until every queued repository refresh has finished.
        void waitForGitRefreshes();

    private:
        bool applyIndex(const fs::path &absolutePath, const char *eventType);
        void commit(const nlohmann::json &event);
        void runGitRefresh(const std::string &canonicalDir);

        Indexer &indexer_;
        store::EntryStore &store_;
        search::SearchCache &cache_;
        broadcast::ChangeBroadcaster &broadcaster_;
        gitmeta::GitMetadataCollector *git_;

        std::mutex commit_mutex_;

        boost::asio::thread_pool git_pool_;
        std::mutex pending_mutex_;
        std::condition_variable pending_cv_;
        std::size_t pending_git_ = 0;
    };
}

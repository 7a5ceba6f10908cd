#include "search_cache.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <chrono>

namespace search
{
    const store::Entry *Snapshot::find(const std::string &path) const
    {
        auto it = positionByPath.find(path);
        if (it == positionByPath.end())
            return nullptr;
        return &entries[it->second];
    }

    const std::vector<store::Tag> &Snapshot::tagsFor(const std::string &path) const
    {
        static const std::vector<store::Tag> empty;
        auto it = tagsByPath.find(path);
        return it == tagsByPath.end() ? empty : it->second;
    }

    SearchCache::SearchCache(const store::EntryStore &store)
        : store_(store), snapshot_(std::make_shared<Snapshot>())
    {
    }

    void SearchCache::rebuild()
    {
        // One rebuild at a time so versions are published in order.
        std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);

        auto next = std::make_shared<Snapshot>();
        next->builtAt = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();

        store::StoreContents contents = store_.readAll();

        for (auto &meta : contents.git)
        {
            auto path = meta.path;
            next->gitByPath.emplace(std::move(path), std::move(meta));
        }

        next->entries = std::move(contents.entries);
        for (std::size_t i = 0; i < next->entries.size(); ++i)
        {
            const auto &entry = next->entries[i];
            next->positionByPath.emplace(entry.path, i);
            next->entryIndex.add({entry.path, entry.name});
        }

        next->tags = std::move(contents.tags);
        for (const auto &tag : next->tags)
        {
            next->tagsByPath[tag.path].push_back(tag);
            auto &values = next->tagValuesByKey[tag.key];
            if (std::find(values.begin(), values.end(), tag.value) == values.end())
                values.push_back(tag.value);
            next->tagIndex.add({tag.key + ":" + tag.value, tag.key, tag.value});
        }
        for (auto &[path, tags] : next->tagsByPath)
        {
            std::sort(tags.begin(), tags.end(), [](const store::Tag &a, const store::Tag &b)
                      { return a.key != b.key ? a.key < b.key : a.value < b.value; });
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            next->version = next_version_++;
            snapshot_ = std::move(next);
        }
        MyLogger::debug("Search cache rebuilt");
    }

    std::shared_ptr<const Snapshot> SearchCache::current() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    std::uint64_t SearchCache::version() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_->version;
    }
}

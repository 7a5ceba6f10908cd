#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "fuzzy.hpp"
#include "../store/entry_store.hpp"

namespace search
{
    // Immutable view of the index used by every read path. A new snapshot is
    // built from the store after each mutation and swapped in whole.
    struct Snapshot
    {
        std::uint64_t version = 0;
        std::int64_t builtAt = 0;

        std::vector<store::Entry> entries; // depth, then case-insensitive name
        std::unordered_map<std::string, std::size_t> positionByPath;

        std::vector<store::Tag> tags;
        std::unordered_map<std::string, std::vector<store::Tag>> tagsByPath;
        // Known values per tag key, first-seen order.
        std::map<std::string, std::vector<std::string>> tagValuesByKey;

        std::unordered_map<std::string, store::GitMetadata> gitByPath;

        FuzzyIndex entryIndex{0.3}; // keys: path, name
        FuzzyIndex tagIndex{0.2};   // keys: "key:value", key, value

        const store::Entry *find(const std::string &path) const;
        const std::vector<store::Tag> &tagsFor(const std::string &path) const;
    };

    class SearchCache
    {
    public:
        explicit SearchCache(const store::EntryStore &store);

        // Reads the whole store and publishes a fresh snapshot.
        void rebuild();

        std::shared_ptr<const Snapshot> current() const;
        std::uint64_t version() const;

    private:
        const store::EntryStore &store_;
        mutable std::mutex mutex_;
        std::mutex rebuild_mutex_;
        std::shared_ptr<const Snapshot> snapshot_;
        std::uint64_t next_version_ = 1;
    };
}

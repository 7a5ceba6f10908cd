#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "rocksdb/db.h"
#include "records.hpp"

namespace store
{
    // Consistent copy of everything in the store, read from one RocksDB snapshot.
    struct StoreContents
    {
        std::vector<Entry> entries;
        std::vector<Tag> tags;
        std::vector<GitMetadata> git;
    };

    enum class AddTagResult
    {
        Added,
        AlreadyPresent,
        EntryMissing,
        Invalid,
        Failed
    };

    // RocksDB-backed store of entries, tags and repository metadata.
    //
    // Key layout:
    //   e:<path>                       -> Entry JSON
    //   t:<path>\x1f<key>\x1f<value>   -> "" (tag row)
    //   g:<path>                       -> GitMetadata JSON
    //
    // Writes are serialized by one mutex; multi-row deletions go through a
    // single WriteBatch so readers never see half of a removed branch.
    class EntryStore
    {
    public:
        // Destroys whatever lives at dbPath first: the index is rebuilt from
        // disk on every start. Throws std::runtime_error when RocksDB fails.
        explicit EntryStore(const std::string &dbPath);
        ~EntryStore();

        EntryStore(const EntryStore &) = delete;
        EntryStore &operator=(const EntryStore &) = delete;

        bool upsertEntry(const Entry &entry);
        std::optional<Entry> getEntry(const std::string &path) const;
        // Ordered by depth, then case-insensitive name.
        std::vector<Entry> allEntries() const;
        std::size_t entryCount() const;

        // Removes 'path', every descendant entry, their tags and their
        // repository metadata atomically. Returns the number of entries removed.
        std::size_t removeBranch(const std::string &path);

        AddTagResult addTag(const std::string &path, const std::string &key, const std::string &value);
        bool removeTag(const std::string &path, const std::string &key, const std::string &value);
        // Sorted by key, then value.
        std::vector<Tag> tagsFor(const std::string &path) const;
        std::vector<Tag> allTags() const;
        std::vector<std::string> pathsForTag(const std::string &key, const std::string &value) const;

        bool upsertGitMetadata(const GitMetadata &meta);
        bool deleteGitMetadata(const std::string &path);
        std::optional<GitMetadata> gitMetadataFor(const std::string &path) const;
        std::vector<GitMetadata> allGitMetadata() const;

        StoreContents readAll() const;

        // Drops every row; used before a full rescan.
        bool clear();

    private:
        std::vector<std::string> keysWithPrefix(const std::string &prefix,
                                                const rocksdb::ReadOptions &options = rocksdb::ReadOptions()) const;
        std::vector<Entry> readEntries(const rocksdb::ReadOptions &options) const;
        std::vector<Tag> readTags(const rocksdb::ReadOptions &options) const;
        std::vector<GitMetadata> readGitMetadata(const rocksdb::ReadOptions &options) const;
        bool put(const std::string &key, const std::string &value);

        std::string db_path_;
        std::shared_ptr<rocksdb::DB> db_;
        mutable std::mutex write_mutex_;
    };
}

#include "entry_store.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "rocksdb/options.h"
#include "rocksdb/write_batch.h"

using json = nlohmann::json;

namespace store
{
    namespace
    {
        const char kSep = '\x1f';

        std::string entryKey(const std::string &path) { return "e:" + path; }
        std::string gitKey(const std::string &path) { return "g:" + path; }

        std::string tagPrefix(const std::string &path)
        {
            return "t:" + path + kSep;
        }

        std::string tagKey(const std::string &path, const std::string &key, const std::string &value)
        {
            return tagPrefix(path) + key + kSep + value;
        }

        // Prefix selecting everything strictly below 'path'.
        std::string childPrefix(const std::string &path)
        {
            return path == "/" ? "/" : path + "/";
        }

        std::optional<Tag> parseTagKey(const std::string &raw)
        {
            if (raw.compare(0, 2, "t:") != 0)
                return std::nullopt;
            auto first = raw.find(kSep, 2);
            if (first == std::string::npos)
                return std::nullopt;
            auto second = raw.find(kSep, first + 1);
            if (second == std::string::npos)
                return std::nullopt;
            return Tag{raw.substr(2, first - 2),
                       raw.substr(first + 1, second - first - 1),
                       raw.substr(second + 1)};
        }

        std::string lower(const std::string &s)
        {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }
    }

    EntryStore::EntryStore(const std::string &dbPath)
        : db_path_(dbPath)
    {
        rocksdb::Options options;
        rocksdb::Status status = rocksdb::DestroyDB(db_path_, options);
        if (!status.ok())
        {
            MyLogger::warning("Could not destroy previous index at " + db_path_ + ": " + status.ToString());
        }

        options.create_if_missing = true;
        rocksdb::DB *raw_db = nullptr;
        status = rocksdb::DB::Open(options, db_path_, &raw_db);
        if (!status.ok())
            throw std::runtime_error("Failed to open RocksDB at: " + db_path_ + " Error: " + status.ToString());
        db_ = std::shared_ptr<rocksdb::DB>(raw_db);
        MyLogger::info("Entry store opened at " + db_path_);
    }

    EntryStore::~EntryStore()
    {
        if (db_)
        {
            rocksdb::Status status = db_->Close();
            if (!status.ok())
                MyLogger::warning("Closing entry store failed: " + status.ToString());
        }
    }

    bool EntryStore::put(const std::string &key, const std::string &value)
    {
        rocksdb::Status status = db_->Put(rocksdb::WriteOptions(), key, value);
        if (!status.ok())
        {
            MyLogger::error("RocksDB put failed for " + key + ": " + status.ToString());
            return false;
        }
        return true;
    }

    std::vector<std::string> EntryStore::keysWithPrefix(const std::string &prefix,
                                                        const rocksdb::ReadOptions &options) const
    {
        std::vector<std::string> keys;
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(options));
        for (it->Seek(prefix); it->Valid(); it->Next())
        {
            auto key = it->key();
            if (!key.starts_with(prefix))
                break;
            keys.push_back(key.ToString());
        }
        if (!it->status().ok())
            MyLogger::error("RocksDB iteration failed for prefix " + prefix + ": " + it->status().ToString());
        return keys;
    }

    bool EntryStore::upsertEntry(const Entry &entry)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        return put(entryKey(entry.path), json(entry).dump());
    }

    std::optional<Entry> EntryStore::getEntry(const std::string &path) const
    {
        std::string value;
        rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), entryKey(path), &value);
        if (status.IsNotFound())
            return std::nullopt;
        if (!status.ok())
        {
            MyLogger::error("RocksDB get failed for " + path + ": " + status.ToString());
            return std::nullopt;
        }
        try
        {
            return json::parse(value).get<Entry>();
        }
        catch (const json::exception &e)
        {
            MyLogger::error("Corrupt entry record for " + path + ": " + e.what());
            return std::nullopt;
        }
    }

    std::vector<Entry> EntryStore::allEntries() const
    {
        return readEntries(rocksdb::ReadOptions());
    }

    std::vector<Entry> EntryStore::readEntries(const rocksdb::ReadOptions &options) const
    {
        std::vector<Entry> entries;
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(options));
        for (it->Seek("e:"); it->Valid(); it->Next())
        {
            if (!it->key().starts_with("e:"))
                break;
            try
            {
                entries.push_back(json::parse(it->value().ToString()).get<Entry>());
            }
            catch (const json::exception &e)
            {
                MyLogger::error("Skipping corrupt entry record " + it->key().ToString() + ": " + e.what());
            }
        }
        if (!it->status().ok())
            MyLogger::error("RocksDB iteration over entries failed: " + it->status().ToString());

        std::stable_sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b)
                         {
            if (a.depth != b.depth)
                return a.depth < b.depth;
            auto la = lower(a.name);
            auto lb = lower(b.name);
            if (la != lb)
                return la < lb;
            return a.path < b.path; });
        return entries;
    }

    std::size_t EntryStore::entryCount() const
    {
        return keysWithPrefix("e:").size();
    }

    bool EntryStore::clear()
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        rocksdb::WriteBatch batch;
        for (const auto &key : keysWithPrefix(""))
            batch.Delete(key);
        rocksdb::Status status = db_->Write(rocksdb::WriteOptions(), &batch);
        if (!status.ok())
        {
            MyLogger::error("Failed to clear entry store: " + status.ToString());
            return false;
        }
        return true;
    }

    std::size_t EntryStore::removeBranch(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        rocksdb::WriteBatch batch;
        std::size_t removed = 0;

        if (getEntry(path))
        {
            batch.Delete(entryKey(path));
            ++removed;
        }
        for (const auto &key : keysWithPrefix(entryKey(childPrefix(path))))
        {
            if (key == entryKey(path))
                continue;
            batch.Delete(key);
            ++removed;
        }
        for (const auto &key : keysWithPrefix(tagPrefix(path)))
            batch.Delete(key);
        for (const auto &key : keysWithPrefix("t:" + childPrefix(path)))
            batch.Delete(key);
        batch.Delete(gitKey(path));
        for (const auto &key : keysWithPrefix(gitKey(childPrefix(path))))
            batch.Delete(key);

        rocksdb::Status status = db_->Write(rocksdb::WriteOptions(), &batch);
        if (!status.ok())
        {
            MyLogger::error("Failed to remove branch " + path + ": " + status.ToString());
            return 0;
        }
        if (removed > 0)
            MyLogger::debug("Removed " + std::to_string(removed) + " entries under " + path);
        return removed;
    }

    AddTagResult EntryStore::addTag(const std::string &path, const std::string &key, const std::string &value)
    {
        if (key.find(kSep) != std::string::npos || value.find(kSep) != std::string::npos)
            return AddTagResult::Invalid;

        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!getEntry(path))
            return AddTagResult::EntryMissing;

        std::string existing;
        rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), tagKey(path, key, value), &existing);
        if (status.ok())
            return AddTagResult::AlreadyPresent;
        if (!status.IsNotFound())
        {
            MyLogger::error("RocksDB get failed for tag on " + path + ": " + status.ToString());
            return AddTagResult::Failed;
        }
        return put(tagKey(path, key, value), "") ? AddTagResult::Added : AddTagResult::Failed;
    }

    bool EntryStore::removeTag(const std::string &path, const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        rocksdb::Status status = db_->Delete(rocksdb::WriteOptions(), tagKey(path, key, value));
        if (!status.ok())
        {
            MyLogger::error("Failed to remove tag from " + path + ": " + status.ToString());
            return false;
        }
        return true;
    }

    std::vector<Tag> EntryStore::tagsFor(const std::string &path) const
    {
        std::vector<Tag> tags;
        for (const auto &raw : keysWithPrefix(tagPrefix(path)))
        {
            if (auto tag = parseTagKey(raw))
                tags.push_back(*tag);
        }
        std::sort(tags.begin(), tags.end(), [](const Tag &a, const Tag &b)
                  { return a.key != b.key ? a.key < b.key : a.value < b.value; });
        return tags;
    }

    std::vector<Tag> EntryStore::allTags() const
    {
        return readTags(rocksdb::ReadOptions());
    }

    std::vector<Tag> EntryStore::readTags(const rocksdb::ReadOptions &options) const
    {
        std::vector<Tag> tags;
        for (const auto &raw : keysWithPrefix("t:", options))
        {
            if (auto tag = parseTagKey(raw))
                tags.push_back(*tag);
        }
        return tags;
    }

    std::vector<std::string> EntryStore::pathsForTag(const std::string &key, const std::string &value) const
    {
        std::vector<std::string> paths;
        for (const auto &tag : allTags())
        {
            if (tag.key == key && tag.value == value)
                paths.push_back(tag.path);
        }
        return paths;
    }

    bool EntryStore::upsertGitMetadata(const GitMetadata &meta)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        return put(gitKey(meta.path), json(meta).dump());
    }

    bool EntryStore::deleteGitMetadata(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        rocksdb::Status status = db_->Delete(rocksdb::WriteOptions(), gitKey(path));
        if (!status.ok())
        {
            MyLogger::error("Failed to delete git metadata for " + path + ": " + status.ToString());
            return false;
        }
        return true;
    }

    std::optional<GitMetadata> EntryStore::gitMetadataFor(const std::string &path) const
    {
        std::string value;
        rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), gitKey(path), &value);
        if (!status.ok())
        {
            if (!status.IsNotFound())
                MyLogger::error("RocksDB get failed for git metadata " + path + ": " + status.ToString());
            return std::nullopt;
        }
        try
        {
            return json::parse(value).get<GitMetadata>();
        }
        catch (const json::exception &e)
        {
            MyLogger::error("Corrupt git metadata for " + path + ": " + e.what());
            return std::nullopt;
        }
    }

    std::vector<GitMetadata> EntryStore::allGitMetadata() const
    {
        return readGitMetadata(rocksdb::ReadOptions());
    }

    std::vector<GitMetadata> EntryStore::readGitMetadata(const rocksdb::ReadOptions &options) const
    {
        std::vector<GitMetadata> result;
        std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(options));
        for (it->Seek("g:"); it->Valid(); it->Next())
        {
            if (!it->key().starts_with("g:"))
                break;
            try
            {
                result.push_back(json::parse(it->value().ToString()).get<GitMetadata>());
            }
            catch (const json::exception &e)
            {
                MyLogger::error("Skipping corrupt git metadata " + it->key().ToString() + ": " + e.what());
            }
        }
        return result;
    }

    StoreContents EntryStore::readAll() const
    {
        const rocksdb::Snapshot *snapshot = db_->GetSnapshot();
        rocksdb::ReadOptions options;
        options.snapshot = snapshot;

        StoreContents contents;
        contents.entries = readEntries(options);
        contents.tags = readTags(options);
        contents.git = readGitMetadata(options);

        db_->ReleaseSnapshot(snapshot);
        return contents;
    }
}

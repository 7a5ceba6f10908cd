#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"

namespace store
{
    enum class EntryKind
    {
        File,
        Directory
    };

    inline std::string kindName(EntryKind kind)
    {
        return kind == EntryKind::Directory ? "directory" : "file";
    }

    // One indexed filesystem node.
    struct Entry
    {
        std::string path;                      // canonical, "/" for the root
        std::string name;                      // base name
        std::optional<std::string> parentPath; // empty for the root
        EntryKind kind = EntryKind::File;
        std::optional<std::uint64_t> size;     // files only
        std::int64_t modifiedAt = 0;           // milliseconds since epoch
        std::string extension;                 // files only, lower-case, no dot
        int depth = 0;

        bool isDirectory() const { return kind == EntryKind::Directory; }

        bool operator==(const Entry &other) const
        {
            return path == other.path && name == other.name && parentPath == other.parentPath &&
                   kind == other.kind && size == other.size && modifiedAt == other.modifiedAt &&
                   extension == other.extension && depth == other.depth;
        }
    };

    struct Tag
    {
        std::string path;
        std::string key;
        std::string value;

        bool operator==(const Tag &other) const
        {
            return path == other.path && key == other.key && value == other.value;
        }
    };

    struct GitRemote
    {
        std::string name;
        std::optional<std::string> fetchUrl;
        std::optional<std::string> pushUrl;
    };

    // Facts about a directory that is the root of a working tree.
    struct GitMetadata
    {
        std::string path;
        std::int64_t detectedAt = 0;
        std::optional<std::string> currentBranch;
        std::optional<std::int64_t> commitCount;
        std::optional<std::int64_t> branchCount;
        std::vector<GitRemote> remotes;
    };

    namespace detail
    {
        template <typename T>
        nlohmann::json optionalToJson(const std::optional<T> &value)
        {
            if (!value)
                return nullptr;
            return *value;
        }

        template <typename T>
        std::optional<T> optionalFromJson(const nlohmann::json &j, const char *key)
        {
            if (!j.contains(key) || j.at(key).is_null())
                return std::nullopt;
            return j.at(key).get<T>();
        }
    }

    inline void to_json(nlohmann::json &j, const Entry &entry)
    {
        j = nlohmann::json{
            {"path", entry.path},
            {"name", entry.name},
            {"parent_path", detail::optionalToJson(entry.parentPath)},
            {"type", kindName(entry.kind)},
            {"size", detail::optionalToJson(entry.size)},
            {"mtime", entry.modifiedAt},
            {"extension", entry.extension},
            {"depth", entry.depth}};
    }

    inline void from_json(const nlohmann::json &j, Entry &entry)
    {
        j.at("path").get_to(entry.path);
        j.at("name").get_to(entry.name);
        entry.parentPath = detail::optionalFromJson<std::string>(j, "parent_path");
        entry.kind = j.at("type").get<std::string>() == "directory" ? EntryKind::Directory : EntryKind::File;
        entry.size = detail::optionalFromJson<std::uint64_t>(j, "size");
        j.at("mtime").get_to(entry.modifiedAt);
        j.at("extension").get_to(entry.extension);
        j.at("depth").get_to(entry.depth);
    }

    inline void to_json(nlohmann::json &j, const Tag &tag)
    {
        j = nlohmann::json{{"path", tag.path}, {"key", tag.key}, {"value", tag.value}};
    }

    inline void to_json(nlohmann::json &j, const GitRemote &remote)
    {
        j = nlohmann::json{
            {"name", remote.name},
            {"fetchUrl", detail::optionalToJson(remote.fetchUrl)},
            {"pushUrl", detail::optionalToJson(remote.pushUrl)}};
    }

    inline void from_json(const nlohmann::json &j, GitRemote &remote)
    {
        j.at("name").get_to(remote.name);
        remote.fetchUrl = detail::optionalFromJson<std::string>(j, "fetchUrl");
        remote.pushUrl = detail::optionalFromJson<std::string>(j, "pushUrl");
    }

    inline void to_json(nlohmann::json &j, const GitMetadata &meta)
    {
        j = nlohmann::json{
            {"path", meta.path},
            {"detected_at", meta.detectedAt},
            {"current_branch", detail::optionalToJson(meta.currentBranch)},
            {"commit_count", detail::optionalToJson(meta.commitCount)},
            {"branch_count", detail::optionalToJson(meta.branchCount)},
            {"remotes", meta.remotes}};
    }

    inline void from_json(const nlohmann::json &j, GitMetadata &meta)
    {
        j.at("path").get_to(meta.path);
        j.at("detected_at").get_to(meta.detectedAt);
        meta.currentBranch = detail::optionalFromJson<std::string>(j, "current_branch");
        meta.commitCount = detail::optionalFromJson<std::int64_t>(j, "commit_count");
        meta.branchCount = detail::optionalFromJson<std::int64_t>(j, "branch_count");
        meta.remotes.clear();
        if (j.contains("remotes") && j.at("remotes").is_array())
            j.at("remotes").get_to(meta.remotes);
    }
}

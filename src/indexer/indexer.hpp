#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "../gitmeta/git_metadata.hpp"
#include "../pathUtils/ignoreRegistry.hpp"
#include "../store/entry_store.hpp"

namespace fs = std::filesystem;

namespace indexer
{
    enum class IndexOutcome
    {
        Indexed,
        Ignored,     // outside the root, marked unsupported, or a special file
        Missing,     // vanished before it could be read
        GitInternal, // lives inside a ".git" directory; see repoRoot
        Failed
    };

    struct IndexResult
    {
        IndexOutcome outcome = IndexOutcome::Failed;
        std::string path; // canonical path when known
        bool isDirectory = false;
        std::optional<std::string> repoRoot;
    };

    // Keeps the entry store in line with the filesystem below one root.
    class Indexer
    {
    public:
        // 'git' may be null; repository metadata is then left to the caller.
        Indexer(fs::path root,
                store::EntryStore &store,
                pathUtils::IgnoreRegistry &ignores,
                gitmeta::GitMetadataCollector *git = nullptr);

        // Stats 'absolutePath' and upserts its entry. Directories get their
        // repository metadata refreshed when 'collectGit' is set.
        IndexResult indexPath(const fs::path &absolutePath, bool collectGit = true);

        // Removes the entry, its whole subtree and their tags. Returns the
        // canonical path, or std::nullopt when the path is outside the root,
        // ignored, internal repository state, or was never indexed.
        std::optional<std::string> removePath(const fs::path &absolutePath);

        // Depth-first walk of the whole root. Re-running it is harmless.
        // Returns the number of entries written.
        std::size_t scan();

        static store::Entry makeEntry(const std::string &canonicalPath,
                                      const std::string &rootName,
                                      bool isDirectory,
                                      std::optional<std::uint64_t> size,
                                      std::int64_t modifiedAt);

        // Milliseconds since the epoch.
        static std::int64_t toEpochMillis(fs::file_time_type time);

        const fs::path &root() const { return root_; }
        const std::string &rootName() const { return root_name_; }

    private:
        void walk(const fs::path &absolutePath, std::size_t &written);

        fs::path root_;
        std::string root_name_;
        store::EntryStore &store_;
        pathUtils::IgnoreRegistry &ignores_;
        gitmeta::GitMetadataCollector *git_;
    };
}

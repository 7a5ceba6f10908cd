#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pathUtils
{
    // Session-scoped set of paths the indexer must never touch again.
    // Paths are keyed by their canonical form. Nothing outside the root is
    // ever indexed, so such paths are not recorded.
    class IgnoreRegistry
    {
    public:
        explicit IgnoreRegistry(fs::path root);

        void markUnsupported(const fs::path &absolutePath);

        bool shouldIgnore(const std::string &absolutePath) const;

        std::size_t size() const;

        // EACCES, EPERM, ENOTSUP/EOPNOTSUPP and ENAMETOOLONG.
        static bool isUnsupportedError(const std::error_code &ec);

        // Sockets, FIFOs and device nodes are never indexed.
        static bool isSpecialFile(const fs::file_status &status);

    private:
        fs::path root_;
        mutable std::shared_mutex mutex_;
        std::unordered_set<std::string> paths_;
    };
}

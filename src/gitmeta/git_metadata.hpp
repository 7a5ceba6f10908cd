#pragma once

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "command_runner.hpp"
#include "../store/entry_store.hpp"

namespace fs = std::filesystem;

namespace gitmeta
{
    // Raised internally once the binary turns out to be missing.
    class GitUnavailable : public std::runtime_error
    {
    public:
        GitUnavailable() : std::runtime_error("git executable unavailable") {}
    };

    // Derives branch/commit/remote facts for directories that are the root
    // of a working tree and records them in the entry store.
    class GitMetadataCollector
    {
    public:
        GitMetadataCollector(fs::path root,
                             store::EntryStore &store,
                             std::shared_ptr<CommandRunner> runner);

        // Collects (or clears) metadata for a canonical directory path.
        // Concurrent calls for the same directory share one collection.
        std::optional<store::GitMetadata> refresh(const std::string &canonicalDir);

        // False once the binary was found missing; stays false.
        bool enabled() const { return !disabled_.load(); }

        static std::vector<store::GitRemote> parseRemotes(const std::string &output);

    private:
        std::optional<store::GitMetadata> gather(const std::string &canonicalDir);
        CommandResult runGit(const std::vector<std::string> &args, const fs::path &cwd);
        void clear(const std::string &canonicalDir);

        fs::path root_;
        store::EntryStore &store_;
        std::shared_ptr<CommandRunner> runner_;
        std::atomic<bool> disabled_{false};

        std::mutex pending_mutex_;
        std::unordered_map<std::string, std::shared_future<std::optional<store::GitMetadata>>> pending_;
    };
}

#include "git_metadata.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/ignoreRegistry.hpp"
#include "../pathUtils/pathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace gitmeta
{
    namespace
    {
        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        bool isNotRepositoryError(const CommandResult &result)
        {
            std::string text = result.err + " " + result.out;
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text.find("not a git repository") != std::string::npos ||
                   text.find("invalid gitfile format") != std::string::npos;
        }

        std::int64_t nowMillis()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        std::optional<std::int64_t> parseCount(const std::string &output)
        {
            try
            {
                std::string value = trim(output);
                if (value.empty())
                    return std::nullopt;
                return std::stoll(value);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
    }

    GitMetadataCollector::GitMetadataCollector(fs::path root,
                                               store::EntryStore &store,
                                               std::shared_ptr<CommandRunner> runner)
        : root_(std::move(root)), store_(store), runner_(std::move(runner))
    {
    }

    CommandResult GitMetadataCollector::runGit(const std::vector<std::string> &args, const fs::path &cwd)
    {
        if (disabled_.load())
            throw GitUnavailable();

        CommandResult result = runner_->run(args, cwd.string());
        if (result.outcome == CommandOutcome::Unavailable)
        {
            if (!disabled_.exchange(true))
                MyLogger::warning("git is not available on PATH; skipping repository metadata.");
            throw GitUnavailable();
        }
        if (result.outcome == CommandOutcome::TimedOut)
            MyLogger::warning("git " + (args.empty() ? std::string() : args.front()) + " timed out in " + cwd.string());
        return result;
    }

    void GitMetadataCollector::clear(const std::string &canonicalDir)
    {
        if (store_.gitMetadataFor(canonicalDir))
            store_.deleteGitMetadata(canonicalDir);
    }

    std::vector<store::GitRemote> GitMetadataCollector::parseRemotes(const std::string &output)
    {
        std::vector<store::GitRemote> remotes;
        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            std::istringstream fields(line);
            std::string name, url, direction;
            if (!(fields >> name >> url))
                continue;
            fields >> direction;

            auto it = std::find_if(remotes.begin(), remotes.end(),
                                   [&name](const store::GitRemote &r)
                                   { return r.name == name; });
            if (it == remotes.end())
            {
                remotes.push_back(store::GitRemote{name, std::nullopt, std::nullopt});
                it = std::prev(remotes.end());
            }

            if (direction == "(fetch)")
            {
                it->fetchUrl = url;
            }
            else if (direction == "(push)")
            {
                it->pushUrl = url;
            }
            else
            {
                if (!it->fetchUrl)
                    it->fetchUrl = url;
                if (!it->pushUrl)
                    it->pushUrl = url;
            }
        }
        for (auto &remote : remotes)
        {
            if (!remote.pushUrl)
                remote.pushUrl = remote.fetchUrl;
        }
        return remotes;
    }

    std::optional<store::GitMetadata> GitMetadataCollector::gather(const std::string &canonicalDir)
    {
        if (canonicalDir != "/" && pathUtils::baseName(canonicalDir) == ".git")
            return std::nullopt;

        fs::path absolute = pathUtils::toAbsolute(root_, canonicalDir);
        std::error_code ec;
        auto status = fs::status(absolute, ec);
        if (ec || !fs::is_directory(status))
        {
            if (ec && pathUtils::IgnoreRegistry::isUnsupportedError(ec))
                return std::nullopt;
            clear(canonicalDir);
            return std::nullopt;
        }

        auto marker = fs::symlink_status(absolute / ".git", ec);
        if (ec && pathUtils::IgnoreRegistry::isUnsupportedError(ec))
            return std::nullopt;
        if (!fs::exists(marker))
        {
            clear(canonicalDir);
            return std::nullopt;
        }

        CommandResult toplevel = runGit({"rev-parse", "--show-toplevel"}, absolute);
        if (!toplevel.ok())
        {
            if (toplevel.outcome == CommandOutcome::Completed && isNotRepositoryError(toplevel))
            {
                clear(canonicalDir);
                return std::nullopt;
            }
            MyLogger::warning("Failed to resolve git root for " + absolute.string() + ": " + trim(toplevel.err));
            return std::nullopt;
        }

        auto repoCanonical = pathUtils::toCanonical(root_, fs::path(trim(toplevel.out)));
        if (!repoCanonical || *repoCanonical != canonicalDir)
        {
            // Sub-directory of a repository rooted elsewhere.
            clear(canonicalDir);
            return std::nullopt;
        }

        store::GitMetadata meta;
        meta.path = canonicalDir;

        CommandResult branch = runGit({"symbolic-ref", "--quiet", "--short", "HEAD"}, absolute);
        if (branch.ok() && !trim(branch.out).empty())
        {
            meta.currentBranch = trim(branch.out);
        }
        else if (!isNotRepositoryError(branch))
        {
            CommandResult detached = runGit({"rev-parse", "--short", "HEAD"}, absolute);
            if (detached.ok() && !trim(detached.out).empty())
                meta.currentBranch = trim(detached.out);
        }

        CommandResult commits = runGit({"rev-list", "--all", "--count"}, absolute);
        if (commits.ok())
            meta.commitCount = parseCount(commits.out);

        CommandResult branches = runGit({"branch", "--format=%(refname:short)"}, absolute);
        if (branches.ok())
        {
            std::int64_t count = 0;
            std::istringstream lines(branches.out);
            std::string line;
            while (std::getline(lines, line))
            {
                if (!trim(line).empty())
                    ++count;
            }
            meta.branchCount = count;
        }

        CommandResult remotes = runGit({"remote", "-v"}, absolute);
        if (remotes.ok())
            meta.remotes = parseRemotes(remotes.out);

        meta.detectedAt = nowMillis();
        if (!store_.upsertGitMetadata(meta))
            return std::nullopt;
        MyLogger::debug("Recorded git metadata for " + canonicalDir);
        return meta;
    }

    std::optional<store::GitMetadata> GitMetadataCollector::refresh(const std::string &canonicalDir)
    {
        if (canonicalDir.empty() || disabled_.load())
            return std::nullopt;

        std::promise<std::optional<store::GitMetadata>> promise;
        std::shared_future<std::optional<store::GitMetadata>> inflight;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(canonicalDir);
            if (it != pending_.end())
            {
                inflight = it->second;
            }
            else
            {
                inflight = promise.get_future().share();
                pending_.emplace(canonicalDir, inflight);
                owner = true;
            }
        }
        if (!owner)
            return inflight.get();

        std::optional<store::GitMetadata> result;
        try
        {
            result = gather(canonicalDir);
        }
        catch (const GitUnavailable &)
        {
            result = std::nullopt;
        }
        catch (const std::exception &e)
        {
            MyLogger::warning("Failed to update git metadata for " + canonicalDir + ": " + e.what());
            result = std::nullopt;
        }

        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(canonicalDir);
        }
        promise.set_value(result);
        return result;
    }
}

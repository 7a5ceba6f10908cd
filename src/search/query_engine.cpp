#include "query_engine.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace search
{
    namespace
    {
        const std::size_t kSuggestionLimit = 10;
        const std::size_t kSuggestionsPerSource = 5;

        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        json tagsJson(const std::vector<store::Tag> &tags)
        {
            json out = json::array();
            for (const auto &tag : tags)
                out.push_back({{"key", tag.key}, {"value", tag.value}});
            return out;
        }

        bool childOrder(const store::Entry &a, const store::Entry &b)
        {
            if (a.kind != b.kind)
                return a.isDirectory();
            auto la = toLower(a.name);
            auto lb = toLower(b.name);
            if (la != lb)
                return la < lb;
            return a.name < b.name;
        }
    }

    void to_json(json &j, const Suggestion &suggestion)
    {
        j = json{{"type", suggestion.type}, {"value", suggestion.value}};
    }

    QueryEngine::QueryEngine(const SearchCache &cache,
                             const store::EntryStore &store,
                             std::string rootName,
                             std::size_t searchLimit)
        : cache_(cache), store_(store), root_name_(std::move(rootName)), search_limit_(searchLimit)
    {
    }

    std::vector<TagFilter> QueryEngine::parseTagFilters(const std::string &raw)
    {
        std::vector<TagFilter> filters;
        std::istringstream pieces(raw);
        std::string piece;
        while (std::getline(pieces, piece, ','))
        {
            piece = trim(piece);
            auto colon = piece.find(':');
            if (piece.empty() || colon == std::string::npos)
                continue;
            auto key = trim(piece.substr(0, colon));
            auto value = trim(piece.substr(colon + 1));
            if (!key.empty() && !value.empty())
                filters.push_back(TagFilter{key, value});
        }
        return filters;
    }

    json QueryEngine::gitInfo(const store::Entry &entry, const store::GitMetadata *meta)
    {
        if (!entry.isDirectory())
            return nullptr;
        if (!meta)
            return json{{"isRepo", false}};

        json remotes = meta->remotes;
        auto count = meta->remotes.size();
        return json{
            {"isRepo", true},
            {"detectedAt", meta->detectedAt},
            {"currentBranch", meta->currentBranch ? json(*meta->currentBranch) : json(nullptr)},
            {"commitCount", meta->commitCount ? json(*meta->commitCount) : json(nullptr)},
            {"branchCount", meta->branchCount ? json(*meta->branchCount) : json(nullptr)},
            {"remoteCount", count},
            {"isLocalOnly", count == 0},
            {"remotes", remotes}};
    }

    json QueryEngine::entryJson(const Snapshot &snapshot, const store::Entry &entry) const
    {
        json j = entry;
        auto git = snapshot.gitByPath.find(entry.path);
        j["git"] = gitInfo(entry, git == snapshot.gitByPath.end() ? nullptr : &git->second);
        j["tags"] = tagsJson(snapshot.tagsFor(entry.path));
        return j;
    }

    json QueryEngine::buildTree() const
    {
        auto snapshot = cache_.current();

        std::unordered_map<std::string, std::vector<const store::Entry *>> children;
        for (const auto &entry : snapshot->entries)
        {
            if (entry.parentPath && snapshot->find(*entry.parentPath))
                children[*entry.parentPath].push_back(&entry);
        }
        for (auto &[parent, list] : children)
        {
            std::sort(list.begin(), list.end(), [](const store::Entry *a, const store::Entry *b)
                      { return childOrder(*a, *b); });
        }

        std::function<json(const store::Entry &)> build = [&](const store::Entry &entry)
        {
            json node = entryJson(*snapshot, entry);
            if (entry.path == "/")
                node["name"] = root_name_;
            node["children"] = json::array();
            auto it = children.find(entry.path);
            if (it != children.end())
            {
                for (const auto *child : it->second)
                    node["children"].push_back(build(*child));
            }
            return node;
        };

        const store::Entry *root = snapshot->find("/");
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
        return json{
            {"root", root ? build(*root) : json(nullptr)},
            {"rootName", root_name_},
            {"generatedAt", now}};
    }

    std::vector<store::Entry> QueryEngine::searchIn(const Snapshot &snapshot,
                                                    const std::string &query,
                                                    const std::vector<TagFilter> &filters) const
    {
        std::optional<std::unordered_set<std::string>> allowed;
        for (const auto &filter : filters)
        {
            std::unordered_set<std::string> matching;
            for (const auto &tag : snapshot.tags)
            {
                if (tag.key == filter.key && tag.value == filter.value)
                    matching.insert(tag.path);
            }
            if (!allowed)
            {
                allowed = std::move(matching);
                continue;
            }
            std::unordered_set<std::string> intersection;
            for (const auto &path : *allowed)
            {
                if (matching.count(path))
                    intersection.insert(path);
            }
            allowed = std::move(intersection);
        }

        std::vector<store::Entry> results;
        if (!query.empty())
        {
            std::unordered_set<std::string> seen;
            for (const auto &hit : snapshot.entryIndex.search(query, search_limit_))
            {
                const auto &entry = snapshot.entries[hit.index];
                if (allowed && !allowed->count(entry.path))
                    continue;
                if (seen.insert(entry.path).second)
                    results.push_back(entry);
            }
            return results;
        }

        for (const auto &entry : snapshot.entries)
        {
            if (results.size() >= search_limit_)
                break;
            if (allowed && !allowed->count(entry.path))
                continue;
            results.push_back(entry);
        }
        return results;
    }

    std::vector<store::Entry> QueryEngine::search(const std::string &query, const std::vector<TagFilter> &filters) const
    {
        auto snapshot = cache_.current();
        return searchIn(*snapshot, trim(query), filters);
    }

    json QueryEngine::searchJson(const std::string &query, const std::vector<TagFilter> &filters) const
    {
        auto snapshot = cache_.current();
        json results = json::array();
        for (const auto &entry : searchIn(*snapshot, trim(query), filters))
            results.push_back(entryJson(*snapshot, entry));
        return results;
    }

    std::vector<Suggestion> QueryEngine::suggest(const std::string &rawQuery) const
    {
        auto snapshot = cache_.current();
        std::string query = trim(rawQuery);
        std::vector<Suggestion> suggestions;

        if (query.empty())
        {
            for (const auto &entry : snapshot->entries)
            {
                if (suggestions.size() >= kSuggestionLimit)
                    break;
                if (entry.isDirectory() && entry.path != "/")
                    suggestions.push_back(Suggestion{"path", entry.path});
            }
            return suggestions;
        }

        // Only the last whitespace-separated token is completed.
        auto lastSpace = query.find_last_of(" \t");
        std::string current = lastSpace == std::string::npos ? query : query.substr(lastSpace + 1);

        auto colon = current.find(':');
        if (colon != std::string::npos)
        {
            std::string key = current.substr(0, colon);
            std::string prefix = toLower(current.substr(colon + 1));
            auto values = snapshot->tagValuesByKey.find(key);
            if (values == snapshot->tagValuesByKey.end())
                return suggestions;
            for (const auto &value : values->second)
            {
                if (suggestions.size() >= kSuggestionLimit)
                    break;
                if (toLower(value).compare(0, prefix.size(), prefix) == 0)
                    suggestions.push_back(Suggestion{"tag", key + ":" + value});
            }
            return suggestions;
        }

        std::vector<Suggestion> merged;
        for (const auto &hit : snapshot->entryIndex.search(current, kSuggestionsPerSource))
            merged.push_back(Suggestion{"path", snapshot->entries[hit.index].path});
        for (const auto &hit : snapshot->tagIndex.search(current, kSuggestionsPerSource))
        {
            const auto &tag = snapshot->tags[hit.index];
            merged.push_back(Suggestion{"tag", tag.key + ":" + tag.value});
        }
        std::string lowered = toLower(current);
        std::size_t keyMatches = 0;
        for (const auto &[key, values] : snapshot->tagValuesByKey)
        {
            if (keyMatches >= kSuggestionsPerSource)
                break;
            if (toLower(key).compare(0, lowered.size(), lowered) == 0)
            {
                merged.push_back(Suggestion{"tagKey", key + ":"});
                ++keyMatches;
            }
        }

        std::set<std::pair<std::string, std::string>> seen;
        for (auto &suggestion : merged)
        {
            if (suggestions.size() >= kSuggestionLimit)
                break;
            if (seen.emplace(suggestion.type, suggestion.value).second)
                suggestions.push_back(std::move(suggestion));
        }
        return suggestions;
    }

    std::optional<std::vector<store::Tag>> QueryEngine::listTags(const std::string &path) const
    {
        if (!store_.getEntry(path))
            return std::nullopt;
        return store_.tagsFor(path);
    }

    std::vector<store::Tag> QueryEngine::listAllTags() const
    {
        return cache_.current()->tags;
    }

    std::vector<TagSearchResult> QueryEngine::searchTags(const std::string &query, std::size_t limit) const
    {
        auto snapshot = cache_.current();
        std::vector<TagSearchResult> results;
        for (const auto &hit : snapshot->tagIndex.search(trim(query), limit))
        {
            const auto &tag = snapshot->tags[hit.index];
            results.push_back(TagSearchResult{tag, tag.key + ":" + tag.value, hit.score});
        }
        return results;
    }

    std::optional<json> QueryEngine::entryDetails(const std::string &path) const
    {
        auto entry = store_.getEntry(path);
        if (!entry)
            return std::nullopt;
        json j = *entry;
        auto meta = store_.gitMetadataFor(path);
        j["git"] = gitInfo(*entry, meta ? &*meta : nullptr);
        j["tags"] = tagsJson(store_.tagsFor(path));
        return j;
    }
}

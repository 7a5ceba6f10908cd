#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "nlohmann/json.hpp"
#include "search_cache.hpp"

namespace search
{
    using json = nlohmann::json;

    struct TagFilter
    {
        std::string key;
        std::string value;
    };

    struct Suggestion
    {
        std::string type; // "path", "tag" or "tagKey"
        std::string value;
    };

    struct TagSearchResult
    {
        store::Tag tag;
        std::string pair;
        double score;
    };

    // Read side of the index: tree reconstruction, tag-filtered fuzzy
    // search and autosuggest, all answered from one cache snapshot.
    class QueryEngine
    {
    public:
        QueryEngine(const SearchCache &cache,
                    const store::EntryStore &store,
                    std::string rootName,
                    std::size_t searchLimit = 50);

        // "k:v,k2:v2" -> filters. Pieces without a key or a value are dropped.
        static std::vector<TagFilter> parseTagFilters(const std::string &raw);

        // {root, rootName, generatedAt}
        json buildTree() const;

        std::vector<store::Entry> search(const std::string &query, const std::vector<TagFilter> &filters) const;
        // Same results with tags and repository info attached.
        json searchJson(const std::string &query, const std::vector<TagFilter> &filters) const;

        std::vector<Suggestion> suggest(const std::string &query) const;

        // std::nullopt when the entry does not exist.
        std::optional<std::vector<store::Tag>> listTags(const std::string &path) const;
        std::vector<store::Tag> listAllTags() const;
        std::vector<TagSearchResult> searchTags(const std::string &query, std::size_t limit) const;

        // Entry with tags and repository info, read from the store.
        std::optional<json> entryDetails(const std::string &path) const;

        const std::string &rootName() const { return root_name_; }

        static json gitInfo(const store::Entry &entry, const store::GitMetadata *meta);

    private:
        std::vector<store::Entry> searchIn(const Snapshot &snapshot,
                                           const std::string &query,
                                           const std::vector<TagFilter> &filters) const;
        json entryJson(const Snapshot &snapshot, const store::Entry &entry) const;

        const SearchCache &cache_;
        const store::EntryStore &store_;
        std::string root_name_;
        std::size_t search_limit_;
    };

    void to_json(json &j, const Suggestion &suggestion);
}

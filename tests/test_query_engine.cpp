#include <gtest/gtest.h>
#include <algorithm>
#include "test_utils.hpp"
#include "indexer/indexer.hpp"
#include "search/query_engine.hpp"

using namespace livetree::test::utils;
using search::QueryEngine;
using search::TagFilter;

namespace
{
    bool containsPath(const std::vector<store::Entry> &entries, const std::string &path)
    {
        return std::any_of(entries.begin(), entries.end(), [&](const store::Entry &e)
                           { return e.path == path; });
    }

    const nlohmann::json *childNamed(const nlohmann::json &node, const std::string &name)
    {
        for (const auto &child : node.at("children"))
        {
            if (child.at("name") == name)
                return &child;
        }
        return nullptr;
    }
}

class QueryEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tempDir = createTempDir();
        root = tempDir / "project";
        createFile(root, "src/a.txt", "hello");
        createFile(root, "src/b/c.txt", "nested");
        db = std::make_unique<store::EntryStore>((tempDir / "db").string());
        ignores = std::make_unique<pathUtils::IgnoreRegistry>(root);
        indexer::Indexer indexer(root, *db, *ignores);
        indexer.scan();

        ASSERT_EQ(db->addTag("/src/a.txt", "lang", "txt"), store::AddTagResult::Added);
        ASSERT_EQ(db->addTag("/src/b/c.txt", "lang", "md"), store::AddTagResult::Added);

        cache = std::make_unique<search::SearchCache>(*db);
        cache->rebuild();
        engine = std::make_unique<QueryEngine>(*cache, *db, "project");
    }

    void TearDown() override
    {
        engine.reset();
        cache.reset();
        db.reset();
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path root;
    std::unique_ptr<store::EntryStore> db;
    std::unique_ptr<pathUtils::IgnoreRegistry> ignores;
    std::unique_ptr<search::SearchCache> cache;
    std::unique_ptr<QueryEngine> engine;
};

TEST_F(QueryEngineTest, TreeNestsEntriesUnderTheirParents)
{
    auto tree = engine->buildTree();
    EXPECT_EQ(tree.at("rootName"), "project");
    EXPECT_GT(tree.at("generatedAt").get<std::int64_t>(), 0);

    const auto &root = tree.at("root");
    EXPECT_EQ(root.at("path"), "/");
    EXPECT_EQ(root.at("name"), "project");
    ASSERT_EQ(root.at("children").size(), 1u);

    const auto *src = childNamed(root, "src");
    ASSERT_NE(src, nullptr);
    ASSERT_EQ(src->at("children").size(), 2u);
    // Directories come before files.
    EXPECT_EQ(src->at("children")[0].at("name"), "b");

    const auto *a = childNamed(*src, "a.txt");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->at("size"), 5);
    EXPECT_TRUE(a->at("git").is_null());
    ASSERT_EQ(a->at("tags").size(), 1u);
    EXPECT_EQ(a->at("tags")[0].at("value"), "txt");

    const auto *b = childNamed(*src, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->at("git").at("isRepo"), false);
    ASSERT_EQ(b->at("children").size(), 1u);
    EXPECT_EQ(b->at("children")[0].at("path"), "/src/b/c.txt");
}

TEST_F(QueryEngineTest, TagFiltersIntersect)
{
    auto txt = engine->search("", {TagFilter{"lang", "txt"}});
    ASSERT_EQ(txt.size(), 1u);
    EXPECT_EQ(txt[0].path, "/src/a.txt");

    auto md = engine->search("", {TagFilter{"lang", "md"}});
    ASSERT_EQ(md.size(), 1u);
    EXPECT_EQ(md[0].path, "/src/b/c.txt");

    EXPECT_TRUE(engine->search("", {TagFilter{"lang", "txt"}, TagFilter{"lang", "md"}}).empty());
    EXPECT_TRUE(engine->search("", {TagFilter{"lang", "go"}}).empty());
}

TEST_F(QueryEngineTest, QueryCombinesWithFilters)
{
    auto hits = engine->search("c.txt", {});
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].path, "/src/b/c.txt");

    auto exact = engine->search("b/c", {});
    ASSERT_EQ(exact.size(), 1u);
    EXPECT_TRUE(engine->search("b/c", {TagFilter{"lang", "txt"}}).empty());

    auto all = engine->search("", {});
    EXPECT_EQ(all.size(), 5u);
    EXPECT_EQ(all[0].path, "/");
}

TEST_F(QueryEngineTest, RemovedBranchDisappearsWithItsTags)
{
    EXPECT_EQ(db->removeBranch("/src/b"), 2u);
    cache->rebuild();

    auto all = engine->search("", {});
    EXPECT_FALSE(containsPath(all, "/src/b"));
    EXPECT_FALSE(containsPath(all, "/src/b/c.txt"));
    EXPECT_TRUE(containsPath(all, "/src/a.txt"));

    auto tags = engine->listAllTags();
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].path, "/src/a.txt");
    EXPECT_TRUE(engine->search("", {TagFilter{"lang", "md"}}).empty());
}

TEST_F(QueryEngineTest, ParsesTagFilterList)
{
    auto filters = QueryEngine::parseTagFilters(" lang:txt , broken, :x, y: ,team:core");
    ASSERT_EQ(filters.size(), 2u);
    EXPECT_EQ(filters[0].key, "lang");
    EXPECT_EQ(filters[0].value, "txt");
    EXPECT_EQ(filters[1].key, "team");
    EXPECT_EQ(filters[1].value, "core");
    EXPECT_TRUE(QueryEngine::parseTagFilters("").empty());
}

TEST_F(QueryEngineTest, SuggestsDirectoriesForEmptyQuery)
{
    auto suggestions = engine->suggest("  ");
    ASSERT_EQ(suggestions.size(), 2u);
    EXPECT_EQ(suggestions[0].type, "path");
    EXPECT_EQ(suggestions[0].value, "/src");
    EXPECT_EQ(suggestions[1].value, "/src/b");
}

TEST_F(QueryEngineTest, SuggestsTagValuesAfterColon)
{
    auto suggestions = engine->suggest("notes lang:");
    ASSERT_EQ(suggestions.size(), 2u);
    for (const auto &s : suggestions)
        EXPECT_EQ(s.type, "tag");

    auto narrowed = engine->suggest("lang:M");
    ASSERT_EQ(narrowed.size(), 1u);
    EXPECT_EQ(narrowed[0].value, "lang:md");

    EXPECT_TRUE(engine->suggest("owner:").empty());
}

TEST_F(QueryEngineTest, SuggestsTagKeys)
{
    auto suggestions = engine->suggest("lan");
    bool sawKey = std::any_of(suggestions.begin(), suggestions.end(), [](const search::Suggestion &s)
                              { return s.type == "tagKey" && s.value == "lang:"; });
    EXPECT_TRUE(sawKey);
    EXPECT_LE(suggestions.size(), 10u);
}

TEST_F(QueryEngineTest, SearchesTags)
{
    auto results = engine->searchTags("lang:txt", 20);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].pair, "lang:txt");
    EXPECT_EQ(results[0].tag.path, "/src/a.txt");
    EXPECT_DOUBLE_EQ(results[0].score, 0.0);

    EXPECT_EQ(engine->searchTags("lang", 1).size(), 1u);
}

TEST_F(QueryEngineTest, EntryDetailsAndTagListing)
{
    auto details = engine->entryDetails("/src/a.txt");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->at("type"), "file");
    EXPECT_TRUE(details->at("git").is_null());
    EXPECT_EQ(details->at("tags").size(), 1u);

    EXPECT_FALSE(engine->entryDetails("/missing").has_value());
    EXPECT_FALSE(engine->listTags("/missing").has_value());

    auto tags = engine->listTags("/src");
    ASSERT_TRUE(tags.has_value());
    EXPECT_TRUE(tags->empty());
}

TEST(GitInfoTest, DescribesRepositoryState)
{
    auto dirEntry = indexer::Indexer::makeEntry("/repo", "root", true, std::nullopt, 0);
    auto fileEntry = indexer::Indexer::makeEntry("/repo/x.txt", "root", false, 1, 0);

    EXPECT_TRUE(QueryEngine::gitInfo(fileEntry, nullptr).is_null());
    EXPECT_EQ(QueryEngine::gitInfo(dirEntry, nullptr), (nlohmann::json{{"isRepo", false}}));

    store::GitMetadata meta;
    meta.path = "/repo";
    meta.detectedAt = 42;
    meta.currentBranch = "main";
    meta.commitCount = 3;

    auto local = QueryEngine::gitInfo(dirEntry, &meta);
    EXPECT_EQ(local.at("isRepo"), true);
    EXPECT_EQ(local.at("currentBranch"), "main");
    EXPECT_TRUE(local.at("branchCount").is_null());
    EXPECT_EQ(local.at("remoteCount"), 0);
    EXPECT_EQ(local.at("isLocalOnly"), true);

    meta.remotes.push_back(store::GitRemote{"origin", std::string("u"), std::string("u")});
    auto shared = QueryEngine::gitInfo(dirEntry, &meta);
    EXPECT_EQ(shared.at("remoteCount"), 1);
    EXPECT_EQ(shared.at("isLocalOnly"), false);
    EXPECT_EQ(shared.at("remotes")[0].at("name"), "origin");
}

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include <vector>
#include "test_utils.hpp"
#include "indexer/live_index.hpp"
#include "pathUtils/pathUtils.hpp"
#include "search/query_engine.hpp"

using namespace livetree::test::utils;
using indexer::IndexOutcome;
using indexer::Indexer;

class IndexerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tempDir = createTempDir();
        root = tempDir / "project";
        createFile(root, "README.md", "# readme");
        createFile(root, "src/main.cpp", "int main() {}");
        createFile(root, "src/util/strings.hpp", "#pragma once");
        fs::create_directories(root / "empty");
        db = std::make_unique<store::EntryStore>((tempDir / "db").string());
        ignores = std::make_unique<pathUtils::IgnoreRegistry>(root);
        indexer = std::make_unique<Indexer>(root, *db, *ignores);
    }

    void TearDown() override
    {
        indexer.reset();
        db.reset();
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path root;
    std::unique_ptr<store::EntryStore> db;
    std::unique_ptr<pathUtils::IgnoreRegistry> ignores;
    std::unique_ptr<Indexer> indexer;
};

TEST_F(IndexerTest, ScanRecordsEveryEntryUnderItsParent)
{
    EXPECT_EQ(indexer->scan(), 7u);
    EXPECT_EQ(indexer->rootName(), "project");

    auto entries = db->allEntries();
    ASSERT_EQ(entries.size(), 7u);
    EXPECT_EQ(entries[0].path, "/");
    EXPECT_EQ(entries[0].name, "project");
    EXPECT_FALSE(entries[0].parentPath.has_value());

    for (const auto &entry : entries)
    {
        if (entry.path == "/")
            continue;
        ASSERT_TRUE(entry.parentPath.has_value());
        EXPECT_TRUE(db->getEntry(*entry.parentPath).has_value()) << entry.path;
    }

    auto main = db->getEntry("/src/main.cpp");
    ASSERT_TRUE(main.has_value());
    EXPECT_EQ(main->size, std::optional<std::uint64_t>(13));
    EXPECT_EQ(main->extension, "cpp");
    EXPECT_GT(main->modifiedAt, 0);

    auto empty = db->getEntry("/empty");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->isDirectory());
    EXPECT_FALSE(empty->size.has_value());
}

TEST_F(IndexerTest, RescanIsIdempotent)
{
    indexer->scan();
    auto first = db->allEntries();
    indexer->scan();
    EXPECT_EQ(db->allEntries(), first);
}

TEST_F(IndexerTest, RepositoryInternalsAreNeverIndexed)
{
    createFile(root, ".git/HEAD", "ref: refs/heads/main\n");
    createFile(root, ".git/objects/ab/cdef", "blob");
    indexer->scan();

    EXPECT_FALSE(db->getEntry("/.git").has_value());
    EXPECT_FALSE(db->getEntry("/.git/HEAD").has_value());

    auto result = indexer->indexPath(root / ".git" / "HEAD");
    EXPECT_EQ(result.outcome, IndexOutcome::GitInternal);
    EXPECT_EQ(result.repoRoot, std::optional<std::string>("/"));
    EXPECT_FALSE(indexer->removePath(root / ".git" / "HEAD").has_value());
}

TEST_F(IndexerTest, SpecialFilesAndSocketsAreSkipped)
{
    ASSERT_EQ(mkfifo((root / "pipe").c_str(), 0600), 0);
    createFile(root, "agent.sock", "");
    indexer->scan();

    EXPECT_FALSE(db->getEntry("/pipe").has_value());
    EXPECT_FALSE(db->getEntry("/agent.sock").has_value());
    EXPECT_EQ(indexer->indexPath(root / "pipe").outcome, IndexOutcome::Ignored);
}

TEST_F(IndexerTest, PathsOutsideRootAreIgnored)
{
    createFile(tempDir, "outside.txt", "x");
    EXPECT_EQ(indexer->indexPath(tempDir / "outside.txt").outcome, IndexOutcome::Ignored);
    EXPECT_EQ(indexer->indexPath(root / "nope.txt").outcome, IndexOutcome::Missing);
}

TEST_F(IndexerTest, RemovePathCascadesButKeepsRoot)
{
    indexer->scan();
    ASSERT_EQ(db->addTag("/src/util/strings.hpp", "kind", "header"), store::AddTagResult::Added);

    fs::remove_all(root / "src");
    EXPECT_EQ(indexer->removePath(root / "src"), std::optional<std::string>("/src"));
    EXPECT_FALSE(db->getEntry("/src/util").has_value());
    EXPECT_TRUE(db->tagsFor("/src/util/strings.hpp").empty());

    EXPECT_FALSE(indexer->removePath(root).has_value());
    EXPECT_TRUE(db->getEntry("/").has_value());
}

TEST_F(IndexerTest, RemovingUnindexedPathReportsNothing)
{
    indexer->scan();
    EXPECT_FALSE(indexer->removePath(root / "never-seen.txt").has_value());
    EXPECT_FALSE(indexer->removePath(root / "src" / "ghost").has_value());
    EXPECT_EQ(db->entryCount(), 7u);
}

TEST_F(IndexerTest, UnreadableDirectoryIsMarkedUnsupported)
{
    if (geteuid() == 0)
        GTEST_SKIP() << "permissions are not enforced for root";

    fs::create_directories(root / "locked" / "inner");
    fs::permissions(root / "locked", fs::perms::none);
    indexer->scan();
    fs::permissions(root / "locked", fs::perms::owner_all);

    EXPECT_TRUE(ignores->shouldIgnore((root / "locked").string()));
    EXPECT_FALSE(db->getEntry("/locked/inner").has_value());
}

class LiveIndexTest : public IndexerTest
{
protected:
    void SetUp() override
    {
        IndexerTest::SetUp();
        runner = std::make_shared<ScriptedRunner>(
            [](const std::vector<std::string> &args, const std::string &cwd)
            {
                if (args[0] == "rev-parse" && args[1] == "--show-toplevel")
                    return ScriptedRunner::success(cwd + "\n");
                if (args[0] == "symbolic-ref")
                    return ScriptedRunner::success("main\n");
                if (args[0] == "rev-list")
                    return ScriptedRunner::success("1\n");
                return ScriptedRunner::success("");
            });
        git = std::make_unique<gitmeta::GitMetadataCollector>(root, *db, runner);
        indexer = std::make_unique<Indexer>(root, *db, *ignores, git.get());
        cache = std::make_unique<search::SearchCache>(*db);
        observer = std::make_shared<RecordingObserver>();
        broadcaster.subscribe(observer);
        live = std::make_unique<indexer::LiveIndex>(*indexer, *db, *cache, broadcaster, git.get());
        live->initialScan();
    }

    void TearDown() override
    {
        live.reset();
        IndexerTest::TearDown();
    }

    std::shared_ptr<ScriptedRunner> runner;
    std::unique_ptr<gitmeta::GitMetadataCollector> git;
    std::unique_ptr<search::SearchCache> cache;
    broadcast::ChangeBroadcaster broadcaster;
    std::shared_ptr<RecordingObserver> observer;
    std::unique_ptr<indexer::LiveIndex> live;
};

TEST_F(LiveIndexTest, InitialScanBroadcastsNothing)
{
    EXPECT_TRUE(observer->messages().empty());
    EXPECT_NE(cache->current()->find("/src/main.cpp"), nullptr);
}

TEST_F(LiveIndexTest, AddedFileIsVisibleWhenBroadcast)
{
    createFile(root, "src/new.cpp", "x");
    EXPECT_TRUE(live->pathAdded(root / "src" / "new.cpp"));

    auto added = observer->messagesOfType("entry-added");
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].at("path"), "/src/new.cpp");
    EXPECT_NE(cache->current()->find("/src/new.cpp"), nullptr);
}

TEST_F(LiveIndexTest, ChangedAndRemovedPathsAreBroadcast)
{
    createFile(root, "README.md", "# longer readme");
    EXPECT_TRUE(live->pathChanged(root / "README.md"));
    ASSERT_EQ(observer->messagesOfType("entry-updated").size(), 1u);
    EXPECT_EQ(cache->current()->find("/README.md")->size, std::optional<std::uint64_t>(15));

    fs::remove_all(root / "src");
    EXPECT_TRUE(live->pathRemoved(root / "src"));
    auto removed = observer->messagesOfType("entry-removed");
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].at("path"), "/src");
    EXPECT_EQ(cache->current()->find("/src/util/strings.hpp"), nullptr);
}

TEST_F(LiveIndexTest, TagEditsBroadcastOnlyRealChanges)
{
    EXPECT_EQ(live->addTag("/src", "team", "core"), store::AddTagResult::Added);
    EXPECT_EQ(live->addTag("/src", "team", "core"), store::AddTagResult::AlreadyPresent);
    EXPECT_EQ(live->addTag("/missing", "team", "core"), store::AddTagResult::EntryMissing);
    ASSERT_EQ(observer->messagesOfType("tag-added").size(), 1u);
    EXPECT_EQ(cache->current()->tagsFor("/src").size(), 1u);

    EXPECT_TRUE(live->removeTag("/src", "team", "core"));
    ASSERT_EQ(observer->messagesOfType("tag-removed").size(), 1u);
    EXPECT_TRUE(cache->current()->tagsFor("/src").empty());
}

TEST_F(LiveIndexTest, NewRepositoryIsAnnouncedOnceMetadataExists)
{
    fs::create_directories(root / "repo" / ".git");
    EXPECT_TRUE(live->pathAdded(root / "repo"));
    live->waitForGitRefreshes();

    auto meta = db->gitMetadataFor("/repo");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->currentBranch, std::optional<std::string>("main"));

    auto updates = observer->messagesOfType("entry-updated");
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].at("path"), "/repo");
    EXPECT_EQ(cache->current()->gitByPath.count("/repo"), 1u);

    // Unchanged metadata is not announced again.
    live->scheduleGitRefresh("/repo");
    live->waitForGitRefreshes();
    EXPECT_EQ(observer->messagesOfType("entry-updated").size(), 1u);
}

TEST_F(LiveIndexTest, ChangeInsideRepositoryRefreshesItsRoot)
{
    fs::create_directories(root / "repo" / ".git");
    live->pathAdded(root / "repo");
    live->waitForGitRefreshes();
    std::size_t before = runner->callCount("rev-list");

    createFile(root, "repo/.git/HEAD", "ref: refs/heads/main\n");
    EXPECT_FALSE(live->pathChanged(root / "repo" / ".git" / "HEAD"));
    live->waitForGitRefreshes();
    EXPECT_EQ(runner->callCount("rev-list"), before + 1);
    EXPECT_FALSE(db->getEntry("/repo/.git/HEAD").has_value());
}

TEST_F(LiveIndexTest, RemovalInsideRepositoryRefreshesItsRoot)
{
    fs::create_directories(root / "repo" / ".git");
    live->pathAdded(root / "repo");
    live->waitForGitRefreshes();
    std::size_t before = runner->callCount("rev-list");
    std::size_t broadcasts = observer->messages().size();

    EXPECT_FALSE(live->pathRemoved(root / "repo" / ".git" / "index.lock"));
    live->waitForGitRefreshes();
    EXPECT_EQ(runner->callCount("rev-list"), before + 1);
    EXPECT_EQ(observer->messages().size(), broadcasts);
    EXPECT_TRUE(db->getEntry("/repo").has_value());
}

TEST_F(LiveIndexTest, RemovedSpecialFileIsNotBroadcast)
{
    ASSERT_EQ(mkfifo((root / "pipe").c_str(), 0600), 0);
    EXPECT_FALSE(live->pathAdded(root / "pipe"));

    fs::remove(root / "pipe");
    EXPECT_FALSE(live->pathRemoved(root / "pipe"));
    EXPECT_TRUE(observer->messages().empty());
}

namespace
{
    std::size_t countNodes(const nlohmann::json &node)
    {
        std::size_t count = 1;
        for (const auto &child : node.at("children"))
            count += countNodes(child);
        return count;
    }
}

TEST_F(LiveIndexTest, ReadersSeeWholeBranchOrNone)
{
    // "/src", "/src/main.cpp", "/src/util", "/src/util/strings.hpp"
    const std::size_t branchSize = 4;
    search::QueryEngine engine(*cache, *db, indexer->rootName());

    std::atomic<bool> done{false};
    std::atomic<std::size_t> partial{0};
    std::atomic<std::size_t> withBranch{0};
    std::atomic<std::size_t> withoutBranch{0};

    auto reader = [&]()
    {
        while (!done)
        {
            auto snapshot = cache->current();
            std::size_t inSnapshot = 0;
            for (const auto &entry : snapshot->entries)
            {
                if (pathUtils::isSelfOrDescendant("/src", entry.path))
                    ++inSnapshot;
            }
            if (inSnapshot != 0 && inSnapshot != branchSize)
                ++partial;

            auto tree = engine.buildTree();
            std::size_t inTree = 0;
            for (const auto &child : tree.at("root").at("children"))
            {
                if (child.at("path") == "/src")
                    inTree = countNodes(child);
            }
            if (inTree == 0)
                ++withoutBranch;
            else if (inTree == branchSize)
                ++withBranch;
            else
                ++partial;
        }
    };

    std::vector<std::thread> readers;
    for (int i = 0; i < 3; ++i)
        readers.emplace_back(reader);

    for (int round = 0; round < 25; ++round)
    {
        EXPECT_TRUE(live->pathRemoved(root / "src"));
        live->initialScan();
    }
    done = true;
    for (auto &t : readers)
        t.join();

    EXPECT_EQ(partial.load(), 0u);
    EXPECT_GT(withBranch.load() + withoutBranch.load(), 0u);
    EXPECT_NE(cache->current()->find("/src/util/strings.hpp"), nullptr);
}

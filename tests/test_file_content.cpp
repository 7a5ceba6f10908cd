#include <gtest/gtest.h>
#include <sys/stat.h>
#include "test_utils.hpp"
#include "filecontent/file_content.hpp"
#include "indexer/indexer.hpp"

using namespace livetree::test::utils;
using filecontent::CancelToken;
using filecontent::FileContentService;
using filecontent::RequestRegistry;

class FileContentTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tempDir = createTempDir();
        root = tempDir / "project";
        createFile(root, "notes.txt", "alpha\nfoobar\nzzz\n");
        createFile(root, "docs/readme.md", "# docs");
        db = std::make_unique<store::EntryStore>((tempDir / "db").string());
        ignores = std::make_unique<pathUtils::IgnoreRegistry>(root);
        indexer = std::make_unique<indexer::Indexer>(root, *db, *ignores);
        indexer->scan();
        service = std::make_unique<FileContentService>(root, *db);
    }

    void TearDown() override
    {
        service.reset();
        indexer.reset();
        db.reset();
        removeDir(tempDir);
    }

    void index(const std::string &relative, const std::string &content)
    {
        createFile(root, relative, content);
        indexer->indexPath(root / relative);
    }

    fs::path tempDir;
    fs::path root;
    std::unique_ptr<store::EntryStore> db;
    std::unique_ptr<pathUtils::IgnoreRegistry> ignores;
    std::unique_ptr<indexer::Indexer> indexer;
    std::unique_ptr<FileContentService> service;
};

TEST_F(FileContentTest, FindsTheMatchingLine)
{
    auto result = service->searchInFile("/notes.txt", "foo");
    ASSERT_FALSE(result.error.has_value());
    EXPECT_FALSE(result.cancelled);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].line, 2u);
    EXPECT_DOUBLE_EQ(result.matches[0].score, 0.0);
    EXPECT_EQ(result.matches[0].snippet, "foobar");
}

TEST_F(FileContentTest, ApproximateLinesRankAfterExactOnes)
{
    index("code.txt", "let cofnig = 1;\nload(config);\nnothing here\n");
    auto result = service->searchInFile("/code.txt", "config");
    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line, 2u);
    EXPECT_EQ(result.matches[1].line, 1u);
    EXPECT_GT(result.matches[1].score, 0.0);
}

TEST_F(FileContentTest, MatchLimitKeepsFileOrderForTies)
{
    index("many.txt", "foo 1\nfoo 2\nfoo 3\nfoo 4\n");
    FileContentService limited(root, *db, 2);
    auto result = limited.searchInFile("/many.txt", "foo");
    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].line, 1u);
    EXPECT_EQ(result.matches[1].line, 2u);
}

TEST_F(FileContentTest, SearchRejectsBadRequests)
{
    auto noPath = service->searchInFile("", "foo");
    ASSERT_TRUE(noPath.error.has_value());
    EXPECT_EQ(noPath.error->status, 400);
    EXPECT_EQ(noPath.error->message, "path query parameter required");

    auto noQuery = service->searchInFile("/notes.txt", "   ");
    ASSERT_TRUE(noQuery.error.has_value());
    EXPECT_EQ(noQuery.error->message, "q query parameter required");

    auto missing = service->searchInFile("/absent.txt", "foo");
    ASSERT_TRUE(missing.error.has_value());
    EXPECT_EQ(missing.error->status, 404);

    auto directory = service->searchInFile("/docs", "foo");
    ASSERT_TRUE(directory.error.has_value());
    EXPECT_EQ(directory.error->status, 400);
    EXPECT_EQ(directory.error->message, "Requested path is not a file");
}

TEST_F(FileContentTest, VanishedFileIsNotFound)
{
    fs::remove(root / "notes.txt");
    auto result = service->openStream("/notes.txt");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->status, 404);
    EXPECT_EQ(result.error->message, "File not found");
    EXPECT_EQ(result.stream, nullptr);
}

TEST_F(FileContentTest, SpecialFileIsNotRegular)
{
    ASSERT_EQ(mkfifo((root / "pipe").c_str(), 0600), 0);
    ASSERT_TRUE(db->upsertEntry(indexer::Indexer::makeEntry("/pipe", "project", false, 0, 0)));

    auto result = service->openStream("/pipe");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->status, 400);
    EXPECT_EQ(result.error->message, "Requested path is not a regular file");
}

TEST_F(FileContentTest, StreamsInFixedSizeChunks)
{
    std::string content(2 * filecontent::kChunkSize + 10, 'x');
    content[filecontent::kChunkSize] = 'y';
    index("big.bin", content);

    auto result = service->openStream("/big.bin");
    ASSERT_FALSE(result.error.has_value());
    ASSERT_NE(result.stream, nullptr);
    EXPECT_EQ(result.stream->size(), content.size());
    EXPECT_EQ(result.stream->path(), "/big.bin");
    EXPECT_GT(result.stream->modifiedAt(), 0);

    std::vector<std::size_t> sizes;
    std::string received;
    while (auto chunk = result.stream->nextChunk())
    {
        sizes.push_back(chunk->size());
        received += *chunk;
    }
    EXPECT_EQ(sizes, (std::vector<std::size_t>{filecontent::kChunkSize, filecontent::kChunkSize, 10}));
    EXPECT_EQ(received, content);
    EXPECT_FALSE(result.stream->failed());
}

TEST_F(FileContentTest, CancelledStreamStopsEarly)
{
    index("big.bin", std::string(3 * filecontent::kChunkSize, 'z'));
    auto token = std::make_shared<CancelToken>();
    auto result = service->openStream("/big.bin", token);
    ASSERT_NE(result.stream, nullptr);

    ASSERT_TRUE(result.stream->nextChunk().has_value());
    token->cancel();
    EXPECT_FALSE(result.stream->nextChunk().has_value());
    EXPECT_TRUE(result.stream->cancelled());
}

TEST_F(FileContentTest, CancelledSearchReportsNoMatches)
{
    auto token = std::make_shared<CancelToken>();
    token->cancel();
    auto result = service->searchInFile("/notes.txt", "foo", token);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_FALSE(result.error.has_value());
}

TEST(SplitLinesTest, HandlesEveryLineEnding)
{
    auto lines = FileContentService::splitLines("a\r\nb\rc\nd");
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(FileContentService::splitLines("x\n"), (std::vector<std::string>{"x", ""}));
    EXPECT_EQ(FileContentService::splitLines(""), (std::vector<std::string>{""}));
}

TEST(SnippetTest, CentersOnTheHitWithEllipses)
{
    std::string line = std::string(100, 'a') + "Needle" + std::string(200, 'b');
    auto snippet = FileContentService::buildSnippet(line, "needle");
    std::string expected = "\xE2\x80\xA6" + std::string(60, 'a') + "Needle" + std::string(120, 'b') + "\xE2\x80\xA6";
    EXPECT_EQ(snippet, expected);
}

TEST(SnippetTest, ShortLinesAreKeptWhole)
{
    EXPECT_EQ(FileContentService::buildSnippet("\tint x = foo();", "foo"), "    int x = foo();");
    EXPECT_EQ(FileContentService::buildSnippet("", "foo"), "");
}

TEST(SnippetTest, LongLineWithoutHitIsTruncated)
{
    std::string line(300, 'q');
    auto snippet = FileContentService::buildSnippet(line, "fuzzy");
    EXPECT_EQ(snippet, std::string(239, 'q') + "\xE2\x80\xA6");
}

TEST(SnippetTest, CountsCodePointsNotBytes)
{
    std::string accented;
    for (int i = 0; i < 100; ++i)
        accented += "\xC3\xA9"; // é
    auto snippet = FileContentService::buildSnippet(accented + "hit", "hit");

    std::string expected = "\xE2\x80\xA6";
    for (int i = 0; i < 60; ++i)
        expected += "\xC3\xA9";
    expected += "hit";
    EXPECT_EQ(snippet, expected);
}

TEST(RequestRegistryTest, NewerRequestCancelsOlder)
{
    RequestRegistry registry;
    auto first = registry.begin("search|c1|/a.txt");
    auto second = registry.begin("search|c1|/a.txt");
    auto other = registry.begin("search|c2|/a.txt");

    EXPECT_TRUE(first->cancelled());
    EXPECT_FALSE(second->cancelled());
    EXPECT_FALSE(other->cancelled());
    EXPECT_EQ(registry.inFlight(), 2u);

    registry.finish("search|c1|/a.txt", first);
    EXPECT_EQ(registry.inFlight(), 2u);
    registry.finish("search|c1|/a.txt", second);
    registry.finish("search|c2|/a.txt", other);
    EXPECT_EQ(registry.inFlight(), 0u);
}

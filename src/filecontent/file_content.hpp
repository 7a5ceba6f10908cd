#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "request_registry.hpp"
#include "../store/entry_store.hpp"

namespace fs = std::filesystem;

namespace filecontent
{
    const std::size_t kChunkSize = 64 * 1024;

    struct FileError
    {
        int status; // HTTP status to answer with
        std::string message;
    };

    // Sequential reader over one file, 64 KiB at a time.
    class FileStream
    {
    public:
        FileStream(const fs::path &absolutePath,
                   std::string canonicalPath,
                   std::uintmax_t size,
                   std::int64_t modifiedAt,
                   std::shared_ptr<CancelToken> token);

        // std::nullopt at end of file, on a read error or once cancelled.
        std::optional<std::string> nextChunk();

        bool isOpen() const { return in_.is_open(); }
        bool cancelled() const { return token_ && token_->cancelled(); }
        bool failed() const { return failed_; }

        const std::string &path() const { return path_; }
        std::uintmax_t size() const { return size_; }
        std::int64_t modifiedAt() const { return modified_at_; }

    private:
        std::ifstream in_;
        std::string path_;
        std::uintmax_t size_;
        std::int64_t modified_at_;
        std::shared_ptr<CancelToken> token_;
        bool failed_ = false;
    };

    struct OpenResult
    {
        std::unique_ptr<FileStream> stream;
        std::optional<FileError> error;
    };

    struct LineMatch
    {
        std::size_t line; // 1-based
        double score;
        std::string snippet;
    };

    struct SearchResult
    {
        std::vector<LineMatch> matches;
        std::optional<FileError> error;
        bool cancelled = false;
    };

    // Streams and searches the contents of indexed files.
    class FileContentService
    {
    public:
        FileContentService(fs::path root, const store::EntryStore &store, std::size_t matchLimit = 50);

        OpenResult openStream(const std::string &path, std::shared_ptr<CancelToken> token = nullptr) const;

        SearchResult searchInFile(const std::string &path,
                                  const std::string &query,
                                  std::shared_ptr<CancelToken> token = nullptr) const;

        // Splits on "\r\n", "\n" or "\r".
        static std::vector<std::string> splitLines(const std::string &content);

        // Display form of one line around the first case-insensitive hit.
        static std::string buildSnippet(const std::string &line, const std::string &query);

    private:
        // Common checks for both operations. Fills 'status' on success.
        std::optional<FileError> validate(const std::string &path, fs::path &absolute, fs::file_status &status) const;

        fs::path root_;
        const store::EntryStore &store_;
        std::size_t match_limit_;
    };
}

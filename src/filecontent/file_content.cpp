#include "file_content.hpp"
#include "../logger/Mylogger.hpp"
#include "../pathUtils/ignoreRegistry.hpp"
#include "../pathUtils/pathUtils.hpp"
#include "../search/fuzzy.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iterator>
#include <sstream>

namespace filecontent
{
    namespace
    {
        const double kLineThreshold = 0.4;
        const std::size_t kSnippetMax = 240;
        const std::size_t kPreContext = 60;
        const std::size_t kPostContext = 120;
        const char *kEllipsis = "\xE2\x80\xA6";

        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        // Byte offset of every UTF-8 code point, plus the total size.
        std::vector<std::size_t> codePointOffsets(const std::string &s)
        {
            std::vector<std::size_t> offsets;
            for (std::size_t i = 0; i < s.size(); ++i)
            {
                if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80)
                    offsets.push_back(i);
            }
            offsets.push_back(s.size());
            return offsets;
        }

        FileError unreadable(const fs::path &absolute, const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
                return FileError{404, "File not found"};
            if (pathUtils::IgnoreRegistry::isUnsupportedError(ec))
                return FileError{403, "File cannot be read on this filesystem"};
            MyLogger::error("Failed to read " + absolute.string() + ": " + ec.message());
            return FileError{500, "Failed to read file"};
        }
    }

    FileStream::FileStream(const fs::path &absolutePath,
                           std::string canonicalPath,
                           std::uintmax_t size,
                           std::int64_t modifiedAt,
                           std::shared_ptr<CancelToken> token)
        : in_(absolutePath, std::ios::binary),
          path_(std::move(canonicalPath)),
          size_(size),
          modified_at_(modifiedAt),
          token_(std::move(token))
    {
    }

    std::optional<std::string> FileStream::nextChunk()
    {
        if (cancelled() || failed_ || !in_.is_open())
            return std::nullopt;
        std::string chunk(kChunkSize, '\0');
        in_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = in_.gcount();
        if (in_.bad())
        {
            failed_ = true;
            MyLogger::error("Stream error while sending " + path_);
            return std::nullopt;
        }
        if (got <= 0)
            return std::nullopt;
        chunk.resize(static_cast<std::size_t>(got));
        return chunk;
    }

    FileContentService::FileContentService(fs::path root, const store::EntryStore &store, std::size_t matchLimit)
        : root_(std::move(root)), store_(store), match_limit_(matchLimit)
    {
    }

    std::optional<FileError> FileContentService::validate(const std::string &path,
                                                          fs::path &absolute,
                                                          fs::file_status &status) const
    {
        if (path.empty())
            return FileError{400, "path query parameter required"};
        auto entry = store_.getEntry(path);
        if (!entry)
            return FileError{404, "File not found"};
        if (entry->isDirectory())
            return FileError{400, "Requested path is not a file"};

        absolute = pathUtils::toAbsolute(root_, path);
        std::error_code ec;
        status = fs::status(absolute, ec);
        if (ec)
            return unreadable(absolute, ec);
        if (!fs::exists(status))
            return FileError{404, "File not found"};
        if (!fs::is_regular_file(status))
            return FileError{400, "Requested path is not a regular file"};
        return std::nullopt;
    }

    OpenResult FileContentService::openStream(const std::string &path, std::shared_ptr<CancelToken> token) const
    {
        OpenResult result;
        fs::path absolute;
        fs::file_status status;
        result.error = validate(path, absolute, status);
        if (result.error)
            return result;

        std::error_code ec;
        std::uintmax_t size = fs::file_size(absolute, ec);
        if (ec)
        {
            result.error = unreadable(absolute, ec);
            return result;
        }
        std::int64_t mtime;
        auto writeTime = fs::last_write_time(absolute, ec);
        if (ec)
        {
            mtime = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
        }
        else
        {
            mtime = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::file_clock::to_sys(writeTime).time_since_epoch())
                        .count();
        }

        errno = 0;
        auto stream = std::make_unique<FileStream>(absolute, path, size, mtime, std::move(token));
        if (!stream->isOpen())
        {
            result.error = unreadable(absolute, std::error_code(errno ? errno : EIO, std::generic_category()));
            return result;
        }
        result.stream = std::move(stream);
        return result;
    }

    std::vector<std::string> FileContentService::splitLines(const std::string &content)
    {
        std::vector<std::string> lines;
        std::string current;
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            char c = content[i];
            if (c == '\r' || c == '\n')
            {
                lines.push_back(current);
                current.clear();
                if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n')
                    ++i;
                continue;
            }
            current.push_back(c);
        }
        lines.push_back(current);
        return lines;
    }

    std::string FileContentService::buildSnippet(const std::string &line, const std::string &query)
    {
        if (line.empty())
            return "";

        std::string text;
        text.reserve(line.size());
        for (char c : line)
        {
            if (c == '\t')
                text += "    ";
            else
                text.push_back(c);
        }

        auto offsets = codePointOffsets(text);
        const std::size_t length = offsets.size() - 1;
        auto slice = [&](std::size_t from, std::size_t to)
        {
            return text.substr(offsets[from], offsets[to] - offsets[from]);
        };
        auto truncated = [&]()
        {
            if (length <= kSnippetMax)
                return text;
            return slice(0, kSnippetMax - 1) + kEllipsis;
        };

        std::string needle = search::toLower(trim(query));
        if (needle.empty())
            return truncated();
        auto hit = search::toLower(text).find(needle);
        if (hit == std::string::npos)
            return truncated();

        std::size_t index = static_cast<std::size_t>(
            std::lower_bound(offsets.begin(), offsets.end(), hit) - offsets.begin());
        std::size_t needleLength = codePointOffsets(needle).size() - 1;

        std::size_t start = index > kPreContext ? index - kPreContext : 0;
        std::size_t end = std::min(length, index + needleLength + kPostContext);
        std::string snippet = slice(start, end);
        if (start > 0)
            snippet = kEllipsis + snippet;
        if (end < length)
            snippet += kEllipsis;
        return snippet;
    }

    SearchResult FileContentService::searchInFile(const std::string &path,
                                                  const std::string &rawQuery,
                                                  std::shared_ptr<CancelToken> token) const
    {
        SearchResult result;
        std::string query = trim(rawQuery);
        if (path.empty())
        {
            result.error = FileError{400, "path query parameter required"};
            return result;
        }
        if (query.empty())
        {
            result.error = FileError{400, "q query parameter required"};
            return result;
        }

        fs::path absolute;
        fs::file_status status;
        result.error = validate(path, absolute, status);
        if (result.error)
            return result;

        errno = 0;
        std::ifstream in(absolute, std::ios::binary);
        if (!in.is_open())
        {
            result.error = unreadable(absolute, std::error_code(errno ? errno : EIO, std::generic_category()));
            return result;
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            result.error = unreadable(absolute, std::error_code(EIO, std::generic_category()));
            return result;
        }

        auto lines = splitLines(content);
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (token && (i % 256) == 0 && token->cancelled())
            {
                result.cancelled = true;
                return result;
            }
            auto score = search::fuzzyScore(query, lines[i], kLineThreshold);
            if (score)
                result.matches.push_back(LineMatch{i + 1, *score, std::string()});
        }
        if (token && token->cancelled())
        {
            result.cancelled = true;
            result.matches.clear();
            return result;
        }

        std::stable_sort(result.matches.begin(), result.matches.end(),
                         [](const LineMatch &a, const LineMatch &b)
                         { return a.score < b.score; });
        if (result.matches.size() > match_limit_)
            result.matches.resize(match_limit_);
        for (auto &match : result.matches)
            match.snippet = buildSnippet(lines[match.line - 1], query);
        return result;
    }
}

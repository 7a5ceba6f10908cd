#include "api_handler.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace api
{
    namespace
    {
        const int kDefaultTagLimit = 20;
        const int kMaxTagLimit = 100;

        std::string param(const QueryParams &query, const std::string &name)
        {
            auto found = query.find(name);
            return found == query.end() ? std::string() : found->second;
        }

        std::string trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        // Strings as-is, numbers and booleans in their JSON spelling.
        std::string fieldAsString(const json &body, const char *name)
        {
            if (!body.contains(name) || body.at(name).is_null())
                return "";
            const json &value = body.at(name);
            if (value.is_string())
                return value.get<std::string>();
            if (value.is_number() || value.is_boolean())
                return value.dump();
            return "";
        }

        int hexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    }

    ApiResponse errorResponse(unsigned status, const std::string &message)
    {
        return ApiResponse{status, json{{"error", message}}};
    }

    std::string urlDecode(const std::string &encoded, bool plusAsSpace)
    {
        std::string out;
        out.reserve(encoded.size());
        for (std::size_t i = 0; i < encoded.size(); ++i)
        {
            char c = encoded[i];
            if (c == '%' && i + 2 < encoded.size())
            {
                int hi = hexValue(encoded[i + 1]);
                int lo = hexValue(encoded[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                    continue;
                }
            }
            if (c == '+' && plusAsSpace)
            {
                out.push_back(' ');
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    void parseTarget(const std::string &target, std::string &path, QueryParams &query)
    {
        auto mark = target.find('?');
        path = urlDecode(target.substr(0, mark), false);
        query.clear();
        if (mark == std::string::npos)
            return;

        std::string rest = target.substr(mark + 1);
        std::size_t pos = 0;
        while (pos <= rest.size())
        {
            auto amp = rest.find('&', pos);
            std::string pair = rest.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
            if (!pair.empty())
            {
                auto eq = pair.find('=');
                std::string key = urlDecode(pair.substr(0, eq));
                std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
                // First occurrence wins.
                query.emplace(key, value);
            }
            if (amp == std::string::npos)
                break;
            pos = amp + 1;
        }
    }

    ApiHandler::ApiHandler(const search::QueryEngine &queries,
                           indexer::LiveIndex &index,
                           const filecontent::FileContentService &files,
                           filecontent::RequestRegistry &requests,
                           StatusProvider status)
        : queries_(queries), index_(index), files_(files), requests_(requests), status_(std::move(status))
    {
    }

    ApiResponse ApiHandler::handle(const std::string &method,
                                   const std::string &path,
                                   const QueryParams &query,
                                   const std::string &body)
    {
        try
        {
            if (path == "/api/tags" && (method == "POST" || method == "DELETE"))
                return changeTag(method, body);
            if (method != "GET")
                return errorResponse(405, "Method not allowed");

            if (path == "/api/tree")
                return tree();
            if (path == "/api/search")
                return searchEntries(query);
            if (path == "/api/suggestions")
                return suggestions(query);
            if (path == "/api/entry")
                return entry(query);
            if (path == "/api/file/search")
                return fileSearch(query);
            if (path == "/api/tags")
                return listTags(query);
            if (path == "/api/tags/search")
                return searchTags(query);
            if (path == "/api/status")
                return ApiResponse{200, status_ ? status_() : json::object()};
            return errorResponse(404, "Not found");
        }
        catch (const std::exception &e)
        {
            MyLogger::error("Request " + method + " " + path + " failed: " + e.what());
            return errorResponse(500, "Internal server error");
        }
    }

    ApiResponse ApiHandler::tree() const
    {
        return ApiResponse{200, queries_.buildTree()};
    }

    ApiResponse ApiHandler::searchEntries(const QueryParams &query) const
    {
        auto filters = search::QueryEngine::parseTagFilters(param(query, "tags"));
        return ApiResponse{200, json{{"results", queries_.searchJson(param(query, "q"), filters)}}};
    }

    ApiResponse ApiHandler::suggestions(const QueryParams &query) const
    {
        return ApiResponse{200, json{{"suggestions", queries_.suggest(param(query, "q"))}}};
    }

    ApiResponse ApiHandler::entry(const QueryParams &query) const
    {
        std::string path = param(query, "path");
        if (path.empty())
            return errorResponse(400, "path query parameter required");
        auto details = queries_.entryDetails(path);
        if (!details)
            return errorResponse(404, "Not found");
        return ApiResponse{200, json{{"entry", *details}}};
    }

    ApiResponse ApiHandler::fileSearch(const QueryParams &query)
    {
        std::string path = param(query, "path");
        std::string client = param(query, "client");
        std::string key;
        std::shared_ptr<filecontent::CancelToken> token;
        if (!client.empty())
        {
            key = "search|" + client + "|" + path;
            token = requests_.begin(key);
        }

        auto result = files_.searchInFile(path, param(query, "q"), token);
        if (token)
            requests_.finish(key, token);

        if (result.cancelled)
            return errorResponse(409, "Request superseded");
        if (result.error)
            return errorResponse(result.error->status, result.error->message);

        json matches = json::array();
        for (const auto &match : result.matches)
            matches.push_back({{"line", match.line}, {"score", match.score}, {"snippet", match.snippet}});
        return ApiResponse{200, json{{"matches", matches}}};
    }

    ApiResponse ApiHandler::listTags(const QueryParams &query) const
    {
        std::string path = param(query, "path");
        if (!path.empty())
        {
            auto tags = queries_.listTags(path);
            if (!tags)
                return errorResponse(404, "Entry not found");
            return ApiResponse{200, json{{"tags", *tags}}};
        }
        return ApiResponse{200, json{{"tags", queries_.listAllTags()}}};
    }

    ApiResponse ApiHandler::searchTags(const QueryParams &query) const
    {
        std::string q = trim(param(query, "q"));
        if (q.empty())
            return errorResponse(400, "q query parameter required");

        int limit = kDefaultTagLimit;
        std::string rawLimit = param(query, "limit");
        if (!rawLimit.empty())
        {
            try
            {
                limit = std::clamp(std::stoi(rawLimit), 1, kMaxTagLimit);
            }
            catch (const std::exception &)
            {
                limit = kDefaultTagLimit;
            }
        }

        json results = json::array();
        for (const auto &hit : queries_.searchTags(q, static_cast<std::size_t>(limit)))
        {
            results.push_back({{"path", hit.tag.path},
                               {"key", hit.tag.key},
                               {"value", hit.tag.value},
                               {"pair", hit.pair},
                               {"score", hit.score}});
        }
        return ApiResponse{200, json{{"results", results}}};
    }

    ApiResponse ApiHandler::changeTag(const std::string &method, const std::string &body)
    {
        json payload = json::parse(body.empty() ? "{}" : body, nullptr, false);
        if (payload.is_discarded() || !payload.is_object())
            return errorResponse(400, "path, key, and value are required");

        std::string path = fieldAsString(payload, "path");
        std::string key = fieldAsString(payload, "key");
        std::string value = fieldAsString(payload, "value");
        if (path.empty() || key.empty() || value.empty())
            return errorResponse(400, "path, key, and value are required");

        if (method == "DELETE")
        {
            if (!index_.removeTag(path, key, value))
                return errorResponse(500, "Failed to remove tag");
            return ApiResponse{200, json{{"success", true}}};
        }

        switch (index_.addTag(path, key, value))
        {
        case store::AddTagResult::Added:
        case store::AddTagResult::AlreadyPresent:
            return ApiResponse{200, json{{"success", true}}};
        case store::AddTagResult::EntryMissing:
            return errorResponse(404, "Entry not found");
        case store::AddTagResult::Invalid:
            return errorResponse(400, "Tag key or value contains an unsupported character");
        case store::AddTagResult::Failed:
            break;
        }
        return errorResponse(500, "Failed to store tag");
    }

    StreamResponse ApiHandler::openFileStream(const QueryParams &query)
    {
        StreamResponse response;
        std::string path = param(query, "path");
        std::string client = param(query, "client");
        if (!client.empty() && !path.empty())
        {
            response.resourceKey = "stream|" + client + "|" + path;
            response.token = requests_.begin(response.resourceKey);
        }

        auto opened = files_.openStream(path, response.token);
        if (opened.error)
        {
            finishStream(response);
            response.error = errorResponse(opened.error->status, opened.error->message);
            return response;
        }
        response.stream = std::move(opened.stream);
        return response;
    }

    void ApiHandler::finishStream(const StreamResponse &response)
    {
        if (response.token)
            requests_.finish(response.resourceKey, response.token);
    }
}

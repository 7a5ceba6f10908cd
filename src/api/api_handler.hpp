#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "nlohmann/json.hpp"
#include "../filecontent/file_content.hpp"
#include "../indexer/live_index.hpp"
#include "../search/query_engine.hpp"

namespace api
{
    using json = nlohmann::json;
    using QueryParams = std::map<std::string, std::string>;

    struct ApiResponse
    {
        unsigned status = 200;
        json body = json::object();
    };

    ApiResponse errorResponse(unsigned status, const std::string &message);

    // Splits "/api/search?q=a%20b" into path and decoded parameters.
    void parseTarget(const std::string &target, std::string &path, QueryParams &query);
    std::string urlDecode(const std::string &encoded, bool plusAsSpace = true);

    struct StreamResponse
    {
        std::unique_ptr<filecontent::FileStream> stream;
        std::optional<ApiResponse> error;
        // Set when the read was registered for supersession.
        std::string resourceKey;
        std::shared_ptr<filecontent::CancelToken> token;
    };

    // Transport-independent request routing for the JSON API.
    class ApiHandler
    {
    public:
        using StatusProvider = std::function<json()>;

        ApiHandler(const search::QueryEngine &queries,
                   indexer::LiveIndex &index,
                   const filecontent::FileContentService &files,
                   filecontent::RequestRegistry &requests,
                   StatusProvider status);

        ApiResponse handle(const std::string &method,
                           const std::string &path,
                           const QueryParams &query,
                           const std::string &body);

        // GET /api/file/stream. The caller sends the chunks and calls
        // finishStream() afterwards.
        StreamResponse openFileStream(const QueryParams &query);
        void finishStream(const StreamResponse &response);

    private:
        ApiResponse tree() const;
        ApiResponse searchEntries(const QueryParams &query) const;
        ApiResponse suggestions(const QueryParams &query) const;
        ApiResponse entry(const QueryParams &query) const;
        ApiResponse fileSearch(const QueryParams &query);
        ApiResponse listTags(const QueryParams &query) const;
        ApiResponse searchTags(const QueryParams &query) const;
        ApiResponse changeTag(const std::string &method, const std::string &body);

        const search::QueryEngine &queries_;
        indexer::LiveIndex &index_;
        const filecontent::FileContentService &files_;
        filecontent::RequestRegistry &requests_;
        StatusProvider status_;
    };
}

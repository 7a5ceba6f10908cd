#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "api/api_handler.hpp"
#include "broadcast/change_broadcaster.hpp"
#include "filecontent/file_content.hpp"
#include "gitmeta/command_runner.hpp"
#include "gitmeta/git_metadata.hpp"
#include "indexer/indexer.hpp"
#include "indexer/live_index.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "pathUtils/ignoreRegistry.hpp"
#include "search/query_engine.hpp"
#include "search/search_cache.hpp"
#include "server/http_server.hpp"
#include "store/entry_store.hpp"
#include "watcher/watcher_controller.hpp"

namespace fs = std::filesystem;
namespace asio = boost::asio;

int main(int argc, char *argv[])
{
    const std::string config_path = argc > 1 ? argv[1] : "";

    try
    {
        ConfigReader::Settings settings = ConfigReader::loadSettings(config_path);
        MyLogger::init(settings.log_level, settings.log_file);

        fs::path root(settings.root_path);
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            MyLogger::error("Root path is not a directory: " + root.string());
            return 1;
        }
        MyLogger::info("Monitoring " + root.string());

        // Declared first so it outlives every socket and session.
        asio::io_context ioc;

        store::EntryStore store(settings.db_path);
        pathUtils::IgnoreRegistry ignores(root);
        auto runner = std::make_shared<gitmeta::ProcessCommandRunner>(
            "git", std::chrono::milliseconds(settings.git_timeout_ms), settings.git_max_output_bytes);
        gitmeta::GitMetadataCollector git(root, store, runner);

        indexer::Indexer indexer(root, store, ignores, &git);
        search::SearchCache cache(store);
        broadcast::ChangeBroadcaster broadcaster;
        indexer::LiveIndex live(indexer, store, cache, broadcaster, &git);
        live.initialScan();

        search::QueryEngine queries(cache, store, indexer.rootName(), settings.search_limit);
        filecontent::FileContentService files(root, store);
        filecontent::RequestRegistry requests;

        watcher::WatcherController watcher(root, ignores, live, std::chrono::milliseconds(settings.poll_interval_ms));

        api::ApiHandler handler(queries, live, files, requests,
                                [&]()
                                {
                                    auto mode = watcher.mode();
                                    return nlohmann::json{
                                        {"root", root.string()},
                                        {"watchMode", mode ? nlohmann::json(watcher::modeName(*mode)) : nlohmann::json(nullptr)},
                                        {"entries", cache.current()->entries.size()},
                                        {"gitEnabled", git.enabled()}};
                                });

        watcher.start(watcher::WatchMode::Native);

        server::HttpServer http(ioc, settings.bind_address, settings.port, handler, broadcaster);
        http.run();
        MyLogger::info("livetree running at http://localhost:" + std::to_string(http.port()));

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](const boost::system::error_code &error, int signal_number)
            {
                if (error)
                    return;
                MyLogger::info("Received signal " + std::to_string(signal_number) + ", shutting down");
                http.stop();
                ioc.stop();
            });

        const unsigned thread_count = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> workers;
        workers.reserve(thread_count - 1);
        for (unsigned i = 1; i < thread_count; ++i)
            workers.emplace_back([&ioc]()
                                 { ioc.run(); });
        ioc.run();
        for (auto &worker : workers)
            worker.join();

        watcher.stop();
        MyLogger::info("Shutdown complete");
        return 0;
    }
    catch (const std::exception &e)
    {
        MyLogger::error(std::string("Failed to bootstrap service: ") + e.what());
        return 1;
    }
}

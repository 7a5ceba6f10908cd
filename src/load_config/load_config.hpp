#pragma once

#include <cstdint>
#include <string>
#include "nlohmann/json.hpp"
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    // Runtime settings of the index service.
    struct Settings
    {
        std::string root_path;
        std::string bind_address = "0.0.0.0";
        unsigned short port = 4174;
        std::string db_path = "/tmp/livetree-index";
        int poll_interval_ms = 5000;
        int git_timeout_ms = 5000;
        std::size_t git_max_output_bytes = 2 * 1024 * 1024;
        std::size_t search_limit = 50;
        std::string log_level = "info";
        std::string log_file;
    };

    json load(const std::string &filepath);

    int get_config_value(const std::string &key, const json &j);
    std::string get_config_string(const std::string &key, const json &j);
    unsigned short get_config_short(const std::string &key, const json &j);

    // Builds settings from a parsed document, keeping defaults for absent keys,
    // then applies START_PATH / PORT environment overrides.
    Settings fromJson(const json &j);

    // Empty filepath means "defaults plus environment".
    Settings loadSettings(const std::string &filepath);
}

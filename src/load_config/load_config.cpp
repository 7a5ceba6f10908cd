#include "load_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
        }
        return json::object();
    }

    int get_config_value(const std::string &key, const json &j)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON: " + key);
            return 0;
        }
        if (!j[key].is_number_integer())
        {
            MyLogger::error("Key is not an integer: " + key);
            return 0;
        }
        return j[key].get<int>();
    }

    std::string get_config_string(const std::string &key, const json &j)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON: " + key);
            return "";
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            return "";
        }
        return j[key].get<std::string>();
    }

    unsigned short get_config_short(const std::string &key, const json &j)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON: " + key);
            return 0;
        }
        if (!j[key].is_number_unsigned())
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            return 0;
        }
        auto val = j[key].get<unsigned int>();
        if (val > std::numeric_limits<unsigned short>::max())
        {
            MyLogger::error("Value for key '" + key + "' exceeds unsigned short limit");
            return 0;
        }
        return static_cast<unsigned short>(val);
    }

    Settings fromJson(const json &j)
    {
        Settings settings;
        settings.root_path = std::filesystem::current_path().string();

        if (auto root = get_config_string("root_path", j); !root.empty())
            settings.root_path = root;
        if (auto bind = get_config_string("bind_address", j); !bind.empty())
            settings.bind_address = bind;
        if (auto port = get_config_short("port", j); port != 0)
            settings.port = port;
        if (auto db = get_config_string("db_path", j); !db.empty())
            settings.db_path = db;
        if (auto poll = get_config_value("poll_interval_ms", j); poll > 0)
            settings.poll_interval_ms = poll;
        if (auto timeout = get_config_value("git_timeout_ms", j); timeout > 0)
            settings.git_timeout_ms = timeout;
        if (auto cap = get_config_value("git_max_output_bytes", j); cap > 0)
            settings.git_max_output_bytes = static_cast<std::size_t>(cap);
        if (auto limit = get_config_value("search_limit", j); limit > 0)
            settings.search_limit = static_cast<std::size_t>(limit);
        if (auto level = get_config_string("log_level", j); !level.empty())
            settings.log_level = level;
        settings.log_file = get_config_string("log_file", j);

        if (const char *start = std::getenv("START_PATH"); start && *start)
            settings.root_path = start;
        if (const char *port = std::getenv("PORT"); port && *port)
        {
            try
            {
                int parsed = std::stoi(port);
                if (parsed > 0 && parsed <= std::numeric_limits<unsigned short>::max())
                    settings.port = static_cast<unsigned short>(parsed);
                else
                    MyLogger::warning("Ignoring out of range PORT: " + std::string(port));
            }
            catch (const std::exception &e)
            {
                MyLogger::warning("Ignoring invalid PORT '" + std::string(port) + "': " + e.what());
            }
        }

        settings.root_path = std::filesystem::weakly_canonical(std::filesystem::absolute(settings.root_path)).string();
        return settings;
    }

    Settings loadSettings(const std::string &filepath)
    {
        if (filepath.empty())
            return fromJson(json::object());
        return fromJson(load(filepath));
    }
}

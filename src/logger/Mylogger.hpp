#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Thin facade over Boost.Log so every module logs the same way.
class MyLogger
{
public:
    // Configure sinks. An empty log_file keeps console output only.
    static void init(const std::string &level, const std::string &log_file = "");

    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP

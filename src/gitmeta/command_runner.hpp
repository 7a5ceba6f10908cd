#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace gitmeta
{
    enum class CommandOutcome
    {
        Completed,   // process ran to completion, see exitCode
        Unavailable, // binary not found on PATH
        LaunchFailed,
        TimedOut,
        Truncated // output exceeded the cap
    };

    struct CommandResult
    {
        CommandOutcome outcome = CommandOutcome::Completed;
        int exitCode = -1;
        std::string out;
        std::string err;

        bool ok() const { return outcome == CommandOutcome::Completed && exitCode == 0; }
    };

    // Seam over the external version-control binary.
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;
        virtual CommandResult run(const std::vector<std::string> &args, const std::string &cwd) = 0;
    };

    // Runs the binary through Boost.Process with a wall-clock timeout and a
    // cap on captured output.
    class ProcessCommandRunner : public CommandRunner
    {
    public:
        ProcessCommandRunner(std::string binary,
                             std::chrono::milliseconds timeout,
                             std::size_t maxOutputBytes);

        CommandResult run(const std::vector<std::string> &args, const std::string &cwd) override;

    private:
        std::string binary_;
        std::chrono::milliseconds timeout_;
        std::size_t max_output_;
    };
}

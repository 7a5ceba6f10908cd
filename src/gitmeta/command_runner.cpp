#include "command_runner.hpp"
#include "../logger/Mylogger.hpp"

#include <utility>
#include <boost/asio.hpp>
#include <boost/process.hpp>
#include <system_error>

namespace bp = boost::process;
namespace asio = boost::asio;

namespace gitmeta
{
    ProcessCommandRunner::ProcessCommandRunner(std::string binary,
                                               std::chrono::milliseconds timeout,
                                               std::size_t maxOutputBytes)
        : binary_(std::move(binary)), timeout_(timeout), max_output_(maxOutputBytes)
    {
    }

    CommandResult ProcessCommandRunner::run(const std::vector<std::string> &args, const std::string &cwd)
    {
        CommandResult result;
        auto exe = bp::search_path(binary_);
        if (exe.empty())
        {
            result.outcome = CommandOutcome::Unavailable;
            return result;
        }

        asio::io_context ioc;
        bp::async_pipe out_pipe(ioc);
        bp::async_pipe err_pipe(ioc);
        std::error_code launch_ec;
        bp::child child(exe, bp::args(args), bp::start_dir = cwd,
                        bp::std_out > out_pipe, bp::std_err > err_pipe,
                        bp::std_in.close(), launch_ec);
        if (launch_ec)
        {
            result.outcome = CommandOutcome::LaunchFailed;
            result.err = launch_ec.message();
            return result;
        }

        bool out_done = false;
        bool err_done = false;
        asio::async_read(out_pipe, asio::dynamic_buffer(result.out, max_output_),
                         [&out_done](const boost::system::error_code &, std::size_t)
                         { out_done = true; });
        asio::async_read(err_pipe, asio::dynamic_buffer(result.err, max_output_),
                         [&err_done](const boost::system::error_code &, std::size_t)
                         { err_done = true; });

        auto started = std::chrono::steady_clock::now();
        ioc.run_for(timeout_);

        std::error_code ec;
        if (result.out.size() >= max_output_ || result.err.size() >= max_output_)
        {
            result.outcome = CommandOutcome::Truncated;
        }
        else if (!out_done || !err_done)
        {
            result.outcome = CommandOutcome::TimedOut;
        }
        else
        {
            auto remaining = timeout_ - std::chrono::duration_cast<std::chrono::milliseconds>(
                                            std::chrono::steady_clock::now() - started);
            if (remaining.count() <= 0 || !child.wait_for(remaining, ec))
                result.outcome = CommandOutcome::TimedOut;
        }

        if (result.outcome != CommandOutcome::Completed)
        {
            if (child.running(ec))
                child.terminate(ec);
            if (ec)
                MyLogger::warning("Failed to terminate " + binary_ + ": " + ec.message());
            return result;
        }

        result.exitCode = child.exit_code();
        return result;
    }
}

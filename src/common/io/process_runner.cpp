//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "process_runner.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "usbad/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace usbad
{
namespace common
{
namespace io
{
namespace
{

constexpr std::size_t MaxOutputSize = 64UL * 1024UL;

class ProcessRunnerImpl final : public ProcessRunner
{
public:
    ProcessRunnerImpl() = default;

    // ProcessRunner

    CETL_NODISCARD RunResult::Var run(const std::vector<std::string>& args) override
    {
        if (args.empty())
        {
            return EINVAL;
        }
        if (logger_->should_log(spdlog::level::debug))
        {
            std::string cmd_line;
            for (const auto& arg : args)
            {
                cmd_line += cmd_line.empty() ? arg : (" " + arg);
            }
            logger_->debug("Running '{}'...", cmd_line);
        }

        // Prepare everything that allocates before `fork` - the child may only call async-signal-safe functions.
        //
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
        }
        argv.push_back(nullptr);

        OwnFd read_end;
        OwnFd write_end;
        if (const auto err = makePipe(read_end, write_end))
        {
            return err;
        }

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            const int err = errno;
            logger_->error("Failed to fork for '{}': {}.", args.front(), std::strerror(err));
            return err;
        }
        if (pid == 0)
        {
            // Child: both stdout and stderr go to the pipe; stdin is closed.
            //
            ::dup2(write_end.get(), STDOUT_FILENO);
            ::dup2(write_end.get(), STDERR_FILENO);
            ::close(STDIN_FILENO);
            ::execvp(argv.front(), argv.data());

            // Only reached if `execvp` has failed.
            constexpr int exec_failure_status = 127;
            ::_exit(exec_failure_status);
        }

        // Parent: close our copy of the write end, so that EOF is seen when the child exits.
        //
        write_end.reset();
        auto output = readAll(read_end);

        int status = 0;
        if (const auto err = platform::posixSyscallError([pid, &status] {
                //
                return ::waitpid(pid, &status, 0);
            }))
        {
            logger_->error("Failed to wait for '{}' (pid={}): {}.", args.front(), pid, std::strerror(err));
            return err;
        }

        int exit_status = EXIT_FAILURE;
        if (WIFEXITED(status))
        {
            exit_status = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            constexpr int signal_status_base = 128;
            exit_status                      = signal_status_base + WTERMSIG(status);
        }

        logger_->debug("'{}' has exited (pid={}, status={}).", args.front(), pid, exit_status);
        return RunResult::Success{exit_status, std::move(output)};
    }

private:
    std::string readAll(const OwnFd& fd) const
    {
        std::string              output;
        std::array<char, 1024UL> buffer{};
        while (true)
        {
            ssize_t bytes_read = 0;
            if (const auto err = platform::posixSyscallError([&fd, &buffer, &bytes_read] {
                    //
                    return bytes_read = ::read(fd.get(), buffer.data(), buffer.size());
                }))
            {
                logger_->warn("Failed to read process output: {}.", std::strerror(err));
                break;
            }
            if (bytes_read == 0)
            {
                break;
            }

            // Excessive output is drained but not kept.
            if (output.size() < MaxOutputSize)
            {
                output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
            }
        }
        return output;
    }

    LoggerPtr logger_{getLogger("io")};

};  // ProcessRunnerImpl

}  // namespace

ProcessRunner::Ptr ProcessRunner::make()
{
    return std::make_unique<ProcessRunnerImpl>();
}

}  // namespace io
}  // namespace common
}  // namespace usbad

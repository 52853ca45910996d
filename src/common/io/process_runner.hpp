//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IO_PROCESS_RUNNER_HPP_INCLUDED
#define USBAD_COMMON_IO_PROCESS_RUNNER_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace usbad
{
namespace common
{
namespace io
{

/// Runs short-lived external tools synchronously.
///
class ProcessRunner
{
public:
    using Ptr = std::unique_ptr<ProcessRunner>;

    struct RunResult
    {
        struct Success
        {
            int         exit_status;
            std::string output;  // combined stdout and stderr

        };  // Success

        using Failure = int;  // aka errno
        using Var     = cetl::variant<Success, Failure>;

    };  // RunResult

    /// Makes runner which spawns processes directly (without shell), so arguments need no escaping.
    ///
    CETL_NODISCARD static Ptr make();

    ProcessRunner(const ProcessRunner&)                = delete;
    ProcessRunner(ProcessRunner&&) noexcept            = delete;
    ProcessRunner& operator=(const ProcessRunner&)     = delete;
    ProcessRunner& operator=(ProcessRunner&&) noexcept = delete;

    virtual ~ProcessRunner() = default;

    /// Runs the program `args[0]` (searched in `PATH`) with the rest of `args` as its arguments,
    /// and waits for its termination.
    ///
    /// @return Exit status and output of the process, or errno if it could not be run at all.
    ///         A process killed by a signal reports `128 + signal` as its exit status.
    ///
    CETL_NODISCARD virtual RunResult::Var run(const std::vector<std::string>& args) = 0;

protected:
    ProcessRunner() = default;

};  // ProcessRunner

}  // namespace io
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IO_PROCESS_RUNNER_HPP_INCLUDED

//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IO_PROCESS_RUNNER_MOCK_HPP_INCLUDED
#define USBAD_COMMON_IO_PROCESS_RUNNER_MOCK_HPP_INCLUDED

#include "io/process_runner.hpp"

#include "ref_wrapper.hpp"

#include <gmock/gmock.h>

#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace common
{
namespace io
{

class ProcessRunnerMock : public ProcessRunner
{
public:
    struct Wrapper final : RefWrapper<ProcessRunner, ProcessRunnerMock>
    {
        using RefWrapper::RefWrapper;

        // MARK: ProcessRunner

        RunResult::Var run(const std::vector<std::string>& args) override
        {
            return reference().run(args);
        }

    };  // Wrapper

    /// Makes successful result of a process run.
    ///
    static RunResult::Var exited(const int exit_status, std::string output = {})
    {
        return RunResult::Success{exit_status, std::move(output)};
    }

    MOCK_METHOD(void, deinit, (), (const));
    MOCK_METHOD(RunResult::Var, run, (const std::vector<std::string>& args), (override));

};  // ProcessRunnerMock

}  // namespace io
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IO_PROCESS_RUNNER_MOCK_HPP_INCLUDED

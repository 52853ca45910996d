//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_VIRTUAL_TIME_SCHEDULER_HPP_INCLUDED
#define USBAD_VIRTUAL_TIME_SCHEDULER_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>

namespace usbad
{

/// Executor with virtual (manually advanced) time.
///
/// Callbacks are executed only by `spinFor` - never behind the test's back.
///
class VirtualTimeScheduler final : public libcyphal::platform::SingleThreadedExecutor
{
public:
    explicit VirtualTimeScheduler(const libcyphal::TimePoint initial_now = {})
        : now_{initial_now}
    {
    }

    /// Advances virtual time by the given duration, executing all callbacks which become due on the way
    /// (each at its own scheduled time).
    ///
    void spinFor(const libcyphal::Duration duration)
    {
        const auto end_time = now_ + duration;
        while (true)
        {
            const auto spin_result = spinOnce();
            if (!spin_result.next_exec_time.has_value() || (spin_result.next_exec_time.value() > end_time))
            {
                break;
            }
            now_ = std::max(now_, spin_result.next_exec_time.value());
        }
        now_ = end_time;
    }

    /// Executes callbacks which are due right now (without advancing time).
    ///
    void spinNow()
    {
        spinFor(libcyphal::Duration::zero());
    }

    // MARK: IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        return now_;
    }

private:
    libcyphal::TimePoint now_;

};  // VirtualTimeScheduler

}  // namespace usbad

#endif  // USBAD_VIRTUAL_TIME_SCHEDULER_HPP_INCLUDED

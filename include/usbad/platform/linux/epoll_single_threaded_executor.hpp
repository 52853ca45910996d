//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define USBAD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "usbad/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace usbad
{
namespace platform
{
namespace Linux
{

/// Single threaded executor which also awaits readiness of file descriptors (via `epoll`).
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
    using Base = SingleThreadedExecutor;
    using Self = EpollSingleThreadedExecutor;

public:
    /// Failure of the polling, aka `errno`.
    ///
    using PollFailure = int;

    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
        , total_awaitables_{0}
    {
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor() override
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    CETL_NODISCARD cetl::optional<PollFailure> pollAwaitableResourcesFor(
        const cetl::optional<libcyphal::Duration> timeout) const
    {
        CETL_DEBUG_ASSERT((total_awaitables_ > 0) || timeout, "Infinite timeout without awaitables.");

        if (epollfd_ < 0)
        {
            return EBADF;
        }

        if (total_awaitables_ == 0)
        {
            if (!timeout)
            {
                return EINVAL;
            }
            std::this_thread::sleep_for(std::max(timeout.value(), libcyphal::Duration::zero()));
            return cetl::nullopt;
        }

        // Convert the timeout (if any) to the epoll one (in milliseconds).
        // Negative timeout is treated as zero (return immediately from the `::epoll_wait`).
        //
        int clamped_timeout_ms = -1;  // "infinite" timeout
        if (timeout)
        {
            using PollDuration = std::chrono::milliseconds;

            clamped_timeout_ms = static_cast<int>(  //
                std::max(static_cast<PollDuration::rep>(0),
                         std::min(std::chrono::duration_cast<PollDuration>(timeout.value()).count(),
                                  static_cast<PollDuration::rep>(std::numeric_limits<int>::max()))));
        }

        std::array<epoll_event, MaxEvents> evts{};
        const int epoll_result = ::epoll_wait(epollfd_, evts.data(), static_cast<int>(evts.size()), clamped_timeout_ms);
        if (epoll_result < 0)
        {
            const int err = errno;
            return (err == EINTR) ? cetl::nullopt : cetl::optional<PollFailure>{err};
        }

        const auto now_time = now();
        for (int index = 0; index < epoll_result; ++index)
        {
            const epoll_event& evt = evts[static_cast<std::size_t>(index)];
            if (auto* const awaitable_node = static_cast<AwaitableNode*>(evt.data.ptr))
            {
                awaitable_node->schedule(Callback::Schedule::Once{now_time});
            }
        }

        return cetl::nullopt;
    }

    // MARK: - IPosixExecutorExtension

    CETL_NODISCARD Callback::Any registerAwaitableCallback(Callback::Function&&    function,
                                                           const Trigger::Variant& trigger) override
    {
        AwaitableNode new_cb_node{*this, std::move(function)};

        cetl::visit(  //
            cetl::make_overloaded(
                [&new_cb_node](const Trigger::Readable& readable) {
                    //
                    new_cb_node.setup(readable.fd, EPOLLIN);
                },
                [&new_cb_node](const Trigger::Writable& writable) {
                    //
                    new_cb_node.setup(writable.fd, EPOLLOUT);
                }),
            trigger);

        insertCallbackNode(new_cb_node);
        return {std::move(new_cb_node)};
    }

    // MARK: - RTTI

    CETL_NODISCARD cetl::void_ptr _cast_(const cetl::type_id& id) & noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD cetl::void_cptr _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    static constexpr std::size_t MaxEvents = 16;

    class AwaitableNode final : public CallbackNode
    {
    public:
        AwaitableNode(Self& executor, Callback::Function&& function)
            : CallbackNode{executor, std::move(function)}
            , fd_{-1}
            , events_{0}
        {
        }

        ~AwaitableNode() override
        {
            if (fd_ >= 0)
            {
                ::epoll_event ev{};
                (void) ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_DEL, fd_, &ev);
                --getExecutor().total_awaitables_;
            }
        }

        AwaitableNode(AwaitableNode&& other) noexcept
            : CallbackNode(std::move(static_cast<CallbackNode&&>(other)))
            , fd_{std::exchange(other.fd_, -1)}
            , events_{std::exchange(other.events_, 0)}
        {
            if (fd_ >= 0)
            {
                // The epoll user data must follow the node to its new location.
                ::epoll_event ev{};
                ev.events   = events_;
                ev.data.ptr = this;
                (void) ::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_MOD, fd_, &ev);
            }
        }

        AwaitableNode(const AwaitableNode&)                = delete;
        AwaitableNode& operator=(const AwaitableNode&)     = delete;
        AwaitableNode& operator=(AwaitableNode&&) noexcept = delete;

        void setup(const int fd, const std::uint32_t events) noexcept
        {
            CETL_DEBUG_ASSERT(fd >= 0, "");

            ::epoll_event ev{};
            ev.events   = events;
            ev.data.ptr = this;
            if (::epoll_ctl(getExecutor().epollfd_, EPOLL_CTL_ADD, fd, &ev) == 0)
            {
                fd_     = fd;
                events_ = events;
                ++getExecutor().total_awaitables_;
            }
        }

    private:
        Self& getExecutor() const noexcept
        {
            // No lint b/c we know for sure that the executor is of type `Self`.
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-static-cast-downcast)
            return static_cast<Self&>(executor());
        }

        int           fd_;
        std::uint32_t events_;

    };  // AwaitableNode

    const int   epollfd_;
    std::size_t total_awaitables_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace usbad

#endif  // USBAD_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

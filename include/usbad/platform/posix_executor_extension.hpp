//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define USBAD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace usbad
{
namespace platform
{

/// Extends an executor with callbacks triggered by readiness of POSIX file descriptors.
///
/// Sockets of client connections, the control socket and the udev monitor are all served this way,
/// so every event of the daemon is handled on the single executor thread.
///
class IPosixExecutorExtension
{
    // 4B0C9A61-52D7-4E0F-9D3A-7C1E26F8B3A5
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x4B, 0x0C, 0x9A, 0x61, 0x52, 0xD7, 0x4E, 0x0F, 0x9D, 0x3A, 0x7C, 0x1E, 0x26, 0xF8, 0xB3, 0xA5>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace usbad

#endif  // USBAD_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

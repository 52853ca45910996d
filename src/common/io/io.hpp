//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IO_HPP_INCLUDED
#define USBAD_COMMON_IO_HPP_INCLUDED

#include <cstddef>
#include <utility>

namespace usbad
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    bool isValid() const noexcept
    {
        return fd_ >= 0;
    }

    /// Releases ownership of the descriptor without closing it.
    ///
    int release() noexcept
    {
        return std::exchange(fd_, -1);
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

/// Creates a pair of connected pipe descriptors (read end first), both with `O_CLOEXEC`.
///
/// @return errno of the failure, or 0 on success.
///
int makePipe(OwnFd& read_end, OwnFd& write_end);

}  // namespace io
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IO_HPP_INCLUDED

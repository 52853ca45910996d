//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"
#include "usbad/platform/posix_utils.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace usbad
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
        if (::close(fd_) < 0)
        {
            const int err = errno;
            getLogger("io")->error("Failed to close file descriptor {}: {}.", fd_, std::strerror(err));
        }

        fd_ = -1;
    }
}

OwnFd::~OwnFd()
{
    reset();
}

int makePipe(OwnFd& read_end, OwnFd& write_end)
{
    std::array<int, 2> fds{-1, -1};
    if (const auto err = platform::posixSyscallError([&fds] {
            //
            return ::pipe2(fds.data(), O_CLOEXEC);
        }))
    {
        getLogger("io")->error("Failed to create pipe: {}.", std::strerror(err));
        return err;
    }

    read_end  = OwnFd{fds[0]};
    write_end = OwnFd{fds[1]};
    return 0;
}

}  // namespace io
}  // namespace common
}  // namespace usbad

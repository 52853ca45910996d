//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_DEVICES_DRIVER_TRANSPORT_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_DEVICES_DRIVER_TRANSPORT_HPP_INCLUDED

#include "engine_types.hpp"

#include <cetl/cetl.hpp>

#include <memory>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Host side of the USB/IP driver layer - exports (binds) devices of local ports.
///
/// All methods are synchronous and return zero on success, otherwise an errno-like code.
///
class DriverTransport
{
public:
    using Ptr = std::unique_ptr<DriverTransport>;

    DriverTransport(const DriverTransport&)                = delete;
    DriverTransport(DriverTransport&&) noexcept            = delete;
    DriverTransport& operator=(const DriverTransport&)     = delete;
    DriverTransport& operator=(DriverTransport&&) noexcept = delete;

    virtual ~DriverTransport() = default;

    /// Binds device of the port to the `usbip-host` driver (making it exportable).
    ///
    /// A device which is already bound is a success.
    ///
    CETL_NODISCARD virtual int bind(const PortId& port_id) = 0;

    /// Unbinds device of the port from the `usbip-host` driver.
    ///
    /// Any remote session of the device is terminated.
    ///
    CETL_NODISCARD virtual int unbind(const PortId& port_id) = 0;

    /// Checks whether device of the port is currently bound to the `usbip-host` driver.
    ///
    CETL_NODISCARD virtual bool isBound(const PortId& port_id) const = 0;

protected:
    DriverTransport() = default;

};  // DriverTransport

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_DEVICES_DRIVER_TRANSPORT_HPP_INCLUDED

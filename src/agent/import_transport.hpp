//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_IMPORT_TRANSPORT_HPP_INCLUDED
#define USBAD_AGENT_IMPORT_TRANSPORT_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <memory>
#include <string>

namespace usbad
{
namespace agent
{

/// Client side of the USB/IP driver layer - imports (attaches) devices exported by the host.
///
/// All methods are synchronous and return zero on success, otherwise an errno-like code.
///
class ImportTransport
{
public:
    using Ptr = std::unique_ptr<ImportTransport>;

    ImportTransport(const ImportTransport&)                = delete;
    ImportTransport(ImportTransport&&) noexcept            = delete;
    ImportTransport& operator=(const ImportTransport&)     = delete;
    ImportTransport& operator=(ImportTransport&&) noexcept = delete;

    virtual ~ImportTransport() = default;

    /// Imports the remote device of the host port.
    ///
    /// A stale import of the same port (f.e. left from a previous session) is released first.
    ///
    CETL_NODISCARD virtual int attach(const std::string& port_id) = 0;

    /// Releases the imported device of the host port.
    ///
    /// A device which is not imported is a success.
    ///
    CETL_NODISCARD virtual int detach(const std::string& port_id) = 0;

protected:
    ImportTransport() = default;

};  // ImportTransport

}  // namespace agent
}  // namespace usbad

#endif  // USBAD_AGENT_IMPORT_TRANSPORT_HPP_INCLUDED

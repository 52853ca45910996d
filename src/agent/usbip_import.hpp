//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_USBIP_IMPORT_HPP_INCLUDED
#define USBAD_AGENT_USBIP_IMPORT_HPP_INCLUDED

#include "import_transport.hpp"
#include "io/process_runner.hpp"

#include <cetl/cetl.hpp>

#include <map>
#include <string>

namespace usbad
{
namespace agent
{

/// Import transport implemented on top of the `usbip` command line tool.
///
class UsbipImport
{
public:
    /// Local (virtual host controller) port numbers of the imported devices, keyed by the remote bus id.
    ///
    using ImportedPorts = std::map<std::string, std::string>;

    CETL_NODISCARD static ImportTransport::Ptr make(common::io::ProcessRunner::Ptr process_runner,
                                                    std::string                    usbip_tool,
                                                    std::string                    remote_host);

    /// Parses output of the `usbip port` command.
    ///
    /// Understands both the Linux format (`Port 00: ...` followed by `... -> usbip://host:3240/1-1`),
    /// and the Windows one (`port 1: <-> busid 1-1 ...`).
    ///
    CETL_NODISCARD static ImportedPorts parseImportedPorts(const std::string& output);

};  // UsbipImport

}  // namespace agent
}  // namespace usbad

#endif  // USBAD_AGENT_USBIP_IMPORT_HPP_INCLUDED

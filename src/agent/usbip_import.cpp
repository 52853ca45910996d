//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "usbip_import.hpp"

#include "import_transport.hpp"
#include "io/process_runner.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace agent
{
namespace
{

bool isBusIdChar(const char ch)
{
    return (std::isdigit(static_cast<unsigned char>(ch)) != 0) || (ch == '-') || (ch == '.');
}

/// Takes the bus id (like `1-1.2`) at the beginning of the text.
///
std::string takeBusId(const std::string& text)
{
    const auto end = std::find_if_not(text.begin(), text.end(), isBusIdChar);
    std::string bus_id{text.begin(), end};
    return (bus_id.find('-') != std::string::npos) ? bus_id : std::string{};
}

/// Parses `<prefix><digits>:` at the beginning of the line.
///
cetl::optional<std::string> tryParsePortNumber(const std::string& line, const std::string& prefix)
{
    if (line.compare(0, prefix.size(), prefix) != 0)
    {
        return cetl::nullopt;
    }

    auto pos = line.find_first_not_of(' ', prefix.size());
    if (pos == std::string::npos)
    {
        return cetl::nullopt;
    }
    const auto digits_begin = pos;
    while ((pos < line.size()) && (std::isdigit(static_cast<unsigned char>(line[pos])) != 0))
    {
        ++pos;
    }
    if ((pos == digits_begin) || (pos >= line.size()) || (line[pos] != ':'))
    {
        return cetl::nullopt;
    }
    return line.substr(digits_begin, pos - digits_begin);
}

std::string trimLeft(const std::string& line)
{
    const auto pos = line.find_first_not_of(" \t");
    return (pos == std::string::npos) ? std::string{} : line.substr(pos);
}

class UsbipImportImpl final : public ImportTransport
{
public:
    UsbipImportImpl(common::io::ProcessRunner::Ptr process_runner, std::string usbip_tool, std::string remote_host)
        : process_runner_{std::move(process_runner)}
        , usbip_tool_{std::move(usbip_tool)}
        , remote_host_{std::move(remote_host)}
    {
        CETL_DEBUG_ASSERT(process_runner_, "");
    }

    // ImportTransport

    CETL_NODISCARD int attach(const std::string& port_id) override
    {
        const auto imported_ports = queryImportedPorts();
        const auto it             = imported_ports.find(port_id);
        if (it != imported_ports.end())
        {
            logger_->info("Releasing stale import before attach (port='{}', vhci_port={}).", port_id, it->second);
            if (const int err = runTool({usbip_tool_, "detach", "-p", it->second}))
            {
                logger_->warn("Failed to release stale import (port='{}', err={}).", port_id, err);
            }
        }

        const int err = runTool({usbip_tool_, "attach", "-r", remote_host_, "-b", port_id});
        if (err != 0)
        {
            logger_->warn("Failed to attach device (host='{}', port='{}', err={}).", remote_host_, port_id, err);
            return err;
        }

        logger_->info("Device is attached (host='{}', port='{}').", remote_host_, port_id);
        return 0;
    }

    CETL_NODISCARD int detach(const std::string& port_id) override
    {
        const auto imported_ports = queryImportedPorts();
        const auto it             = imported_ports.find(port_id);
        if (it == imported_ports.end())
        {
            logger_->info("Device is not attached (port='{}').", port_id);
            return 0;
        }

        const int err = runTool({usbip_tool_, "detach", "-p", it->second});
        if (err != 0)
        {
            logger_->warn("Failed to detach device (port='{}', vhci_port={}, err={}).", port_id, it->second, err);
            return err;
        }

        logger_->info("Device is detached (port='{}', vhci_port={}).", port_id, it->second);
        return 0;
    }

private:
    using RunResult = common::io::ProcessRunner::RunResult;

    /// Failure to query (f.e. `vhci-hcd` is not loaded) means there is nothing imported.
    ///
    UsbipImport::ImportedPorts queryImportedPorts()
    {
        std::string output;
        if (0 != runTool({usbip_tool_, "port"}, &output))
        {
            return {};
        }
        return UsbipImport::parseImportedPorts(output);
    }

    /// @return Zero on success; `EIO` if the tool has failed; or errno if it could not be run.
    ///
    int runTool(const std::vector<std::string>& args, std::string* const out_output = nullptr)
    {
        auto maybe_result = process_runner_->run(args);
        if (const auto* const failure = cetl::get_if<RunResult::Failure>(&maybe_result))
        {
            logger_->error("Failed to run '{} {}': {}.", usbip_tool_, args.at(1), std::strerror(*failure));
            return *failure;
        }

        auto& success = cetl::get<RunResult::Success>(maybe_result);
        if (success.exit_status != 0)
        {
            logger_->debug("'{} {}' has failed (status={}): {}",
                           usbip_tool_,
                           args.at(1),
                           success.exit_status,
                           success.output);
            return EIO;
        }

        if (out_output != nullptr)
        {
            *out_output = std::move(success.output);
        }
        return 0;
    }

    common::LoggerPtr                    logger_{common::getLogger("agent")};
    const common::io::ProcessRunner::Ptr process_runner_;
    const std::string                    usbip_tool_;
    const std::string                    remote_host_;

};  // UsbipImportImpl

}  // namespace

ImportTransport::Ptr UsbipImport::make(common::io::ProcessRunner::Ptr process_runner,
                                       std::string                    usbip_tool,
                                       std::string                    remote_host)
{
    return std::make_unique<UsbipImportImpl>(std::move(process_runner),
                                             std::move(usbip_tool),
                                             std::move(remote_host));
}

UsbipImport::ImportedPorts UsbipImport::parseImportedPorts(const std::string& output)
{
    static const std::string linux_url_marker  = "-> usbip://";
    static const std::string windows_busid_tag = "<-> busid ";

    ImportedPorts result;

    cetl::optional<std::string> current_port;
    std::istringstream          lines{output};
    std::string                 line;
    while (std::getline(lines, line))
    {
        line = trimLeft(line);

        // Windows: `port 1: <-> busid 1-1 (1234:5678)`
        //
        const auto busid_pos = line.find(windows_busid_tag);
        if (busid_pos != std::string::npos)
        {
            if (const auto port_number = tryParsePortNumber(line, "port"))
            {
                const auto bus_id = takeBusId(line.substr(busid_pos + windows_busid_tag.size()));
                if (!bus_id.empty())
                {
                    result[bus_id] = *port_number;
                }
            }
            continue;
        }

        // Linux: `Port 00: <Port in Use> at High Speed(480Mbps)`
        //        `       1-1 -> usbip://host:3240/1-1`
        //
        if (const auto port_number = tryParsePortNumber(line, "Port"))
        {
            current_port = port_number;
            continue;
        }
        const auto url_pos = line.find(linux_url_marker);
        if ((url_pos != std::string::npos) && current_port)
        {
            const auto url       = line.substr(url_pos + linux_url_marker.size());
            const auto slash_pos = url.find('/');
            if (slash_pos != std::string::npos)
            {
                const auto bus_id = takeBusId(url.substr(slash_pos + 1));
                if (!bus_id.empty())
                {
                    result[bus_id] = *current_port;
                }
            }
            current_port.reset();
        }
    }
    return result;
}

}  // namespace agent
}  // namespace usbad

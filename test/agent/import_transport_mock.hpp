//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_IMPORT_TRANSPORT_MOCK_HPP_INCLUDED
#define USBAD_AGENT_IMPORT_TRANSPORT_MOCK_HPP_INCLUDED

#include "import_transport.hpp"

#include <gmock/gmock.h>

#include <string>

namespace usbad
{
namespace agent
{

class ImportTransportMock : public ImportTransport
{
public:
    MOCK_METHOD(int, attach, (const std::string& port_id), (override));
    MOCK_METHOD(int, detach, (const std::string& port_id), (override));

};  // ImportTransportMock

}  // namespace agent
}  // namespace usbad

#endif  // USBAD_AGENT_IMPORT_TRANSPORT_MOCK_HPP_INCLUDED

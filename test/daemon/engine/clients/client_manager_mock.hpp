//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_MOCK_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_MOCK_HPP_INCLUDED

#include "clients/client_manager.hpp"
#include "engine_types.hpp"

#include <gmock/gmock.h>

#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace clients
{

class ClientManagerMock : public ClientManager
{
public:
    MOCK_METHOD(int, start, (EventHandler event_handler), (override));
    MOCK_METHOD(int, send, (const ClientId& client_id, const Command::Var& command), (override));
    MOCK_METHOD(bool, isConnected, (const ClientId& client_id), (const, override));
    MOCK_METHOD(std::vector<ClientRecord>, clients, (), (const, override));

};  // ClientManagerMock

}  // namespace clients
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_MOCK_HPP_INCLUDED

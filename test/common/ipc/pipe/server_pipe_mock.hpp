//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED
#define USBAD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED

#include "ipc/pipe/server_pipe.hpp"

#include "ipc/ipc_types.hpp"
#include "ref_wrapper.hpp"

#include <gmock/gmock.h>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

class ServerPipeMock : public ServerPipe
{
public:
    struct Wrapper final : RefWrapper<ServerPipe, ServerPipeMock>
    {
        using RefWrapper::RefWrapper;

        // MARK: ServerPipe

        int start(EventHandler event_handler) override
        {
            reference().event_handler_ = event_handler;
            return reference().start(event_handler);
        }

        int send(const ClientId client_id, const Payloads payloads) override
        {
            return reference().send(client_id, payloads);
        }

        void disconnect(const ClientId client_id) override
        {
            reference().disconnect(client_id);
        }

    };  // Wrapper

    MOCK_METHOD(void, deinit, (), (const));
    MOCK_METHOD(int, start, (EventHandler event_handler), (override));
    MOCK_METHOD(int, send, (const ClientId client_id, const Payloads payloads), (override));
    MOCK_METHOD(void, disconnect, (const ClientId client_id), (override));

    // MARK: Data members:

    // NOLINTBEGIN
    EventHandler event_handler_;
    // NOLINTEND

};  // ServerPipeMock

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_SERVER_PIPE_MOCK_HPP_INCLUDED

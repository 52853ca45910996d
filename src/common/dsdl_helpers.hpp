//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_DSDL_HELPERS_HPP_INCLUDED
#define USBAD_COMMON_DSDL_HELPERS_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>

namespace usbad
{
namespace common
{

/// Maximum lengths of identifiers on the wire (capacities of the DSDL `uint8[<=N]` fields).
///
constexpr std::size_t MaxPortIdLength   = 32;
constexpr std::size_t MaxClientIdLength = 64;

template <typename Message>
auto tryDeserializePayload(const cetl::span<const std::uint8_t> payload, Message& out_message)
{
    return deserialize(out_message, {payload.data(), payload.size()});
}

/// Serializes the message into a stack buffer and passes the resulting bytes to the action.
///
/// Only for messages with small serialization buffers - see the heap variant below.
///
template <typename Message, typename Action>
int tryPerformOnSerialized(const Message& message, Action&& action)
{
    // Next nolint b/c we use a buffer to serialize the message, so no need to zero it (and performance better).
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    std::array<std::uint8_t, Message::_traits_::SerializationBufferSizeBytes> buffer;
    //
    const auto result_size = serialize(message, {buffer.data(), buffer.size()});
    if (!result_size)
    {
        return EINVAL;
    }

    const cetl::span<const std::uint8_t> bytes{buffer.data(), result_size.value()};
    return std::forward<Action>(action)(bytes);
}

/// Same as above, but the serialization buffer is allocated on the heap.
///
template <typename Message, typename Action>
int tryPerformOnSerializedInHeap(const Message& message, Action&& action)
{
    using ArrayOfBytes = std::array<std::uint8_t, Message::_traits_::SerializationBufferSizeBytes>;
    const std::unique_ptr<ArrayOfBytes> buffer{new ArrayOfBytes};
    //
    const auto result_size = serialize(message, {buffer->data(), buffer->size()});
    if (!result_size)
    {
        return EINVAL;
    }

    const cetl::span<const std::uint8_t> bytes{buffer->data(), result_size.value()};
    return std::forward<Action>(action)(bytes);
}

/// Fills a DSDL `uint8[<=N]` field with the string characters.
///
/// Strings longer than `capacity` (the `N` of the field) are truncated.
///
template <typename Bytes>
void assignString(Bytes& out_bytes, const std::string& str, const std::size_t capacity)
{
    const auto size = std::min(str.size(), capacity);

    out_bytes.clear();
    out_bytes.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
    {
        out_bytes.push_back(static_cast<std::uint8_t>(str[i]));
    }
}

template <typename Bytes>
std::string toString(const Bytes& bytes)
{
    return std::string{bytes.begin(), bytes.end()};
}

}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_DSDL_HELPERS_HPP_INCLUDED

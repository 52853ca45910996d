//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_ASSIGNMENT_STORE_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_ASSIGNMENT_STORE_HPP_INCLUDED

#include "assignment_types.hpp"

#include <cetl/cetl.hpp>

#include <memory>
#include <string>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace assignment
{

/// Durable storage of the assignment intents.
///
class AssignmentStore
{
public:
    using Ptr = std::unique_ptr<AssignmentStore>;

    /// Makes TOML file based store.
    ///
    /// The file is replaced atomically on every save (via a temporary `<file_path>.tmp` file).
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    AssignmentStore(const AssignmentStore&)                = delete;
    AssignmentStore(AssignmentStore&&) noexcept            = delete;
    AssignmentStore& operator=(const AssignmentStore&)     = delete;
    AssignmentStore& operator=(AssignmentStore&&) noexcept = delete;

    virtual ~AssignmentStore() = default;

    /// Loads the persisted state.
    ///
    /// Missing file is an empty state. So is an unparsable one (it is logged, and left as is until the next save).
    ///
    CETL_NODISCARD virtual PersistentState load() = 0;

    /// Durably replaces the persisted state.
    ///
    /// @return Zero on success, otherwise errno.
    ///
    CETL_NODISCARD virtual int save(const PersistentState& state) = 0;

protected:
    AssignmentStore() = default;

};  // AssignmentStore

}  // namespace assignment
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_ASSIGNMENT_STORE_HPP_INCLUDED

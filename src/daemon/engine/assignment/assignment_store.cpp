//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "assignment_store.hpp"

#include "assignment_types.hpp"
#include "io/io.hpp"
#include "logging.hpp"
#include "usbad/platform/posix_utils.hpp"

#include <toml.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace assignment
{
namespace
{

constexpr const char* AssignAllClientKey = "assign_all_client_id";
constexpr const char* AssignmentsKey     = "assignments";

class AssignmentStoreImpl final : public AssignmentStore
{
public:
    explicit AssignmentStoreImpl(std::string file_path)
        : file_path_{std::move(file_path)}
    {
    }

    // AssignmentStore

    CETL_NODISCARD PersistentState load() override
    {
        PersistentState state;

        struct stat file_stat{};
        if (::stat(file_path_.c_str(), &file_stat) != 0)
        {
            const int err = errno;
            if (err == ENOENT)
            {
                logger_->info("No assignments file yet - starting empty (file='{}').", file_path_);
            }
            else
            {
                logger_->error("Failed to access assignments file (file='{}'): {}.", file_path_, std::strerror(err));
            }
            return state;
        }

        try
        {
            const auto root = toml::parse(file_path_);

            if (root.contains(AssignAllClientKey) && root.at(AssignAllClientKey).is_string())
            {
                const auto& client_id = root.at(AssignAllClientKey).as_string();
                if (!client_id.empty())
                {
                    state.assign_all_client = client_id;
                }
            }

            if (root.contains(AssignmentsKey) && root.at(AssignmentsKey).is_table())
            {
                for (const auto& port_and_client : root.at(AssignmentsKey).as_table())
                {
                    if (!port_and_client.second.is_string())
                    {
                        logger_->warn("Ignoring non-string assignment (port='{}').", port_and_client.first);
                        continue;
                    }
                    state.intents.emplace(port_and_client.first, port_and_client.second.as_string());
                }
            }

        } catch (const std::exception& ex)
        {
            logger_->error("Failed to parse assignments file - starting empty (file='{}'): {}", file_path_, ex.what());
            return PersistentState{};
        }

        logger_->info("Loaded assignments (file='{}', count={}, assign_all='{}').",
                      file_path_,
                      state.intents.size(),
                      state.assign_all_client.value_or(""));
        return state;
    }

    CETL_NODISCARD int save(const PersistentState& state) override
    {
        const auto tmp_file_path = file_path_ + ".tmp";
        if (const int err = ensureParentDir())
        {
            logger_->error("Storage error: failed to create directory of assignments file (file='{}'): {}.",
                           file_path_,
                           std::strerror(err));
            return err;
        }

        // 1. Write the whole state into the temporary file.
        //
        try
        {
            toml::ordered_value root{toml::ordered_table{}};
            if (state.assign_all_client)
            {
                root[AssignAllClientKey] = *state.assign_all_client;
            }
            auto& assignments = root[AssignmentsKey];
            assignments       = toml::ordered_table{};
            for (const auto& port_and_client : state.intents)
            {
                assignments[port_and_client.first] = port_and_client.second;
            }

            const auto    content = toml::format(root);
            std::ofstream file{tmp_file_path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc};
            file << content;
            file.close();
            if (!file)
            {
                logger_->error("Storage error: failed to write assignments (file='{}').", tmp_file_path);
                return EIO;
            }

        } catch (const std::exception& ex)
        {
            logger_->error("Storage error: failed to format assignments (file='{}'): {}", tmp_file_path, ex.what());
            return EIO;
        }

        // 2. Flush it to the disk, and atomically replace the target file.
        //
        if (const int err = syncFile(tmp_file_path))
        {
            logger_->error("Storage error: failed to sync assignments (file='{}'): {}.",
                           tmp_file_path,
                           std::strerror(err));
            return err;
        }
        if (const int err = platform::posixSyscallError([this, &tmp_file_path] {
                //
                return std::rename(tmp_file_path.c_str(), file_path_.c_str());
            }))
        {
            logger_->error("Storage error: failed to rename assignments file (file='{}'): {}.",
                           file_path_,
                           std::strerror(err));
            return err;
        }

        logger_->debug("Saved assignments (file='{}', count={}).", file_path_, state.intents.size());
        return 0;
    }

private:
    int ensureParentDir() const
    {
        const auto slash_pos = file_path_.rfind('/');
        if ((slash_pos == std::string::npos) || (slash_pos == 0))
        {
            return 0;
        }

        const auto dir_path = file_path_.substr(0, slash_pos);
        if ((::mkdir(dir_path.c_str(), 0755) != 0) && (errno != EEXIST))  // NOLINT(*-magic-numbers)
        {
            return errno;
        }
        return 0;
    }

    static int syncFile(const std::string& file_path)
    {
        const common::io::OwnFd fd{::open(file_path.c_str(), O_RDONLY | O_CLOEXEC)};  // NOLINT(*-vararg)
        if (!fd.isValid())
        {
            return errno;
        }
        return platform::posixSyscallError([&fd] {
            //
            return ::fsync(fd.get());
        });
    }

    common::LoggerPtr logger_{common::getLogger("store")};
    const std::string file_path_;

};  // AssignmentStoreImpl

}  // namespace

AssignmentStore::Ptr AssignmentStore::make(std::string file_path)
{
    return std::make_unique<AssignmentStoreImpl>(std::move(file_path));
}

}  // namespace assignment
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define USBAD_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <sys/syslog.h>
#include <unistd.h>

namespace detail
{

/// Names of the daemon subsystem loggers (see `usbad::common::getLogger`).
///
constexpr std::array<const char*, 9> SubsystemLoggers{
    {"engine", "orch", "registry", "discovery", "clients", "control", "store", "ipc", "io"}};

/// Applies flush levels given in the `SPDLOG_LEVEL` like format (f.e. `warn,orch=debug`).
///
inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : key_vals)
    {
        auto&      level_name = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto level      = spdlog::level::from_str(level_name);
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;  // Unknown level name.
        }

        if (name_level.first.empty())
        {
            spdlog::default_logger()->flush_on(level);
        }
        else if (const auto logger = spdlog::get(name_level.first))
        {
            logger->flush_on(level);
        }
    }

    // Loggers without explicit flush level follow the default one.
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Searches for `SPDLOG_FLUSH_LEVEL=` among the arguments.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    const std::string flush_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.compare(0, flush_level_prefix.size(), flush_level_prefix) == 0)
        {
            loadFlushLevels(arg_str.substr(flush_level_prefix.size()));
        }
    }
}

}  // namespace detail

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = std::strlen(str);
    return static_cast<ssize_t>(str_len) == ::write(fd, str, str_len);
}

/// Sets up logging of the daemon.
///
/// The default logger goes both to syslog and to the rotating log file, while the subsystem loggers
/// (`orch`, `clients` etc.) go to the file only. Levels come from the `[logging]` section of the
/// configuration, and then from `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments.
///
inline void setupLogging(const int                                 err_fd,
                         const bool                                is_daemonized,
                         const int                                 argc,
                         const char** const                        argv,
                         const usbad::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::syslog_sink_st;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        const std::string log_prefix    = "usbad";
        auto              log_file_path = (is_daemonized ? "/var/log/" : "./") + log_prefix + ".log";
        if (const auto logging_file = config->getLoggingFile())
        {
            log_file_path = logging_file.value();
        }

        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const int  syslog_facility = is_daemonized ? LOG_DAEMON : LOG_USER;
        const auto syslog_sink     = std::make_shared<syslog_sink_st>(log_prefix, LOG_PID, syslog_facility, true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        const std::initializer_list<spdlog::sink_ptr> sinks{syslog_sink, file_sink};
        const auto                                    default_logger = std::make_shared<spdlog::logger>("", sinks);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        for (const auto* const logger_name : detail::SubsystemLoggers)
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(logger_name, file_sink));
        }

        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Separates runs in the log file (but not in syslog).
        //
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(err_fd, "Failed to setup logging: ");
        writeString(err_fd, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // USBAD_DAEMON_SETUP_LOGGING_HPP_INCLUDED

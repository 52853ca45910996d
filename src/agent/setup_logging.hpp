//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_SETUP_LOGGING_HPP_INCLUDED
#define USBAD_AGENT_SETUP_LOGGING_HPP_INCLUDED

#include "agent_config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <sys/syslog.h>

namespace detail
{

inline void applyFlushLevels(const std::string& flush_levels)
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
            continue;
        }
        if (const auto logger = name_level.first.empty() ? spdlog::default_logger() : spdlog::get(name_level.first))
        {
            logger->flush_on(level);
        }
    }
}

}  // namespace detail

/// Sets up logging of the agent.
///
/// Same sinks as the daemon has (syslog for the default logger, and the rotating file for all),
/// but the log file goes to the working directory unless configured.
///
inline void setupLogging(const int argc, const char** const argv, const usbad::agent::AgentConfig::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::syslog_sink_st;

    try
    {
        constexpr std::size_t log_max_files     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        const std::string log_prefix    = "usbad-agent";
        auto              log_file_path = "./" + log_prefix + ".log";
        if (const auto logging_file = config->getLoggingFile())
        {
            log_file_path = logging_file.value();
        }

        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto syslog_sink = std::make_shared<syslog_sink_st>(log_prefix, LOG_PID, LOG_USER, true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        const std::initializer_list<spdlog::sink_ptr> sinks{syslog_sink, file_sink};
        const auto                                    default_logger = std::make_shared<spdlog::logger>("", sinks);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        // Agent decisions also go to syslog - there is nobody else to tell about a failed import.
        spdlog::register_logger(std::make_shared<spdlog::logger>("agent", sinks));
        spdlog::register_logger(std::make_shared<spdlog::logger>("ipc", file_sink));
        spdlog::register_logger(std::make_shared<spdlog::logger>("io", file_sink));

        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::applyFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);

        file_sink->log({"", spdlog::level::info, "--------------------------"});

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // USBAD_AGENT_SETUP_LOGGING_HPP_INCLUDED

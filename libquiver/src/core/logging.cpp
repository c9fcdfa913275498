// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "quiver/core/logging.hpp"
#include "quiver/util/string.hpp"

namespace quiver
{
    auto log_level_parse(std::string_view name) -> std::optional<log_level>
    {
        const auto lower = util::to_lower(util::strip(name));
        if (lower == "warn")
        {
            return log_level::warn;
        }
        if (lower == "err")
        {
            return log_level::err;
        }
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lower == name_of(level))
            {
                return level;
            }
        }
        return std::nullopt;
    }

    namespace logging
    {
        namespace
        {
            auto to_spdlog(log_level level) -> spdlog::level::level_enum
            {
                switch (level)
                {
                    case log_level::trace:
                        return spdlog::level::trace;
                    case log_level::debug:
                        return spdlog::level::debug;
                    case log_level::info:
                        return spdlog::level::info;
                    case log_level::warn:
                        return spdlog::level::warn;
                    case log_level::err:
                        return spdlog::level::err;
                    case log_level::critical:
                        return spdlog::level::critical;
                    case log_level::off:
                        return spdlog::level::off;
                }
                return spdlog::level::off;
            }

            std::mutex params_mutex;
            LoggingParams current_params = {};

            void configure(spdlog::logger& logger, const LoggingParams& params)
            {
                logger.set_pattern(params.log_pattern);
                logger.set_level(to_spdlog(params.logging_level));
                if (params.log_backtrace > 0)
                {
                    logger.enable_backtrace(params.log_backtrace);
                }
                else
                {
                    logger.disable_backtrace();
                }
            }

            // Caller must hold params_mutex
            auto library_logger_unsafe() -> std::shared_ptr<spdlog::logger>
            {
                const auto name = std::string(logger_name);
                if (auto logger = spdlog::get(name))
                {
                    return logger;
                }
                auto logger = spdlog::stderr_color_mt(name);
                configure(*logger, current_params);
                return logger;
            }

            auto library_logger() -> std::shared_ptr<spdlog::logger>
            {
                const std::lock_guard<std::mutex> lock(params_mutex);
                return library_logger_unsafe();
            }
        }

        void set_logging_params(const LoggingParams& params)
        {
            const std::lock_guard<std::mutex> lock(params_mutex);
            current_params = params;
            configure(*library_logger_unsafe(), current_params);
        }

        auto get_logging_params() -> LoggingParams
        {
            const std::lock_guard<std::mutex> lock(params_mutex);
            return current_params;
        }

        auto set_log_level(log_level new_level) -> log_level
        {
            const std::lock_guard<std::mutex> lock(params_mutex);
            const auto previous_level = current_params.logging_level;
            current_params.logging_level = new_level;
            library_logger_unsafe()->set_level(to_spdlog(new_level));
            return previous_level;
        }

        auto get_log_level() -> log_level
        {
            const std::lock_guard<std::mutex> lock(params_mutex);
            return current_params.logging_level;
        }

        void log_backtrace()
        {
            if (auto logger = library_logger())
            {
                logger->dump_backtrace();
            }
        }

        /*******************
         *  MessageLogger  *
         *******************/

        MessageLogger::MessageLogger(log_level level)
            : m_level(level)
            , m_stream()
        {
        }

        MessageLogger::~MessageLogger()
        {
            if (m_level == log_level::off)
            {
                return;
            }
            auto logger = library_logger();
            logger->log(to_spdlog(m_level), m_stream.str());
            if (m_level == log_level::critical)
            {
                logger->dump_backtrace();
            }
        }

        auto MessageLogger::stream() -> std::stringstream&
        {
            return m_stream;
        }
    }
}

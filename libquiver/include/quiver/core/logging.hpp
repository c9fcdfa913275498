// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef QUIVER_CORE_LOGGING_HPP
#define QUIVER_CORE_LOGGING_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   quiver::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(quiver::log_level::trace)
#define LOG_DEBUG       LOG(quiver::log_level::debug)
#define LOG_INFO        LOG(quiver::log_level::info)
#define LOG_WARNING     LOG(quiver::log_level::warn)
#define LOG_ERROR       LOG(quiver::log_level::err)
#define LOG_CRITICAL    LOG(quiver::log_level::critical)
// clang-format on

namespace quiver
{
    /** Severity of a log record, from the most verbose to ``off``. */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off,
    };

    /** Display name of the level, ``warning`` and ``error`` for ``warn`` and ``err``. */
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{
            "trace", "debug", "info", "warning", "error", "critical", "off",
        };
        return names[static_cast<std::size_t>(level)];
    }

    /** Case insensitive inverse of ``name_of``, also accepting ``warn`` and ``err``. */
    auto log_level_parse(std::string_view name) -> std::optional<log_level>;

    struct LoggingParams
    {
        log_level logging_level = log_level::warn;
        /** Records below the level kept in memory and dumped on critical errors, 0 to disable. */
        std::size_t log_backtrace = 0;
        /** spdlog formatting pattern. */
        std::string log_pattern = "%^%-9!l%-8n%$ %v";

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    namespace logging
    {
        /** All library records go to the spdlog logger of this name. */
        inline constexpr std::string_view logger_name = "libquiver";

        void set_logging_params(const LoggingParams& params);
        [[nodiscard]] auto get_logging_params() -> LoggingParams;

        /** Change the level only, returning the former one. */
        auto set_log_level(log_level new_level) -> log_level;
        [[nodiscard]] auto get_log_level() -> log_level;

        void log_backtrace();

        /**
         * Accumulates one record through ``stream()`` and sends it to the library logger
         * when destroyed.
         */
        class MessageLogger
        {
        public:

            explicit MessageLogger(log_level level);
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            auto operator=(const MessageLogger&) -> MessageLogger& = delete;

            auto stream() -> std::stringstream&;

        private:

            log_level m_level;
            std::stringstream m_stream;
        };
    }
}

#endif

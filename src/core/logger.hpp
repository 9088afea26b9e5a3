#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core pipeline + application loggers).

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jyotish::core
{
    /// @brief Logger setup, read from the `logging` block of the chart config.
    struct LogSettings
    {
        spdlog::level::level_enum core_level{spdlog::level::debug};
        spdlog::level::level_enum app_level{spdlog::level::trace};
        std::string               file{"jyotish.log"};  ///< Empty disables the rotating file
        bool                      console{true};
    };

    /// @brief Centralized logging facility for jyotish.
    ///
    /// Provides two separate loggers:
    /// - **JYOTISH** (core): chart pipeline internals, config loading
    /// - **APP**: demo executable, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// The core logger also keeps its recent warnings and errors as chart
    /// diagnostics (missing bodies, fallback ascendant, skipped table rows).
    /// Call init() once from main() before any logging. The accessors
    /// initialize on first use so library code driven from tests still logs.
    class Logger
    {
    public:
        /// @brief Initialize both loggers.
        /// Calling it again while the loggers are alive is a no-op.
        static void init(const LogSettings& settings = {});

        /// @brief Rebuild both loggers with new settings.
        /// Diagnostics collected so far are discarded.
        static void configure(const LogSettings& settings);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the pipeline logger ("JYOTISH").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

        /// @brief Most recent pipeline warnings and errors, oldest first.
        /// @param limit Return at most this many; 0 returns all retained.
        [[nodiscard]] static std::vector<std::string> diagnostics(std::size_t limit = 0);

        /// @brief Level from its spdlog name ("trace" .. "critical", "warn", "err", "off").
        [[nodiscard]] static std::optional<spdlog::level::level_enum> level_from_name(std::string_view name);

        static constexpr std::size_t kDiagnosticCapacity = 64;

    private:
        static void build(const LogSettings& settings);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
        static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> s_diagnostics;
    };

} // namespace jyotish::core

// -----------------------------------------------------------------
// Core pipeline log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define JYO_CORE_TRACE(...)    ::jyotish::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define JYO_CORE_DEBUG(...)    ::jyotish::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define JYO_CORE_INFO(...)     ::jyotish::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define JYO_CORE_WARN(...)     ::jyotish::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define JYO_CORE_ERROR(...)    ::jyotish::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define JYO_CORE_CRITICAL(...) ::jyotish::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define JYO_TRACE(...)         ::jyotish::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define JYO_INFO(...)          ::jyotish::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define JYO_WARN(...)          ::jyotish::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define JYO_ERROR(...)         ::jyotish::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define JYO_CRITICAL(...)      ::jyotish::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

/// @file logger.cpp
/// @brief Logger implementation: two spdlog loggers sharing console, rotating file and diagnostic sinks.

#include "core/logger.hpp"

#include "core/text.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace jyotish::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> Logger::s_diagnostics;

namespace
{
    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";
    constexpr const char* kCoreName = "JYOTISH";
    constexpr const char* kAppName = "APP";
}

void Logger::init(const LogSettings& settings)
{
    if (s_core_logger && s_app_logger)
    {
        return;
    }
    build(settings);
}

void Logger::configure(const LogSettings& settings)
{
    shutdown();
    build(settings);
}

void Logger::build(const LogSettings& settings)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> shared_sinks;

    if (settings.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kPattern);
        shared_sinks.push_back(console_sink);
    }

    if (!settings.file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        shared_sinks.push_back(file_sink);
    }

    // Pipeline warnings kept for the chart report, message text only
    s_diagnostics = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(kDiagnosticCapacity);
    s_diagnostics->set_pattern("%v");
    s_diagnostics->set_level(spdlog::level::warn);

    // -----------------------------------------------------------------
    // Core logger ("JYOTISH"): chart pipeline
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> core_sinks = shared_sinks;
    core_sinks.push_back(s_diagnostics);
    s_core_logger = std::make_shared<spdlog::logger>(kCoreName, core_sinks.begin(), core_sinks.end());
    s_core_logger->set_level(settings.core_level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): demo output
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>(kAppName, shared_sinks.begin(), shared_sinks.end());
    s_app_logger->set_level(settings.app_level);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    s_diagnostics.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    if (!s_core_logger)
    {
        init();
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    if (!s_app_logger)
    {
        init();
    }
    return s_app_logger;
}

std::vector<std::string> Logger::diagnostics(std::size_t limit)
{
    if (!s_diagnostics)
    {
        return {};
    }

    std::vector<std::string> messages = s_diagnostics->last_formatted(limit);
    for (std::string& message : messages)
    {
        message = std::string(trim(message));
    }
    return messages;
}

std::optional<spdlog::level::level_enum> Logger::level_from_name(std::string_view name)
{
    const std::string key = fold_identifier(name);

    // from_str maps every unrecognized name to off
    const spdlog::level::level_enum level = spdlog::level::from_str(key);
    if (level == spdlog::level::off && key != "off")
    {
        return std::nullopt;
    }
    return level;
}

} // namespace jyotish::core

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace FanoutBench
{

//
// Logging
//
//   All components log through one named spdlog logger. Structured events are rendered as
//   a single JSON object per line so they can be grepped or parsed after a run.
//

inline constexpr std::string_view kLoggerName = "fanoutbench";

namespace detail
{

inline auto loggerMutex() -> std::mutex&
{
    static std::mutex mutex;
    return mutex;
}

inline auto buildLogger(const std::string& logDir) -> std::shared_ptr<spdlog::logger>
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!logDir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        if (!ec)
        {
            const auto path = std::filesystem::path(logDir) / "fanoutbench.log";
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(std::string(kLoggerName), sinks.begin(), sinks.end());
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace detail

// Returns the shared logger, creating a stdout-only one on first use.
inline auto logger() -> std::shared_ptr<spdlog::logger>
{
    if (auto existing = spdlog::get(std::string(kLoggerName)))
    {
        return existing;
    }

    std::lock_guard<std::mutex> lock(detail::loggerMutex());
    if (auto existing = spdlog::get(std::string(kLoggerName)))
    {
        return existing;
    }

    auto created = detail::buildLogger({});
    spdlog::register_logger(created);
    return created;
}

// Replaces the shared logger. An empty logDir keeps output on stdout only.
inline void configureLogging(const std::string& level, const std::string& logDir)
{
    std::lock_guard<std::mutex> lock(detail::loggerMutex());

    spdlog::drop(std::string(kLoggerName));
    auto created = detail::buildLogger(logDir);
    created->set_level(spdlog::level::from_str(level));
    spdlog::register_logger(created);
}

inline void setLogLevel(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

//
// logEvent
//
//   Emits {"event": <event>, ...fields}. The body is only merged and dumped when the level is
//   enabled.
//
inline void logEvent(spdlog::level::level_enum level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object())
{
    auto log = logger();
    if (!log->should_log(level))
    {
        return;
    }

    nlohmann::json body = { { "event", std::string(event) } };
    if (fields.is_object())
    {
        body.update(fields);
    }
    log->log(level, "{}", body.dump());
}

} // namespace FanoutBench

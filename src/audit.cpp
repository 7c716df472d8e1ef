#include "sentinel/audit.hpp"
#include <spdlog/spdlog.h>
#include <ctime>

namespace sentinel
{

    std::string now_ts()
    {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    nlohmann::json AccessEvent::to_json() const
    {
        nlohmann::json j{{"ts", ts},
                         {"agent", agent},
                         {"service", service},
                         {"method", method},
                         {"path", path},
                         {"latency_ms", latency_ms}};
        if (status)
            j["status"] = *status;
        if (error)
            j["error"] = *error;
        return j;
    }

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    spdlog::logger &AuditLogger::sink()
    {
        if (logger_)
            return *logger_;
        return *spdlog::default_logger_raw();
    }

    void AuditLogger::log(const AccessEvent &event)
    {
        sink().info(event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void AuditLogger::log_denied(const std::string &agent, const std::string &service, const SentinelError &error)
    {
        nlohmann::json j{{"ts", now_ts()},
                         {"agent", agent},
                         {"service", service},
                         {"status", error.http_status()},
                         {"reason", error_code_to_string(error.code)}};
        sink().warn(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

} // namespace sentinel

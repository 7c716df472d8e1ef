#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace sentinel
{
    /**
     * One access-log record per upstream call. Carries metadata only: no
     * headers, bodies, tokens or credentials.
     */
    struct AccessEvent
    {
        std::string ts;
        std::string agent;
        std::string service;
        std::string method;
        std::string path;
        std::optional<unsigned> status;
        std::optional<std::string> error;
        std::int64_t latency_ms{0};

        nlohmann::json to_json() const;
    };

    /** UTC timestamp with millisecond precision, e.g. 2024-01-31T12:00:00.123Z */
    std::string now_ts();

    /** Writes access events and admission denials as JSON lines through spdlog. */
    class AuditLogger
    {
    public:
        /** Uses spdlog's default logger when none is given. */
        explicit AuditLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

        void log(const AccessEvent &event);

        /** Request refused before any upstream call was made. */
        void log_denied(const std::string &agent, const std::string &service, const SentinelError &error);

    private:
        spdlog::logger &sink();

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace sentinel

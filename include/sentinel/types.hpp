#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace sentinel
{

    /**
     * Error categories surfaced by the gateway. Each maps to one HTTP status
     * returned to the caller (see SentinelError::http_status).
     */
    enum class ErrorCode
    {
        ConfigError,
        AuthenticationError,
        AuthorizationError,
        NotFound,
        ValidationError,
        RateLimited,
        SecretMissing,
        UpstreamTimeout,
        UpstreamTransport,
        InternalError
    };

    /**
     * Convert ErrorCode to string representation
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::AuthenticationError:
            return "AuthenticationError";
        case ErrorCode::AuthorizationError:
            return "AuthorizationError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::RateLimited:
            return "RateLimited";
        case ErrorCode::SecretMissing:
            return "SecretMissing";
        case ErrorCode::UpstreamTimeout:
            return "UpstreamTimeout";
        case ErrorCode::UpstreamTransport:
            return "UpstreamTransport";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Sentinel error with code and message. Messages are shown to callers
     * verbatim and must never carry secret material.
     */
    class SentinelError : public std::runtime_error
    {
    public:
        ErrorCode code;

        SentinelError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        /** HTTP status returned to the caller for this error. */
        unsigned http_status() const;

        static SentinelError config(const std::string &msg)
        {
            return SentinelError(ErrorCode::ConfigError, msg);
        }

        static SentinelError authentication(const std::string &msg)
        {
            return SentinelError(ErrorCode::AuthenticationError, msg);
        }

        static SentinelError authorization(const std::string &msg)
        {
            return SentinelError(ErrorCode::AuthorizationError, msg);
        }

        static SentinelError not_found(const std::string &msg)
        {
            return SentinelError(ErrorCode::NotFound, msg);
        }

        static SentinelError validation(const std::string &msg)
        {
            return SentinelError(ErrorCode::ValidationError, msg);
        }

        static SentinelError rate_limited(const std::string &msg)
        {
            return SentinelError(ErrorCode::RateLimited, msg);
        }

        static SentinelError secret_missing(const std::string &msg)
        {
            return SentinelError(ErrorCode::SecretMissing, msg);
        }

        static SentinelError upstream_timeout(const std::string &msg)
        {
            return SentinelError(ErrorCode::UpstreamTimeout, msg);
        }

        static SentinelError upstream_transport(const std::string &msg)
        {
            return SentinelError(ErrorCode::UpstreamTransport, msg);
        }

        static SentinelError internal(const std::string &msg)
        {
            return SentinelError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, SentinelError>;

} // namespace sentinel

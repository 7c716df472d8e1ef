#include "sentinel/types.hpp"

namespace sentinel
{

    unsigned SentinelError::http_status() const
    {
        switch (code)
        {
        case ErrorCode::AuthenticationError:
            return 401;
        case ErrorCode::AuthorizationError:
            return 403;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::ValidationError:
            return 400;
        case ErrorCode::RateLimited:
            return 429;
        case ErrorCode::UpstreamTimeout:
            return 504;
        case ErrorCode::UpstreamTransport:
            return 502;
        case ErrorCode::ConfigError:
        case ErrorCode::SecretMissing:
        case ErrorCode::InternalError:
            return 500;
        }
        return 500;
    }

} // namespace sentinel

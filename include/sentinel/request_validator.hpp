#pragma once

#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sentinel
{

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /**
     * The call an agent asks the gateway to make, taken from the JSON body of
     * POST /v1/proxy/{service}. The method is upper-cased; the body is already
     * serialized and is absent for GET/HEAD.
     */
    struct ProxyRequest
    {
        std::string method;
        std::string path;
        HeaderList headers;
        std::optional<std::string> body;
    };

    /** Parse the raw caller body; malformed JSON or a non-object is a ValidationError. */
    Result<nlohmann::json> parse_proxy_body(std::string_view raw);

    /**
     * Check method and path against the service's declared policy and build
     * the normalized ProxyRequest. No side effects.
     */
    Result<ProxyRequest> validate_request(const ServiceDefinition &service, const nlohmann::json &body);

    /** True if text starts with "scheme://" or "//". */
    bool is_absolute_reference(std::string_view text);

    /** True if any path segment is "." or ".." (percent-encoded dots included). */
    bool has_dot_segment(std::string_view path);

    /** RFC 7230 token: non-empty, tchar only. Used for methods and header names. */
    bool is_http_token(std::string_view text);

    /** True if text contains SP, DEL or any control character. */
    bool has_control_or_space(std::string_view text);

    bool is_safe_header_value(std::string_view value);

    std::string to_upper(std::string_view text);

} // namespace sentinel

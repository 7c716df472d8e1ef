#include "sentinel/request_validator.hpp"
#include <algorithm>
#include <cctype>

namespace sentinel
{

    namespace
    {
        std::string join(const std::vector<std::string> &items)
        {
            std::string out;
            for (const auto &item : items)
            {
                if (!out.empty())
                    out += ", ";
                out += item;
            }
            return out;
        }

        std::string to_lower(std::string_view text)
        {
            std::string out(text);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool is_dot_segment(std::string_view segment)
        {
            auto lowered = to_lower(segment);
            return lowered == "." || lowered == ".." || lowered == "%2e" || lowered == "%2e%2e" ||
                   lowered == ".%2e" || lowered == "%2e.";
        }

        bool is_tchar(unsigned char c)
        {
            return std::isalnum(c) || std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string_view::npos;
        }
    } // namespace

    std::string to_upper(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    bool is_absolute_reference(std::string_view text)
    {
        if (text.starts_with("//"))
            return true;

        auto sep = text.find("://");
        if (sep == std::string_view::npos || sep == 0)
            return false;
        if (!std::isalpha(static_cast<unsigned char>(text[0])))
            return false;
        return std::all_of(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(sep), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        });
    }

    bool is_http_token(std::string_view text)
    {
        return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return is_tchar(c); });
    }

    bool has_control_or_space(std::string_view text)
    {
        return std::any_of(text.begin(), text.end(), [](unsigned char c) { return c <= 0x20 || c == 0x7f; });
    }

    bool is_safe_header_value(std::string_view value)
    {
        return value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
    }

    bool has_dot_segment(std::string_view path)
    {
        std::size_t start = 0;
        while (start <= path.size())
        {
            auto slash = path.find('/', start);
            auto segment = path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
            if (is_dot_segment(segment))
                return true;
            if (slash == std::string_view::npos)
                break;
            start = slash + 1;
        }
        return false;
    }

    Result<nlohmann::json> parse_proxy_body(std::string_view raw)
    {
        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (parsed.is_discarded())
        {
            return std::unexpected(SentinelError::validation("Invalid JSON body"));
        }
        if (!parsed.is_object())
        {
            return std::unexpected(SentinelError::validation("Request body must be a JSON object"));
        }
        return parsed;
    }

    Result<ProxyRequest> validate_request(const ServiceDefinition &service, const nlohmann::json &body)
    {
        ProxyRequest req;

        auto method_it = body.find("method");
        if (method_it == body.end() || !method_it->is_string() || method_it->get_ref<const std::string &>().empty())
        {
            return std::unexpected(SentinelError::validation("Missing or invalid 'method'"));
        }
        req.method = to_upper(method_it->get_ref<const std::string &>());
        if (!is_http_token(req.method))
        {
            return std::unexpected(SentinelError::validation("Method must be an HTTP token"));
        }

        if (service.allowed_methods)
        {
            std::vector<std::string> allowed;
            for (const auto &m : *service.allowed_methods)
                allowed.push_back(to_upper(m));
            if (std::find(allowed.begin(), allowed.end(), req.method) == allowed.end())
            {
                return std::unexpected(SentinelError::validation(
                    "Method \"" + req.method + "\" not allowed. Allowed: " + join(allowed)));
            }
        }

        auto path_it = body.find("path");
        if (path_it == body.end() || !path_it->is_string() || path_it->get_ref<const std::string &>().empty())
        {
            return std::unexpected(SentinelError::validation("Missing or invalid 'path'"));
        }
        req.path = path_it->get<std::string>();

        if (is_absolute_reference(req.path))
        {
            return std::unexpected(SentinelError::validation("Path must be a relative path, not a full URL"));
        }
        if (!req.path.starts_with("/"))
        {
            return std::unexpected(SentinelError::validation("Path must start with '/'"));
        }

        if (has_control_or_space(req.path))
        {
            return std::unexpected(SentinelError::validation("Path must not contain spaces or control characters"));
        }

        auto path_only = req.path.substr(0, req.path.find('?'));
        if (has_dot_segment(path_only))
        {
            return std::unexpected(SentinelError::validation("Path must not contain '.' or '..' segments"));
        }

        if (service.allowed_path_prefixes)
        {
            const auto &prefixes = *service.allowed_path_prefixes;
            bool ok = std::any_of(prefixes.begin(), prefixes.end(),
                                  [&](const std::string &prefix) { return path_only.starts_with(prefix); });
            if (!ok)
            {
                return std::unexpected(SentinelError::validation(
                    "Path \"" + path_only + "\" not allowed. Allowed prefixes: " + join(prefixes)));
            }
        }

        if (auto headers = body.find("headers"); headers != body.end() && headers->is_object())
        {
            for (const auto &item : headers->items())
            {
                if (!item.value().is_string())
                    continue;
                if (!is_http_token(item.key()))
                {
                    return std::unexpected(SentinelError::validation("Header names must be HTTP tokens"));
                }
                const auto &value = item.value().get_ref<const std::string &>();
                if (!is_safe_header_value(value))
                {
                    return std::unexpected(SentinelError::validation(
                        "Header \"" + item.key() + "\" must not contain CR, LF or NUL"));
                }
                req.headers.emplace_back(item.key(), value);
            }
        }

        if (auto payload = body.find("body"); payload != body.end() && req.method != "GET" && req.method != "HEAD")
        {
            req.body = payload->is_string() ? payload->get<std::string>() : payload->dump();
        }

        return req;
    }

} // namespace sentinel

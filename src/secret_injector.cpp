#include "sentinel/secret_injector.hpp"
#include <cstdlib>
#include <type_traits>

namespace sentinel
{

    std::optional<std::string> EnvironmentSecretSource::lookup(const std::string &name) const
    {
        const char *value = std::getenv(name.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    }

    std::optional<std::string> StaticSecretSource::lookup(const std::string &name) const
    {
        auto it = values_.find(name);
        if (it == values_.end())
            return std::nullopt;
        return it->second;
    }

    std::string substitute_once(const std::string &text, std::string_view placeholder, const std::string &value)
    {
        auto pos = text.find(placeholder);
        if (pos == std::string::npos)
            return text;
        std::string out = text;
        out.replace(pos, placeholder.size(), value);
        return out;
    }

    Result<std::string> SecretInjector::render(const ServiceDefinition &service) const
    {
        auto raw = source_.lookup(service.secret_env);
        if (!raw || raw->empty())
        {
            return std::unexpected(SentinelError::secret_missing(
                "Server misconfigured: env var \"" + service.secret_env + "\" is not set"));
        }

        const auto &template_text = std::visit([](const auto &auth) -> const std::string & { return auth.template_text; }, service.auth);
        return substitute_once(template_text, kSecretPlaceholder, *raw);
    }

    void SecretInjector::inject(const AuthInjection &auth, const std::string &rendered, UpstreamRequest &request)
    {
        std::visit(
            [&](const auto &rule) {
                using T = std::decay_t<decltype(rule)>;
                if constexpr (std::is_same_v<T, HeaderAuth>)
                    set_header(request.headers, rule.header_name, rendered);
                else
                    request.url.set_query_param(rule.query_param, rendered);
            },
            auth);
    }

} // namespace sentinel

#pragma once

#include "config.hpp"
#include "types.hpp"
#include "upstream.hpp"
#include <map>
#include <optional>
#include <string>

namespace sentinel
{

    /** Where real upstream credentials come from. */
    class SecretSource
    {
    public:
        virtual ~SecretSource() = default;
        virtual std::optional<std::string> lookup(const std::string &name) const = 0;
    };

    /** Reads credentials from the process environment. */
    class EnvironmentSecretSource : public SecretSource
    {
    public:
        std::optional<std::string> lookup(const std::string &name) const override;
    };

    /** Fixed name/value table; used by tests and embedding code. */
    class StaticSecretSource : public SecretSource
    {
    public:
        explicit StaticSecretSource(std::map<std::string, std::string> values) : values_(std::move(values)) {}
        std::optional<std::string> lookup(const std::string &name) const override;

    private:
        std::map<std::string, std::string> values_;
    };

    /**
     * Resolves a service's credential and writes it into an outgoing request.
     * The rendered value is never logged or echoed in error messages.
     */
    class SecretInjector
    {
    public:
        explicit SecretInjector(const SecretSource &source) : source_(source) {}

        /**
         * Substitute the credential for the single ${SECRET} placeholder in
         * the service template. A missing or empty value is SecretMissing,
         * naming only the variable.
         */
        Result<std::string> render(const ServiceDefinition &service) const;

        /**
         * Header mode overwrites any same-named caller header (case-insensitive);
         * query mode sets the named parameter on the target URL.
         */
        static void inject(const AuthInjection &auth, const std::string &rendered, UpstreamRequest &request);

    private:
        const SecretSource &source_;
    };

    /** Replace the first occurrence of placeholder in text with value. */
    std::string substitute_once(const std::string &text, std::string_view placeholder, const std::string &value);

} // namespace sentinel

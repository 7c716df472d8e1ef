#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace sentinel
{

    /**
     * Absolute http(s) URL split into the pieces the upstream transport needs.
     * Only registered host names and IPv4 literals are supported as hosts.
     */
    struct Url
    {
        std::string scheme; // lower-case "http" or "https"
        std::string host;   // lower-case
        std::string port;   // empty when the scheme default applies
        std::string path{"/"};
        std::string query; // without the leading '?'

        static Result<Url> parse(std::string_view text);

        bool is_https() const { return scheme == "https"; }
        std::string port_or_default() const;

        /** Value for the Host header (host plus explicit non-default port). */
        std::string host_header() const;

        /** Request target: path plus "?query" when present. */
        std::string target() const;

        std::string to_string() const;

        /**
         * Resolve an absolute-path reference ("/a/b?c=d") against this URL.
         * The authority is kept; the reference's path and query replace ours
         * and any fragment is dropped.
         */
        Url resolve(std::string_view reference) const;

        /** Replace every occurrence of name in the query with name=value. */
        void set_query_param(std::string_view name, std::string_view value);
    };

    /** Percent-encode everything outside the RFC 3986 unreserved set. */
    std::string percent_encode(std::string_view text);

} // namespace sentinel

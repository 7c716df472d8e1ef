#include "sentinel/url.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace sentinel
{

    namespace
    {
        std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool is_unreserved(unsigned char c)
        {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }
    } // namespace

    Result<Url> Url::parse(std::string_view text)
    {
        static const std::regex url_regex(
            R"(^([A-Za-z]+)://([^:/?#\s@]+)(?::(\d{1,5}))?(/[^?#\s]*)?(?:\?([^#\s]*))?(?:#\S*)?$)");

        std::string input(text);
        std::smatch match;
        if (!std::regex_match(input, match, url_regex))
        {
            return std::unexpected(SentinelError::validation("Invalid URL: " + input));
        }

        Url url;
        url.scheme = to_lower(match[1].str());
        if (url.scheme != "http" && url.scheme != "https")
        {
            return std::unexpected(SentinelError::validation("Unsupported URL scheme: " + url.scheme));
        }
        url.host = to_lower(match[2].str());
        url.port = match[3].str();
        if (!url.port.empty() && std::stoul(url.port) > 65535)
        {
            return std::unexpected(SentinelError::validation("Invalid URL port: " + url.port));
        }
        url.path = match[4].str().empty() ? "/" : match[4].str();
        url.query = match[5].str();
        return url;
    }

    std::string Url::port_or_default() const
    {
        if (!port.empty())
            return port;
        return is_https() ? "443" : "80";
    }

    std::string Url::host_header() const
    {
        if (port.empty() || port == (is_https() ? "443" : "80"))
            return host;
        return host + ":" + port;
    }

    std::string Url::target() const
    {
        if (query.empty())
            return path;
        return path + "?" + query;
    }

    std::string Url::to_string() const
    {
        std::string out = scheme + "://" + host;
        if (!port.empty())
            out += ":" + port;
        return out + target();
    }

    Url Url::resolve(std::string_view reference) const
    {
        Url out = *this;

        auto hash = reference.find('#');
        if (hash != std::string_view::npos)
            reference = reference.substr(0, hash);

        auto question = reference.find('?');
        if (question == std::string_view::npos)
        {
            out.path = std::string(reference);
            out.query.clear();
        }
        else
        {
            out.path = std::string(reference.substr(0, question));
            out.query = std::string(reference.substr(question + 1));
        }
        if (out.path.empty())
            out.path = "/";
        return out;
    }

    void Url::set_query_param(std::string_view name, std::string_view value)
    {
        auto encoded_name = percent_encode(name);
        std::string rebuilt;

        std::size_t start = 0;
        while (start <= query.size() && !query.empty())
        {
            auto amp = query.find('&', start);
            auto pair = std::string_view(query).substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            auto key = pair.substr(0, pair.find('='));
            if (!pair.empty() && key != encoded_name)
            {
                if (!rebuilt.empty())
                    rebuilt += '&';
                rebuilt += pair;
            }
            if (amp == std::string::npos)
                break;
            start = amp + 1;
        }

        if (!rebuilt.empty())
            rebuilt += '&';
        rebuilt += encoded_name + "=" + percent_encode(value);
        query = std::move(rebuilt);
    }

    std::string percent_encode(std::string_view text)
    {
        static constexpr char kHex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(text.size());
        for (unsigned char c : text)
        {
            if (is_unreserved(c))
            {
                out += static_cast<char>(c);
            }
            else
            {
                out += '%';
                out += kHex[c >> 4];
                out += kHex[c & 0x0F];
            }
        }
        return out;
    }

} // namespace sentinel

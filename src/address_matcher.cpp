#include "sentinel/address_matcher.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <algorithm>
#include <charconv>
#include <cctype>

namespace net = boost::asio;

namespace sentinel
{

    namespace
    {
        constexpr std::string_view kMappedPrefix = "::ffff:";

        unsigned bit_width(const IpAddress &addr)
        {
            return std::holds_alternative<IPv4Bytes>(addr) ? 32u : 128u;
        }
    } // namespace

    std::optional<IPv4Bytes> parse_ipv4(std::string_view text)
    {
        boost::system::error_code ec;
        auto addr = net::ip::make_address_v4(std::string(text), ec);
        if (ec)
            return std::nullopt;
        auto bytes = addr.to_bytes();
        IPv4Bytes out{};
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    std::optional<IPv6Bytes> parse_ipv6(std::string_view text)
    {
        // Zone ids ("fe80::1%eth0") never appear in allowlists or peer text.
        if (text.find('%') != std::string_view::npos)
            return std::nullopt;

        boost::system::error_code ec;
        auto addr = net::ip::make_address_v6(std::string(text), ec);
        if (ec)
            return std::nullopt;
        auto bytes = addr.to_bytes();
        IPv6Bytes out{};
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }

    std::optional<std::array<std::uint16_t, 8>> expand_ipv6(std::string_view text)
    {
        auto bytes = parse_ipv6(text);
        if (!bytes)
            return std::nullopt;

        std::array<std::uint16_t, 8> groups{};
        for (std::size_t i = 0; i < 8; ++i)
            groups[i] = static_cast<std::uint16_t>(((*bytes)[2 * i] << 8) | (*bytes)[2 * i + 1]);
        return groups;
    }

    std::optional<IpAddress> parse_ip(std::string_view text)
    {
        if (text.find(':') != std::string_view::npos)
        {
            if (auto v6 = parse_ipv6(text))
                return IpAddress{*v6};
            return std::nullopt;
        }
        if (auto v4 = parse_ipv4(text))
            return IpAddress{*v4};
        return std::nullopt;
    }

    std::string normalize_client_address(std::string_view address)
    {
        if (address.size() > kMappedPrefix.size())
        {
            std::string head(address.substr(0, kMappedPrefix.size()));
            for (auto &c : head)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            auto tail = address.substr(kMappedPrefix.size());
            if (head == kMappedPrefix && parse_ipv4(tail))
                return std::string(tail);
        }
        return std::string(address);
    }

    std::optional<AllowEntry> parse_allow_entry(std::string_view entry)
    {
        auto slash = entry.find('/');
        if (slash == std::string_view::npos)
            return AllowEntry{ExactAddress{std::string(entry)}};

        auto base = parse_ip(entry.substr(0, slash));
        if (!base)
            return std::nullopt;

        auto len_text = entry.substr(slash + 1);
        if (len_text.empty() || len_text.size() > 3)
            return std::nullopt;
        unsigned prefix_len = 0;
        auto [ptr, ec] = std::from_chars(len_text.data(), len_text.data() + len_text.size(), prefix_len);
        if (ec != std::errc{} || ptr != len_text.data() + len_text.size())
            return std::nullopt;
        if (prefix_len > bit_width(*base))
            return std::nullopt;

        return AllowEntry{CidrBlock{*base, prefix_len}};
    }

    bool prefix_equal(const std::uint8_t *a, const std::uint8_t *b, unsigned prefix_len)
    {
        unsigned full_bytes = prefix_len / 8;
        unsigned remaining_bits = prefix_len % 8;

        for (unsigned i = 0; i < full_bytes; ++i)
        {
            if (a[i] != b[i])
                return false;
        }

        if (remaining_bits != 0)
        {
            auto mask = static_cast<std::uint8_t>(0xFF << (8 - remaining_bits));
            if ((a[full_bytes] & mask) != (b[full_bytes] & mask))
                return false;
        }
        return true;
    }

    bool matches(std::string_view client_address, const AllowEntry &entry)
    {
        if (const auto *exact = std::get_if<ExactAddress>(&entry))
            return client_address == exact->text;

        const auto &block = std::get<CidrBlock>(entry);
        auto client = parse_ip(client_address);
        if (!client || client->index() != block.base.index())
            return false;

        if (const auto *v4 = std::get_if<IPv4Bytes>(&*client))
            return prefix_equal(v4->data(), std::get<IPv4Bytes>(block.base).data(), block.prefix_len);
        return prefix_equal(std::get<IPv6Bytes>(*client).data(), std::get<IPv6Bytes>(block.base).data(), block.prefix_len);
    }

    bool matches(std::string_view client_address, std::string_view entry)
    {
        auto parsed = parse_allow_entry(entry);
        if (!parsed)
            return false;
        return matches(client_address, *parsed);
    }

    bool matches_any(std::string_view client_address, const std::vector<std::string> &entries)
    {
        for (const auto &entry : entries)
        {
            if (matches(client_address, std::string_view(entry)))
                return true;
        }
        return false;
    }

} // namespace sentinel

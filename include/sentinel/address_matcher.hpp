#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sentinel
{

    using IPv4Bytes = std::array<std::uint8_t, 4>;
    using IPv6Bytes = std::array<std::uint8_t, 16>;

    /** A parsed address of either family. */
    using IpAddress = std::variant<IPv4Bytes, IPv6Bytes>;

    struct ExactAddress
    {
        std::string text;
    };

    struct CidrBlock
    {
        IpAddress base;
        unsigned prefix_len{0};
    };

    /** Allowlist entry: an exact address string or a CIDR block. */
    using AllowEntry = std::variant<ExactAddress, CidrBlock>;

    /** Parse dotted-quad IPv4 text through Asio. */
    std::optional<IPv4Bytes> parse_ipv4(std::string_view text);

    /** Parse IPv6 text into network-order bytes through Asio. Zone ids are rejected. */
    std::optional<IPv6Bytes> parse_ipv6(std::string_view text);

    /**
     * Expand IPv6 text (with optional "::" shorthand and optional trailing
     * dotted-quad) into eight 16-bit groups.
     */
    std::optional<std::array<std::uint16_t, 8>> expand_ipv6(std::string_view text);

    /** Parse an address of either family. */
    std::optional<IpAddress> parse_ip(std::string_view text);

    /**
     * Strip the "::ffff:" prefix from IPv4-mapped IPv6 text so the address is
     * matched as IPv4. Other input is returned unchanged.
     */
    std::string normalize_client_address(std::string_view address);

    /**
     * Parse an allowlist entry. Text without '/' is an exact entry; CIDR text
     * yields nullopt when the base does not parse or the prefix length exceeds
     * the family's bit width.
     */
    std::optional<AllowEntry> parse_allow_entry(std::string_view entry);

    /**
     * True if the top prefix_len bits of both byte ranges are equal.
     * Whole bytes are compared exactly, a trailing partial byte through
     * the mask 0xFF << (8 - remaining bits).
     */
    bool prefix_equal(const std::uint8_t *a, const std::uint8_t *b, unsigned prefix_len);

    bool matches(std::string_view client_address, const AllowEntry &entry);

    /**
     * Does client_address fall inside entry? Exact entries compare textually;
     * CIDR entries fail closed on parse errors, family mismatch or a prefix
     * longer than the family's bit width.
     */
    bool matches(std::string_view client_address, std::string_view entry);

    /** True if client_address matches at least one entry. */
    bool matches_any(std::string_view client_address, const std::vector<std::string> &entries);

} // namespace sentinel

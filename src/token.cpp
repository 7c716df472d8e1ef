#include "sentinel/token.hpp"
#include "sentinel/config.hpp"
#include <sodium.h>
#include <array>

namespace sentinel::token
{

    namespace
    {
        Result<void> ensure_sodium()
        {
            if (sodium_init() < 0)
            {
                return std::unexpected(SentinelError::internal("Failed to initialize libsodium"));
            }
            return {};
        }
    } // namespace

    Result<std::string> generate()
    {
        if (auto ready = ensure_sodium(); !ready)
            return std::unexpected(ready.error());

        std::array<unsigned char, kRandomBytes> bytes{};
        randombytes_buf(bytes.data(), bytes.size());

        std::array<char, kRandomBytes * 2 + 1> hex{};
        sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
        sodium_memzero(bytes.data(), bytes.size());

        return std::string(kAgentTokenPrefix) + std::string(hex.data(), kRandomBytes * 2);
    }

    bool is_valid_format(std::string_view token)
    {
        if (!token.starts_with(kAgentTokenPrefix))
            return false;
        auto tail = token.substr(kAgentTokenPrefix.size());
        if (tail.size() != kRandomBytes * 2)
            return false;
        for (char c : tail)
        {
            bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex)
                return false;
        }
        return true;
    }

    bool constant_time_equals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        if (a.empty())
            return true;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

} // namespace sentinel::token

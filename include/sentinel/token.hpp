#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace sentinel::token
{

    /** Number of random bytes behind an agent token (hex-encoded after "agt_"). */
    inline constexpr std::size_t kRandomBytes = 24;

    /**
     * Generate a new agent token: "agt_" followed by 48 lower-case hex chars
     * drawn from libsodium's CSPRNG.
     */
    Result<std::string> generate();

    /** True if token is exactly "agt_" + 48 lower-case hex characters. */
    bool is_valid_format(std::string_view token);

    /** Compare two tokens without early exit on the first differing byte. */
    bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace sentinel::token

#include "sentinel/upstream.hpp"
#include <algorithm>
#include <cctype>

namespace sentinel
{

    bool iequals(std::string_view a, std::string_view b)
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    void set_header(HeaderList &headers, const std::string &name, const std::string &value)
    {
        std::erase_if(headers, [&](const auto &h) { return iequals(h.first, name); });
        headers.emplace_back(name, value);
    }

} // namespace sentinel

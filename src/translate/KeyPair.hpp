#pragma once

#include <cstdint>
#include <string>

namespace translate
{

// Server-issued secret embedded in the host page as key:'<a>.<b>'.
// 'a' seeds the accumulator, 'b' is the final XOR mask (coarse hour bucket).
struct KeyPair
{
    std::int64_t a = 0;
    std::int64_t b = 0;

    std::string toString() const { return std::to_string(a) + "." + std::to_string(b); }

    bool operator==(const KeyPair& other) const { return a == other.a && b == other.b; }
    bool operator!=(const KeyPair& other) const { return !(*this == other); }
};

} // namespace translate

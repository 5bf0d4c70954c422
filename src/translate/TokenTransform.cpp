#include "TokenTransform.hpp"

#include <utf8proc.h>

namespace translate
{
namespace token
{

namespace
{

constexpr utf8proc_int32_t kReplacementChar = 0xFFFD;

inline std::uint32_t low32(std::int64_t v)
{
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(v) & 0xFFFFFFFFu);
}

inline unsigned magnitudeOf(char c)
{
    if (c >= 'a' && c <= 'z')
        return static_cast<unsigned>(c - 87);
    return static_cast<unsigned>(c - '0');
}

} // namespace

std::vector<std::uint16_t> toCodeUnits(const std::string& utf8_text)
{
    std::vector<std::uint16_t> units;
    units.reserve(utf8_text.size());

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_text.data());
    const auto len = static_cast<utf8proc_ssize_t>(utf8_text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            codepoint = kReplacementChar;
            bytes = 1;
        }
        pos += bytes;

        const auto v = static_cast<std::uint32_t>(codepoint);
        if (v <= 0xFFFF)
        {
            units.push_back(static_cast<std::uint16_t>(v));
        }
        else
        {
            units.push_back(static_cast<std::uint16_t>(((v - 0x10000) >> 10) + 0xD800));
            units.push_back(static_cast<std::uint16_t>((v % 0x400) + 0xDC00));
        }
    }
    return units;
}

std::uint32_t mix(std::uint32_t acc, const char* program)
{
    if (!program)
        return acc;

    for (const char* op = program; op[0] && op[1] && op[2]; op += 3)
    {
        const unsigned magnitude = magnitudeOf(op[2]) & 31u;
        const std::uint32_t shifted = op[1] == '+' ? acc >> magnitude : acc << magnitude;
        acc = op[0] == '+' ? acc + shifted : acc ^ shifted;
    }
    return acc;
}

std::string deriveTokenFromUnits(const std::vector<std::uint16_t>& code_units, const KeyPair& pair)
{
    const std::uint32_t seed = low32(pair.a);

    std::uint32_t acc = seed;
    for (std::uint16_t unit : code_units)
    {
        acc += unit;
        acc = mix(acc, kLoopProgram);
    }
    acc = mix(acc, kFinalProgram);
    acc ^= low32(pair.b);

    // The front-end remaps a negative int32 into [2^31, 2^32); the unsigned word already is that value
    acc %= kTokenModulus;

    return std::to_string(acc) + "." + std::to_string(acc ^ seed);
}

std::string deriveToken(const std::string& utf8_text, const KeyPair& pair)
{
    return deriveTokenFromUnits(toCodeUnits(utf8_text), pair);
}

} // namespace token
} // namespace translate

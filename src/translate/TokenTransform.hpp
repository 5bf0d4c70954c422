#pragma once

#include "KeyPair.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace translate
{
namespace token
{

// Micro-op programs run by the front-end script inside and after the accumulation loop
inline constexpr const char* kLoopProgram = "+-a^+6";
inline constexpr const char* kFinalProgram = "+-3^+b+-f";

inline constexpr std::uint32_t kTokenModulus = 1000000;

/// Expand UTF-8 text into UTF-16 code units. Malformed bytes decode to U+FFFD one byte at a time.
std::vector<std::uint16_t> toCodeUnits(const std::string& utf8_text);

/// Run a mix program over the accumulator in (combine, shift-direction, magnitude) triples.
/// '+' combine adds, anything else XORs; '+' direction is a logical right shift, anything else
/// a left shift. All arithmetic wraps at 32 bits.
std::uint32_t mix(std::uint32_t acc, const char* program);

/// Token for an already expanded code unit sequence
std::string deriveTokenFromUnits(const std::vector<std::uint16_t>& code_units, const KeyPair& pair);

/// Token for UTF-8 text: "<n>.<n ^ a>" with n in [0, 1000000). Pure and thread-safe.
std::string deriveToken(const std::string& utf8_text, const KeyPair& pair);

} // namespace token
} // namespace translate

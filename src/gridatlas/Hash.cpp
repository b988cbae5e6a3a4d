#include "gridatlas/Hash.hpp"

namespace gridatlas {

namespace {

constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

} // namespace

std::uint64_t HashBytes(std::string_view bytes, std::uint64_t seed)
{
  std::uint64_t h = seed;
  for (char c : bytes) HashByte(h, static_cast<std::uint8_t>(c));
  return h;
}

std::uint64_t HashCombine(std::uint64_t h, std::uint64_t v)
{
  // Little-endian byte order keeps the result platform independent.
  for (int i = 0; i < 8; ++i) HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFull));
  return h;
}

} // namespace gridatlas

#pragma once

#include <cstdint>
#include <string_view>

namespace gridatlas {

// Stable 64-bit FNV-1a over output bytes. Used to compare repeated exports:
// identical inputs and configuration produce identical hashes.
//
// NOTE: the hash is a diagnostic, not part of any file format.

constexpr std::uint64_t kFNVOffset = 14695981039346656037ull;

std::uint64_t HashBytes(std::string_view bytes, std::uint64_t seed = kFNVOffset);

// Chain several documents: HashCombine(h, HashBytes(doc)).
std::uint64_t HashCombine(std::uint64_t h, std::uint64_t v);

} // namespace gridatlas

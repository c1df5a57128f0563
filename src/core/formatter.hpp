#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/error.hpp"

namespace sid::core {

inline constexpr std::size_t kIdBytes = 16;
inline constexpr std::size_t kTextLength = 36;

using IdBytes = std::array<std::uint8_t, kIdBytes>;

/// Lowercase 8-4-4-4-12 hex grouping of bytes [0:4]-[4:6]-[6:8]-[8:10]-[10:16].
auto to_text(const IdBytes& bytes) -> std::string;

/// True when `text` is exactly 36 chars of lowercase hex with hyphens at 8, 13, 18 and 23.
auto is_canonical(std::string_view text) -> bool;

/// Grammar check plus hex decode. No scope resolution.
auto from_text(std::string_view text) -> Expected<IdBytes>;

}  // namespace sid::core

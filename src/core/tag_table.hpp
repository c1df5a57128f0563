#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace sid::core {

inline constexpr std::size_t kScopeSlots = 64;

/// Bits of byte 0 reserved for the scope tag. The remaining two bits are entropy.
inline constexpr std::uint8_t kTagMask = 0xFC;
inline constexpr std::uint8_t kJitterMask = 0x03;

using Tag = std::uint8_t;

/// Tag bound to registry slot `i` is `i << 2`: 0x00, 0x04, ... 0xFC.
inline constexpr auto kTagTable = [] {
  std::array<Tag, kScopeSlots> tags{};
  for (std::size_t i = 0; i < kScopeSlots; ++i) {
    tags[i] = static_cast<Tag>(i << 2);
  }
  return tags;
}();

constexpr auto slot_of(Tag tag) -> std::size_t {
  return static_cast<std::size_t>(tag >> 2);
}

constexpr auto is_tag(std::uint8_t value) -> bool {
  return (value & kJitterMask) == 0;
}

static_assert(kTagTable.front() == 0x00);
static_assert(kTagTable[4] == 0x10);
static_assert(kTagTable.back() == 0xFC);

}  // namespace sid::core

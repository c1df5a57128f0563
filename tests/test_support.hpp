#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <span>
#include <string>

#include "core/entropy.hpp"
#include "core/registry.hpp"

namespace sid::test {

/// "one".."eight" followed by "scope_8".."scope_63".
inline auto full_scope_names() -> core::ScopeNames {
  core::ScopeNames names;
  const std::array<const char*, 8> first{"one", "two", "three", "four",
                                         "five", "six", "seven", "eight"};
  for (std::size_t i = 0; i < names.size(); ++i) {
    names[i] = i < first.size() ? std::string(first[i]) : std::format("scope_{}", i);
  }
  return names;
}

/// Only the first eight slots bound; the rest are left empty.
inline auto partial_scope_names() -> core::ScopeNames {
  auto names = full_scope_names();
  for (std::size_t i = 8; i < names.size(); ++i) {
    names[i].clear();
  }
  return names;
}

/// Deterministic RandomFill that writes `value` into every byte.
inline auto constant_fill(std::uint8_t value) -> core::RandomFill {
  return [value](std::span<std::uint8_t> out) -> core::Expected<void> {
    for (auto& b : out) {
      b = value;
    }
    return {};
  };
}

}  // namespace sid::test

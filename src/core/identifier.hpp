#pragma once

#include <cstddef>
#include <format>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "core/formatter.hpp"

namespace sid::core {

class Encoder;
class Decoder;

/// 128-bit random identifier whose first byte carries its scope tag.
///
/// A default-constructed Identifier is empty. Every accessor is safe on an
/// empty value and returns the zero equivalent ("" or all-zero bytes).
/// Only Encoder and Decoder produce non-empty identifiers.
class Identifier {
 public:
  Identifier() = default;

  auto empty() const -> bool { return !state_.has_value(); }

  auto scope() const -> std::string;
  auto bytes() const -> IdBytes;

  /// Canonical text, derived from the binary form on every call.
  auto hex() const -> std::string;

  /// True iff the scope equals one of `candidates`. Always false when empty.
  auto scope_matches(std::span<const std::string> candidates) const -> bool;
  auto scope_matches(std::initializer_list<std::string_view> candidates) const -> bool;

  auto operator==(const Identifier& other) const -> bool = default;

 private:
  friend class Encoder;
  friend class Decoder;

  struct State {
    std::string scope;
    IdBytes bytes{};

    auto operator==(const State&) const -> bool = default;
  };

  Identifier(std::string scope, const IdBytes& bytes);

  std::optional<State> state_;
};

}  // namespace sid::core

template <>
struct std::hash<sid::core::Identifier> {
  auto operator()(const sid::core::Identifier& id) const -> std::size_t {
    const auto bytes = id.bytes();
    std::size_t h = 0;
    for (auto b : bytes) {
      h = h * 31 + b;
    }
    return h ^ (std::hash<std::string>{}(id.scope()) << 1);
  }
};

template <>
struct std::formatter<sid::core::Identifier> : std::formatter<std::string> {
  auto format(const sid::core::Identifier& id, std::format_context& ctx) const {
    return formatter<std::string>::format(id.hex(), ctx);
  }
};

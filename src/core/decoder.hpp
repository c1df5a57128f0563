#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "core/error.hpp"
#include "core/identifier.hpp"
#include "core/registry.hpp"

namespace sid::core {

/// Rebuilds identifiers from canonical text or raw bytes and recovers their scope
/// from the tag bits. The registry must outlive the decoder.
class Decoder {
 public:
  explicit Decoder(const ScopeRegistry& registry);

  /// Errors: BadString, MissingScope, BadScope.
  auto parse_text(std::string_view text) const -> Expected<Identifier>;
  /// Errors: MissingScope, BadScope.
  auto parse_binary(const IdBytes& bytes) const -> Expected<Identifier>;
  /// As above; any size other than 16 is MalformedStorageValue.
  auto parse_binary(std::span<const std::uint8_t> bytes) const -> Expected<Identifier>;

 private:
  auto resolve(const IdBytes& bytes) const -> Expected<Identifier>;

  const ScopeRegistry* registry_;
};

}  // namespace sid::core

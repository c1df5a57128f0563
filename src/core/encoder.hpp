#pragma once

#include <string_view>

#include "core/entropy.hpp"
#include "core/error.hpp"
#include "core/identifier.hpp"
#include "core/registry.hpp"

namespace sid::core {

/// Generates identifiers for scopes bound in a registry.
///
/// The registry must outlive the encoder. Generation does not mutate shared state,
/// so one encoder may be used from several threads when its RandomFill is thread-safe.
class Encoder {
 public:
  explicit Encoder(const ScopeRegistry& registry, RandomFill fill = system_random_fill);

  /// New identifier with `scope`'s tag in bits 7-2 of byte 0 and random bits elsewhere.
  /// Fails with MissingScope if the registry is unconfigured or does not know `scope`.
  auto generate(std::string_view scope) const -> Expected<Identifier>;

 private:
  const ScopeRegistry* registry_;
  RandomFill fill_;
};

}  // namespace sid::core

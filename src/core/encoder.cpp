#include "core/encoder.hpp"

#include <format>
#include <string>
#include <utility>

#include "common/logging/log.hpp"

namespace sid::core {

Encoder::Encoder(const ScopeRegistry& registry, RandomFill fill)
    : registry_(&registry), fill_(std::move(fill)) {}

auto Encoder::generate(std::string_view scope) const -> Expected<Identifier> {
  auto tag = registry_->tag_of(scope);
  if (!tag) {
    return tl::unexpected(
      make_error(IdErrc::MissingScope, std::format("scope '{}' is not known", scope)));
  }

  IdBytes bytes{};
  if (auto filled = fill_(bytes); !filled) {
    sid::log::error("identifier generation failed: {}", filled.error().message);
    return tl::unexpected(filled.error());
  }

  // Bits 1-0 of byte 0 were filled by the entropy source and are kept as jitter.
  bytes[0] = static_cast<std::uint8_t>((*tag & kTagMask) | (bytes[0] & kJitterMask));
  return Identifier(std::string(scope), bytes);
}

}  // namespace sid::core

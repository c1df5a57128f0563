#include "core/decoder.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "common/logging/log.hpp"

namespace sid::core {

Decoder::Decoder(const ScopeRegistry& registry) : registry_(&registry) {}

auto Decoder::parse_text(std::string_view text) const -> Expected<Identifier> {
  auto bytes = from_text(text);
  if (!bytes) {
    sid::log::debug("rejected identifier text: {}", bytes.error().message);
    return tl::unexpected(bytes.error());
  }
  return resolve(*bytes);
}

auto Decoder::parse_binary(const IdBytes& bytes) const -> Expected<Identifier> {
  return resolve(bytes);
}

auto Decoder::parse_binary(std::span<const std::uint8_t> bytes) const -> Expected<Identifier> {
  if (bytes.size() != kIdBytes) {
    return tl::unexpected(make_error(
      IdErrc::MalformedStorageValue,
      std::format("expected {} identifier bytes, got {}", kIdBytes, bytes.size())));
  }
  IdBytes copy{};
  std::copy(bytes.begin(), bytes.end(), copy.begin());
  return resolve(copy);
}

auto Decoder::resolve(const IdBytes& bytes) const -> Expected<Identifier> {
  if (!registry_->is_configured()) {
    return tl::unexpected(make_error(IdErrc::MissingScope, "no scopes configured"));
  }
  const auto tag = static_cast<Tag>(bytes[0] & kTagMask);
  auto scope = registry_->name_of_tag(tag);
  if (!scope) {
    sid::log::debug("rejected identifier {}: unbound tag {:#04x}", to_text(bytes), tag);
    return tl::unexpected(
      make_error(IdErrc::BadScope, std::format("tag {:#04x} is not bound to a scope", tag)));
  }
  return Identifier(std::move(*scope), bytes);
}

}  // namespace sid::core

#include "core/identifier.hpp"

#include <utility>

namespace sid::core {

Identifier::Identifier(std::string scope, const IdBytes& bytes)
    : state_(State{std::move(scope), bytes}) {}

auto Identifier::scope() const -> std::string {
  if (!state_) {
    return {};
  }
  return state_->scope;
}

auto Identifier::bytes() const -> IdBytes {
  if (!state_) {
    return IdBytes{};
  }
  return state_->bytes;
}

auto Identifier::hex() const -> std::string {
  if (!state_) {
    return {};
  }
  return to_text(state_->bytes);
}

auto Identifier::scope_matches(std::span<const std::string> candidates) const -> bool {
  if (!state_) {
    return false;
  }
  for (const auto& candidate : candidates) {
    if (candidate == state_->scope) {
      return true;
    }
  }
  return false;
}

auto Identifier::scope_matches(std::initializer_list<std::string_view> candidates) const -> bool {
  if (!state_) {
    return false;
  }
  for (auto candidate : candidates) {
    if (candidate == state_->scope) {
      return true;
    }
  }
  return false;
}

}  // namespace sid::core

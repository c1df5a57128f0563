#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/error.hpp"
#include "core/tag_table.hpp"

namespace sid::core {

/// Ordered scope names; index `i` binds to `kTagTable[i]`. An empty name leaves the slot unbound.
using ScopeNames = std::array<std::string, kScopeSlots>;

/// Write-once binding between scope names and tags.
///
/// `configure` succeeds exactly once per instance, even when called from several
/// threads at the same time. Lookups may run concurrently with each other and
/// with configuration; they either see an unconfigured registry or the full table.
class ScopeRegistry {
 public:
  ScopeRegistry() = default;
  ScopeRegistry(const ScopeRegistry&) = delete;
  auto operator=(const ScopeRegistry&) -> ScopeRegistry& = delete;

  auto configure(const ScopeNames& names) -> Expected<void>;
  auto is_configured() const -> bool;

  auto tag_of(std::string_view name) const -> std::optional<Tag>;
  auto name_of_tag(Tag tag) const -> std::optional<std::string>;

  /// Bound names in unspecified order.
  auto all_names() const -> std::vector<std::string>;
  auto size() const -> std::size_t;

 private:
  mutable std::shared_mutex mutex_;
  bool configured_ = false;
  struct NameHash {
    using is_transparent = void;
    auto operator()(std::string_view name) const -> std::size_t {
      return std::hash<std::string_view>{}(name);
    }
  };

  std::unordered_map<std::string, Tag, NameHash, std::equal_to<>> tags_;
  std::array<std::string, kScopeSlots> names_by_slot_;
};

/// Process-wide registry for callers that do not manage their own instance.
auto default_registry() -> ScopeRegistry&;

}  // namespace sid::core

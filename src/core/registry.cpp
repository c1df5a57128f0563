#include "core/registry.hpp"

#include <mutex>
#include <utility>

#include "common/logging/log.hpp"

namespace sid::core {

auto ScopeRegistry::configure(const ScopeNames& names) -> Expected<void> {
  std::unique_lock lock(mutex_);
  if (configured_) {
    sid::log::warn("scope registry: rejected reconfiguration");
    return tl::unexpected(make_error(IdErrc::AlreadyConfigured, "scopes can only be set once"));
  }

  std::unordered_map<std::string, Tag, NameHash, std::equal_to<>> tags;
  std::array<std::string, kScopeSlots> names_by_slot;
  for (std::size_t slot = 0; slot < kScopeSlots; ++slot) {
    const auto& name = names[slot];
    if (name.empty()) {
      continue;
    }
    const auto tag = kTagTable[slot];
    auto [it, inserted] = tags.try_emplace(name, tag);
    if (!inserted) {
      // Last slot wins; the earlier tag is left without a name.
      sid::log::warn("scope registry: duplicate scope '{}' moved from tag {:#04x} to {:#04x}", name,
                     it->second, tag);
      names_by_slot[slot_of(it->second)].clear();
      it->second = tag;
    }
    names_by_slot[slot] = name;
  }

  tags_ = std::move(tags);
  names_by_slot_ = std::move(names_by_slot);
  configured_ = true;
  sid::log::info("scope registry configured with {} scopes", tags_.size());
  return {};
}

auto ScopeRegistry::is_configured() const -> bool {
  std::shared_lock lock(mutex_);
  return configured_;
}

auto ScopeRegistry::tag_of(std::string_view name) const -> std::optional<Tag> {
  std::shared_lock lock(mutex_);
  if (!configured_) {
    return std::nullopt;
  }
  auto it = tags_.find(name);
  if (it == tags_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ScopeRegistry::name_of_tag(Tag tag) const -> std::optional<std::string> {
  if (!is_tag(tag)) {
    return std::nullopt;
  }
  std::shared_lock lock(mutex_);
  if (!configured_) {
    return std::nullopt;
  }
  const auto& name = names_by_slot_[slot_of(tag)];
  if (name.empty()) {
    return std::nullopt;
  }
  return name;
}

auto ScopeRegistry::all_names() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> names;
  names.reserve(tags_.size());
  for (const auto& [name, tag] : tags_) {
    names.push_back(name);
  }
  return names;
}

auto ScopeRegistry::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return tags_.size();
}

auto default_registry() -> ScopeRegistry& {
  static ScopeRegistry registry;
  return registry;
}

}  // namespace sid::core

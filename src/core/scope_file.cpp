#include "core/scope_file.hpp"

#include <cstddef>
#include <format>
#include <fstream>
#include <string>

namespace sid::core {
namespace {

auto trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto first = text.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kSpace);
  return text.substr(first, last - first + 1);
}

auto out_of_scopes() -> IdError {
  return make_error(IdErrc::OutOfScopes, std::format("limit of {} scopes exceeded", kScopeSlots));
}

}  // namespace

auto parse_scope_list(std::string_view list) -> Expected<ScopeNames> {
  ScopeNames names;
  if (trim(list).empty()) {
    return names;
  }

  std::size_t slot = 0;
  while (true) {
    const auto comma = list.find(',');
    if (slot >= kScopeSlots) {
      return tl::unexpected(out_of_scopes());
    }
    names[slot++] = std::string(trim(list.substr(0, comma)));
    if (comma == std::string_view::npos) {
      break;
    }
    list.remove_prefix(comma + 1);
  }
  return names;
}

auto load_scope_file(const std::filesystem::path& path) -> Expected<ScopeNames> {
  std::ifstream file(path);
  if (!file) {
    return tl::unexpected(make_error(IdErrc::ScopeFileError,
                                     std::format("cannot open scope file '{}'", path.string())));
  }

  ScopeNames names;
  std::size_t slot = 0;
  std::string line;
  while (std::getline(file, line)) {
    auto name = trim(line);
    if (name.empty() || name.front() == '#') {
      continue;
    }
    if (slot >= kScopeSlots) {
      return tl::unexpected(out_of_scopes());
    }
    names[slot++] = std::string(name);
  }
  if (file.bad()) {
    return tl::unexpected(make_error(IdErrc::ScopeFileError,
                                     std::format("failed reading scope file '{}'", path.string())));
  }
  return names;
}

}  // namespace sid::core

#pragma once

#include <filesystem>
#include <string_view>

#include "core/error.hpp"
#include "core/registry.hpp"

namespace sid::core {

/// Comma-separated names, trimmed. Unlisted trailing slots stay empty.
/// More than 64 names is OutOfScopes.
auto parse_scope_list(std::string_view list) -> Expected<ScopeNames>;

/// One name per line; blank lines and '#' comments are skipped.
/// Errors: ScopeFileError, OutOfScopes.
auto load_scope_file(const std::filesystem::path& path) -> Expected<ScopeNames>;

}  // namespace sid::core

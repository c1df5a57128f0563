#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace sid::core {

enum class IdErrc {
  MissingScope,
  BadScope,
  BadString,
  AlreadyConfigured,
  MalformedStorageValue,
  OutOfScopes,
  RandomnessFailure,
  ScopeFileError,
};

struct IdError {
  IdErrc code = IdErrc::BadString;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, IdError>;

inline auto make_error(IdErrc code, std::string message) -> IdError {
  return IdError{code, std::move(message)};
}

/// Stable lowercase name of an error code, e.g. "missing_scope".
auto to_string(IdErrc code) -> std::string_view;

}  // namespace sid::core

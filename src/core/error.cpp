#include "core/error.hpp"

namespace sid::core {

auto to_string(IdErrc code) -> std::string_view {
  switch (code) {
    case IdErrc::MissingScope:
      return "missing_scope";
    case IdErrc::BadScope:
      return "bad_scope";
    case IdErrc::BadString:
      return "bad_string";
    case IdErrc::AlreadyConfigured:
      return "already_configured";
    case IdErrc::MalformedStorageValue:
      return "malformed_storage_value";
    case IdErrc::OutOfScopes:
      return "out_of_scopes";
    case IdErrc::RandomnessFailure:
      return "randomness_failure";
    case IdErrc::ScopeFileError:
      return "scope_file_error";
  }
  return "unknown";
}

}  // namespace sid::core

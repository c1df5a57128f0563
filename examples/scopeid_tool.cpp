#include <gflags/gflags.h>

#include <format>
#include <iostream>
#include <string>

#include "common/logging/log.hpp"
#include "core/decoder.hpp"
#include "core/encoder.hpp"
#include "core/registry.hpp"
#include "core/scope_file.hpp"

DEFINE_string(scopes, "", "Comma-separated scope names, in tag order");
DEFINE_string(scope_file, "", "File with one scope name per line, in tag order");
DEFINE_string(generate, "", "Scope to generate identifiers for");
DEFINE_int32(count, 1, "Number of identifiers to generate");

namespace {

auto load_names() -> sid::core::Expected<sid::core::ScopeNames> {
  if (!FLAGS_scope_file.empty()) {
    return sid::core::load_scope_file(FLAGS_scope_file);
  }
  return sid::core::parse_scope_list(FLAGS_scopes);
}

auto report(const sid::core::IdError& error) -> int {
  std::cerr << std::format("error: {}: {}\n", sid::core::to_string(error.code), error.message);
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("scopeid_tool --scopes=a,b,c [--generate=a --count=N] [ID...]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  sid::log::init();

  auto names = load_names();
  if (!names) {
    sid::log::shutdown();
    return report(names.error());
  }

  auto& registry = sid::core::default_registry();
  if (auto configured = registry.configure(*names); !configured) {
    sid::log::shutdown();
    return report(configured.error());
  }

  int status = 0;
  if (!FLAGS_generate.empty()) {
    sid::core::Encoder encoder(registry);
    for (int i = 0; i < FLAGS_count; ++i) {
      auto id = encoder.generate(FLAGS_generate);
      if (!id) {
        status = report(id.error());
        break;
      }
      std::cout << std::format("{}\n", *id);
    }
    sid::log::info("generate", {{"scope", FLAGS_generate}, {"count", std::to_string(FLAGS_count)}});
  }

  sid::core::Decoder decoder(registry);
  for (int i = 1; i < argc; ++i) {
    auto id = decoder.parse_text(argv[i]);
    if (!id) {
      status = report(id.error());
      continue;
    }
    std::cout << std::format("{} {}\n", id->hex(), id->scope());
  }

  sid::log::shutdown();
  return status;
}

#include "core/decoder.hpp"
#include "core/encoder.hpp"
#include "core/identifier.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <format>
#include <unordered_set>
#include <vector>

using sid::core::Identifier;

TEST(Identifier, EmptyAccessorsReturnZeroValues) {
  Identifier id;
  ASSERT_TRUE(id.empty());
  ASSERT_EQ(id.scope(), "");
  ASSERT_EQ(id.hex(), "");
  ASSERT_EQ(id.bytes(), sid::core::IdBytes{});
}

TEST(Identifier, EmptyNeverMatches) {
  Identifier id;
  std::vector<std::string> candidates{"", "one"};
  ASSERT_FALSE(id.scope_matches(candidates));
  ASSERT_FALSE(id.scope_matches({""}));
}

TEST(Identifier, ScopeMatchesCandidates) {
  sid::core::ScopeRegistry registry;
  auto names = sid::test::full_scope_names();
  ASSERT_TRUE(registry.configure(names));
  sid::core::Encoder encoder(registry);

  auto id = encoder.generate("five");
  ASSERT_TRUE(id);
  ASSERT_FALSE(id->scope_matches({"ten"}));
  ASSERT_TRUE(id->scope_matches(names));
  ASSERT_TRUE(id->scope_matches({"one", "five"}));
  ASSERT_FALSE(id->scope_matches(std::vector<std::string>{}));
  ASSERT_FALSE(id->scope_matches({"Five", "five "}));
}

TEST(Identifier, ScopeOutlivesTemporaryResult) {
  sid::core::ScopeRegistry registry;
  ASSERT_TRUE(registry.configure(sid::test::full_scope_names()));
  sid::core::Decoder decoder(registry);

  auto scope = decoder.parse_text("10000000-0000-0000-0000-000000000000")->scope();
  auto other = decoder.parse_text("fc000000-0000-0000-0000-000000000000")->scope();
  ASSERT_EQ(scope, "five");
  ASSERT_EQ(other, "scope_63");
}

TEST(Identifier, EqualityHashAndFormat) {
  sid::core::ScopeRegistry registry;
  ASSERT_TRUE(registry.configure(sid::test::full_scope_names()));
  sid::core::Encoder encoder(registry);
  sid::core::Decoder decoder(registry);

  auto a = encoder.generate("two");
  ASSERT_TRUE(a);
  auto b = decoder.parse_text(a->hex());
  ASSERT_TRUE(b);
  ASSERT_EQ(*a, *b);
  ASSERT_NE(*a, Identifier{});
  ASSERT_EQ(Identifier{}, Identifier{});
  ASSERT_EQ(std::format("{}", *a), a->hex());

  std::unordered_set<Identifier> set{*a, *b};
  ASSERT_EQ(set.size(), 1u);
}

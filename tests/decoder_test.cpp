#include "core/decoder.hpp"
#include "core/encoder.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

#include <vector>

using sid::core::Decoder;
using sid::core::Encoder;
using sid::core::IdErrc;
using sid::core::ScopeRegistry;

namespace {

class DecoderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.configure(sid::test::partial_scope_names()));
  }

  ScopeRegistry registry_;
  Encoder encoder_{registry_};
  Decoder decoder_{registry_};
};

}  // namespace

TEST(Decoder, RoundTripsEveryScope) {
  ScopeRegistry registry;
  ASSERT_TRUE(registry.configure(sid::test::full_scope_names()));
  ASSERT_EQ(registry.size(), sid::core::kScopeSlots);
  Encoder encoder(registry);
  Decoder decoder(registry);

  for (const auto& name : registry.all_names()) {
    auto original = encoder.generate(name);
    ASSERT_TRUE(original) << name;
    auto parsed = decoder.parse_text(original->hex());
    ASSERT_TRUE(parsed) << name;
    ASSERT_EQ(parsed->scope(), name);
    ASSERT_EQ(parsed->bytes(), original->bytes());
    ASSERT_EQ(parsed->hex(), original->hex());
    ASSERT_EQ(*parsed, *original);
  }
}

TEST_F(DecoderTest, ParseBinaryMatchesParseText) {
  auto original = encoder_.generate("seven");
  ASSERT_TRUE(original);
  auto parsed = decoder_.parse_binary(original->bytes());
  ASSERT_TRUE(parsed);
  ASSERT_EQ(*parsed, *original);
}

TEST_F(DecoderTest, IgnoresJitterBits) {
  auto parsed = decoder_.parse_text("13000000-0000-0000-0000-000000000000");
  ASSERT_TRUE(parsed);
  ASSERT_EQ(parsed->scope(), "five");
  ASSERT_EQ(parsed->hex(), "13000000-0000-0000-0000-000000000000");
}

TEST_F(DecoderTest, RejectsTruncatedText) {
  auto original = encoder_.generate("five");
  ASSERT_TRUE(original);
  auto parsed = decoder_.parse_text(original->hex().substr(0, 1));
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, IdErrc::BadString);
}

TEST_F(DecoderTest, RejectsUppercaseText) {
  auto parsed = decoder_.parse_text("10ABCDEF-0000-0000-0000-000000000000");
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, IdErrc::BadString);
}

TEST_F(DecoderTest, RejectsUnboundTag) {
  auto parsed = decoder_.parse_text("ff8cb1d0-84f3-9d8d-76cc-682d1ca34dae");
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, IdErrc::BadScope);

  sid::core::IdBytes bytes{};
  bytes[0] = 0x20;
  auto binary = decoder_.parse_binary(bytes);
  ASSERT_FALSE(binary);
  ASSERT_EQ(binary.error().code, IdErrc::BadScope);
}

TEST_F(DecoderTest, RejectsWrongBinaryLength) {
  std::vector<std::uint8_t> bytes(15, 0);
  auto parsed = decoder_.parse_binary(std::span<const std::uint8_t>(bytes));
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, IdErrc::MalformedStorageValue);
}

TEST(Decoder, UnconfiguredRegistryIsMissingScope) {
  ScopeRegistry registry;
  Decoder decoder(registry);
  auto parsed = decoder.parse_text("10000000-0000-0000-0000-000000000000");
  ASSERT_FALSE(parsed);
  ASSERT_EQ(parsed.error().code, IdErrc::MissingScope);
  ASSERT_EQ(decoder.parse_binary(sid::core::IdBytes{}).error().code, IdErrc::MissingScope);
}

TEST(Decoder, BadStringTakesPriorityOverMissingScope) {
  ScopeRegistry registry;
  Decoder decoder(registry);
  ASSERT_EQ(decoder.parse_text("nope").error().code, IdErrc::BadString);
}

TEST(Decoder, DuplicateNameOrphansEarlierTag) {
  ScopeRegistry registry;
  auto names = sid::test::full_scope_names();
  names[10] = "one";
  ASSERT_TRUE(registry.configure(names));
  Decoder decoder(registry);

  ASSERT_EQ(decoder.parse_text("00000000-0000-0000-0000-000000000000").error().code,
            IdErrc::BadScope);
  auto parsed = decoder.parse_text("28000000-0000-0000-0000-000000000000");
  ASSERT_TRUE(parsed);
  ASSERT_EQ(parsed->scope(), "one");
}

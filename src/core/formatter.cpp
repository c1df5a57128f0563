#include "core/formatter.hpp"

#include <format>

namespace sid::core {
namespace {

constexpr std::array<std::size_t, 4> kHyphenPositions{8, 13, 18, 23};
constexpr std::string_view kHexDigits = "0123456789abcdef";

auto is_hyphen_position(std::size_t pos) -> bool {
  for (auto hyphen : kHyphenPositions) {
    if (pos == hyphen) {
      return true;
    }
  }
  return false;
}

auto is_lower_hex(char c) -> bool {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

auto nibble(char c) -> std::uint8_t {
  if (c <= '9') {
    return static_cast<std::uint8_t>(c - '0');
  }
  return static_cast<std::uint8_t>(c - 'a' + 10);
}

}  // namespace

auto to_text(const IdBytes& bytes) -> std::string {
  std::string text;
  text.reserve(kTextLength);
  for (std::size_t i = 0; i < kIdBytes; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      text.push_back('-');
    }
    text.push_back(kHexDigits[bytes[i] >> 4]);
    text.push_back(kHexDigits[bytes[i] & 0x0F]);
  }
  return text;
}

auto is_canonical(std::string_view text) -> bool {
  if (text.size() != kTextLength) {
    return false;
  }
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    if (is_hyphen_position(pos)) {
      if (text[pos] != '-') {
        return false;
      }
    } else if (!is_lower_hex(text[pos])) {
      return false;
    }
  }
  return true;
}

auto from_text(std::string_view text) -> Expected<IdBytes> {
  if (!is_canonical(text)) {
    return tl::unexpected(
      make_error(IdErrc::BadString, std::format("'{}' is not a canonical identifier", text)));
  }

  IdBytes bytes{};
  std::size_t out = 0;
  for (std::size_t pos = 0; pos < text.size(); pos += 2) {
    if (text[pos] == '-') {
      ++pos;
    }
    bytes[out++] = static_cast<std::uint8_t>((nibble(text[pos]) << 4) | nibble(text[pos + 1]));
  }
  return bytes;
}

}  // namespace sid::core

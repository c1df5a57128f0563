#include "core/storage.hpp"

#include <format>
#include <string_view>

#include "core/formatter.hpp"

namespace sid::core {

auto to_storage_value(const Identifier& id) -> Expected<std::string> {
  auto text = id.hex();
  if (text.size() != kTextLength) {
    return tl::unexpected(
      make_error(IdErrc::MalformedStorageValue, "identifier is not initialized"));
  }
  return text;
}

auto from_storage_bytes(const Decoder& decoder, std::span<const std::uint8_t> value)
  -> Expected<Identifier> {
  if (value.size() == kIdBytes) {
    return decoder.parse_binary(value);
  }
  if (value.size() == kTextLength) {
    std::string_view text(reinterpret_cast<const char*>(value.data()), value.size());
    if (!is_canonical(text)) {
      return tl::unexpected(make_error(IdErrc::MalformedStorageValue,
                                       "36-byte storage value is not canonical text"));
    }
    return decoder.parse_text(text);
  }
  return tl::unexpected(make_error(
    IdErrc::MalformedStorageValue,
    std::format("storage value of {} bytes is neither binary nor canonical text", value.size())));
}

}  // namespace sid::core

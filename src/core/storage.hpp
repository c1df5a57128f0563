#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "core/decoder.hpp"
#include "core/error.hpp"
#include "core/identifier.hpp"

namespace sid::core {

/// Value written to a persistence layer: the canonical text.
/// An empty identifier is MalformedStorageValue.
auto to_storage_value(const Identifier& id) -> Expected<std::string>;

/// Rebuilds an identifier read back from a persistence layer. Accepts the 16 raw
/// bytes or the 36 bytes of canonical text. Any other length, or 36 bytes that are not
/// canonical text, is MalformedStorageValue; scope errors pass through from the decoder.
auto from_storage_bytes(const Decoder& decoder, std::span<const std::uint8_t> value)
  -> Expected<Identifier>;

}  // namespace sid::core

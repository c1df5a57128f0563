#pragma once

#include <cstdint>
#include <functional>
#include <span>

#include "core/error.hpp"

namespace sid::core {

/// Fills the buffer completely or reports why it could not.
using RandomFill = std::function<Expected<void>(std::span<std::uint8_t>)>;

/// Reads from the kernel CSPRNG via getrandom(2).
auto system_random_fill(std::span<std::uint8_t> out) -> Expected<void>;

}  // namespace sid::core

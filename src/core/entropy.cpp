#include "core/entropy.hpp"

#include <sys/random.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace sid::core {

auto system_random_fill(std::span<std::uint8_t> out) -> Expected<void> {
  std::size_t filled = 0;
  while (filled < out.size()) {
    auto n = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return tl::unexpected(make_error(IdErrc::RandomnessFailure,
                                       std::format("getrandom failed: {}", std::strerror(errno))));
    }
    filled += static_cast<std::size_t>(n);
  }
  return {};
}

}  // namespace sid::core

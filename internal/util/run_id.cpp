#include "run_id.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace signoff::util {

std::string NewRunId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  // version nibble lives in the high word, variant bits in the low word
  const std::uint64_t high = (rng() & ~0xF000ULL) | 0x4000ULL;
  const std::uint64_t low  = (rng() & ~(0xC0ULL << 56)) | (0x80ULL << 56);

  char text[37];
  std::snprintf(text, sizeof(text), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(high >> 32),
                static_cast<unsigned>((high >> 16) & 0xFFFF), static_cast<unsigned>(high & 0xFFFF), static_cast<unsigned>(low >> 48),
                static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
  return text;
}

} // namespace signoff::util

#include "util/misc.hpp"

#include <chrono>
#include <random>

#include "absl/strings/str_cat.h"

namespace util {

std::string Truncate(const std::string& s, size_t max_len) {
  static const constexpr char kMarker[] = "...";
  if (s.size() <= max_len) return s;
  size_t keep = max_len < sizeof(kMarker) ? max_len
                                          : max_len - sizeof(kMarker) + 1;
  // Never split a UTF-8 sequence.
  while (keep > 0 && (static_cast<unsigned char>(s[keep]) & 0xc0) == 0x80)
    keep--;
  if (max_len < sizeof(kMarker)) return s.substr(0, keep);
  return absl::StrCat(s.substr(0, keep), kMarker);
}

std::string RandomId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  static const constexpr char kHex[] = "0123456789abcdef";
  std::string id;
  for (int i = 0; i < 2; i++) {
    uint64_t chunk = rng();
    for (int j = 0; j < 16; j++) {
      id += kHex[chunk & 0xf];
      chunk >>= 4;
    }
  }
  return id;
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace util

#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP

#include <stdint.h>

#include <string>

namespace util {

// Cuts s to at most max_len bytes, appending a marker when something was
// removed. UTF-8 sequences are never split.
std::string Truncate(const std::string& s, size_t max_len);

// Returns a random 128-bit identifier as 32 hex characters.
std::string RandomId();

// Milliseconds since the unix epoch.
int64_t NowMillis();

}  // namespace util

#endif

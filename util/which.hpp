#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Returns the first path of an existing file named cmd in the directories of
// PATH, or an empty string.
std::string which(const std::string& cmd);

}  // namespace util

#endif

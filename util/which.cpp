#include "util/which.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"

namespace {
absl::Mutex cmd_cache_mutex(absl::kConstInit);
std::unordered_map<std::string, std::string>* cmd_cache
    GUARDED_BY(cmd_cache_mutex) = nullptr;

bool file_exists(const std::string& path) {
  struct stat buffer {};
  return stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode);
}
}  // namespace

namespace util {

std::string which(const std::string& cmd) {
  absl::MutexLock lock(&cmd_cache_mutex);
  if (!cmd_cache) cmd_cache = new std::unordered_map<std::string, std::string>;
  auto cached = cmd_cache->find(cmd);
  if (cached != cmd_cache->end()) return cached->second;

  const char* path = std::getenv("PATH");
  std::vector<std::string> dirs =
      absl::StrSplit(path ? path : "", ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = absl::StrCat(dir, "/", cmd);
    if (file_exists(fullpath)) return (*cmd_cache)[cmd] = fullpath;
  }
  return (*cmd_cache)[cmd] = "";
}

}  // namespace util

#include "script/errors.hpp"

#include "absl/strings/str_cat.h"

namespace script {

std::string ScriptError::Traceback() const {
  std::string out = "Traceback (most recent call last):\n";
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    absl::StrAppend(&out, "  line ", it->second, ", in ", it->first, "\n");
  }
  absl::StrAppend(&out, type_, message_.empty() ? "" : ": ", message_, "\n");
  return out;
}

}  // namespace script

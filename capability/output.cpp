#include "capability/output.hpp"

namespace capability {

void OutputBuffer::Write(const std::string& text) {
  if (truncated_) return;
  size_t room = max_bytes_ > static_cast<int64_t>(contents_.size())
                    ? max_bytes_ - contents_.size()
                    : 0;
  if (text.size() <= room) {
    contents_ += text;
    return;
  }
  size_t keep = room;
  while (keep > 0 && (static_cast<unsigned char>(text[keep]) & 0xc0) == 0x80)
    keep--;
  contents_.append(text, 0, keep);
  truncated_ = true;
}

}  // namespace capability

#ifndef CAPABILITY_OUTPUT_HPP
#define CAPABILITY_OUTPUT_HPP

#include <stdint.h>

#include <string>

namespace capability {

// A captured output stream with a size cap. Writes past the cap are dropped
// and the buffer is flagged as truncated.
class OutputBuffer {
 public:
  explicit OutputBuffer(int64_t max_bytes) : max_bytes_(max_bytes) {}
  OutputBuffer(const OutputBuffer&) = delete;
  OutputBuffer& operator=(const OutputBuffer&) = delete;

  void Write(const std::string& text);

  const std::string& contents() const { return contents_; }
  bool truncated() const { return truncated_; }

 private:
  int64_t max_bytes_;
  std::string contents_;
  bool truncated_ = false;
};

}  // namespace capability

#endif

#ifndef UTIL_CHANNEL_HPP
#define UTIL_CHANNEL_HPP

#include <stdint.h>

#include <string>

#include "google/protobuf/message_lite.h"

namespace util {

// Frames larger than this are rejected by both ends.
static const constexpr uint32_t kMaxFrameSize = 64 * 1024 * 1024;

// Writes message on fd as a 4-byte length followed by its serialization.
// Returns false and sets error_msg on failure. Never raises SIGPIPE.
bool WriteMessage(int fd, const google::protobuf::MessageLite& message,
                  std::string* error_msg);

enum class ReadStatus { kMessage, kClosed, kError };

// Reads one frame written by WriteMessage. Blocks until the whole frame is
// available. kClosed is returned when the peer closed the channel on a frame
// boundary.
ReadStatus ReadMessage(int fd, google::protobuf::MessageLite* message,
                       std::string* error_msg);

}  // namespace util

#endif

#include "util/channel.hpp"

#include <errno.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "absl/strings/str_cat.h"

namespace {

bool WriteAll(int fd, const char* data, size_t len, std::string* error_msg) {
  while (len > 0) {
    ssize_t written = send(fd, data, len, MSG_NOSIGNAL);
    if (written == -1 && errno == ENOTSOCK) written = write(fd, data, len);
    if (written == -1) {
      if (errno == EINTR) continue;
      *error_msg = absl::StrCat("write: ", strerror(errno));
      return false;
    }
    data += written;
    len -= written;
  }
  return true;
}

// Returns the number of bytes read, which is smaller than len only at EOF.
ssize_t ReadAll(int fd, char* data, size_t len, std::string* error_msg) {
  size_t total = 0;
  while (total < len) {
    ssize_t cur = read(fd, data + total, len - total);
    if (cur == -1) {
      if (errno == EINTR) continue;
      *error_msg = absl::StrCat("read: ", strerror(errno));
      return -1;
    }
    if (cur == 0) break;
    total += cur;
  }
  return total;
}

}  // namespace

namespace util {

bool WriteMessage(int fd, const google::protobuf::MessageLite& message,
                  std::string* error_msg) {
  std::string data;
  if (!message.SerializeToString(&data)) {
    *error_msg = "Failed to serialize " + message.GetTypeName();
    return false;
  }
  if (data.size() > kMaxFrameSize) {
    *error_msg = absl::StrCat("Frame too large: ", data.size());
    return false;
  }
  uint32_t len = data.size();
  unsigned char header[4] = {
      static_cast<unsigned char>(len >> 24),
      static_cast<unsigned char>(len >> 16),
      static_cast<unsigned char>(len >> 8), static_cast<unsigned char>(len)};
  if (!WriteAll(fd, reinterpret_cast<const char*>(header), sizeof(header),
                error_msg))
    return false;
  return WriteAll(fd, data.data(), data.size(), error_msg);
}

ReadStatus ReadMessage(int fd, google::protobuf::MessageLite* message,
                       std::string* error_msg) {
  unsigned char header[4] = {};
  ssize_t got =
      ReadAll(fd, reinterpret_cast<char*>(header), sizeof(header), error_msg);
  if (got < 0) return ReadStatus::kError;
  if (got == 0) return ReadStatus::kClosed;
  if (got != sizeof(header)) {
    *error_msg = "Channel closed inside a frame header";
    return ReadStatus::kError;
  }
  uint32_t len = (uint32_t(header[0]) << 24) | (uint32_t(header[1]) << 16) |
                 (uint32_t(header[2]) << 8) | uint32_t(header[3]);
  if (len > kMaxFrameSize) {
    *error_msg = absl::StrCat("Frame too large: ", len);
    return ReadStatus::kError;
  }
  std::string data(len, '\0');
  got = ReadAll(fd, &data[0], len, error_msg);
  if (got < 0) return ReadStatus::kError;
  if (static_cast<uint32_t>(got) != len) {
    *error_msg = "Channel closed inside a frame";
    return ReadStatus::kError;
  }
  if (!message->ParseFromString(data)) {
    *error_msg = "Failed to parse " + message->GetTypeName();
    return ReadStatus::kError;
  }
  return ReadStatus::kMessage;
}

}  // namespace util

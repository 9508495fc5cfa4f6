#include "ramcp_core/framed_channel.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>

#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace ramcp {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

bool ParseContentLength(const std::string& value, size_t* out) {
  std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return false;
  }
  for (char c : trimmed) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  errno = 0;
  unsigned long long parsed = std::strtoull(trimmed.c_str(), nullptr, 10);
  if (errno == ERANGE || parsed > kMaxContentLength) {
    return false;
  }
  *out = static_cast<size_t>(parsed);
  return true;
}

}  // namespace

std::string EncodeFrame(const json& message) {
  std::string payload = message.dump();
  std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
  frame += payload;
  return frame;
}

FramedReader::FramedReader(int fd) : fd_(fd) {
  if (pipe2(wake_fds_, O_CLOEXEC) != 0) {
    wake_fds_[0] = -1;
    wake_fds_[1] = -1;
    Log(std::string("FramedReader: wake pipe failed: ") + std::strerror(errno));
  }
}

FramedReader::~FramedReader() {
  if (fd_ >= 0) {
    close(fd_);
  }
  for (int& fd : wake_fds_) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

void FramedReader::RequestStop() {
  if (wake_fds_[1] >= 0) {
    char byte = 1;
    ssize_t written;
    do {
      written = write(wake_fds_[1], &byte, 1);
    } while (written < 0 && errno == EINTR);
  }
}

FramedReader::FillResult FramedReader::Fill() {
  if (pos_ > 0 && pos_ * 2 >= buffer_.size()) {
    buffer_.erase(0, pos_);
    pos_ = 0;
  }
  while (true) {
    pollfd fds[2];
    fds[0] = {fd_, POLLIN, 0};
    fds[1] = {wake_fds_[0], POLLIN, 0};
    int nfds = wake_fds_[0] >= 0 ? 2 : 1;
    int ready = poll(fds, nfds, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return FillResult::kError;
    }
    if (nfds == 2 && (fds[1].revents & POLLIN) != 0) {
      return FillResult::kStopped;
    }
    if (fds[0].revents == 0) {
      continue;
    }
    char chunk[kReadChunk];
    ssize_t received = read(fd_, chunk, sizeof(chunk));
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return FillResult::kError;
    }
    if (received == 0) {
      return FillResult::kEof;
    }
    buffer_.append(chunk, static_cast<size_t>(received));
    return FillResult::kData;
  }
}

bool FramedReader::ReadHeaderLine(std::string* line, bool* clean_eof, Error* error) {
  *clean_eof = false;
  size_t scanned = pos_;
  while (true) {
    size_t newline = buffer_.find('\n', scanned);
    if (newline != std::string::npos) {
      if (newline == pos_ || buffer_[newline - 1] != '\r') {
        SetError(error, ErrorCode::kFraming, "header line not terminated by CRLF");
        return false;
      }
      line->assign(buffer_, pos_, newline - 1 - pos_);
      pos_ = newline + 1;
      return true;
    }
    if (buffer_.size() - pos_ > kMaxHeaderLineBytes) {
      SetError(error, ErrorCode::kFraming, "header line too long");
      return false;
    }
    // Fill may compact the buffer, so keep the scan offset relative to pos_.
    size_t scanned_rel = buffer_.size() - pos_;
    bool at_frame_start = scanned_rel == 0;
    switch (Fill()) {
      case FillResult::kData:
        scanned = pos_ + scanned_rel;
        break;
      case FillResult::kEof:
        if (at_frame_start) {
          *clean_eof = true;
          SetError(error, ErrorCode::kConnectionClosed, "stream closed");
        } else {
          SetError(error, ErrorCode::kFraming, "stream closed inside header");
        }
        return false;
      case FillResult::kStopped:
        SetError(error, ErrorCode::kConnectionClosed, "reader stopped");
        return false;
      case FillResult::kError:
        SetError(error, ErrorCode::kConnectionClosed,
                 std::string("read failed: ") + std::strerror(errno));
        return false;
    }
  }
}

bool FramedReader::ReadPayload(size_t length, std::string* payload, Error* error) {
  while (buffer_.size() - pos_ < length) {
    switch (Fill()) {
      case FillResult::kData:
        break;
      case FillResult::kEof:
        SetError(error, ErrorCode::kFraming,
                 "stream closed after " + std::to_string(buffer_.size() - pos_) + " of " +
                     std::to_string(length) + " payload bytes");
        return false;
      case FillResult::kStopped:
        SetError(error, ErrorCode::kConnectionClosed, "reader stopped");
        return false;
      case FillResult::kError:
        SetError(error, ErrorCode::kConnectionClosed,
                 std::string("read failed: ") + std::strerror(errno));
        return false;
    }
  }
  payload->assign(buffer_, pos_, length);
  pos_ += length;
  return true;
}

bool FramedReader::ReadMessage(json* out, Error* error) {
  std::optional<size_t> content_length;
  bool first_line = true;
  while (true) {
    std::string line;
    bool clean_eof = false;
    if (!ReadHeaderLine(&line, &clean_eof, error)) {
      if (!first_line && clean_eof) {
        SetError(error, ErrorCode::kFraming, "stream closed inside header");
      }
      return false;
    }
    first_line = false;
    if (line.empty()) {
      break;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      SetError(error, ErrorCode::kFraming, "malformed header line: " + line);
      return false;
    }
    std::string name = Trim(std::string_view(line).substr(0, colon));
    if (ToLower(name) == "content-length") {
      size_t length = 0;
      if (!ParseContentLength(line.substr(colon + 1), &length)) {
        SetError(error, ErrorCode::kFraming, "invalid Content-Length: " + line);
        return false;
      }
      content_length = length;
    }
  }

  if (!content_length.has_value()) {
    SetError(error, ErrorCode::kFraming, "missing Content-Length header");
    return false;
  }

  std::string payload;
  if (!ReadPayload(*content_length, &payload, error)) {
    return false;
  }

  try {
    *out = json::parse(payload);
  } catch (const json::parse_error& e) {
    SetError(error, ErrorCode::kFraming, std::string("payload is not JSON: ") + e.what());
    return false;
  }
  if (!out->is_object()) {
    SetError(error, ErrorCode::kFraming, "payload is not a JSON object");
    return false;
  }
  return true;
}

FramedWriter::FramedWriter(int fd) : fd_(fd) {}

FramedWriter::~FramedWriter() { Close(); }

void FramedWriter::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

bool FramedWriter::WriteMessage(const json& message, Error* error) {
  std::string frame;
  try {
    frame = EncodeFrame(message);
  } catch (const json::type_error& e) {
    SetError(error, ErrorCode::kInvalidParams, std::string("unencodable message: ") + e.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0 || broken_) {
    SetError(error, ErrorCode::kConnectionClosed, "output stream closed");
    return false;
  }
  const char* data = frame.data();
  size_t remaining = frame.size();
  while (remaining > 0) {
    ssize_t written = write(fd_, data, remaining);
    if (written < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      // Part of a frame may be on the wire; nothing after it can be trusted.
      broken_ = true;
      SetError(error, ErrorCode::kConnectionClosed,
               std::string("write failed: ") + std::strerror(errno));
      return false;
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  return true;
}

}  // namespace ramcp

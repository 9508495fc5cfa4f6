#ifndef RAMCP_CORE_FRAMED_CHANNEL_H_
#define RAMCP_CORE_FRAMED_CHANNEL_H_

#include <cstddef>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "ramcp_core/error.h"

namespace ramcp {

using json = nlohmann::json;

constexpr size_t kMaxHeaderLineBytes = 8 * 1024;
constexpr size_t kMaxContentLength = 256 * 1024 * 1024;

// Read side of a Content-Length framed stream. Owns the descriptor.
// Only one thread may call ReadMessage; RequestStop may be called from any.
class FramedReader {
 public:
  explicit FramedReader(int fd);
  ~FramedReader();

  FramedReader(const FramedReader&) = delete;
  FramedReader& operator=(const FramedReader&) = delete;

  // Blocks until one full frame is parsed. A clean end of stream before the
  // first header byte is kConnectionClosed; anything else malformed,
  // including a stream that ends inside a frame, is kFraming.
  bool ReadMessage(json* out, Error* error);

  // Unblocks a pending ReadMessage, which then fails with kConnectionClosed.
  void RequestStop();

 private:
  enum class FillResult { kData, kEof, kStopped, kError };

  FillResult Fill();
  bool ReadHeaderLine(std::string* line, bool* clean_eof, Error* error);
  bool ReadPayload(size_t length, std::string* payload, Error* error);

  int fd_;
  int wake_fds_[2] = {-1, -1};
  std::string buffer_;
  size_t pos_ = 0;
};

// Write side. Owns the descriptor. Each WriteMessage emits one whole frame
// under an internal lock; a failed partial write poisons the writer.
class FramedWriter {
 public:
  explicit FramedWriter(int fd);
  ~FramedWriter();

  FramedWriter(const FramedWriter&) = delete;
  FramedWriter& operator=(const FramedWriter&) = delete;

  bool WriteMessage(const json& message, Error* error);
  void Close();

 private:
  std::mutex mutex_;
  int fd_;
  bool broken_ = false;
};

std::string EncodeFrame(const json& message);

}  // namespace ramcp

#endif  // RAMCP_CORE_FRAMED_CHANNEL_H_

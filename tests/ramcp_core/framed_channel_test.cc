#include <gtest/gtest.h>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>

#include "ramcp_core/framed_channel.h"

namespace {

using ramcp::Error;
using ramcp::ErrorCode;
using ramcp::FramedReader;
using ramcp::FramedWriter;
using ramcp::json;

// Pipe whose write end the test feeds by hand.
struct RawPipe {
  RawPipe() {
    int fds[2];
    EXPECT_EQ(pipe(fds), 0);
    read_fd = fds[0];
    write_fd = fds[1];
  }
  ~RawPipe() { CloseWriter(); }

  void Feed(const std::string& bytes) {
    ASSERT_EQ(write(write_fd, bytes.data(), bytes.size()),
              static_cast<ssize_t>(bytes.size()));
  }
  void CloseWriter() {
    if (write_fd >= 0) {
      close(write_fd);
      write_fd = -1;
    }
  }

  int read_fd = -1;
  int write_fd = -1;
};

TEST(FramedChannelTest, ReadsBackToBackFrames) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed(ramcp::EncodeFrame({{"id", 1}}) + ramcp::EncodeFrame({{"id", 2}}));

  json first;
  json second;
  Error error;
  ASSERT_TRUE(reader.ReadMessage(&first, &error)) << error.message;
  ASSERT_TRUE(reader.ReadMessage(&second, &error)) << error.message;
  EXPECT_EQ(first["id"], 1);
  EXPECT_EQ(second["id"], 2);
}

TEST(FramedChannelTest, IgnoresUnknownHeadersAndHeaderCase) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  std::string payload = R"({"method":"x"})";
  pipe.Feed("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\ncontent-length: " +
            std::to_string(payload.size()) + "\r\n\r\n" + payload);

  json message;
  Error error;
  ASSERT_TRUE(reader.ReadMessage(&message, &error)) << error.message;
  EXPECT_EQ(message["method"], "x");
}

TEST(FramedChannelTest, ReassemblesFrameSplitAcrossWrites) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  std::string frame = ramcp::EncodeFrame({{"text", std::string(1000, 'a')}});
  std::thread feeder([&]() {
    for (size_t i = 0; i < frame.size(); i += 7) {
      pipe.Feed(frame.substr(i, 7));
    }
  });
  json message;
  Error error;
  bool ok = reader.ReadMessage(&message, &error);
  feeder.join();
  ASSERT_TRUE(ok) << error.message;
  EXPECT_EQ(message["text"].get<std::string>().size(), 1000u);
}

TEST(FramedChannelTest, TruncatedPayloadIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("Content-Length: 50\r\n\r\n{\"id\":1}");
  pipe.CloseWriter();

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, MissingContentLengthIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("Content-Type: text/plain\r\n\r\n{}");

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, MalformedHeaderLineIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("garbage without separator\r\n\r\n{}");

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, NonNumericContentLengthIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("Content-Length: 12abc\r\n\r\n{}");

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, InvalidJsonPayloadIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("Content-Length: 5\r\n\r\n{nope");

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, CleanEndOfStreamIsConnectionClosed) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.CloseWriter();

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kConnectionClosed);
}

TEST(FramedChannelTest, EndOfStreamInsideHeaderIsFramingError) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  pipe.Feed("Content-Length: 2\r\n");
  pipe.CloseWriter();

  json message;
  Error error;
  EXPECT_FALSE(reader.ReadMessage(&message, &error));
  EXPECT_EQ(error.code, ErrorCode::kFraming);
}

TEST(FramedChannelTest, RequestStopUnblocksReader) {
  RawPipe pipe;
  FramedReader reader(pipe.read_fd);
  Error error;
  std::thread blocked([&]() {
    json message;
    EXPECT_FALSE(reader.ReadMessage(&message, &error));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  reader.RequestStop();
  blocked.join();
  EXPECT_EQ(error.code, ErrorCode::kConnectionClosed);
}

TEST(FramedChannelTest, WriterCountsUtf8Bytes) {
  RawPipe pipe;
  FramedWriter writer(pipe.write_fd);
  pipe.write_fd = -1;
  FramedReader reader(pipe.read_fd);

  Error error;
  ASSERT_TRUE(writer.WriteMessage({{"text", "größe ✓"}}, &error)) << error.message;
  json message;
  ASSERT_TRUE(reader.ReadMessage(&message, &error)) << error.message;
  EXPECT_EQ(message["text"], "größe ✓");
}

TEST(FramedChannelTest, WriteAfterCloseFails) {
  RawPipe pipe;
  FramedWriter writer(pipe.write_fd);
  pipe.write_fd = -1;
  writer.Close();

  Error error;
  EXPECT_FALSE(writer.WriteMessage({{"id", 1}}, &error));
  EXPECT_EQ(error.code, ErrorCode::kConnectionClosed);
  close(pipe.read_fd);
}

TEST(FramedChannelTest, WriteToClosedReaderFails) {
  signal(SIGPIPE, SIG_IGN);
  RawPipe pipe;
  FramedWriter writer(pipe.write_fd);
  pipe.write_fd = -1;
  close(pipe.read_fd);

  Error error;
  EXPECT_FALSE(writer.WriteMessage({{"id", 1}}, &error));
  EXPECT_EQ(error.code, ErrorCode::kConnectionClosed);
  EXPECT_FALSE(writer.WriteMessage({{"id", 2}}, &error));
}

}  // namespace

#ifndef RAMCP_MCP_TRANSPORT_H_
#define RAMCP_MCP_TRANSPORT_H_

#include <iosfwd>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace ramcp::server {

using json = nlohmann::json;

enum class ReadStatus {
  kMessage,
  kParseError,
  kEndOfStream,
};

// Newline-delimited JSON-RPC, one message per line.
class McpTransport {
 public:
  McpTransport(std::istream& in, std::ostream& out);

  // Blank lines are skipped. On kParseError `raw` holds the offending line.
  ReadStatus ReadMessage(json* message, std::string* raw);
  void SendMessage(const json& message);

 private:
  std::istream& in_;
  std::ostream& out_;
  std::mutex write_mutex_;
};

}  // namespace ramcp::server

#endif  // RAMCP_MCP_TRANSPORT_H_

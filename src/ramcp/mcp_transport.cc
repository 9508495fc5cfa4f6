#include "ramcp/mcp_transport.h"

#include <istream>
#include <ostream>
#include <utility>

#include "ramcp_core/logging.h"
#include "ramcp_core/utils.h"

namespace ramcp::server {

McpTransport::McpTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

ReadStatus McpTransport::ReadMessage(json* message, std::string* raw) {
  std::string line;
  while (std::getline(in_, line)) {
    std::string trimmed = Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    json parsed = json::parse(trimmed, nullptr, false);
    if (parsed.is_discarded()) {
      Log("MCP parse error on line: " + trimmed.substr(0, 200));
      if (raw) {
        *raw = std::move(trimmed);
      }
      return ReadStatus::kParseError;
    }
    *message = std::move(parsed);
    return ReadStatus::kMessage;
  }
  return ReadStatus::kEndOfStream;
}

void McpTransport::SendMessage(const json& message) {
  // Invalid UTF-8 from tool output is replaced rather than thrown on.
  std::string payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << payload << '\n';
  out_.flush();
}

}  // namespace ramcp::server

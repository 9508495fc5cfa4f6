#ifndef RAMCP_MCP_SERVER_H_
#define RAMCP_MCP_SERVER_H_

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ramcp/mcp_transport.h"
#include "ramcp/tool_registry.h"

namespace ramcp::server {

constexpr const char kProtocolVersion[] = "2024-11-05";
constexpr const char kServerName[] = "ramcp";
constexpr const char kServerVersion[] = "0.1.0";

// MCP method dispatch over a ToolRegistry.
class McpServer {
 public:
  explicit McpServer(const ToolRegistry* registry);

  // Reply for one incoming message; nullopt for notifications.
  std::optional<json> HandleMessage(const json& message);

  // Serves until end of input.
  void Run(McpTransport* transport);

 private:
  json HandleInitialize(const json& id, const json& params);

  const ToolRegistry* registry_;
  bool initialized_ = false;
};

}  // namespace ramcp::server

#endif  // RAMCP_MCP_SERVER_H_

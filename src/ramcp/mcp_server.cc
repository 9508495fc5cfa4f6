#include "ramcp/mcp_server.h"

#include "ramcp_core/json_rpc.h"
#include "ramcp_core/logging.h"

namespace ramcp::server {

McpServer::McpServer(const ToolRegistry* registry) : registry_(registry) {}

json McpServer::HandleInitialize(const json& id, const json& params) {
  std::string client = "unknown";
  if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
    client = params["clientInfo"].value("name", client);
  }
  Log("MCP initialize from " + client);
  initialized_ = true;
  return MakeResult(id, {{"protocolVersion", kProtocolVersion},
                         {"capabilities", {{"tools", {{"listChanged", false}}}}},
                         {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}});
}

std::optional<json> McpServer::HandleMessage(const json& message) {
  MessageKind kind = ClassifyMessage(message);
  if (kind == MessageKind::kResponse) {
    // This server never sends requests; stray responses are dropped.
    return std::nullopt;
  }
  if (kind == MessageKind::kInvalid) {
    json id = message.is_object() ? message.value("id", json()) : json();
    return MakeErrorResponse(id, rpc_error::kInvalidRequest, "invalid JSON-RPC message");
  }

  const std::string method = message["method"].get<std::string>();
  if (kind == MessageKind::kNotification) {
    if (method != "notifications/initialized" && method != "notifications/cancelled") {
      Log("MCP notification ignored: " + method);
    }
    return std::nullopt;
  }

  const json& id = message["id"];
  const json params = message.value("params", json::object());
  if (method == "initialize") {
    return HandleInitialize(id, params);
  }
  if (method == "ping") {
    return MakeResult(id, json::object());
  }
  if (method == "tools/list") {
    return MakeResult(id, registry_->ListTools());
  }
  if (method == "tools/call") {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
      return MakeErrorResponse(id, rpc_error::kInvalidParams, "tools/call requires a name");
    }
    const std::string name = params["name"].get<std::string>();
    if (!registry_->HasTool(name)) {
      return MakeErrorResponse(id, rpc_error::kInvalidParams, "unknown tool: " + name);
    }
    return MakeResult(id, registry_->CallTool(name, params.value("arguments", json::object())));
  }
  return MakeErrorResponse(id, rpc_error::kMethodNotFound, "method not found: " + method);
}

void McpServer::Run(McpTransport* transport) {
  while (true) {
    json message;
    std::string raw;
    ReadStatus status = transport->ReadMessage(&message, &raw);
    if (status == ReadStatus::kEndOfStream) {
      Log("MCP input closed");
      return;
    }
    if (status == ReadStatus::kParseError) {
      transport->SendMessage(MakeErrorResponse(json(), rpc_error::kParseError, "parse error"));
      continue;
    }
    auto reply = HandleMessage(message);
    if (reply.has_value()) {
      transport->SendMessage(*reply);
    }
  }
}

}  // namespace ramcp::server

#ifndef RAMCP_CORE_JSON_RPC_H_
#define RAMCP_CORE_JSON_RPC_H_

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ramcp {

using json = nlohmann::json;

namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerNotInitialized = -32002;
constexpr int kRequestCancelled = -32800;
constexpr int kContentModified = -32801;
}  // namespace rpc_error

enum class MessageKind {
  kRequest,       // id + method
  kNotification,  // method, no id
  kResponse,      // id + result or error
  kInvalid,
};

MessageKind ClassifyMessage(const json& message);

json MakeRequest(int64_t id, const std::string& method, const json& params);
json MakeNotification(const std::string& method, const json& params);
json MakeResult(const json& id, const json& result);
json MakeErrorResponse(const json& id, int code, const std::string& message);

// Numeric id of a response. Integral strings are accepted as well.
std::optional<int64_t> MessageId(const json& message);

}  // namespace ramcp

#endif  // RAMCP_CORE_JSON_RPC_H_

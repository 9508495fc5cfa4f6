#include <gtest/gtest.h>

#include "ramcp_core/json_rpc.h"

using ramcp::ClassifyMessage;
using ramcp::json;
using ramcp::MessageKind;

TEST(JsonRpcTest, ClassifiesMessageShapes) {
  EXPECT_EQ(ClassifyMessage({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}),
            MessageKind::kRequest);
  EXPECT_EQ(ClassifyMessage({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "x"}}),
            MessageKind::kRequest);
  EXPECT_EQ(ClassifyMessage({{"jsonrpc", "2.0"}, {"method", "initialized"}}),
            MessageKind::kNotification);
  EXPECT_EQ(ClassifyMessage({{"jsonrpc", "2.0"}, {"id", 4}, {"result", nullptr}}),
            MessageKind::kResponse);
  EXPECT_EQ(ClassifyMessage({{"jsonrpc", "2.0"}, {"id", 4}, {"error", {{"code", -1}}}}),
            MessageKind::kResponse);
}

TEST(JsonRpcTest, NullIdErrorIsStillAResponse) {
  json message = {{"jsonrpc", "2.0"}, {"id", nullptr}, {"error", {{"code", -32700}}}};
  EXPECT_EQ(ClassifyMessage(message), MessageKind::kResponse);
}

TEST(JsonRpcTest, RejectsMalformedMessages) {
  EXPECT_EQ(ClassifyMessage(json::array()), MessageKind::kInvalid);
  EXPECT_EQ(ClassifyMessage("text"), MessageKind::kInvalid);
  EXPECT_EQ(ClassifyMessage({{"id", 3}}), MessageKind::kInvalid);
  EXPECT_EQ(ClassifyMessage({{"method", 12}}), MessageKind::kInvalid);
}

TEST(JsonRpcTest, RequestOmitsNullParams) {
  json request = ramcp::MakeRequest(7, "shutdown", json());
  EXPECT_EQ(request["jsonrpc"], "2.0");
  EXPECT_EQ(request["id"], 7);
  EXPECT_EQ(request["method"], "shutdown");
  EXPECT_FALSE(request.contains("params"));

  json with_params = ramcp::MakeRequest(8, "workspace/symbol", {{"query", "Foo"}});
  EXPECT_EQ(with_params["params"]["query"], "Foo");
}

TEST(JsonRpcTest, NotificationHasNoId) {
  json notification = ramcp::MakeNotification("exit", json());
  EXPECT_FALSE(notification.contains("id"));
  EXPECT_FALSE(notification.contains("params"));
}

TEST(JsonRpcTest, ErrorResponseCarriesCodeAndMessage) {
  json reply = ramcp::MakeErrorResponse("req-1", ramcp::rpc_error::kMethodNotFound, "nope");
  EXPECT_EQ(reply["id"], "req-1");
  EXPECT_EQ(reply["error"]["code"], -32601);
  EXPECT_EQ(reply["error"]["message"], "nope");
  EXPECT_FALSE(reply.contains("result"));
}

TEST(JsonRpcTest, MessageIdAcceptsIntegralStrings) {
  EXPECT_EQ(ramcp::MessageId({{"id", 42}}), 42);
  EXPECT_EQ(ramcp::MessageId({{"id", "17"}}), 17);
  EXPECT_FALSE(ramcp::MessageId({{"id", "progress-1"}}).has_value());
  EXPECT_FALSE(ramcp::MessageId({{"id", ""}}).has_value());
  EXPECT_FALSE(ramcp::MessageId({{"result", 1}}).has_value());
}

#include "RpcMessages.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("parseRpcRequest", "[RpcMessages]") {
  SECTION("Full request") {
    auto request = parseRpcRequest(json::parse(
        R"({"jsonrpc":"2.0","id":"abc","method":"tools/call","params":{"name":"hello"}})"));
    REQUIRE(request.jsonrpc == "2.0");
    REQUIRE(request.id == "abc");
    REQUIRE(request.hasId());
    REQUIRE(request.method == "tools/call");
    REQUIRE(request.params["name"] == "hello");
  }

  SECTION("Notification has no id") {
    auto request =
        parseRpcRequest(json::parse(R"({"jsonrpc":"2.0","method":"ping"})"));
    REQUIRE_FALSE(request.hasId());
    REQUIRE(request.params.is_null());
  }

  SECTION("Bad payloads") {
    REQUIRE_THROWS_AS(parseRpcRequest(json("just a string")),
                      RpcParseException);
    REQUIRE_THROWS_AS(parseRpcRequest(json::parse(R"({"method":5})")),
                      RpcParseException);
    REQUIRE_THROWS_AS(parseRpcRequest(json::array()), RpcParseException);
  }
}

TEST_CASE("rpcResponseToJson", "[RpcMessages]") {
  SECTION("Success echoes the id verbatim") {
    json id = {{"nested", 1}};
    json j = rpcResponseToJson(RpcResponse::success(id, {{"ok", true}}));
    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == id);
    REQUIRE(j["result"]["ok"] == true);
    REQUIRE_FALSE(j.contains("error"));
  }

  SECTION("Failure carries code and message") {
    json j = rpcResponseToJson(
        RpcResponse::failure(42, METHOD_NOT_FOUND, "Method not found: x"));
    REQUIRE(j["id"] == 42);
    REQUIRE(j["error"]["code"] == -32601);
    REQUIRE(j["error"]["message"] == "Method not found: x");
    REQUIRE_FALSE(j["error"].contains("data"));
    REQUIRE_FALSE(j.contains("result"));
  }

  SECTION("Missing id is omitted") {
    json j = rpcResponseToJson(
        RpcResponse::failure(json(), PARSE_ERROR, "Parse error"));
    REQUIRE_FALSE(j.contains("id"));
  }

  SECTION("Empty result object is still present") {
    json j = rpcResponseToJson(RpcResponse::success(1, json::object()));
    REQUIRE(j.contains("result"));
    REQUIRE(j["result"].empty());
  }
}

TEST_CASE("parseRpcResponse reads what rpcResponseToJson writes",
          "[RpcMessages]") {
  auto response = parseRpcResponse(rpcResponseToJson(
      RpcResponse::failure("req-1", INVALID_PARAMS, "Invalid params")));
  REQUIRE(response.id == "req-1");
  REQUIRE(response.error.has_value());
  REQUIRE(response.error->code == INVALID_PARAMS);
  REQUIRE(response.error->message == "Invalid params");
  REQUIRE_FALSE(response.result.has_value());

  REQUIRE_THROWS_AS(parseRpcResponse(json::parse(R"({"error":{"code":"x"}})")),
                    RpcParseException);
}

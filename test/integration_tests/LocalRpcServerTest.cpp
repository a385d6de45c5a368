#include "ActionConfig.hpp"
#include "ActionInvoker.hpp"
#include "LocalRpcServer.hpp"
#include "TestHeaders.hpp"
#include "httplib.h"

using namespace tt;

namespace {
const string MANIFEST = R"({
  "name": "local-test",
  "version": "0.3.0",
  "actions": [
    {
      "name": "hello",
      "description": "Say hello",
      "parameters": [{"name": "name", "required": true}],
      "script": {"shell": "echo \"Hello, {{name}}!\""}
    },
    {
      "name": "fails",
      "script": {"shell": "echo broken >&2; exit 3"}
    }
  ]
})";

class ThrowingHandler : public RpcHandler {
 public:
  virtual RpcResponse handleRequest(const RpcRequest&) override {
    throw std::runtime_error("handler exploded");
  }
};

shared_ptr<ProtocolDispatcher> makeDispatcher() {
  auto gate =
      make_shared<RegistrySwapGate>(ActionConfig::parse(MANIFEST).registry);
  auto runner = make_shared<ActionRunner>(
      make_shared<ProcessInvoker>(make_shared<SubprocessUtils>()),
      make_shared<HttpInvoker>());
  return make_shared<ProtocolDispatcher>(gate, runner);
}

json rpc(const json& id, const string& method, const json& params = json()) {
  json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
  if (!params.is_null()) {
    request["params"] = params;
  }
  return request;
}
}  // namespace

TEST_CASE("LocalRpcServer handles bodies", "[LocalRpcServer]") {
  LocalRpcServer server(makeDispatcher());
  int status = 0;

  SECTION("tools/list") {
    json response =
        json::parse(server.handleBody(rpc(1, "tools/list").dump(), &status));
    REQUIRE(status == 200);
    REQUIRE(response["id"] == 1);
    REQUIRE(response["result"]["tools"].size() == 2);
    REQUIRE(response["result"]["tools"][0]["name"] == "hello");
  }

  SECTION("Unknown methods are JSON-RPC errors") {
    string body = server.handleBody(rpc("a", "resources/list").dump(), &status);
    json response = json::parse(body);
    REQUIRE(status == 200);
    REQUIRE(response["error"]["code"] == -32601);
  }

  SECTION("Malformed bodies are rejected") {
    REQUIRE(server.handleBody("{\"jsonrpc\":", &status) == "Invalid JSON\n");
    REQUIRE(status == 400);
    status = 0;
    REQUIRE(server.handleBody("[1,2,3]", &status) == "Invalid JSON\n");
    REQUIRE(status == 400);
  }
}

TEST_CASE("LocalRpcServer maps handler exceptions", "[LocalRpcServer]") {
  LocalRpcServer server(make_shared<ThrowingHandler>());
  int status = 0;
  json response =
      json::parse(server.handleBody(rpc(9, "ping").dump(), &status));
  REQUIRE(status == 200);
  REQUIRE(response["id"] == 9);
  REQUIRE(response["error"]["code"] == -32603);
  REQUIRE(response["error"]["message"] == "handler exploded");
}

TEST_CASE("LocalRpcServer serves over HTTP", "[LocalRpcServer]") {
  LocalRpcServer server(makeDispatcher());
  int port = server.bind("127.0.0.1", 0);
  REQUIRE(port > 0);
  server.start();

  httplib::Client client("127.0.0.1", port);
  client.set_read_timeout(10, 0);

  SECTION("tools/call runs the action") {
    json params = {{"name", "hello"}, {"arguments", {{"name", "World"}}}};
    auto res = client.Post("/mcp", rpc(2, "tools/call", params).dump(),
                           "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->get_header_value("Content-Type") == "application/json");
    json response = json::parse(res->body);
    REQUIRE(response["result"]["isError"] == false);
    REQUIRE(response["result"]["content"][0]["type"] == "text");
    REQUIRE(response["result"]["content"][0]["text"] == "Hello, World!");
  }

  SECTION("A failing action is a tool error, not an RPC error") {
    json params = {{"name", "fails"}};
    auto res = client.Post("/mcp", rpc(3, "tools/call", params).dump(),
                           "application/json");
    REQUIRE(res);
    json response = json::parse(res->body);
    REQUIRE_FALSE(response.contains("error"));
    REQUIRE(response["result"]["isError"] == true);
    REQUIRE(response["result"]["content"][0]["text"] == "broken");
  }

  SECTION("Invalid JSON is a 400") {
    auto res = client.Post("/mcp", "not json", "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 400);
    REQUIRE(res->body == "Invalid JSON\n");
  }

  SECTION("Only POST is accepted on /mcp") {
    auto res = client.Get("/mcp");
    REQUIRE(res);
    REQUIRE(res->status == 405);
    REQUIRE(res->body == "Method not allowed\n");
  }

  SECTION("The event stream announces the endpoint") {
    string received;
    client.Get("/sse", [&received](const char* data, size_t length) {
      received.append(data, length);
      // Stop reading once the endpoint event has arrived
      return received.find("\n\n") == string::npos;
    });
    REQUIRE(received.find("event: endpoint\ndata: /mcp\n\n") == 0);
  }

  server.stop();
  server.stop();
}

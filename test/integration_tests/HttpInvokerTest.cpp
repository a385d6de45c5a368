#include "ActionInvoker.hpp"
#include "ProtocolDispatcher.hpp"
#include "TestHeaders.hpp"
#include "httplib.h"

using namespace tt;

namespace {
class FakeApi {
 public:
  FakeApi() {
    server.Get(R"(/weather/(\w+))",
               [](const httplib::Request& req, httplib::Response& res) {
                 json body = {{"city", req.matches[1].str()},
                              {"current", {{"temp", 21.5}}},
                              {"units", req.get_param_value("units")}};
                 res.set_content(body.dump(), "application/json");
               });
    server.Post("/echo", [](const httplib::Request& req,
                            httplib::Response& res) {
      json body = {{"body", req.body},
                   {"contentType", req.get_header_value("Content-Type")},
                   {"token", req.get_header_value("X-Token")}};
      res.set_content(body.dump(), "application/json");
    });
    server.Get("/fail", [](const httplib::Request&, httplib::Response& res) {
      res.status = 503;
      res.set_content("  service unavailable\n", "text/plain");
    });
    server.Get("/gone", [](const httplib::Request&, httplib::Response& res) {
      res.status = 502;
    });
    port = server.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);
    serverThread.reset(new thread([this]() { server.listen_after_bind(); }));
    while (!server.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  ~FakeApi() {
    server.stop();
    serverThread->join();
  }

  string url(const string& path) const {
    return "http://127.0.0.1:" + to_string(port) + path;
  }

  httplib::Server server;
  int port;
  unique_ptr<thread> serverThread;
};

Action httpAction(const string& name, const HttpExecution& execution) {
  Action action;
  action.name = name;
  action.execution = execution;
  return action;
}

ActionParameter parameter(const string& name, const string& defaultValue) {
  ActionParameter p;
  p.name = name;
  p.defaultValue = defaultValue;
  return p;
}
}  // namespace

TEST_CASE("HttpInvoker calls the endpoint", "[HttpInvoker]") {
  FakeApi api;
  HttpInvoker invoker;

  SECTION("GET with placeholders and json extraction") {
    HttpExecution execution;
    execution.url = api.url("/weather/{{city}}?units={{units}}");
    execution.extractJson = "current.temp";
    Action action = httpAction("weather", execution);
    action.parameters = {parameter("city", ""), parameter("units", "metric")};

    auto result = invoker.invoke(action, {{"city", "paris"}});
    REQUIRE_FALSE(result.hasError());
    REQUIRE(result.exitCode == 0);
    REQUIRE(result.output == "21.5");

    execution.extractJson = "units";
    action.execution = execution;
    result = invoker.invoke(action, {{"city", "oslo"}});
    REQUIRE(result.output == "metric");
  }

  SECTION("POST sends the expanded body and headers") {
    HttpExecution execution;
    execution.method = "POST";
    execution.url = api.url("/echo");
    execution.headers = {{"X-Token", "t-{{user}}"}};
    execution.body = R"({"user":"{{user}}"})";
    Action action = httpAction("echo", execution);

    auto result = invoker.invoke(action, {{"user", "ada"}});
    REQUIRE_FALSE(result.hasError());
    json echoed = json::parse(result.output);
    REQUIRE(echoed["body"] == R"({"user":"ada"})");
    REQUIRE(echoed["contentType"] == "application/json");
    REQUIRE(echoed["token"] == "t-ada");
  }

  SECTION("A missing extraction path keeps the raw body") {
    HttpExecution execution;
    execution.url = api.url("/weather/rome");
    execution.extractJson = "forecast.tomorrow";
    auto result = invoker.invoke(httpAction("weather", execution), json());
    REQUIRE(json::parse(result.output)["city"] == "rome");
  }

  SECTION("Error statuses are failures carrying only the body") {
    HttpExecution execution;
    execution.url = api.url("/fail");
    auto result = invoker.invoke(httpAction("fail", execution), json());
    REQUIRE(result.exitCode == 1);
    REQUIRE_FALSE(result.hasError());
    REQUIRE(result.output == "service unavailable");
  }

  SECTION("An error status with an empty body has empty output") {
    HttpExecution execution;
    execution.url = api.url("/gone");
    auto result = invoker.invoke(httpAction("gone", execution), json());
    REQUIRE(result.exitCode == 1);
    REQUIRE_FALSE(result.hasError());
    REQUIRE(result.output.empty());

    json content = ProtocolDispatcher::invocationToResult(result);
    REQUIRE(content["isError"] == true);
    REQUIRE(content["content"][0]["text"] == "");
  }

  SECTION("An oversized array index keeps the whole body") {
    HttpExecution execution;
    execution.url = api.url("/weather/lima");
    execution.extractJson = "current[184467440737095516160]";
    auto result = invoker.invoke(httpAction("weather", execution), json());
    REQUIRE(result.exitCode == 0);
    REQUIRE(json::parse(result.output)["city"] == "lima");
  }
}

TEST_CASE("HttpInvoker reports transport failures", "[HttpInvoker]") {
  HttpInvoker invoker;

  SECTION("Connection refused") {
    HttpExecution execution;
    execution.url = "http://127.0.0.1:1/nothing";
    execution.timeout = std::chrono::seconds(2);
    auto result = invoker.invoke(httpAction("down", execution), json());
    REQUIRE(result.exitCode == -1);
    REQUIRE(result.hasError());
    REQUIRE(result.output.find("Request failed: ") == 0);
  }

  SECTION("Malformed url") {
    HttpExecution execution;
    execution.url = "not a url";
    auto result = invoker.invoke(httpAction("broken", execution), json());
    REQUIRE(result.exitCode == -1);
    REQUIRE(result.output.find("Failed to create request") == 0);
  }
}

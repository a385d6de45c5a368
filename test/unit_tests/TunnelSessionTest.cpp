#include "FakeFrameTransport.hpp"
#include "TestHeaders.hpp"
#include "TunnelSession.hpp"

using namespace tt;

namespace {
const std::chrono::milliseconds WAIT_TIMEOUT(5000);
const string RELAY = "wss://relay.example.com";
const string REGISTERED =
    R"({"type":"registered","tunnel_id":"t1","tunnel_url":"https://relay.example.com/t/t1"})";

class EchoHandler : public RpcHandler {
 public:
  virtual RpcResponse handleRequest(const RpcRequest& request) override {
    return RpcResponse::success(request.id, {{"method", request.method}});
  }
};

bool waitUntil(function<bool()> condition) {
  auto deadline = std::chrono::steady_clock::now() + WAIT_TIMEOUT;
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

string headerValue(const vector<pair<string, string>>& headers,
                   const string& name) {
  for (const auto& it : headers) {
    if (it.first == name) {
      return it.second;
    }
  }
  return "";
}
}  // namespace

TEST_CASE("TunnelSession handshake", "[TunnelSession]") {
  auto transport = make_shared<FakeFrameTransport>();
  TunnelSession session(transport, RELAY, make_shared<EchoHandler>(), "1.4.0",
                        3);
  vector<string> clients;
  mutex clientsMutex;
  session.onClientConnected([&](const string& clientIp) {
    lock_guard<mutex> guard(clientsMutex);
    clients.push_back(clientIp);
  });

  transport->push(REGISTERED);
  REQUIRE(session.connect() == "https://relay.example.com/t/t1");
  REQUIRE(session.getTunnelUrl() == "https://relay.example.com/t/t1");
  REQUIRE(session.getTunnelId() == "t1");
  REQUIRE(session.isRunning());

  auto endpoint = transport->getConnectedEndpoint();
  REQUIRE(endpoint.secure);
  REQUIRE(endpoint.host == "relay.example.com");
  REQUIRE(endpoint.target == "/tunnel");
  auto headers = transport->getConnectHeaders();
  REQUIRE(headerValue(headers, "X-Client-Version") == "1.4.0");
  REQUIRE(headerValue(headers, "X-Tool-Count") == "3");
  REQUIRE(headerValue(headers, "User-Agent") == "tooltunnel/1.4.0");

  SECTION("Requests are answered after the handshake") {
    transport->push(
        R"({"type":"request","request_id":"r1","payload":{"jsonrpc":"2.0","id":1,"method":"ping"}})");
    transport->push(R"({"type":"client_connected","client_ip":"192.0.2.1"})");
    REQUIRE(transport->waitForWrittenFrames(1, WAIT_TIMEOUT));
    Envelope reply = parseEnvelope(transport->getWrittenFrames()[0]);
    REQUIRE(reply.type == EnvelopeType::RESPONSE);
    REQUIRE(reply.requestId == "r1");
    REQUIRE(reply.payload["result"]["method"] == "ping");

    transport->pushClose(true);
    session.wait();
    REQUIRE(waitUntil([&session] { return !session.isRunning(); }));
    lock_guard<mutex> guard(clientsMutex);
    REQUIRE(clients == vector<string>{"192.0.2.1"});
  }

  SECTION("Abnormal close fails wait") {
    transport->pushClose(false);
    REQUIRE_THROWS_AS(session.wait(), TunnelSessionException);
    REQUIRE(waitUntil([&session] { return !session.isRunning(); }));
  }

  SECTION("Malformed frame fails wait") {
    transport->push("not json");
    REQUIRE_THROWS_AS(session.wait(), TunnelSessionException);
  }

  SECTION("close ends wait without an error") {
    thread closer([&session]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      session.close();
    });
    session.wait();
    closer.join();
    session.close();
    REQUIRE(transport->isClosed());
    REQUIRE(transport->getCloseCount() == 1);
    REQUIRE(waitUntil([&session] { return !session.isRunning(); }));
  }
}

TEST_CASE("TunnelSession rejects a bad handshake", "[TunnelSession]") {
  auto transport = make_shared<FakeFrameTransport>();
  TunnelSession session(transport, RELAY, make_shared<EchoHandler>(), "1.0.0",
                        0);

  SECTION("Unexpected first frame") {
    transport->push(R"({"type":"error","error":"tunnel limit reached"})");
    try {
      session.connect();
      FAIL("connect should have thrown");
    } catch (const TunnelConnectException& tce) {
      REQUIRE(tce.getReason() == TunnelConnectException::HANDSHAKE_FAILED);
      REQUIRE(string(tce.what()).find("error") != string::npos);
    }
  }

  SECTION("Relay closes before registering") {
    transport->pushClose(true);
    REQUIRE_THROWS_AS(session.connect(), TunnelConnectException);
  }

  SECTION("Relay sends garbage") {
    transport->push("<html>");
    REQUIRE_THROWS_AS(session.connect(), TunnelConnectException);
  }

  REQUIRE(transport->isClosed());
  REQUIRE_FALSE(session.isRunning());
  REQUIRE_THROWS_AS(session.wait(), TunnelSessionException);
}

TEST_CASE("TunnelSession reports dial failures", "[TunnelSession]") {
  auto transport = make_shared<FakeFrameTransport>();

  SECTION("Version rejected") {
    transport->failConnect(TransportException::UPGRADE_REQUIRED,
                           "HTTP 426 Upgrade Required");
    TunnelSession session(transport, RELAY, make_shared<EchoHandler>(),
                          "0.0.1", 0);
    try {
      session.connect();
      FAIL("connect should have thrown");
    } catch (const TunnelConnectException& tce) {
      REQUIRE(tce.getReason() == TunnelConnectException::VERSION_REJECTED);
    }
    REQUIRE_FALSE(session.isRunning());
  }

  SECTION("Relay unreachable") {
    transport->failConnect(TransportException::CONNECT_FAILED,
                           "connection refused");
    TunnelSession session(transport, RELAY, make_shared<EchoHandler>(),
                          "1.0.0", 0);
    try {
      session.connect();
      FAIL("connect should have thrown");
    } catch (const TunnelConnectException& tce) {
      REQUIRE(tce.getReason() == TunnelConnectException::RELAY_UNREACHABLE);
      REQUIRE(string(tce.what()).find("connection refused") != string::npos);
    }
  }

  SECTION("Invalid relay url") {
    TunnelSession session(transport, "http://relay.example.com",
                          make_shared<EchoHandler>(), "1.0.0", 0);
    REQUIRE_THROWS_AS(session.connect(), TunnelConnectException);
  }
}

TEST_CASE("TunnelSession keepalive", "[TunnelSession]") {
  auto transport = make_shared<FakeFrameTransport>();
  TunnelSession session(transport, RELAY, make_shared<EchoHandler>(), "1.0.0",
                        0, std::chrono::milliseconds(20));
  transport->push(REGISTERED);
  session.connect();

  REQUIRE(transport->waitForPings(3, WAIT_TIMEOUT));
  REQUIRE(session.isKeepaliveRunning());

  SECTION("A failed keepalive write stops only the keepalive loop") {
    transport->failWrites(true);
    REQUIRE(waitUntil([&session] { return !session.isKeepaliveRunning(); }));
    REQUIRE(session.isRunning());

    transport->pushClose(true);
    session.wait();
  }

  SECTION("The keepalive loop stops when the read loop ends") {
    transport->pushClose(true);
    session.wait();
    REQUIRE(waitUntil([&session] { return !session.isKeepaliveRunning(); }));
  }
}

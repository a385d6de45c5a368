#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "TestHeaders.hpp"
#include "WebSocketTransport.hpp"

using namespace tt;

namespace {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

typedef http::request<http::string_body> UpgradeRequest;

/**
 * Accepts one connection on a loopback port and runs a scripted relay on its
 * own thread. The script must not use Catch assertions; it records what it
 * saw and the test checks it after join().
 */
class LoopbackRelay {
 public:
  explicit LoopbackRelay(function<void(tcp::socket&, const UpgradeRequest&)>
                             _script)
      : acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        script(_script) {
    relayThread.reset(new thread([this]() {
      try {
        tcp::socket socket(ioc);
        acceptor.accept(socket);
        beast::flat_buffer buffer;
        UpgradeRequest request;
        http::read(socket, buffer, request);
        script(socket, request);
      } catch (const std::exception& e) {
        error = e.what();
      }
    }));
  }

  ~LoopbackRelay() { join(); }

  void join() {
    if (relayThread) {
      relayThread->join();
      relayThread.reset();
    }
  }

  RelayEndpoint endpoint() const {
    RelayEndpoint endpoint;
    endpoint.secure = false;
    endpoint.host = "127.0.0.1";
    endpoint.port = to_string(acceptor.local_endpoint().port());
    endpoint.target = "/tunnel";
    return endpoint;
  }

  net::io_context ioc;
  tcp::acceptor acceptor;
  function<void(tcp::socket&, const UpgradeRequest&)> script;
  unique_ptr<thread> relayThread;
  string error;
};

// Frames look like "<seq>:" followed by filler derived from seq
string makeFrame(int seq, size_t size) {
  string frame = to_string(seq) + ":";
  frame.append(size - frame.size(), (char)('a' + seq % 26));
  return frame;
}

bool isIntactFrame(const string& frame, size_t size) {
  auto colon = frame.find(':');
  if (frame.size() != size || colon == string::npos || colon == 0) {
    return false;
  }
  int seq = stoi(frame.substr(0, colon));
  return frame == makeFrame(seq, size);
}
}  // namespace

TEST_CASE("WebSocketTransport handshake", "[WebSocketTransport]") {
  string clientVersion;
  string target;
  string received;
  LoopbackRelay relay([&](tcp::socket& socket, const UpgradeRequest& request) {
    clientVersion = string(request["X-Client-Version"]);
    target = string(request.target());
    websocket::stream<tcp::socket> ws(std::move(socket));
    ws.accept(request);
    ws.text(true);
    ws.write(net::buffer(string(R"({"type":"registered"})")));
    beast::flat_buffer buffer;
    ws.read(buffer);
    received = beast::buffers_to_string(buffer.data());
    ws.close(websocket::close_code::normal);
    // Drain until the client answers the close
    beast::error_code ec;
    ws.read(buffer, ec);
  });

  WebSocketTransport transport;
  transport.connect(relay.endpoint(), {{"X-Client-Version", "2.0.0"}});
  string frame;
  REQUIRE(transport.readFrame(&frame));
  REQUIRE(frame == R"({"type":"registered"})");
  transport.writeFrame("hello relay");
  REQUIRE_FALSE(transport.readFrame(&frame));
  relay.join();

  REQUIRE(relay.error.empty());
  REQUIRE(clientVersion == "2.0.0");
  REQUIRE(target == "/tunnel");
  REQUIRE(received == "hello relay");
  transport.close();
  transport.close();
}

TEST_CASE("WebSocketTransport keeps frames intact under relay pings",
          "[WebSocketTransport]") {
  const int WRITERS = 3;
  const int FRAMES_PER_WRITER = 60;
  const size_t FRAME_SIZE = 128 * 1024;
  const int TOTAL = WRITERS * FRAMES_PER_WRITER;

  int intact = 0;
  LoopbackRelay relay([&](tcp::socket& socket, const UpgradeRequest& request) {
    websocket::stream<tcp::socket> ws(std::move(socket));
    ws.read_message_max(FRAME_SIZE * 2);
    ws.accept(request);
    ws.text(true);
    for (int a = 0; a < TOTAL; a++) {
      ws.ping({});
      beast::flat_buffer buffer;
      ws.read(buffer);
      if (isIntactFrame(beast::buffers_to_string(buffer.data()), FRAME_SIZE)) {
        intact++;
      }
    }
    // Wait for the client to finish pinging before starting the close
    beast::flat_buffer bye;
    ws.read(bye);
    ws.write(net::buffer(string("done")));
    ws.close(websocket::close_code::normal);
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws.read(buffer, ec);
  });

  WebSocketTransport transport;
  transport.connect(relay.endpoint(), {});

  vector<string> inbound;
  string readError;
  thread reader([&]() {
    try {
      string frame;
      while (transport.readFrame(&frame)) {
        inbound.push_back(frame);
      }
    } catch (const TransportException& te) {
      readError = te.what();
    }
  });

  atomic<bool> writing(true);
  atomic<int> writeFailures(0);
  thread keepalive([&]() {
    while (writing) {
      try {
        transport.writePing();
      } catch (const TransportException&) {
        writeFailures++;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  });

  vector<unique_ptr<thread>> writers;
  for (int w = 0; w < WRITERS; w++) {
    writers.emplace_back(new thread([&, w]() {
      for (int a = 0; a < FRAMES_PER_WRITER; a++) {
        try {
          int seq = w * FRAMES_PER_WRITER + a;
          transport.writeFrame(makeFrame(seq, FRAME_SIZE));
        } catch (const TransportException&) {
          writeFailures++;
        }
      }
    }));
  }
  for (auto& it : writers) {
    it->join();
  }
  writing = false;
  keepalive.join();
  transport.writeFrame("bye");
  reader.join();
  relay.join();

  REQUIRE(relay.error.empty());
  REQUIRE(writeFailures.load() == 0);
  REQUIRE(readError.empty());
  REQUIRE(intact == TOTAL);
  REQUIRE(inbound == vector<string>{"done"});
}

TEST_CASE("WebSocketTransport reports closes", "[WebSocketTransport]") {
  SECTION("Abnormal close code") {
    LoopbackRelay relay(
        [&](tcp::socket& socket, const UpgradeRequest& request) {
          websocket::stream<tcp::socket> ws(std::move(socket));
          ws.accept(request);
          ws.close(websocket::close_code::policy_error);
          beast::flat_buffer buffer;
          beast::error_code ec;
          ws.read(buffer, ec);
        });
    WebSocketTransport transport;
    transport.connect(relay.endpoint(), {});
    string frame;
    try {
      transport.readFrame(&frame);
      FAIL("readFrame should have thrown");
    } catch (const TransportException& te) {
      REQUIRE(te.getKind() == TransportException::READ_FAILED);
      REQUIRE(string(te.what()).find("1008") != string::npos);
    }
  }

  SECTION("Local close unblocks the reader and fails later writes") {
    LoopbackRelay relay(
        [&](tcp::socket& socket, const UpgradeRequest& request) {
          websocket::stream<tcp::socket> ws(std::move(socket));
          ws.accept(request);
          beast::flat_buffer buffer;
          beast::error_code ec;
          ws.read(buffer, ec);
        });
    WebSocketTransport transport;
    transport.connect(relay.endpoint(), {});

    TransportException::Kind readKind = TransportException::READ_FAILED;
    thread reader([&]() {
      string frame;
      try {
        transport.readFrame(&frame);
      } catch (const TransportException& te) {
        readKind = te.getKind();
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    transport.close();
    reader.join();
    REQUIRE(readKind == TransportException::CLOSED);
    REQUIRE_THROWS_AS(transport.writeFrame("late"), TransportException);
    REQUIRE_THROWS_AS(transport.writePing(), TransportException);
  }
}

TEST_CASE("WebSocketTransport reports dial failures", "[WebSocketTransport]") {
  SECTION("Upgrade required") {
    LoopbackRelay relay(
        [&](tcp::socket& socket, const UpgradeRequest& request) {
          http::response<http::string_body> response{
              http::status::upgrade_required, request.version()};
          response.body() = "client too old";
          response.prepare_payload();
          http::write(socket, response);
        });
    WebSocketTransport transport;
    try {
      transport.connect(relay.endpoint(), {});
      FAIL("connect should have thrown");
    } catch (const TransportException& te) {
      REQUIRE(te.getKind() == TransportException::UPGRADE_REQUIRED);
    }
  }

  SECTION("Nothing listening") {
    RelayEndpoint endpoint;
    {
      net::io_context ioc;
      tcp::acceptor acceptor(
          ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
      endpoint.secure = false;
      endpoint.host = "127.0.0.1";
      endpoint.port = to_string(acceptor.local_endpoint().port());
    }
    WebSocketTransport transport;
    try {
      transport.connect(endpoint, {});
      FAIL("connect should have thrown");
    } catch (const TransportException& te) {
      REQUIRE(te.getKind() == TransportException::CONNECT_FAILED);
    }
    string frame;
    REQUIRE_THROWS_AS(transport.readFrame(&frame), TransportException);
  }
}

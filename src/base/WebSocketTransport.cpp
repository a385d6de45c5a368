#include "WebSocketTransport.hpp"

#include <openssl/err.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <future>

namespace tt {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

typedef websocket::stream<beast::tcp_stream> PlainWebSocket;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> TlsWebSocket;

namespace {
struct PendingWrite {
  bool ping = false;
  string frame;
  std::promise<void> done;
};

enum ReadEnd {
  READ_OPEN,
  READ_NORMAL,
  READ_CLOSED,
  READ_FAILED,
};

void failWrite(const shared_ptr<PendingWrite>& write,
               TransportException::Kind kind, const string& message) {
  write->done.set_exception(
      std::make_exception_ptr(TransportException(kind, message)));
}
}  // namespace

struct WebSocketTransport::Impl {
  Impl()
      : strand(net::make_strand(ioc)),
        sslContext(ssl::context::tls_client),
        workGuard(net::make_work_guard(ioc)),
        writing(false),
        stopped(false),
        readEnd(READ_OPEN) {}

  // Runs fn against whichever stream is active
  template <typename Fn>
  void withStream(Fn&& fn) {
    if (tlsStream) {
      fn(*tlsStream);
    } else if (plainStream) {
      fn(*plainStream);
    } else {
      throw TransportException(TransportException::CLOSED,
                               "websocket is not connected");
    }
  }

  // The methods below run on the strand only

  void startRead() {
    withStream([this](auto& ws) {
      ws.async_read(readBuffer, [this, &ws](beast::error_code ec, size_t) {
        onRead(ec, ws.reason());
      });
    });
  }

  void onRead(const beast::error_code& ec,
              const websocket::close_reason& reason) {
    if (!ec) {
      {
        lock_guard<mutex> guard(inboundMutex);
        inbound.push_back(beast::buffers_to_string(readBuffer.data()));
      }
      readBuffer.consume(readBuffer.size());
      inboundCondition.notify_all();
      startRead();
      return;
    }

    ReadEnd end = READ_FAILED;
    string error;
    if (stopped || ec == net::error::operation_aborted) {
      end = READ_CLOSED;
      error = "websocket is closed";
    } else if (ec == websocket::error::closed) {
      int code = reason.code;
      if (code == websocket::close_code::normal ||
          code == websocket::close_code::going_away) {
        VLOG(1) << "Relay closed the websocket: " << code;
        end = READ_NORMAL;
      } else {
        error = "websocket closed with code " + to_string(code) + ": " +
                string(reason.reason.c_str());
      }
    } else {
      error = "websocket read failed: " + ec.message();
    }
    {
      lock_guard<mutex> guard(inboundMutex);
      readEnd = end;
      readError = error;
    }
    inboundCondition.notify_all();
  }

  void enqueueWrite(const shared_ptr<PendingWrite>& write) {
    if (stopped) {
      failWrite(write, TransportException::CLOSED, "websocket is closed");
      return;
    }
    writeQueue.push_back(write);
    if (!writing) {
      startWrite();
    }
  }

  void startWrite() {
    writing = true;
    auto write = writeQueue.front();
    withStream([this, write](auto& ws) {
      if (write->ping) {
        ws.async_ping({}, [this](beast::error_code ec) { onWrite(ec); });
      } else {
        ws.async_write(net::buffer(write->frame),
                       [this](beast::error_code ec, size_t) { onWrite(ec); });
      }
    });
  }

  void onWrite(const beast::error_code& ec) {
    auto write = writeQueue.front();
    writeQueue.pop_front();
    writing = false;
    if (!ec) {
      write->done.set_value();
    } else if (stopped) {
      failWrite(write, TransportException::CLOSED, "websocket is closed");
    } else {
      failWrite(write, TransportException::WRITE_FAILED,
                string("websocket ") + (write->ping ? "ping" : "write") +
                    " failed: " + ec.message());
    }
    if (!writeQueue.empty() && !stopped) {
      startWrite();
    }
  }

  void shutdown() {
    stopped = true;
    // The write in flight, if any, completes through onWrite
    auto firstQueued = writeQueue.begin() + (writing ? 1 : 0);
    for (auto it = firstQueued; it != writeQueue.end(); ++it) {
      failWrite(*it, TransportException::CLOSED, "websocket is closed");
    }
    writeQueue.erase(firstQueued, writeQueue.end());

    // Drop the socket without a close handshake; pending operations abort
    withStream([](auto& ws) {
      beast::error_code ec;
      auto& socket = beast::get_lowest_layer(ws).socket();
      socket.shutdown(tcp::socket::shutdown_both, ec);
      socket.close(ec);
    });
  }

  net::io_context ioc;
  net::strand<net::io_context::executor_type> strand;
  ssl::context sslContext;
  net::executor_work_guard<net::io_context::executor_type> workGuard;
  unique_ptr<PlainWebSocket> plainStream;
  unique_ptr<TlsWebSocket> tlsStream;
  unique_ptr<thread> ioThread;

  beast::flat_buffer readBuffer;
  deque<shared_ptr<PendingWrite>> writeQueue;
  bool writing;
  bool stopped;

  mutex inboundMutex;
  condition_variable inboundCondition;
  deque<string> inbound;
  ReadEnd readEnd;
  string readError;
};

namespace {
template <typename WebSocket>
void upgrade(WebSocket& ws, const RelayEndpoint& endpoint,
             const vector<pair<string, string>>& headers) {
  ws.set_option(websocket::stream_base::decorator(
      [headers](websocket::request_type& req) {
        for (const auto& it : headers) {
          req.set(it.first, it.second);
        }
      }));

  websocket::response_type response;
  beast::error_code ec;
  ws.handshake(response, endpoint.hostHeader(), endpoint.target, ec);
  if (ec) {
    if (response.result() == http::status::upgrade_required) {
      throw TransportException(
          TransportException::UPGRADE_REQUIRED,
          "relay rejected this client version (HTTP 426): " + response.body());
    }
    throw TransportException(
        TransportException::CONNECT_FAILED,
        "websocket handshake with " + endpoint.toString() +
            " failed: " + ec.message() + " (HTTP " +
            to_string(response.result_int()) + ")");
  }
  ws.text(true);
}
}  // namespace

WebSocketTransport::WebSocketTransport()
    : impl(new Impl()), verifyPeer(true), connected(false), closed(false) {}

WebSocketTransport::~WebSocketTransport() { close(); }

void WebSocketTransport::connect(const RelayEndpoint& endpoint,
                                 const vector<pair<string, string>>& headers) {
  lock_guard<mutex> guard(closeMutex);
  if (connected || closed) {
    throw TransportException(TransportException::CONNECT_FAILED,
                             "websocket transport cannot be reused");
  }
  beast::error_code ec;
  tcp::resolver resolver(impl->ioc);
  auto results = resolver.resolve(endpoint.host, endpoint.port, ec);
  if (ec) {
    throw TransportException(TransportException::CONNECT_FAILED,
                             "could not resolve " + endpoint.host + ": " +
                                 ec.message());
  }

  if (endpoint.secure) {
    if (verifyPeer) {
      impl->sslContext.set_default_verify_paths(ec);
      if (ec) {
        LOG(WARNING) << "Could not load default CA paths: " << ec.message();
      }
    }
    impl->tlsStream.reset(new TlsWebSocket(impl->strand, impl->sslContext));
    auto& ws = *(impl->tlsStream);
    beast::get_lowest_layer(ws).connect(results, ec);
    if (ec) {
      impl->tlsStream.reset();
      throw TransportException(TransportException::CONNECT_FAILED,
                               "could not reach relay " + endpoint.toString() +
                                   ": " + ec.message());
    }
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                  endpoint.host.c_str())) {
      beast::error_code sniError{static_cast<int>(::ERR_get_error()),
                                 net::error::get_ssl_category()};
      impl->tlsStream.reset();
      throw TransportException(TransportException::CONNECT_FAILED,
                               "could not set SNI host name: " +
                                   sniError.message());
    }
    if (verifyPeer) {
      ws.next_layer().set_verify_mode(ssl::verify_peer);
      ws.next_layer().set_verify_callback(
          ssl::host_name_verification(endpoint.host));
    } else {
      ws.next_layer().set_verify_mode(ssl::verify_none);
    }
    ws.next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
      impl->tlsStream.reset();
      throw TransportException(TransportException::CONNECT_FAILED,
                               "TLS handshake with " + endpoint.host +
                                   " failed: " + ec.message());
    }
    try {
      upgrade(ws, endpoint, headers);
    } catch (const TransportException&) {
      impl->tlsStream.reset();
      throw;
    }
  } else {
    impl->plainStream.reset(new PlainWebSocket(impl->strand));
    auto& ws = *(impl->plainStream);
    beast::get_lowest_layer(ws).connect(results, ec);
    if (ec) {
      impl->plainStream.reset();
      throw TransportException(TransportException::CONNECT_FAILED,
                               "could not reach relay " + endpoint.toString() +
                                   ": " + ec.message());
    }
    try {
      upgrade(ws, endpoint, headers);
    } catch (const TransportException&) {
      impl->plainStream.reset();
      throw;
    }
  }

  impl->ioThread.reset(new thread([this]() {
    el::Helpers::setThreadName("websocket-io");
    impl->ioc.run();
  }));
  net::post(impl->strand, [this]() { impl->startRead(); });
  connected = true;
  VLOG(1) << "Websocket established to " << endpoint.toString();
}

bool WebSocketTransport::readFrame(string* frame) {
  if (!connected) {
    throw TransportException(TransportException::CLOSED,
                             "websocket is not connected");
  }
  unique_lock<mutex> lock(impl->inboundMutex);
  impl->inboundCondition.wait(lock, [this] {
    return closed || !impl->inbound.empty() || impl->readEnd != READ_OPEN;
  });
  if (closed) {
    throw TransportException(TransportException::CLOSED,
                             "websocket is closed");
  }
  if (!impl->inbound.empty()) {
    *frame = impl->inbound.front();
    impl->inbound.pop_front();
    return true;
  }
  switch (impl->readEnd) {
    case READ_NORMAL:
      return false;
    case READ_CLOSED:
      throw TransportException(TransportException::CLOSED,
                               "websocket is closed");
    default:
      throw TransportException(TransportException::READ_FAILED,
                               impl->readError);
  }
}

void WebSocketTransport::send(bool ping, const string& frame) {
  auto write = make_shared<PendingWrite>();
  write->ping = ping;
  write->frame = frame;
  auto done = write->done.get_future();
  {
    // close() posts its shutdown under the same lock, so this write reaches
    // the strand first and is either sent or failed there
    lock_guard<mutex> guard(closeMutex);
    if (!connected || closed) {
      throw TransportException(TransportException::CLOSED,
                               "websocket is closed");
    }
    net::post(impl->strand, [this, write]() { impl->enqueueWrite(write); });
  }
  done.get();
}

void WebSocketTransport::writeFrame(const string& frame) { send(false, frame); }

void WebSocketTransport::writePing() { send(true, ""); }

void WebSocketTransport::close() {
  {
    lock_guard<mutex> guard(closeMutex);
    if (closed.exchange(true)) {
      return;
    }
    if (connected) {
      net::post(impl->strand, [this]() { impl->shutdown(); });
    }
  }
  {
    lock_guard<mutex> guard(impl->inboundMutex);
  }
  impl->inboundCondition.notify_all();

  if (impl->ioThread) {
    impl->workGuard.reset();
    impl->ioThread->join();
    impl->ioThread.reset();
    LOG(INFO) << "Websocket closed";
  }
}
}  // namespace tt

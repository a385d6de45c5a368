#ifndef __TT_TUNNEL_SESSION__
#define __TT_TUNNEL_SESSION__

#include "FrameTransport.hpp"
#include "Headers.hpp"
#include "MessageMultiplexer.hpp"
#include "ProtocolDispatcher.hpp"

namespace tt {
/**
 * @brief Thrown by TunnelSession::connect().
 */
class TunnelConnectException : public std::runtime_error {
 public:
  enum Reason {
    RELAY_UNREACHABLE,
    VERSION_REJECTED,
    HANDSHAKE_FAILED,
  };

  TunnelConnectException(Reason _reason, const string& msg)
      : std::runtime_error(msg), reason(_reason) {}

  Reason getReason() const { return reason; }

 private:
  Reason reason;
};

/**
 * @brief Thrown by TunnelSession::wait() when the connection ended abnormally.
 */
class TunnelSessionException : public std::runtime_error {
 public:
  explicit TunnelSessionException(const string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief One connection to the relay, from handshake to close.
 *
 * connect() performs the handshake synchronously, then starts the read loop
 * and the keepalive loop on their own threads. A session is never reused:
 * after it ends the host builds a new one if it wants to reconnect.
 */
class TunnelSession {
 public:
  TunnelSession(shared_ptr<FrameTransport> _transport, const string& _relayUrl,
                shared_ptr<RpcHandler> _handler, const string& _clientVersion,
                int _actionCount,
                std::chrono::milliseconds _keepaliveInterval =
                    std::chrono::seconds(TUNNEL_KEEP_ALIVE_DURATION));

  /**
   * @brief Closes the connection and joins the background threads.
   */
  virtual ~TunnelSession();

  /**
   * @brief Registers an observer for client_connected notifications. Must be
   * called before connect().
   */
  void onClientConnected(function<void(const string&)> listener) {
    clientConnectedListener = listener;
  }

  /**
   * @brief Dials the relay, sends the client headers and waits for the
   * `registered` frame.
   * @return The public tunnel URL.
   * @throws TunnelConnectException on any failure; the transport is closed and
   * no background thread is left running.
   */
  string connect();

  /**
   * @brief Blocks until the read loop ends.
   * @throws TunnelSessionException if it ended with a transport or framing
   * error that was not caused by close().
   */
  void wait();

  /**
   * @brief Releases the transport. Safe to call repeatedly and from any
   * thread, including while another thread is blocked in wait().
   */
  void close();

  const string& getTunnelUrl() const { return tunnelUrl; }
  const string& getTunnelId() const { return tunnelId; }

  /** @brief True while the read loop or the keepalive loop is running. */
  bool isRunning() const { return readerRunning || keepaliveRunning; }
  bool isKeepaliveRunning() const { return keepaliveRunning; }

  vector<pair<string, string>> getHandshakeHeaders() const;

 protected:
  shared_ptr<FrameTransport> transport;
  string relayUrl;
  shared_ptr<RpcHandler> handler;
  string clientVersion;
  int actionCount;
  std::chrono::milliseconds keepaliveInterval;
  function<void(const string&)> clientConnectedListener;

  string tunnelUrl;
  string tunnelId;
  shared_ptr<MessageMultiplexer> multiplexer;
  unique_ptr<thread> readerThread;
  unique_ptr<thread> keepaliveThread;
  atomic<bool> readerRunning;
  atomic<bool> keepaliveRunning;

  mutex stateMutex;
  condition_variable stateCondition;
  bool connected;
  bool done;
  bool closing;
  string failure;

  Envelope readRegistration();
  void runReader();
  void runKeepalive();
};
}  // namespace tt

#endif  // __TT_TUNNEL_SESSION__

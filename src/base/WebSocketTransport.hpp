#ifndef __TT_WEBSOCKET_TRANSPORT__
#define __TT_WEBSOCKET_TRANSPORT__

#include "FrameTransport.hpp"

namespace tt {
/**
 * @brief FrameTransport over a WebSocket (RFC 6455) client connection.
 *
 * The handshake runs synchronously on the caller's thread. After that every
 * operation on the Boost.Beast stream runs on one strand served by a private
 * io thread: a continuous async_read feeds readFrame(), and writes and pings
 * from any thread are queued and drained one at a time. Control frames the
 * stream answers by itself (pong, close) share that strand with our writes.
 */
class WebSocketTransport : public FrameTransport {
 public:
  WebSocketTransport();
  virtual ~WebSocketTransport();

  virtual void connect(const RelayEndpoint& endpoint,
                       const vector<pair<string, string>>& headers);
  virtual bool readFrame(string* frame);
  virtual void writeFrame(const string& frame);
  virtual void writePing();
  virtual void close();

  /** @brief Disables certificate verification (for self-signed relays). */
  void setVerifyPeer(bool verify) { verifyPeer = verify; }

 protected:
  struct Impl;
  unique_ptr<Impl> impl;
  bool verifyPeer;
  atomic<bool> connected;
  atomic<bool> closed;
  mutex closeMutex;

  // Queues one outbound frame on the strand and blocks until it is sent
  void send(bool ping, const string& frame);
};
}  // namespace tt

#endif  // __TT_WEBSOCKET_TRANSPORT__

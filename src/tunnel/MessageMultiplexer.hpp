#ifndef __TT_MESSAGE_MULTIPLEXER__
#define __TT_MESSAGE_MULTIPLEXER__

#include "Envelope.hpp"
#include "FrameTransport.hpp"
#include "Headers.hpp"
#include "ProtocolDispatcher.hpp"

namespace tt {
/**
 * @brief Reads envelopes off the relay connection and fans requests out to
 * worker threads.
 *
 * There is exactly one reader (the thread calling run()). Every write, from
 * request workers, inline pongs and the keepalive, goes through one write
 * mutex so frames never interleave. Responses are written as they complete and
 * carry the request_id of the envelope they answer.
 */
class MessageMultiplexer {
 public:
  MessageMultiplexer(shared_ptr<FrameTransport> _transport,
                     shared_ptr<RpcHandler> _handler);

  /**
   * @brief Waits for every request worker to finish.
   */
  ~MessageMultiplexer();

  void setClientConnectedListener(
      function<void(const string&)> _clientConnectedListener) {
    clientConnectedListener = _clientConnectedListener;
  }

  /**
   * @brief Runs the read loop until the connection ends.
   *
   * Returns when the peer closes normally.
   * @throws TransportException or EnvelopeParseException otherwise.
   */
  void run();

  /**
   * @brief Sends one envelope under the write mutex.
   * @throws TransportException on failure.
   */
  void writeEnvelope(const Envelope& envelope);

  /**
   * @brief Sends a transport-level ping under the write mutex.
   * @throws TransportException on failure.
   */
  void writeKeepalive();

  /**
   * @brief Decodes the RPC request in `envelope`, dispatches it and builds
   * the response envelope. Never throws for bad input or handler failures;
   * those become -32700 and -32603 responses.
   */
  Envelope processRequest(const Envelope& envelope);

  /** @brief Blocks until all request workers have exited. */
  void waitForRequests();

  int getActiveRequestCount();

 protected:
  shared_ptr<FrameTransport> transport;
  shared_ptr<RpcHandler> handler;
  function<void(const string&)> clientConnectedListener;

  mutex writeMutex;

  recursive_mutex requestMutex;
  map<int64_t, shared_ptr<thread>> requestThreads;
  vector<int64_t> finishedRequests;
  int64_t nextRequestId;
  atomic<int> activeRequests;

  void handleEnvelope(const Envelope& envelope);
  void startRequest(const Envelope& envelope);
  void runRequest(int64_t workerId, Envelope envelope);
  void reapFinishedRequests();
};
}  // namespace tt

#endif  // __TT_MESSAGE_MULTIPLEXER__

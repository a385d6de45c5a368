#ifndef __TT_FRAME_TRANSPORT__
#define __TT_FRAME_TRANSPORT__

#include "Headers.hpp"
#include "RelayEndpoint.hpp"

namespace tt {
/**
 * @brief Failure reported by a FrameTransport.
 */
class TransportException : public std::runtime_error {
 public:
  enum Kind {
    CONNECT_FAILED,
    UPGRADE_REQUIRED,
    READ_FAILED,
    WRITE_FAILED,
    CLOSED,
  };

  TransportException(Kind _kind, const string& msg)
      : std::runtime_error(msg), kind(_kind) {}

  Kind getKind() const { return kind; }

 private:
  Kind kind;
};

/**
 * @brief Provides an abstract API for a message-framed, bidirectional
 * connection to the relay.
 *
 * One thread may be blocked in readFrame() while another writes; callers are
 * responsible for serializing writers among themselves.
 */
class FrameTransport {
 public:
  virtual ~FrameTransport() {}

  /**
   * @brief Opens the connection and performs the upgrade handshake.
   * @param headers Extra headers attached to the handshake request.
   * @throws TransportException (CONNECT_FAILED or UPGRADE_REQUIRED).
   */
  virtual void connect(const RelayEndpoint& endpoint,
                       const vector<pair<string, string>>& headers) = 0;

  /**
   * @brief Blocks until one complete frame arrives.
   * @return false when the peer closed with a normal-closure or going-away
   * code.
   * @throws TransportException on any other close or transport failure.
   */
  virtual bool readFrame(string* frame) = 0;

  /**
   * @brief Sends one text frame.
   * @throws TransportException (WRITE_FAILED or CLOSED).
   */
  virtual void writeFrame(const string& frame) = 0;

  /**
   * @brief Sends a transport-level liveness frame.
   * @throws TransportException (WRITE_FAILED or CLOSED).
   */
  virtual void writePing() = 0;

  /**
   * @brief Releases the connection. Safe to call more than once and from a
   * thread other than the reader.
   */
  virtual void close() = 0;
};
}  // namespace tt

#endif  // __TT_FRAME_TRANSPORT__

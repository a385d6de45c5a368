#ifndef __TT_FAKE_FRAME_TRANSPORT__
#define __TT_FAKE_FRAME_TRANSPORT__

#include "FrameTransport.hpp"

namespace tt {

/**
 * @brief In-memory FrameTransport used to script a relay in tests.
 */
class FakeFrameTransport : public FrameTransport {
 public:
  FakeFrameTransport();

  virtual void connect(const RelayEndpoint& endpoint,
                       const vector<pair<string, string>>& headers);
  virtual bool readFrame(string* frame);
  virtual void writeFrame(const string& frame);
  virtual void writePing();
  virtual void close();

  /** @brief Queues an inbound frame for readFrame(). */
  void push(const string& frame);
  /** @brief Queues a peer close; normal closes end reads without error. */
  void pushClose(bool normal);
  /** @brief Makes the next connect() throw with the given kind. */
  void failConnect(TransportException::Kind kind, const string& message);
  /** @brief Makes every subsequent write/ping throw WRITE_FAILED. */
  void failWrites(bool fail);
  /** @brief Holds each write for `delay` to expose unsynchronized writers. */
  void setWriteDelay(std::chrono::milliseconds delay);

  vector<string> getWrittenFrames();
  /**
   * @brief Blocks until at least `count` frames were written.
   * @return false on timeout.
   */
  bool waitForWrittenFrames(size_t count, std::chrono::milliseconds timeout);
  /** @brief Blocks until at least `count` pings were written. */
  bool waitForPings(int count, std::chrono::milliseconds timeout);

  int getPingCount();
  int getCloseCount();
  bool isClosed();
  int getMaxConcurrentWriters() { return maxConcurrentWriters; }
  const RelayEndpoint& getConnectedEndpoint() { return connectedEndpoint; }
  const vector<pair<string, string>>& getConnectHeaders() {
    return connectHeaders;
  }

 protected:
  struct InboundItem {
    enum Kind { FRAME, NORMAL_CLOSE, ABNORMAL_CLOSE } kind;
    string frame;
  };

  mutex transportMutex;
  condition_variable inboundCondition;
  condition_variable outboundCondition;
  deque<InboundItem> inbound;
  vector<string> written;
  int pings;
  int closes;
  bool closed;
  bool writesFail;
  optional<pair<TransportException::Kind, string>> connectFailure;
  std::chrono::milliseconds writeDelay;
  atomic<int> activeWriters;
  atomic<int> maxConcurrentWriters;
  RelayEndpoint connectedEndpoint;
  vector<pair<string, string>> connectHeaders;

  void enterWrite();
  void exitWrite();
};
}  // namespace tt

#endif  // __TT_FAKE_FRAME_TRANSPORT__

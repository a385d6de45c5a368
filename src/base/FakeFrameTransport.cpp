#include "FakeFrameTransport.hpp"

namespace tt {
FakeFrameTransport::FakeFrameTransport()
    : pings(0),
      closes(0),
      closed(false),
      writesFail(false),
      writeDelay(0),
      activeWriters(0),
      maxConcurrentWriters(0) {}

void FakeFrameTransport::connect(const RelayEndpoint& endpoint,
                                 const vector<pair<string, string>>& headers) {
  lock_guard<mutex> guard(transportMutex);
  connectedEndpoint = endpoint;
  connectHeaders = headers;
  if (connectFailure) {
    throw TransportException(connectFailure->first, connectFailure->second);
  }
  closed = false;
}

bool FakeFrameTransport::readFrame(string* frame) {
  unique_lock<mutex> guard(transportMutex);
  inboundCondition.wait(guard, [this] { return closed || !inbound.empty(); });
  if (closed) {
    throw TransportException(TransportException::CLOSED,
                             "use of closed network connection");
  }
  InboundItem item = inbound.front();
  inbound.pop_front();
  switch (item.kind) {
    case InboundItem::FRAME:
      *frame = item.frame;
      return true;
    case InboundItem::NORMAL_CLOSE:
      return false;
    default:
      throw TransportException(TransportException::READ_FAILED,
                               "websocket closed with code 1006");
  }
}

void FakeFrameTransport::enterWrite() {
  int active = ++activeWriters;
  int seen = maxConcurrentWriters;
  while (active > seen &&
         !maxConcurrentWriters.compare_exchange_weak(seen, active)) {
  }
  if (writeDelay.count() > 0) {
    std::this_thread::sleep_for(writeDelay);
  }
}

void FakeFrameTransport::exitWrite() { --activeWriters; }

void FakeFrameTransport::writeFrame(const string& frame) {
  enterWrite();
  lock_guard<mutex> guard(transportMutex);
  exitWrite();
  if (closed) {
    throw TransportException(TransportException::CLOSED,
                             "use of closed network connection");
  }
  if (writesFail) {
    throw TransportException(TransportException::WRITE_FAILED,
                             "broken pipe");
  }
  written.push_back(frame);
  outboundCondition.notify_all();
}

void FakeFrameTransport::writePing() {
  enterWrite();
  lock_guard<mutex> guard(transportMutex);
  exitWrite();
  if (closed) {
    throw TransportException(TransportException::CLOSED,
                             "use of closed network connection");
  }
  if (writesFail) {
    throw TransportException(TransportException::WRITE_FAILED,
                             "broken pipe");
  }
  pings++;
  outboundCondition.notify_all();
}

void FakeFrameTransport::close() {
  lock_guard<mutex> guard(transportMutex);
  closes++;
  closed = true;
  inboundCondition.notify_all();
  outboundCondition.notify_all();
}

void FakeFrameTransport::push(const string& frame) {
  lock_guard<mutex> guard(transportMutex);
  inbound.push_back({InboundItem::FRAME, frame});
  inboundCondition.notify_all();
}

void FakeFrameTransport::pushClose(bool normal) {
  lock_guard<mutex> guard(transportMutex);
  inbound.push_back(
      {normal ? InboundItem::NORMAL_CLOSE : InboundItem::ABNORMAL_CLOSE, ""});
  inboundCondition.notify_all();
}

void FakeFrameTransport::failConnect(TransportException::Kind kind,
                                     const string& message) {
  lock_guard<mutex> guard(transportMutex);
  connectFailure = make_pair(kind, message);
}

void FakeFrameTransport::failWrites(bool fail) {
  lock_guard<mutex> guard(transportMutex);
  writesFail = fail;
}

void FakeFrameTransport::setWriteDelay(std::chrono::milliseconds delay) {
  lock_guard<mutex> guard(transportMutex);
  writeDelay = delay;
}

vector<string> FakeFrameTransport::getWrittenFrames() {
  lock_guard<mutex> guard(transportMutex);
  return written;
}

bool FakeFrameTransport::waitForWrittenFrames(
    size_t count, std::chrono::milliseconds timeout) {
  unique_lock<mutex> guard(transportMutex);
  return outboundCondition.wait_for(
      guard, timeout, [this, count] { return written.size() >= count; });
}

bool FakeFrameTransport::waitForPings(int count,
                                      std::chrono::milliseconds timeout) {
  unique_lock<mutex> guard(transportMutex);
  return outboundCondition.wait_for(
      guard, timeout, [this, count] { return pings >= count; });
}

int FakeFrameTransport::getPingCount() {
  lock_guard<mutex> guard(transportMutex);
  return pings;
}

int FakeFrameTransport::getCloseCount() {
  lock_guard<mutex> guard(transportMutex);
  return closes;
}

bool FakeFrameTransport::isClosed() {
  lock_guard<mutex> guard(transportMutex);
  return closed;
}
}  // namespace tt

#include "MessageMultiplexer.hpp"

namespace tt {
MessageMultiplexer::MessageMultiplexer(shared_ptr<FrameTransport> _transport,
                                       shared_ptr<RpcHandler> _handler)
    : transport(_transport),
      handler(_handler),
      nextRequestId(0),
      activeRequests(0) {}

MessageMultiplexer::~MessageMultiplexer() { waitForRequests(); }

void MessageMultiplexer::run() {
  while (true) {
    string frame;
    if (!transport->readFrame(&frame)) {
      LOG(INFO) << "Relay closed the connection";
      return;
    }
    VLOG(2) << "Got frame: " << frame;
    handleEnvelope(parseEnvelope(frame));
    reapFinishedRequests();
  }
}

void MessageMultiplexer::handleEnvelope(const Envelope& envelope) {
  switch (envelope.type) {
    case EnvelopeType::REQUEST:
      startRequest(envelope);
      break;
    case EnvelopeType::PING:
      try {
        writeEnvelope(Envelope(EnvelopeType::PONG));
      } catch (const TransportException& te) {
        LOG(WARNING) << "Failed to answer ping: " << te.what();
      }
      break;
    case EnvelopeType::CLIENT_CONNECTED:
      if (clientConnectedListener && !envelope.clientIp.empty()) {
        clientConnectedListener(envelope.clientIp);
      }
      break;
    default:
      VLOG(1) << "Ignoring envelope of type "
              << (envelope.type == EnvelopeType::UNKNOWN
                      ? envelope.rawType
                      : envelopeTypeToString(envelope.type));
      break;
  }
}

void MessageMultiplexer::startRequest(const Envelope& envelope) {
  lock_guard<recursive_mutex> guard(requestMutex);
  int64_t workerId = nextRequestId++;
  activeRequests++;
  requestThreads[workerId] = shared_ptr<thread>(
      new thread(&MessageMultiplexer::runRequest, this, workerId, envelope));
}

void MessageMultiplexer::runRequest(int64_t workerId, Envelope envelope) {
  el::Helpers::setThreadName("tunnel-request");
  Envelope reply = processRequest(envelope);
  try {
    writeEnvelope(reply);
  } catch (const TransportException& te) {
    LOG(WARNING) << "Failed to send response for " << envelope.requestId
                 << ": " << te.what();
  }
  lock_guard<recursive_mutex> guard(requestMutex);
  finishedRequests.push_back(workerId);
  activeRequests--;
}

Envelope MessageMultiplexer::processRequest(const Envelope& envelope) {
  RpcResponse response;
  RpcRequest request;
  bool decoded = false;
  try {
    request = parseRpcRequest(envelope.payload);
    decoded = true;
  } catch (const RpcParseException& rpe) {
    LOG(WARNING) << "Bad RPC payload in " << envelope.requestId << ": "
                 << rpe.what();
    json id;
    if (envelope.payload.is_object() && envelope.payload.contains("id")) {
      id = envelope.payload["id"];
    }
    response = RpcResponse::failure(id, PARSE_ERROR, "Parse error");
  }

  if (decoded) {
    try {
      response = handler->handleRequest(request);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Error handling " << request.method << ": " << e.what();
      response = RpcResponse::failure(request.id, INTERNAL_ERROR, e.what());
    }
  }

  Envelope reply(EnvelopeType::RESPONSE);
  reply.requestId = envelope.requestId;
  reply.payload = rpcResponseToJson(response);
  return reply;
}

void MessageMultiplexer::writeEnvelope(const Envelope& envelope) {
  string frame = serializeEnvelope(envelope);
  lock_guard<mutex> guard(writeMutex);
  transport->writeFrame(frame);
}

void MessageMultiplexer::writeKeepalive() {
  lock_guard<mutex> guard(writeMutex);
  transport->writePing();
}

void MessageMultiplexer::reapFinishedRequests() {
  vector<shared_ptr<thread>> toJoin;
  {
    lock_guard<recursive_mutex> guard(requestMutex);
    for (int64_t workerId : finishedRequests) {
      auto it = requestThreads.find(workerId);
      if (it != requestThreads.end()) {
        toJoin.push_back(it->second);
        requestThreads.erase(it);
      }
    }
    finishedRequests.clear();
  }
  for (auto& t : toJoin) {
    t->join();
  }
}

void MessageMultiplexer::waitForRequests() {
  while (true) {
    shared_ptr<thread> t;
    {
      lock_guard<recursive_mutex> guard(requestMutex);
      if (requestThreads.empty()) {
        finishedRequests.clear();
        return;
      }
      t = requestThreads.begin()->second;
      requestThreads.erase(requestThreads.begin());
    }
    t->join();
  }
}

int MessageMultiplexer::getActiveRequestCount() { return activeRequests; }
}  // namespace tt

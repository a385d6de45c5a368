#include "TunnelSession.hpp"

namespace tt {
TunnelSession::TunnelSession(shared_ptr<FrameTransport> _transport,
                             const string& _relayUrl,
                             shared_ptr<RpcHandler> _handler,
                             const string& _clientVersion, int _actionCount,
                             std::chrono::milliseconds _keepaliveInterval)
    : transport(_transport),
      relayUrl(_relayUrl),
      handler(_handler),
      clientVersion(_clientVersion),
      actionCount(_actionCount),
      keepaliveInterval(_keepaliveInterval),
      readerRunning(false),
      keepaliveRunning(false),
      connected(false),
      done(false),
      closing(false) {}

TunnelSession::~TunnelSession() {
  close();
  if (readerThread) {
    readerThread->join();
    readerThread.reset();
  }
  if (keepaliveThread) {
    keepaliveThread->join();
    keepaliveThread.reset();
  }
  multiplexer.reset();
}

vector<pair<string, string>> TunnelSession::getHandshakeHeaders() const {
  return {
      {"User-Agent", "tooltunnel/" + clientVersion},
      {"X-Client-Version", clientVersion},
      {"X-Tool-Count", to_string(actionCount)},
  };
}

string TunnelSession::connect() {
  {
    lock_guard<mutex> guard(stateMutex);
    if (connected || closing) {
      throw TunnelConnectException(TunnelConnectException::HANDSHAKE_FAILED,
                                   "session already used");
    }
  }

  RelayEndpoint endpoint;
  try {
    endpoint = withPath(parseRelayUrl(relayUrl), TUNNEL_PATH);
  } catch (const RelayEndpointException& ree) {
    throw TunnelConnectException(TunnelConnectException::RELAY_UNREACHABLE,
                                 ree.what());
  }

  LOG(INFO) << "Connecting to relay " << endpoint.toString();
  try {
    transport->connect(endpoint, getHandshakeHeaders());
  } catch (const TransportException& te) {
    transport->close();
    if (te.getKind() == TransportException::UPGRADE_REQUIRED) {
      throw TunnelConnectException(
          TunnelConnectException::VERSION_REJECTED,
          "relay rejected client version " + clientVersion + ": " + te.what());
    }
    throw TunnelConnectException(TunnelConnectException::RELAY_UNREACHABLE,
                                 string("dial relay: ") + te.what());
  }

  Envelope registration = readRegistration();
  if (registration.type != EnvelopeType::REGISTERED) {
    transport->close();
    string message = "unexpected message type: " + registration.rawType;
    if (!registration.error.empty()) {
      message += " (" + registration.error + ")";
    }
    throw TunnelConnectException(TunnelConnectException::HANDSHAKE_FAILED,
                                 message);
  }
  tunnelUrl = registration.tunnelUrl;
  tunnelId = registration.tunnelId;
  LOG(INFO) << "Registered tunnel " << tunnelId << " at " << tunnelUrl;

  multiplexer.reset(new MessageMultiplexer(transport, handler));
  multiplexer->setClientConnectedListener(clientConnectedListener);
  {
    lock_guard<mutex> guard(stateMutex);
    connected = true;
  }
  readerRunning = true;
  keepaliveRunning = true;
  readerThread.reset(new thread(&TunnelSession::runReader, this));
  keepaliveThread.reset(new thread(&TunnelSession::runKeepalive, this));
  return tunnelUrl;
}

Envelope TunnelSession::readRegistration() {
  string frame;
  string error;
  try {
    if (transport->readFrame(&frame)) {
      return parseEnvelope(frame);
    }
    error = "relay closed the connection";
  } catch (const TransportException& te) {
    error = te.what();
  } catch (const EnvelopeParseException& epe) {
    error = epe.what();
  }
  transport->close();
  throw TunnelConnectException(TunnelConnectException::HANDSHAKE_FAILED,
                               "read registration: " + error);
}

void TunnelSession::runReader() {
  el::Helpers::setThreadName("tunnel-reader");
  string error;
  try {
    multiplexer->run();
  } catch (const TransportException& te) {
    error = te.what();
  } catch (const EnvelopeParseException& epe) {
    error = epe.what();
  }
  {
    lock_guard<mutex> guard(stateMutex);
    if (!error.empty()) {
      if (closing) {
        VLOG(1) << "Read loop ended after close: " << error;
      } else {
        LOG(WARNING) << "Tunnel connection lost: " << error;
        failure = error;
      }
    }
    done = true;
  }
  readerRunning = false;
  stateCondition.notify_all();
}

void TunnelSession::runKeepalive() {
  el::Helpers::setThreadName("tunnel-keepalive");
  unique_lock<mutex> lock(stateMutex);
  while (true) {
    if (stateCondition.wait_for(lock, keepaliveInterval,
                                [this] { return done || closing; })) {
      break;
    }
    lock.unlock();
    try {
      multiplexer->writeKeepalive();
    } catch (const TransportException& te) {
      LOG(INFO) << "Keepalive stopped: " << te.what();
      keepaliveRunning = false;
      return;
    }
    lock.lock();
  }
  keepaliveRunning = false;
}

void TunnelSession::wait() {
  unique_lock<mutex> lock(stateMutex);
  if (!connected) {
    throw TunnelSessionException("session is not connected");
  }
  stateCondition.wait(lock, [this] { return done; });
  if (!failure.empty()) {
    throw TunnelSessionException(failure);
  }
}

void TunnelSession::close() {
  {
    lock_guard<mutex> guard(stateMutex);
    if (closing) {
      return;
    }
    closing = true;
  }
  stateCondition.notify_all();
  transport->close();
}
}  // namespace tt

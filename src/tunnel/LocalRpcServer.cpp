#include "LocalRpcServer.hpp"

#include "httplib.h"

namespace tt {
namespace {
const string ENDPOINT_EVENT = "event: endpoint\ndata: /mcp\n\n";
}

LocalRpcServer::LocalRpcServer(shared_ptr<RpcHandler> _handler)
    : handler(_handler), server(new httplib::Server()), stopping(false) {
  server->Post("/mcp", [this](const httplib::Request& req,
                              httplib::Response& res) {
    int status = 200;
    string body = handleBody(req.body, &status);
    res.status = status;
    if (status == 200) {
      res.set_content(body, "application/json");
    } else {
      res.set_content(body, "text/plain");
    }
  });
  auto methodNotAllowed = [](const httplib::Request&, httplib::Response& res) {
    res.status = 405;
    res.set_content("Method not allowed\n", "text/plain");
  };
  server->Get("/mcp", methodNotAllowed);
  server->Put("/mcp", methodNotAllowed);
  server->Patch("/mcp", methodNotAllowed);
  server->Delete("/mcp", methodNotAllowed);

  server->Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this](size_t offset, httplib::DataSink& sink) {
          if (offset == 0) {
            sink.write(ENDPOINT_EVENT.data(), ENDPOINT_EVENT.size());
            return true;
          }
          unique_lock<mutex> lock(streamMutex);
          streamCondition.wait_for(lock, std::chrono::seconds(1),
                                   [this] { return stopping; });
          if (stopping || !sink.is_writable()) {
            sink.done();
          }
          return true;
        });
  });
}

LocalRpcServer::~LocalRpcServer() { stop(); }

int LocalRpcServer::bind(const string& host, int port) {
  int boundPort = port;
  if (port == 0) {
    boundPort = server->bind_to_any_port(host);
    if (boundPort < 0) {
      throw std::runtime_error("Could not bind " + host);
    }
  } else if (!server->bind_to_port(host, port)) {
    throw std::runtime_error("Could not bind " + host + ":" + to_string(port));
  }
  LOG(INFO) << "Local RPC server bound to " << host << ":" << boundPort;
  return boundPort;
}

void LocalRpcServer::listen() {
  if (!server->listen_after_bind()) {
    LOG(WARNING) << "Local RPC server stopped listening";
  }
}

void LocalRpcServer::start() {
  serverThread.reset(new thread([this]() {
    el::Helpers::setThreadName("local-rpc");
    listen();
  }));
}

void LocalRpcServer::stop() {
  {
    lock_guard<mutex> guard(streamMutex);
    if (stopping) {
      return;
    }
    stopping = true;
  }
  streamCondition.notify_all();
  server->stop();
  if (serverThread) {
    serverThread->join();
    serverThread.reset();
  }
}

string LocalRpcServer::handleBody(const string& body, int* status) {
  json payload = json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    *status = 400;
    return "Invalid JSON\n";
  }
  RpcRequest request;
  try {
    request = parseRpcRequest(payload);
  } catch (const RpcParseException& rpe) {
    VLOG(1) << "Rejecting local request: " << rpe.what();
    *status = 400;
    return "Invalid JSON\n";
  }

  RpcResponse response;
  try {
    response = handler->handleRequest(request);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error handling " << request.method << ": " << e.what();
    response = RpcResponse::failure(request.id, INTERNAL_ERROR, e.what());
  }
  *status = 200;
  return rpcResponseToJson(response).dump() + "\n";
}
}  // namespace tt

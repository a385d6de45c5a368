#ifndef __TT_LOCAL_RPC_SERVER__
#define __TT_LOCAL_RPC_SERVER__

#include "Headers.hpp"
#include "ProtocolDispatcher.hpp"

namespace httplib {
class Server;
}

namespace tt {
/**
 * @brief Serves the RPC handler over plain HTTP on the local machine.
 *
 * `POST /mcp` takes one JSON-RPC request per call. `GET /sse` is an event
 * stream that announces the `/mcp` endpoint and stays open until stop().
 */
class LocalRpcServer {
 public:
  explicit LocalRpcServer(shared_ptr<RpcHandler> _handler);
  ~LocalRpcServer();

  /**
   * @brief Binds the listening socket. Port 0 picks a free port.
   * @return The bound port.
   * @throws std::runtime_error if the address cannot be bound.
   */
  int bind(const string& host, int port);

  /** @brief Serves on the calling thread until stop(). */
  void listen();

  /** @brief Serves on a background thread. */
  void start();

  void stop();

  /**
   * @brief Handles one POST body.
   * @param status Set to the HTTP status code.
   * @return The response body.
   */
  string handleBody(const string& body, int* status);

 protected:
  shared_ptr<RpcHandler> handler;
  unique_ptr<httplib::Server> server;
  unique_ptr<thread> serverThread;
  mutex streamMutex;
  condition_variable streamCondition;
  bool stopping;
};
}  // namespace tt

#endif  // __TT_LOCAL_RPC_SERVER__

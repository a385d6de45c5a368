#ifndef __TT_PROTOCOL_DISPATCHER__
#define __TT_PROTOCOL_DISPATCHER__

#include "ActionInvoker.hpp"
#include "Headers.hpp"
#include "RegistrySwapGate.hpp"
#include "RpcMessages.hpp"

namespace tt {
const string MCP_PROTOCOL_VERSION = "2024-11-05";

/**
 * @brief Anything that answers RPC requests.
 *
 * Protocol-level rejections come back as error responses; an exception means
 * an unexpected internal failure.
 */
class RpcHandler {
 public:
  virtual ~RpcHandler() {}

  virtual RpcResponse handleRequest(const RpcRequest& request) = 0;
};

/**
 * @brief Routes RPC methods (initialize, tools/list, tools/call, ping) against
 * the live action registry.
 *
 * Holds no per-request state; every call reads the registry from the swap gate
 * so a reload is seen by the very next request.
 */
class ProtocolDispatcher : public RpcHandler {
 public:
  ProtocolDispatcher(shared_ptr<RegistrySwapGate> _registryGate,
                     shared_ptr<ActionInvoker> _invoker)
      : registryGate(_registryGate), invoker(_invoker) {}

  virtual RpcResponse handleRequest(const RpcRequest& request);

  /** @brief Swaps in a new registry without disturbing in-flight calls. */
  void updateRegistry(shared_ptr<const ActionRegistry> registry) {
    registryGate->replace(registry);
  }

  shared_ptr<const ActionRegistry> getRegistry() const {
    return registryGate->current();
  }

  /** @brief JSON-schema object describing an action's parameters. */
  static json projectInputSchema(const Action& action);

  /** @brief Content block list and isError flag for a tools/call result. */
  static json invocationToResult(const InvocationResult& result);

 protected:
  shared_ptr<RegistrySwapGate> registryGate;
  shared_ptr<ActionInvoker> invoker;

  RpcResponse handleInitialize(const RpcRequest& request);
  RpcResponse handleToolsList(const RpcRequest& request);
  RpcResponse handleToolsCall(const RpcRequest& request);
  RpcResponse handlePing(const RpcRequest& request);
};
}  // namespace tt

#endif  // __TT_PROTOCOL_DISPATCHER__

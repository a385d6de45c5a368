#ifndef __TT_RPC_MESSAGES__
#define __TT_RPC_MESSAGES__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tt {
const string JSONRPC_VERSION = "2.0";

enum RpcErrorCode {
  PARSE_ERROR = -32700,
  INVALID_REQUEST = -32600,
  METHOD_NOT_FOUND = -32601,
  INVALID_PARAMS = -32602,
  INTERNAL_ERROR = -32603,
};

struct RpcError {
  int code = INTERNAL_ERROR;
  string message;
  /** @brief Omitted from the wire when null. */
  json data;
};

/**
 * @brief A JSON-RPC request carried in an envelope payload.
 *
 * `id` is caller-supplied and echoed verbatim; a request without one is a
 * notification.
 */
struct RpcRequest {
  string jsonrpc = JSONRPC_VERSION;
  json id;
  string method;
  json params;

  bool hasId() const { return !id.is_null(); }
};

/**
 * @brief A JSON-RPC response. Exactly one of result/error is set.
 */
struct RpcResponse {
  string jsonrpc = JSONRPC_VERSION;
  json id;
  optional<json> result;
  optional<RpcError> error;

  static RpcResponse success(const json& id, const json& result);
  static RpcResponse failure(const json& id, int code, const string& message);
};

/**
 * @brief Thrown when a payload cannot be decoded as an RpcRequest.
 */
class RpcParseException : public std::runtime_error {
 public:
  explicit RpcParseException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @throws RpcParseException if `payload` is not an object or a field has the
 * wrong type.
 */
RpcRequest parseRpcRequest(const json& payload);
json rpcRequestToJson(const RpcRequest& request);

json rpcResponseToJson(const RpcResponse& response);
/**
 * @throws RpcParseException if `payload` is not a response object.
 */
RpcResponse parseRpcResponse(const json& payload);
}  // namespace tt

#endif  // __TT_RPC_MESSAGES__

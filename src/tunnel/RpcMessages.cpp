#include "RpcMessages.hpp"

namespace tt {
RpcResponse RpcResponse::success(const json& id, const json& result) {
  RpcResponse response;
  response.id = id;
  response.result = result;
  return response;
}

RpcResponse RpcResponse::failure(const json& id, int code,
                                 const string& message) {
  RpcResponse response;
  response.id = id;
  RpcError error;
  error.code = code;
  error.message = message;
  response.error = error;
  return response;
}

RpcRequest parseRpcRequest(const json& payload) {
  if (!payload.is_object()) {
    throw RpcParseException("request must be a JSON object");
  }
  RpcRequest request;
  auto it = payload.find("jsonrpc");
  if (it != payload.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw RpcParseException("jsonrpc must be a string");
    }
    request.jsonrpc = it->get<string>();
  }
  it = payload.find("id");
  if (it != payload.end()) {
    request.id = *it;
  }
  it = payload.find("method");
  if (it != payload.end() && !it->is_null()) {
    if (!it->is_string()) {
      throw RpcParseException("method must be a string");
    }
    request.method = it->get<string>();
  }
  it = payload.find("params");
  if (it != payload.end()) {
    request.params = *it;
  }
  return request;
}

json rpcRequestToJson(const RpcRequest& request) {
  json j;
  j["jsonrpc"] = request.jsonrpc;
  if (request.hasId()) j["id"] = request.id;
  j["method"] = request.method;
  if (!request.params.is_null()) j["params"] = request.params;
  return j;
}

json rpcResponseToJson(const RpcResponse& response) {
  json j;
  j["jsonrpc"] = response.jsonrpc;
  if (!response.id.is_null()) {
    j["id"] = response.id;
  }
  if (response.error) {
    json error;
    error["code"] = response.error->code;
    error["message"] = response.error->message;
    if (!response.error->data.is_null()) {
      error["data"] = response.error->data;
    }
    j["error"] = error;
  } else if (response.result) {
    j["result"] = *response.result;
  }
  return j;
}

RpcResponse parseRpcResponse(const json& payload) {
  if (!payload.is_object()) {
    throw RpcParseException("response must be a JSON object");
  }
  RpcResponse response;
  response.jsonrpc = payload.value("jsonrpc", JSONRPC_VERSION);
  auto it = payload.find("id");
  if (it != payload.end()) {
    response.id = *it;
  }
  it = payload.find("error");
  if (it != payload.end() && !it->is_null()) {
    if (!it->is_object() || !it->contains("code") ||
        !(*it)["code"].is_number_integer()) {
      throw RpcParseException("error must be an object with an integer code");
    }
    RpcError error;
    error.code = (*it)["code"].get<int>();
    error.message = it->value("message", "");
    auto data = it->find("data");
    if (data != it->end()) {
      error.data = *data;
    }
    response.error = error;
  }
  it = payload.find("result");
  if (it != payload.end()) {
    response.result = *it;
  }
  return response;
}
}  // namespace tt

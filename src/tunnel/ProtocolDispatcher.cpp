#include "ProtocolDispatcher.hpp"

namespace tt {
RpcResponse ProtocolDispatcher::handleRequest(const RpcRequest& request) {
  if (request.method == "initialize") {
    return handleInitialize(request);
  } else if (request.method == "tools/list") {
    return handleToolsList(request);
  } else if (request.method == "tools/call") {
    return handleToolsCall(request);
  } else if (request.method == "ping") {
    return handlePing(request);
  }
  VLOG(1) << "Unknown method: " << request.method;
  return RpcResponse::failure(request.id, METHOD_NOT_FOUND,
                              "Method not found: " + request.method);
}

RpcResponse ProtocolDispatcher::handleInitialize(const RpcRequest& request) {
  auto registry = registryGate->current();
  json result = {
      {"protocolVersion", MCP_PROTOCOL_VERSION},
      {"serverInfo",
       {{"name", registry->getName()}, {"version", registry->getVersion()}}},
      {"capabilities", {{"tools", json::object()}}},
  };
  return RpcResponse::success(request.id, result);
}

RpcResponse ProtocolDispatcher::handleToolsList(const RpcRequest& request) {
  auto registry = registryGate->current();
  json tools = json::array();
  for (const auto& action : registry->getActions()) {
    tools.push_back({
        {"name", action.name},
        {"description", action.description},
        {"inputSchema", projectInputSchema(action)},
    });
  }
  return RpcResponse::success(request.id, {{"tools", tools}});
}

RpcResponse ProtocolDispatcher::handleToolsCall(const RpcRequest& request) {
  const json& params = request.params;
  if (!params.is_object() || !params.contains("name") ||
      !params["name"].is_string()) {
    return RpcResponse::failure(request.id, INVALID_PARAMS, "Invalid params");
  }
  json arguments = json::object();
  auto argumentsIt = params.find("arguments");
  if (argumentsIt != params.end() && !argumentsIt->is_null()) {
    if (!argumentsIt->is_object()) {
      return RpcResponse::failure(request.id, INVALID_PARAMS,
                                  "Invalid params");
    }
    arguments = *argumentsIt;
  }
  string name = params["name"].get<string>();

  // Hold the snapshot for the whole call so the action outlives a reload
  auto registry = registryGate->current();
  const Action* action = registry->find(name);
  if (action == nullptr) {
    return RpcResponse::failure(request.id, INVALID_PARAMS,
                                "Tool not found: " + name);
  }

  LOG(INFO) << "Executing action: " << name;
  InvocationResult result = invoker->invoke(*action, arguments);
  LOG(INFO) << "Completed " << name << " in " << result.duration.count()
            << "ms (exit=" << result.exitCode << ")";
  return RpcResponse::success(request.id, invocationToResult(result));
}

RpcResponse ProtocolDispatcher::handlePing(const RpcRequest& request) {
  return RpcResponse::success(request.id, json::object());
}

json ProtocolDispatcher::projectInputSchema(const Action& action) {
  json properties = json::object();
  json required = json::array();
  for (const auto& parameter : action.parameters) {
    json property = {
        {"type", parameterTypeToString(parameter.type)},
        {"description", parameter.description},
    };
    if (!parameter.defaultValue.empty()) {
      property["default"] = parameter.defaultValue;
    }
    properties[parameter.name] = property;
    if (parameter.required) {
      required.push_back(parameter.name);
    }
  }
  json schema = {{"type", "object"}, {"properties", properties}};
  if (!required.empty()) {
    schema["required"] = required;
  }
  return schema;
}

json ProtocolDispatcher::invocationToResult(const InvocationResult& result) {
  string text = result.output;
  if (result.hasError() && result.output.empty()) {
    text = "Error: " + result.error;
  }
  return {
      {"content", json::array({{{"type", "text"}, {"text", text}}})},
      {"isError", result.exitCode != 0},
  };
}
}  // namespace tt

#include "ActionInvoker.hpp"

#include "ActionConfig.hpp"
#include "httplib.h"

namespace tt {
namespace {
const string ARGUMENT_ENV_PREFIX = "TOOLTUNNEL_ARG_";

std::chrono::milliseconds elapsedSince(
    const std::chrono::steady_clock::time_point& start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

// Splits "https://host:port/path?q" into "https://host:port" and "/path?q"
bool splitUrl(const string& url, string* schemeHostPort, string* path) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == string::npos || schemeEnd == 0) {
    return false;
  }
  auto pathStart = url.find_first_of("/?", schemeEnd + 3);
  if (pathStart == string::npos) {
    *schemeHostPort = url;
    *path = "/";
  } else {
    *schemeHostPort = url.substr(0, pathStart);
    *path = url.substr(pathStart);
    if ((*path)[0] == '?') {
      *path = "/" + *path;
    }
  }
  return schemeHostPort->length() > schemeEnd + 3;
}

template <typename Duration>
void setTimeouts(httplib::Client* client, const Duration& timeout) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout)
                    .count();
  time_t sec = micros / 1000000;
  time_t usec = micros % 1000000;
  client->set_connection_timeout(sec, usec);
  client->set_read_timeout(sec, usec);
  client->set_write_timeout(sec, usec);
}
}  // namespace

json resolveArguments(const Action& action, const json& arguments) {
  json resolved = arguments.is_object() ? arguments : json::object();
  for (const auto& parameter : action.parameters) {
    if (parameter.defaultValue.empty() || resolved.contains(parameter.name)) {
      continue;
    }
    if (parameter.type == ParameterType::STRING) {
      resolved[parameter.name] = parameter.defaultValue;
      continue;
    }
    json parsed = json::parse(parameter.defaultValue, nullptr, false);
    if (parsed.is_discarded()) {
      resolved[parameter.name] = parameter.defaultValue;
    } else {
      resolved[parameter.name] = parsed;
    }
  }
  return resolved;
}

string argumentToString(const json& value) {
  if (value.is_string()) {
    return value.get<string>();
  }
  return value.dump();
}

string expandArguments(const string& text, const json& arguments) {
  string result = text;
  if (!arguments.is_object()) {
    return result;
  }
  for (auto it = arguments.begin(); it != arguments.end(); ++it) {
    replaceAll(result, "{{" + it.key() + "}}", argumentToString(it.value()));
  }
  return result;
}

bool extractJsonPath(const string& body, const string& path, string* out) {
  json document = json::parse(body, nullptr, false);
  if (document.is_discarded()) {
    return false;
  }
  const json* current = &document;
  for (const string& part : split(path, '.')) {
    auto bracket = part.find('[');
    string key = part.substr(0, bracket);
    if (!key.empty()) {
      if (!current->is_object() || !current->contains(key)) {
        return false;
      }
      current = &(*current)[key];
    }
    while (bracket != string::npos) {
      auto closeBracket = part.find(']', bracket);
      if (closeBracket == string::npos) {
        return false;
      }
      string indexString = part.substr(bracket + 1, closeBracket - bracket - 1);
      if (indexString.empty() ||
          indexString.find_first_not_of("0123456789") != string::npos) {
        return false;
      }
      size_t index;
      try {
        index = stoul(indexString);
      } catch (const std::out_of_range&) {
        return false;
      }
      if (!current->is_array() || index >= current->size()) {
        return false;
      }
      current = &(*current)[index];
      bracket = part.find('[', closeBracket);
    }
  }

  if (current->is_string()) {
    *out = current->get<string>();
  } else if (current->is_null()) {
    *out = "null";
  } else {
    *out = current->dump(2);
  }
  return true;
}

InvocationResult ProcessInvoker::invoke(const Action& action,
                                        const json& arguments) {
  auto start = std::chrono::steady_clock::now();
  const ProcessExecution* execution =
      std::get_if<ProcessExecution>(&action.execution);
  if (execution == nullptr) {
    throw std::invalid_argument("action " + action.name +
                                " is not a process action");
  }
  json resolved = resolveArguments(action, arguments);

  SubprocessRequest request;
  if (!execution->shell.empty()) {
    const char* userShell = ::getenv("SHELL");
    string shell =
        (userShell != nullptr && *userShell) ? userShell : "/bin/sh";
    request.argv = {shell, "-c", expandArguments(execution->shell, resolved)};
  } else {
    request.argv.push_back(
        ActionConfig::expandEnvironment(execution->command));
    for (const auto& arg : execution->args) {
      request.argv.push_back(expandArguments(
          ActionConfig::expandEnvironment(arg), resolved));
    }
  }
  request.workingDirectory =
      ActionConfig::expandEnvironment(execution->workingDir);
  for (const auto& it : action.environment) {
    request.environment.push_back(
        make_pair(it.first, ActionConfig::expandEnvironment(it.second)));
  }
  for (auto it = resolved.begin(); it != resolved.end(); ++it) {
    request.environment.push_back(
        make_pair(ARGUMENT_ENV_PREFIX + toUpper(it.key()),
                  argumentToString(it.value())));
  }
  request.timeout = execution->timeout;

  VLOG(1) << "Running " << action.name << ": " << request.argv[0];
  SubprocessResult subprocessResult = subprocessUtils->run(request);

  InvocationResult result;
  string output = subprocessResult.standardOutput;
  if (!subprocessResult.standardError.empty()) {
    if (!output.empty()) {
      output += "\n";
    }
    output += subprocessResult.standardError;
  }
  result.output = trim(output);
  result.exitCode = subprocessResult.exitCode;
  result.error = subprocessResult.error;
  result.duration = elapsedSince(start);
  return result;
}

InvocationResult HttpInvoker::invoke(const Action& action,
                                     const json& arguments) {
  auto start = std::chrono::steady_clock::now();
  const HttpExecution* execution =
      std::get_if<HttpExecution>(&action.execution);
  if (execution == nullptr) {
    throw std::invalid_argument("action " + action.name +
                                " is not an http action");
  }
  json resolved = resolveArguments(action, arguments);

  InvocationResult result;
  string url = expandArguments(execution->url, resolved);
  string schemeHostPort, path;
  if (!splitUrl(url, &schemeHostPort, &path)) {
    result.exitCode = -1;
    result.error = "invalid url: " + url;
    result.output = "Failed to create request: " + result.error;
    result.duration = elapsedSince(start);
    return result;
  }

  httplib::Client client(schemeHostPort);
  if (!client.is_valid()) {
    result.exitCode = -1;
    result.error = "unsupported url: " + url;
    result.output = "Failed to create request: " + result.error;
    result.duration = elapsedSince(start);
    return result;
  }
  setTimeouts(&client, execution->timeout);
  client.set_follow_location(true);

  httplib::Request request;
  request.method = execution->method;
  request.path = path;
  for (const auto& it : execution->headers) {
    request.set_header(it.first, expandArguments(it.second, resolved));
  }
  if (!execution->body.empty()) {
    request.body = expandArguments(execution->body, resolved);
    if (!request.has_header("Content-Type")) {
      request.set_header("Content-Type", "application/json");
    }
  }

  VLOG(1) << "Calling " << action.name << ": " << request.method << " "
          << url;
  auto response = client.send(request);
  if (!response) {
    result.exitCode = -1;
    result.error = httplib::to_string(response.error());
    result.output = "Request failed: " + result.error;
    result.duration = elapsedSince(start);
    return result;
  }

  string output = response->body;
  if (!execution->extractJson.empty() && !output.empty()) {
    string extracted;
    if (extractJsonPath(output, execution->extractJson, &extracted)) {
      output = extracted;
    } else {
      VLOG(1) << "Could not extract " << execution->extractJson << " from "
              << action.name << " response";
    }
  }
  result.output = trim(output);
  // An error status is a failed call, but the body is the only output
  if (response->status >= 400) {
    VLOG(1) << action.name << " returned HTTP " << response->status;
    result.exitCode = 1;
  }
  result.duration = elapsedSince(start);
  return result;
}

InvocationResult ActionRunner::invoke(const Action& action,
                                      const json& arguments) {
  if (action.isHttp()) {
    return httpInvoker->invoke(action, arguments);
  }
  return processInvoker->invoke(action, arguments);
}
}  // namespace tt

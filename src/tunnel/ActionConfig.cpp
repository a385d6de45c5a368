#include "ActionConfig.hpp"

#include <yaml-cpp/yaml.h>

namespace tt {
const string ActionConfig::DEFAULT_NAME = "tooltunnel-local";
const string ActionConfig::DEFAULT_VERSION = "1.0.0";

namespace {
bool isNameChar(char c) { return isalnum((unsigned char)c) || c == '_'; }

// Walks the document expanding environment references in every string
void expandStrings(json* j) {
  if (j->is_string()) {
    *j = ActionConfig::expandEnvironment(j->get<string>());
  } else if (j->is_array() || j->is_object()) {
    for (auto& it : *j) {
      expandStrings(&it);
    }
  }
}

// Plain YAML scalars that mean null or a boolean keep that meaning; every
// other scalar stays text so that "1.10" or "0755" reach string fields as
// written
json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Sequence: {
      json array = json::array();
      for (const auto& it : node) {
        array.push_back(yamlToJson(it));
      }
      return array;
    }
    case YAML::NodeType::Map: {
      json object = json::object();
      for (const auto& it : node) {
        object[it.first.Scalar()] = yamlToJson(it.second);
      }
      return object;
    }
    case YAML::NodeType::Scalar: {
      const string& value = node.Scalar();
      if (node.Tag() == "!") {
        return value;
      }
      if (value == "~" || value == "null" || value == "Null" ||
          value == "NULL") {
        return nullptr;
      }
      if (value == "true" || value == "True" || value == "TRUE") {
        return true;
      }
      if (value == "false" || value == "False" || value == "FALSE") {
        return false;
      }
      return value;
    }
    default:
      return nullptr;
  }
}

bool hasExtension(const string& path, const string& extension) {
  return path.size() >= extension.size() &&
         toUpper(path.substr(path.size() - extension.size())) ==
             toUpper(extension);
}

// "tools" is accepted in place of "actions"
const char* actionsKey(const json& document) {
  return document.contains("actions") ? "actions" : "tools";
}

// Expands every string except a script's shell, command and args, which are
// left for the shell so that per-call variables still resolve
void expandManifest(json* document) {
  const string actions = actionsKey(*document);
  for (auto it = document->begin(); it != document->end(); ++it) {
    if (it.key() != actions || !it.value().is_array()) {
      expandStrings(&it.value());
      continue;
    }
    for (auto& action : it.value()) {
      if (!action.is_object()) {
        continue;
      }
      for (auto field = action.begin(); field != action.end(); ++field) {
        if (field.key() != "script" || !field.value().is_object()) {
          expandStrings(&field.value());
          continue;
        }
        for (auto scriptField = field.value().begin();
             scriptField != field.value().end(); ++scriptField) {
          const string& key = scriptField.key();
          if (key != "shell" && key != "command" && key != "args") {
            expandStrings(&scriptField.value());
          }
        }
      }
    }
  }
}

string getString(const json& j, const string& key, const string& where) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return "";
  }
  if (it->is_boolean()) {
    return it->get<bool>() ? "true" : "false";
  }
  if (!it->is_string()) {
    throw ActionConfigException(where + ": " + key + " must be a string");
  }
  return it->get<string>();
}

const json* getObject(const json& j, const string& key, const string& where) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ActionConfigException(where + ": " + key + " must be an object");
  }
  return &(*it);
}

vector<pair<string, string>> getStringMap(const json& j, const string& key,
                                          const string& where) {
  vector<pair<string, string>> result;
  const json* object = getObject(j, key, where);
  if (object == nullptr) {
    return result;
  }
  for (auto it = object->begin(); it != object->end(); ++it) {
    result.push_back(make_pair(it.key(), getString(*object, it.key(),
                                                   where + ": " + key)));
  }
  return result;
}
}  // namespace

ActionManifest ActionConfig::load(const string& path) {
  ifstream in(path);
  if (!in.good()) {
    throw ActionConfigException("read file " + path + ": " + strerror(errno));
  }
  stringstream buffer;
  buffer << in.rdbuf();
  if (hasExtension(path, ".yaml") || hasExtension(path, ".yml")) {
    return parseYaml(buffer.str());
  }
  return parse(buffer.str());
}

ActionManifest ActionConfig::parse(const string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ActionConfigException(string("parse manifest: ") + e.what());
  }
  return parseDocument(std::move(document));
}

ActionManifest ActionConfig::parseYaml(const string& text) {
  json document;
  try {
    document = yamlToJson(YAML::Load(text));
  } catch (const YAML::Exception& e) {
    throw ActionConfigException(string("parse manifest: ") + e.what());
  }
  if (document.is_null()) {
    document = json::object();
  }
  return parseDocument(std::move(document));
}

ActionManifest ActionConfig::parseDocument(json document) {
  if (!document.is_object()) {
    throw ActionConfigException("parse manifest: top level must be an object");
  }
  expandManifest(&document);

  string name = getString(document, "name", "manifest");
  string version = getString(document, "version", "manifest");
  string description = getString(document, "description", "manifest");
  if (name.empty()) {
    name = DEFAULT_NAME;
  }
  if (version.empty()) {
    version = DEFAULT_VERSION;
  }

  ActionManifest manifest;
  manifest.port = DEFAULT_PORT;
  const json* server = getObject(document, "server", "manifest");
  if (server != nullptr && server->contains("port")) {
    json port = (*server)["port"];
    if (port.is_string() && !port.get<string>().empty() &&
        port.get<string>().size() <= 5 &&
        all_of(port.get<string>().begin(), port.get<string>().end(),
               [](char c) { return isdigit((unsigned char)c); })) {
      port = stoi(port.get<string>());
    }
    if (!port.is_number_integer() || port.get<int>() < 0 ||
        port.get<int>() > 65535) {
      throw ActionConfigException(
          "manifest: server.port must be a port number");
    }
    if (port.get<int>() != 0) {
      manifest.port = port.get<int>();
    }
  }

  if (document.contains("actions") && document.contains("tools")) {
    throw ActionConfigException(
        "manifest: only one of actions or tools may be set");
  }
  const string actionsName = actionsKey(document);
  vector<Action> actions;
  auto actionsIt = document.find(actionsName);
  if (actionsIt != document.end() && !actionsIt->is_null()) {
    if (!actionsIt->is_array()) {
      throw ActionConfigException("manifest: " + actionsName +
                                  " must be an array");
    }
    for (size_t a = 0; a < actionsIt->size(); a++) {
      actions.push_back(parseAction((*actionsIt)[a], a));
    }
  }

  try {
    manifest.registry = make_shared<const ActionRegistry>(
        name, version, description, std::move(actions));
  } catch (const ActionRegistryException& e) {
    throw ActionConfigException(e.what());
  }
  return manifest;
}

Action ActionConfig::parseAction(const json& j, size_t index) {
  string where = "action " + to_string(index);
  if (!j.is_object()) {
    throw ActionConfigException(where + ": must be an object");
  }
  Action action;
  action.name = getString(j, "name", where);
  if (action.name.empty()) {
    throw ActionConfigException(where + ": name is required");
  }
  where = "action " + action.name;
  action.description = getString(j, "description", where);

  auto parametersIt = j.find("parameters");
  if (parametersIt != j.end() && !parametersIt->is_null()) {
    if (!parametersIt->is_array()) {
      throw ActionConfigException(where + ": parameters must be an array");
    }
    for (const auto& parameter : *parametersIt) {
      action.parameters.push_back(parseParameter(action.name, parameter));
    }
  }

  const json* script = getObject(j, "script", where);
  const json* http = getObject(j, "http", where);
  if (script != nullptr && http != nullptr) {
    throw ActionConfigException(where +
                                ": only one of script or http may be set");
  }
  if (script != nullptr) {
    action.execution = parseProcessExecution(action.name, *script);
  } else if (http != nullptr) {
    action.execution = parseHttpExecution(action.name, *http);
  } else {
    throw ActionConfigException(where + ": script or http is required");
  }

  action.environment = getStringMap(j, "environment", where);
  return action;
}

ActionParameter ActionConfig::parseParameter(const string& actionName,
                                             const json& j) {
  string where = "action " + actionName;
  if (!j.is_object()) {
    throw ActionConfigException(where + ": parameter must be an object");
  }
  ActionParameter parameter;
  parameter.name = getString(j, "name", where);
  if (parameter.name.empty()) {
    throw ActionConfigException(where + ": parameter name is required");
  }
  where += " parameter " + parameter.name;

  string type = getString(j, "type", where);
  if (type.empty()) {
    type = "string";
  }
  if (!parameterTypeFromString(type, &parameter.type)) {
    throw ActionConfigException(where + ": unknown type " + type);
  }
  parameter.description = getString(j, "description", where);

  auto requiredIt = j.find("required");
  if (requiredIt != j.end() && !requiredIt->is_null()) {
    if (!requiredIt->is_boolean()) {
      throw ActionConfigException(where + ": required must be a boolean");
    }
    parameter.required = requiredIt->get<bool>();
  }

  auto defaultIt = j.find("default");
  if (defaultIt != j.end() && !defaultIt->is_null()) {
    parameter.defaultValue = defaultIt->is_string()
                                 ? defaultIt->get<string>()
                                 : defaultIt->dump();
  }
  return parameter;
}

ProcessExecution ActionConfig::parseProcessExecution(const string& actionName,
                                                     const json& j) {
  string where = "action " + actionName + " script";
  ProcessExecution execution;
  execution.command = getString(j, "command", where);
  execution.shell = getString(j, "shell", where);
  execution.workingDir = getString(j, "working_dir", where);
  if (execution.command.empty() && execution.shell.empty()) {
    throw ActionConfigException("action " + actionName +
                                ": script.command or script.shell is required");
  }

  auto argsIt = j.find("args");
  if (argsIt != j.end() && !argsIt->is_null()) {
    if (!argsIt->is_array()) {
      throw ActionConfigException(where + ": args must be an array");
    }
    for (const auto& arg : *argsIt) {
      if (arg.is_boolean()) {
        execution.args.push_back(arg.dump());
        continue;
      }
      if (!arg.is_string()) {
        throw ActionConfigException(where + ": args must be strings");
      }
      execution.args.push_back(arg.get<string>());
    }
  }

  string timeout = getString(j, "timeout", where);
  if (!timeout.empty()) {
    execution.timeout = parseDuration(timeout);
  }
  return execution;
}

HttpExecution ActionConfig::parseHttpExecution(const string& actionName,
                                               const json& j) {
  string where = "action " + actionName + " http";
  HttpExecution execution;
  execution.url = getString(j, "url", where);
  if (execution.url.empty()) {
    throw ActionConfigException("action " + actionName +
                                ": http.url is required");
  }
  string method = getString(j, "method", where);
  if (!method.empty()) {
    execution.method = toUpper(method);
  }
  execution.headers = getStringMap(j, "headers", where);
  execution.body = getString(j, "body", where);
  execution.extractJson = getString(j, "extract_json", where);

  string timeout = getString(j, "timeout", where);
  if (!timeout.empty()) {
    execution.timeout = parseDuration(timeout);
  }
  return execution;
}

string ActionConfig::expandEnvironment(const string& s) {
  string result;
  size_t i = 0;
  while (i < s.length()) {
    if (s[i] != '$' || i + 1 >= s.length()) {
      result += s[i++];
      continue;
    }
    string name;
    size_t next;
    if (s[i + 1] == '{') {
      auto closeBrace = s.find('}', i + 2);
      if (closeBrace == string::npos) {
        result += s[i++];
        continue;
      }
      name = s.substr(i + 2, closeBrace - i - 2);
      next = closeBrace + 1;
    } else {
      next = i + 1;
      while (next < s.length() && isNameChar(s[next])) {
        next++;
      }
      name = s.substr(i + 1, next - i - 1);
    }
    if (name.empty()) {
      result += s[i++];
      continue;
    }
    const char* value = ::getenv(name.c_str());
    if (value != nullptr) {
      result += value;
    }
    i = next;
  }
  return result;
}

std::chrono::milliseconds ActionConfig::parseDuration(const string& s) {
  static const vector<pair<string, double>> UNITS = {
      {"ns", 1e-6}, {"us", 1e-3}, {"ms", 1.0},
      {"s", 1e3},   {"m", 6e4},   {"h", 3.6e6},
  };
  if (s.empty()) {
    throw ActionConfigException("invalid duration: empty");
  }
  double total = 0;
  size_t i = 0;
  while (i < s.length()) {
    size_t numberStart = i;
    while (i < s.length() && (isdigit((unsigned char)s[i]) || s[i] == '.')) {
      i++;
    }
    if (i == numberStart) {
      throw ActionConfigException("invalid duration: " + s);
    }
    double value;
    try {
      value = stod(s.substr(numberStart, i - numberStart));
    } catch (const std::logic_error&) {
      throw ActionConfigException("invalid duration: " + s);
    }
    size_t unitStart = i;
    while (i < s.length() && isalpha((unsigned char)s[i])) {
      i++;
    }
    string unit = s.substr(unitStart, i - unitStart);
    bool found = false;
    for (const auto& it : UNITS) {
      if (it.first == unit) {
        total += value * it.second;
        found = true;
        break;
      }
    }
    if (!found) {
      throw ActionConfigException("invalid duration: " + s);
    }
  }
  return std::chrono::milliseconds((int64_t)total);
}

string ActionConfig::sampleManifest() {
  json manifest = {
      {"name", "my-tools"},
      {"description", "Local actions exposed through ToolTunnel"},
      {"version", "1.0.0"},
      {"server", {{"port", DEFAULT_PORT}}},
      {"actions",
       json::array({
           {{"name", "hello"},
            {"description", "Say hello to someone"},
            {"parameters",
             json::array({{{"name", "name"},
                           {"type", "string"},
                           {"description", "Who to greet"},
                           {"required", true}}})},
            {"script", {{"shell", "echo \"Hello, {{name}}!\""}}}},
           {{"name", "list_files"},
            {"description", "List files in a directory"},
            {"parameters",
             json::array({{{"name", "path"},
                           {"type", "string"},
                           {"description", "Directory to list"},
                           {"default", "."}}})},
            {"script",
             {{"command", "ls"},
              {"args", json::array({"-la", "{{path}}"})},
              {"timeout", "10s"}}}},
           {{"name", "get_ip"},
            {"description", "Look up this machine's public IP address"},
            {"http",
             {{"method", "GET"},
              {"url", "https://api.ipify.org?format=json"},
              {"extract_json", "ip"},
              {"timeout", "10s"}}}},
       })},
  };
  return manifest.dump(2) + "\n";
}
}  // namespace tt

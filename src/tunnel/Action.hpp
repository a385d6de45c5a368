#ifndef __TT_ACTION__
#define __TT_ACTION__

#include "Headers.hpp"

namespace tt {
enum class ParameterType { STRING, NUMBER, BOOLEAN, ARRAY, OBJECT };

string parameterTypeToString(ParameterType type);
/**
 * @return false if `s` is not one of the five schema types.
 */
bool parameterTypeFromString(const string& s, ParameterType* type);

struct ActionParameter {
  string name;
  ParameterType type = ParameterType::STRING;
  string description;
  bool required = false;
  /** @brief Empty means no default. */
  string defaultValue;
};

// Runs a local program, either `shell` through the user's shell or `command`
// with `args` directly.
struct ProcessExecution {
  string command;
  vector<string> args;
  string shell;
  string workingDir;
  std::chrono::milliseconds timeout =
      std::chrono::seconds(DEFAULT_ACTION_TIMEOUT);
};

// Calls an HTTP endpoint.
struct HttpExecution {
  string method = "GET";
  string url;
  vector<pair<string, string>> headers;
  string body;
  /** @brief Dot path such as `data.items[0].name`; empty keeps the body. */
  string extractJson;
  std::chrono::milliseconds timeout =
      std::chrono::seconds(DEFAULT_ACTION_TIMEOUT);
};

typedef std::variant<ProcessExecution, HttpExecution> ActionExecution;

/**
 * @brief A named, schema-described unit of local capability.
 */
struct Action {
  string name;
  string description;
  vector<ActionParameter> parameters;
  ActionExecution execution;
  vector<pair<string, string>> environment;

  bool isHttp() const {
    return std::holds_alternative<HttpExecution>(execution);
  }
  string kindName() const { return isHttp() ? "http" : "script"; }
};

/**
 * @brief Thrown when an action set violates the registry invariants.
 */
class ActionRegistryException : public std::runtime_error {
 public:
  explicit ActionRegistryException(const string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Immutable snapshot of the configured actions.
 *
 * Built once per configuration load and never edited; a reload builds a new
 * registry and swaps it in whole.
 */
class ActionRegistry {
 public:
  /**
   * @throws ActionRegistryException on duplicate action or parameter names.
   */
  ActionRegistry(const string& _name, const string& _version,
                 const string& _description, vector<Action> _actions);

  /** @brief Exact-name lookup; nullptr when absent. */
  const Action* find(const string& actionName) const;

  const vector<Action>& getActions() const { return actions; }
  size_t size() const { return actions.size(); }
  const string& getName() const { return name; }
  const string& getVersion() const { return version; }
  const string& getDescription() const { return description; }

 protected:
  string name;
  string version;
  string description;
  vector<Action> actions;
  unordered_map<string, size_t> actionIndex;
};
}  // namespace tt

#endif  // __TT_ACTION__

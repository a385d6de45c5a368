#ifndef __TT_ACTION_CONFIG__
#define __TT_ACTION_CONFIG__

#include "Action.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tt {
/**
 * @brief Thrown when an action manifest cannot be read or is invalid.
 */
class ActionConfigException : public std::runtime_error {
 public:
  explicit ActionConfigException(const string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Result of loading a manifest: the registry plus the local server
 * port.
 */
struct ActionManifest {
  shared_ptr<const ActionRegistry> registry;
  int port = 3000;
};

/**
 * @brief Reads the action manifest, written in JSON or YAML.
 *
 * The JSON form looks like:
 *
 *   {
 *     "name": "my-tools",
 *     "version": "1.0.0",
 *     "server": {"port": 3000},
 *     "actions": [
 *       {"name": "hello",
 *        "parameters": [{"name": "name", "type": "string", "required": true}],
 *        "script": {"shell": "echo Hello, {{name}}!"}},
 *       {"name": "weather",
 *        "http": {"url": "https://api.example.com/{{city}}",
 *                 "extract_json": "current.temp"}}
 *     ]
 *   }
 *
 * `$VAR` and `${VAR}` are expanded from the environment in every string value
 * except a script's `shell`, `command` and `args`, which are expanded when the
 * action runs (by the shell, or by the invoker for `command`).
 *
 * The YAML form has the same keys. `tools` may stand in for `actions`, and
 * plain scalars other than booleans and null are read as text, so
 * `version: 1.10` keeps its trailing zero.
 */
class ActionConfig {
 public:
  static const string DEFAULT_NAME;
  static const string DEFAULT_VERSION;
  static const int DEFAULT_PORT = 3000;

  /**
   * @brief Loads a manifest, as YAML when the file ends in `.yaml` or `.yml`
   * and as JSON otherwise.
   * @throws ActionConfigException if the file is unreadable or invalid.
   */
  static ActionManifest load(const string& path);
  static ActionManifest parse(const string& text);
  static ActionManifest parseYaml(const string& text);

  /**
   * @brief Replaces `$VAR` and `${VAR}` with the environment value, or with
   * nothing when unset. A `$` not followed by a name is kept.
   */
  static string expandEnvironment(const string& s);

  /**
   * @brief Parses a duration such as `500ms`, `30s`, `2m` or `1h30m`.
   * @throws ActionConfigException on malformed input.
   */
  static std::chrono::milliseconds parseDuration(const string& s);

  /** @brief The manifest written by `tooltunnel init`. */
  static string sampleManifest();

 protected:
  static ActionManifest parseDocument(json document);
  static Action parseAction(const json& j, size_t index);
  static ActionParameter parseParameter(const string& actionName,
                                        const json& j);
  static ProcessExecution parseProcessExecution(const string& actionName,
                                                const json& j);
  static HttpExecution parseHttpExecution(const string& actionName,
                                          const json& j);
};
}  // namespace tt

#endif  // __TT_ACTION_CONFIG__

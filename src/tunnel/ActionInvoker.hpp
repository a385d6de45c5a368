#ifndef __TT_ACTION_INVOKER__
#define __TT_ACTION_INVOKER__

#include "Action.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SubprocessUtils.hpp"

namespace tt {
/**
 * @brief Uniform outcome of running an action of any kind.
 */
struct InvocationResult {
  /** @brief Trimmed text output. */
  string output;
  /** @brief 0 on success, -1 when the action could not run to completion. */
  int exitCode = 0;
  std::chrono::milliseconds duration = std::chrono::milliseconds(0);
  string error;

  bool hasError() const { return !error.empty(); }
};

/**
 * @brief Performs the side-effecting work behind an action.
 *
 * invoke() may block for up to the action's timeout and is called
 * concurrently from several request threads.
 */
class ActionInvoker {
 public:
  virtual ~ActionInvoker() {}

  /**
   * @param arguments The caller's argument object (null means none).
   */
  virtual InvocationResult invoke(const Action& action,
                                  const json& arguments) = 0;
};

/**
 * @brief Runs process actions through SubprocessUtils.
 */
class ProcessInvoker : public ActionInvoker {
 public:
  explicit ProcessInvoker(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}

  virtual InvocationResult invoke(const Action& action, const json& arguments);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
};

/**
 * @brief Runs HTTP actions with cpp-httplib.
 */
class HttpInvoker : public ActionInvoker {
 public:
  virtual InvocationResult invoke(const Action& action, const json& arguments);
};

/**
 * @brief Picks the invoker that matches an action's execution kind.
 */
class ActionRunner : public ActionInvoker {
 public:
  ActionRunner(shared_ptr<ActionInvoker> _processInvoker,
               shared_ptr<ActionInvoker> _httpInvoker)
      : processInvoker(_processInvoker), httpInvoker(_httpInvoker) {}

  virtual InvocationResult invoke(const Action& action, const json& arguments);

 protected:
  shared_ptr<ActionInvoker> processInvoker;
  shared_ptr<ActionInvoker> httpInvoker;
};

/**
 * @brief Returns the arguments with declared defaults filled in for missing
 * parameters. Defaults of non-string parameters are read as JSON when they
 * parse.
 */
json resolveArguments(const Action& action, const json& arguments);

/** @brief Strings verbatim, everything else as compact JSON. */
string argumentToString(const json& value);

/** @brief Replaces each `{{name}}` with the matching argument. */
string expandArguments(const string& text, const json& arguments);

/**
 * @brief Selects `path` (e.g. `data.items[0].name`) from a JSON document.
 * @return false if the body is not JSON or the path does not resolve.
 */
bool extractJsonPath(const string& body, const string& path, string* out);
}  // namespace tt

#endif  // __TT_ACTION_INVOKER__

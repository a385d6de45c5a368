#include "Action.hpp"

namespace tt {
namespace {
const vector<pair<ParameterType, string>> PARAMETER_TYPE_NAMES = {
    {ParameterType::STRING, "string"},   {ParameterType::NUMBER, "number"},
    {ParameterType::BOOLEAN, "boolean"}, {ParameterType::ARRAY, "array"},
    {ParameterType::OBJECT, "object"},
};
}

string parameterTypeToString(ParameterType type) {
  for (const auto& it : PARAMETER_TYPE_NAMES) {
    if (it.first == type) {
      return it.second;
    }
  }
  return "string";
}

bool parameterTypeFromString(const string& s, ParameterType* type) {
  for (const auto& it : PARAMETER_TYPE_NAMES) {
    if (it.second == s) {
      *type = it.first;
      return true;
    }
  }
  return false;
}

ActionRegistry::ActionRegistry(const string& _name, const string& _version,
                               const string& _description,
                               vector<Action> _actions)
    : name(_name),
      version(_version),
      description(_description),
      actions(std::move(_actions)) {
  for (size_t a = 0; a < actions.size(); a++) {
    const Action& action = actions[a];
    if (!actionIndex.emplace(action.name, a).second) {
      throw ActionRegistryException("duplicate action name: " + action.name);
    }
    set<string> parameterNames;
    for (const auto& parameter : action.parameters) {
      if (!parameterNames.insert(parameter.name).second) {
        throw ActionRegistryException("action " + action.name +
                                      ": duplicate parameter name: " +
                                      parameter.name);
      }
    }
  }
}

const Action* ActionRegistry::find(const string& actionName) const {
  auto it = actionIndex.find(actionName);
  if (it == actionIndex.end()) {
    return nullptr;
  }
  return &actions[it->second];
}
}  // namespace tt

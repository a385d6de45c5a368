#ifndef __TT_REGISTRY_SWAP_GATE__
#define __TT_REGISTRY_SWAP_GATE__

#include "Action.hpp"
#include "Headers.hpp"

namespace tt {
/**
 * @brief Single-slot holder for the live ActionRegistry.
 *
 * current() hands out a reference-counted snapshot; a caller holding one keeps
 * seeing it unchanged while replace() installs a new registry for later
 * callers. The old snapshot is released when its last reader drops it.
 */
class RegistrySwapGate {
 public:
  explicit RegistrySwapGate(shared_ptr<const ActionRegistry> _registry) {
    replace(_registry);
  }

  shared_ptr<const ActionRegistry> current() const {
    return std::atomic_load(&registry);
  }

  void replace(shared_ptr<const ActionRegistry> newRegistry) {
    if (newRegistry.get() == NULL) {
      throw std::invalid_argument("Tried to install a null registry");
    }
    std::atomic_store(&registry, newRegistry);
  }

 protected:
  shared_ptr<const ActionRegistry> registry;
};
}  // namespace tt

#endif  // __TT_REGISTRY_SWAP_GATE__

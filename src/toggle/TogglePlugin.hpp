#ifndef __TT_TOGGLE_PLUGIN__
#define __TT_TOGGLE_PLUGIN__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "KeyTable.hpp"
#include "ToggleController.hpp"

namespace tt {
/**
 * @brief Wires the toggle terminal into a host: merges the user's options
 * over the defaults, builds the controller with a fresh registry and binds
 * the configured key chord to it.
 */
class TogglePlugin {
 public:
  /**
   * @throws std::invalid_argument if the merged options are invalid.
   * @return The controller now reachable through `keyTable`.
   */
  static shared_ptr<ToggleController> applyToConfig(
      KeyTable* keyTable, shared_ptr<PaneHost> paneHost,
      const json& userOverrides, const string& stateDirectory);
};
}  // namespace tt

#endif  // __TT_TOGGLE_PLUGIN__

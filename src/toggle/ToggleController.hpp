#ifndef __TT_TOGGLE_CONTROLLER__
#define __TT_TOGGLE_CONTROLLER__

#include "Headers.hpp"
#include "PaneHost.hpp"
#include "TabStateRegistry.hpp"
#include "ToggleConfig.hpp"
#include "ToggleStateFile.hpp"

namespace tt {
/** @brief What a toggle trigger ended up doing. */
enum class ToggleAction { CREATED, SHOWN, HIDDEN, FAILED };

string toggleActionToString(ToggleAction action);

/**
 * @brief Creates, shows or hides the per-tab terminal pane.
 *
 * The state of a tab is derived on every trigger from its TabState and the
 * live topology reported by the host:
 * - inactive: no terminal pane tracked, one gets split off the invoker.
 * - active elsewhere: the terminal pane lives in this tab but another pane
 *   has focus, the terminal pane gets focus.
 * - active focused: the trigger came from the terminal pane, focus goes back
 *   to the invoker pane.
 * - stale: the tracked pane is gone or sits in another tab, the state is
 *   reset and the trigger is handled as inactive.
 *
 * Each trigger causes at most one pane creation.  If the invoker pane has
 * disappeared while hiding, the state is reset and the trigger is evaluated
 * one more time.
 */
class ToggleController {
 public:
  ToggleController(shared_ptr<PaneHost> _paneHost,
                   shared_ptr<TabStateRegistry> _registry,
                   shared_ptr<ToggleStateFile> _stateFile,
                   const ToggleConfig& _config);

  /** @brief Entry point bound to the toggle key chord. */
  ToggleAction onToggleTrigger(WindowId windowId, PaneId invokingPaneId);

  inline const ToggleConfig& getConfig() const { return config; }
  inline shared_ptr<TabStateRegistry> getRegistry() { return registry; }

 protected:
  /** @brief Extra evaluations allowed after an invoker lookup failure. */
  static const int MAX_RETRIES = 1;

  shared_ptr<PaneHost> paneHost;
  shared_ptr<TabStateRegistry> registry;
  shared_ptr<ToggleStateFile> stateFile;
  ToggleConfig config;
  std::mutex toggleMutex;

  ToggleAction createTerminalPane(WindowId windowId, PaneId invokingPaneId,
                                  TabId tabId, TabState& state);
  ToggleAction showTerminalPane(TabId tabId, TabState& state);
  /** @brief Returns false if the invoker pane is gone or in another tab. */
  bool hideTerminalPane(TabId tabId, TabState& state);

  void resetTabState(TabId tabId, TabState& state);
  /** @brief Writes the marker file if the pane is still alive, else clears
   * it. */
  void syncStateFile(TabId tabId, PaneId paneId);
};
}  // namespace tt

#endif  // __TT_TOGGLE_CONTROLLER__

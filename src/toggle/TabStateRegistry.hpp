#ifndef __TT_TAB_STATE_REGISTRY__
#define __TT_TAB_STATE_REGISTRY__

#include "Headers.hpp"

namespace tt {
/**
 * @brief What the toggle controller remembers about one tab.
 *
 * Both ids are hints: the panes they name may have been closed or moved
 * since they were recorded.
 */
struct TabState {
  /** @brief The managed terminal pane, or NO_PANE when inactive. */
  PaneId paneId = NO_PANE;
  /** @brief Pane that gets focus back when the terminal is hidden. */
  PaneId invokerId = NO_PANE;
  /** @brief Whether the terminal pane was zoomed when last hidden. */
  bool zoomed = false;
};

/**
 * @brief Process-scoped store of TabState keyed by tab id.
 *
 * Entries are created on first use and never removed: tab ids are not
 * reused while the host lives, so at most one stale entry per closed tab
 * remains.
 *
 * The mutex only protects the map itself.  References returned by getOrInit
 * are written without it, so callers that mutate a TabState must serialize
 * among themselves (ToggleController holds its own mutex for a whole
 * transition).
 */
class TabStateRegistry {
 public:
  TabStateRegistry() {}

  /**
   * @brief Returns the state for a tab, creating an inactive one if needed.
   * The reference stays valid for the lifetime of the registry.
   */
  TabState& getOrInit(TabId tabId);
  /** @brief Returns a copy of the state for a tab, if one exists. */
  optional<TabState> find(TabId tabId);
  size_t size();

 protected:
  std::mutex registryMutex;
  map<TabId, TabState> tabStates;
};
}  // namespace tt

#endif  // __TT_TAB_STATE_REGISTRY__

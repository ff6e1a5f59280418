#ifndef __TT_TOGGLE_STATE_FILE__
#define __TT_TOGGLE_STATE_FILE__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Publishes which pane is the active toggle terminal of each tab.
 *
 * One JSON file per tab, `toggle_pane_tab_<tab>.json`, holding
 * `{"pane_id", "tab_id", "active": true, "timestamp"}`.  The file is removed
 * when the tab no longer has a terminal pane.  Other tools read these files;
 * toggleterm itself never does.
 *
 * Failures are logged and swallowed: the marker files must never get in the
 * way of pane management.
 */
class ToggleStateFile {
 public:
  explicit ToggleStateFile(const string& _stateDirectory);

  /** @brief `<user cache dir>/toggleterm`. */
  static string getDefaultStateDirectory();

  string getPath(TabId tabId) const;
  /** @brief Writes the active marker for a tab, creating the directory. */
  void write(TabId tabId, PaneId paneId);
  /** @brief Deletes the marker for a tab.  A missing file is fine. */
  void clear(TabId tabId);

  inline const string& getStateDirectory() const { return stateDirectory; }

 protected:
  string stateDirectory;

  bool ensureStateDirectory();
};
}  // namespace tt

#endif  // __TT_TOGGLE_STATE_FILE__

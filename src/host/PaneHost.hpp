#ifndef __TT_PANE_HOST__
#define __TT_PANE_HOST__

#include "Headers.hpp"

namespace tt {
/** @brief Direction in which a new pane is split off its source. */
enum class SplitDirection { UP, DOWN, LEFT, RIGHT };

/** @brief Parses "Up"/"down"/... into a direction, throwing on bad input. */
SplitDirection splitDirectionFromString(const string& s);
/** @brief Returns the canonical ("Up", "Down", ...) name of a direction. */
string splitDirectionToString(SplitDirection direction);

/** @brief A pane of a tab together with its focus/zoom flags. */
struct PaneInfo {
  PaneId paneId;
  bool isActive;
  bool isZoomed;
};

/**
 * @brief Capability set the toggle controller needs from the multiplexer.
 *
 * Every id is an opaque handle that may refer to an object which was closed
 * or moved since it was handed out.  Lookups therefore return optionals and
 * mutations return whether they applied, a miss is never an error.
 */
class PaneHost {
 public:
  virtual ~PaneHost() {}

  /** @brief Returns the tab that owns `paneId`, or nullopt if the pane is
   * gone. */
  virtual optional<TabId> getPaneTab(PaneId paneId) = 0;
  /** @brief Returns the focused pane of the window's active tab. */
  virtual optional<PaneId> getActivePane(WindowId windowId) = 0;
  /**
   * @brief Splits `sourcePaneId`, giving the new pane `percent` of its space.
   * The new pane is expected to become the window's active pane.
   */
  virtual bool splitPane(WindowId windowId, PaneId sourcePaneId,
                         SplitDirection direction, int percent) = 0;
  /** @brief Focuses a pane (and its tab). */
  virtual bool activatePane(PaneId paneId) = 0;
  /** @brief Zooms the active pane of a tab, or clears the zoom. */
  virtual void setZoomed(TabId tabId, bool zoomed) = 0;
  /** @brief Lists the panes of a tab with their active/zoomed flags. */
  virtual vector<PaneInfo> panesWithInfo(TabId tabId) = 0;
};
}  // namespace tt

#endif  // __TT_PANE_HOST__

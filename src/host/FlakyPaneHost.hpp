#ifndef __TT_FLAKY_PANE_HOST__
#define __TT_FLAKY_PANE_HOST__

#include "PaneHost.hpp"

namespace tt {
/**
 * @brief Forwards to a real host but can be told to misbehave, e.g. report
 * an unrelated pane as active right after a split.
 */
class FlakyPaneHost : public PaneHost {
 public:
  FlakyPaneHost(shared_ptr<PaneHost> _actualPaneHost)
      : actualPaneHost(_actualPaneHost), failSplits(false) {}
  virtual ~FlakyPaneHost() {}

  /** @brief When set, getActivePane() always answers with this pane. */
  void setActivePaneOverride(optional<PaneId> paneId) {
    activePaneOverride = paneId;
  }
  /** @brief When true, splitPane() does nothing and reports failure. */
  void setFailSplits(bool fail) { failSplits = fail; }

  virtual optional<TabId> getPaneTab(PaneId paneId) {
    return actualPaneHost->getPaneTab(paneId);
  }
  virtual optional<PaneId> getActivePane(WindowId windowId) {
    if (activePaneOverride) {
      return activePaneOverride;
    }
    return actualPaneHost->getActivePane(windowId);
  }
  virtual bool splitPane(WindowId windowId, PaneId sourcePaneId,
                         SplitDirection direction, int percent) {
    if (failSplits) {
      return false;
    }
    return actualPaneHost->splitPane(windowId, sourcePaneId, direction,
                                     percent);
  }
  virtual bool activatePane(PaneId paneId) {
    return actualPaneHost->activatePane(paneId);
  }
  virtual void setZoomed(TabId tabId, bool zoomed) {
    actualPaneHost->setZoomed(tabId, zoomed);
  }
  virtual vector<PaneInfo> panesWithInfo(TabId tabId) {
    return actualPaneHost->panesWithInfo(tabId);
  }

 protected:
  shared_ptr<PaneHost> actualPaneHost;
  optional<PaneId> activePaneOverride;
  bool failSplits;
};
}  // namespace tt

#endif  // __TT_FLAKY_PANE_HOST__

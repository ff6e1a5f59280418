#ifndef __TT_MULTIPLEXER_STATE_HPP__
#define __TT_MULTIPLEXER_STATE_HPP__

#include "Headers.hpp"
#include "PaneHost.hpp"

namespace tt {
/**
 * @brief Keeps track of windows, tabs, splits and panes of an in-process
 * terminal multiplexer.
 *
 * Windows own an ordered list of tabs.  Each tab owns a tree whose inner
 * nodes are splits and whose leaves are panes.  Every object gets an id from
 * a single counter, so ids are unique across kinds and are never reused.
 */
class MultiplexerState : public PaneHost {
 protected:
  struct Pane;
  struct Split;
  struct Tab;
  struct Window;

 public:
  MultiplexerState();
  virtual ~MultiplexerState() {}

  /** @brief Creates a window holding one tab with a single pane. */
  WindowId newWindow();
  /** @brief Appends a tab with a single pane to a window and focuses it. */
  TabId newTab(WindowId windowId);
  /** @brief Removes a pane, collapsing its split and tab as needed. */
  void closePane(PaneId paneId);
  /**
   * @brief Detaches a pane into a brand new tab of the same window.
   * @return The new tab, or nullopt if the pane does not exist.
   */
  optional<TabId> movePaneToNewTab(PaneId paneId);
  /** @brief Serializes windows/tabs/panes/splits into JSON. */
  string toJsonString();

  optional<TabId> getActiveTab(WindowId windowId);
  optional<WindowId> getTabWindow(TabId tabId);
  vector<WindowId> getWindows();
  /** @brief Returns true when the tab has a pane zoomed. */
  bool isZoomed(TabId tabId);

  inline int numPanes() { return int(panes.size()); }
  inline int numTabs() { return int(tabs.size()); }

  virtual optional<TabId> getPaneTab(PaneId paneId);
  virtual optional<PaneId> getActivePane(WindowId windowId);
  virtual bool splitPane(WindowId windowId, PaneId sourcePaneId,
                         SplitDirection direction, int percent);
  virtual bool activatePane(PaneId paneId);
  virtual void setZoomed(TabId tabId, bool zoomed);
  virtual vector<PaneInfo> panesWithInfo(TabId tabId);

 protected:
  /** @brief Next id handed out to any window/tab/split/pane. */
  int64_t nextId;
  map<int64_t, shared_ptr<Window>> windows;
  map<int64_t, shared_ptr<Tab>> tabs;
  map<int64_t, shared_ptr<Pane>> panes;
  map<int64_t, shared_ptr<Split>> splits;
  /** @brief IDs that have already been closed to prevent reuse. */
  set<int64_t> closed;

  /** @brief Fetches a window object, verifying it exists. */
  inline shared_ptr<Window> getWindow(int64_t id) {
    auto it = windows.find(id);
    if (it == windows.end()) {
      STFATAL << "Tried to get a window that doesn't exist: " << id;
    }
    return it->second;
  }
  /** @brief Fetches a tab object, verifying it exists. */
  inline shared_ptr<Tab> getTab(int64_t id) {
    auto it = tabs.find(id);
    if (it == tabs.end()) {
      STFATAL << "Tried to get a tab that doesn't exist: " << id;
    }
    return it->second;
  }
  /** @brief Fetches a pane object, verifying it exists. */
  inline shared_ptr<Pane> getPane(int64_t id) {
    auto it = panes.find(id);
    if (it == panes.end()) {
      STFATAL << "Tried to get a pane that doesn't exist: " << id;
    }
    return it->second;
  }
  /** @brief Fetches a split object, verifying it exists. */
  inline shared_ptr<Split> getSplit(int64_t id) {
    auto it = splits.find(id);
    if (it == splits.end()) {
      STFATAL << "Tried to get a split that doesn't exist: " << id;
    }
    return it->second;
  }

  /** @brief Walks up the split tree to the tab holding a pane or split. */
  TabId owningTab(int64_t paneOrSplitId);
  /** @brief Returns the first pane (depth-first) below a node. */
  PaneId firstPane(int64_t paneOrSplitId);
  void collectPanes(int64_t paneOrSplitId, vector<PaneId>* out);
  void setParent(int64_t paneOrSplitId, int64_t parentId);
  /** @brief Swaps the child `oldId` of `parentId` (tab or split) for `newId`.
   */
  void replaceChild(int64_t parentId, int64_t oldId, int64_t newId);
  /**
   * @brief Unlinks a pane from its tab, collapsing splits.  A tab left empty
   * is removed from its window.
   * @return The tab the pane used to live in.
   */
  TabId detachPane(shared_ptr<Pane> pane);
  void removeTab(TabId tabId);
  TabId attachNewTab(WindowId windowId, shared_ptr<Pane> pane);
};
}  // namespace tt

#endif  // __TT_MULTIPLEXER_STATE_HPP__

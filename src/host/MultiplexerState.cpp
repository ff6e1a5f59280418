#include "MultiplexerState.hpp"

#include "JsonLib.hpp"

namespace tt {
struct MultiplexerState::Pane {
  PaneId id;
  int64_t parentId;

  json toJson() {
    json pane;
    pane["id"] = id;
    pane["parent"] = parentId;
    return pane;
  }
};
struct MultiplexerState::Split {
  int64_t id;
  int64_t parentId;
  bool vertical;
  vector<int64_t> panes_or_splits;
  vector<float> sizes;

  json toJson() {
    json split;
    split["id"] = id;
    split["vertical"] = vertical;
    split["panesOrSplits"] = panes_or_splits;
    split["sizes"] = sizes;
    return split;
  }
};
struct MultiplexerState::Tab {
  TabId id;
  WindowId windowId;
  int64_t pane_or_split_id;
  PaneId activePaneId;
  PaneId zoomedPaneId;

  json toJson() {
    json tab;
    tab["id"] = id;
    tab["window"] = windowId;
    tab["paneOrSplit"] = pane_or_split_id;
    tab["activePane"] = activePaneId;
    tab["zoomedPane"] = zoomedPaneId;
    return tab;
  }
};
struct MultiplexerState::Window {
  WindowId id;
  vector<TabId> tabs;
  TabId activeTabId;

  json toJson() {
    json window;
    window["id"] = id;
    window["tabs"] = tabs;
    window["activeTab"] = activeTabId;
    return window;
  }
};

MultiplexerState::MultiplexerState() : nextId(0) {}

WindowId MultiplexerState::newWindow() {
  auto window = shared_ptr<Window>(new Window());
  window->id = nextId++;
  window->activeTabId = -1;
  windows.insert(make_pair(window->id, window));
  newTab(window->id);
  LOG(INFO) << "Created window " << window->id;
  return window->id;
}

TabId MultiplexerState::newTab(WindowId windowId) {
  auto pane = shared_ptr<Pane>(new Pane());
  pane->id = nextId++;
  panes.insert(make_pair(pane->id, pane));
  return attachNewTab(windowId, pane);
}

TabId MultiplexerState::attachNewTab(WindowId windowId,
                                     shared_ptr<Pane> pane) {
  auto window = getWindow(windowId);
  auto tab = shared_ptr<Tab>(new Tab());
  tab->id = nextId++;
  tab->windowId = windowId;
  tab->pane_or_split_id = pane->id;
  tab->activePaneId = pane->id;
  tab->zoomedPaneId = NO_PANE;
  tabs.insert(make_pair(tab->id, tab));
  pane->parentId = tab->id;

  window->tabs.push_back(tab->id);
  window->activeTabId = tab->id;
  VLOG(1) << "New tab " << tab->id << " with pane " << pane->id
          << " in window " << windowId;
  return tab->id;
}

optional<TabId> MultiplexerState::getPaneTab(PaneId paneId) {
  if (panes.find(paneId) == panes.end()) {
    return nullopt;
  }
  return owningTab(paneId);
}

optional<PaneId> MultiplexerState::getActivePane(WindowId windowId) {
  auto windowIt = windows.find(windowId);
  if (windowIt == windows.end()) {
    return nullopt;
  }
  auto tabIt = tabs.find(windowIt->second->activeTabId);
  if (tabIt == tabs.end()) {
    return nullopt;
  }
  return tabIt->second->activePaneId;
}

optional<TabId> MultiplexerState::getActiveTab(WindowId windowId) {
  auto windowIt = windows.find(windowId);
  if (windowIt == windows.end() || windowIt->second->tabs.empty()) {
    return nullopt;
  }
  return windowIt->second->activeTabId;
}

optional<WindowId> MultiplexerState::getTabWindow(TabId tabId) {
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    return nullopt;
  }
  return it->second->windowId;
}

vector<WindowId> MultiplexerState::getWindows() {
  vector<WindowId> retval;
  for (auto &it : windows) {
    retval.push_back(it.first);
  }
  return retval;
}

bool MultiplexerState::isZoomed(TabId tabId) {
  auto it = tabs.find(tabId);
  return it != tabs.end() && it->second->zoomedPaneId != NO_PANE;
}

bool MultiplexerState::splitPane(WindowId windowId, PaneId sourcePaneId,
                                 SplitDirection direction, int percent) {
  auto sourceIt = panes.find(sourcePaneId);
  if (sourceIt == panes.end()) {
    LOG(WARNING) << "Cannot split missing pane " << sourcePaneId;
    return false;
  }
  auto sourcePane = sourceIt->second;
  auto tab = getTab(owningTab(sourcePaneId));
  if (tab->windowId != windowId) {
    LOG(WARNING) << "Pane " << sourcePaneId << " is not in window "
                 << windowId;
    return false;
  }

  // Keep both panes visible, whatever the requested share
  percent = std::max(1, std::min(99, percent));
  float fraction = percent / 100.0f;
  bool vertical =
      (direction == SplitDirection::UP || direction == SplitDirection::DOWN);
  bool before =
      (direction == SplitDirection::UP || direction == SplitDirection::LEFT);

  auto newPane = shared_ptr<Pane>(new Pane());
  newPane->id = nextId++;
  panes.insert(make_pair(newPane->id, newPane));

  auto splitIt = splits.find(sourcePane->parentId);
  if (splitIt != splits.end() && splitIt->second->vertical == vertical) {
    VLOG(1) << "Continuing a split";
    // The source is already part of a split with the same orientation.
    // Carve the new pane out of the source's share.
    auto split = splitIt->second;
    size_t index = 0;
    for (; index < split->panes_or_splits.size(); index++) {
      if (split->panes_or_splits[index] == sourcePaneId) {
        break;
      }
    }
    if (index == split->panes_or_splits.size()) {
      STFATAL << "SourcePane missing from parent split";
    }
    float share = split->sizes[index];
    split->sizes[index] = share * (1.0f - fraction);
    size_t insertAt = before ? index : index + 1;
    split->panes_or_splits.insert(split->panes_or_splits.begin() + insertAt,
                                  newPane->id);
    split->sizes.insert(split->sizes.begin() + insertAt, share * fraction);
    newPane->parentId = split->id;
  } else {
    if (splitIt != splits.end()) {
      VLOG(1) << "Splitting in a new direction";
    } else {
      VLOG(1) << "Splitting a root pane";
    }
    // Either the source is the root of the tab or it lives in a split of the
    // other orientation.  In both cases a new split takes its place.
    auto newSplit = shared_ptr<Split>(new Split());
    newSplit->id = nextId++;
    splits.insert(make_pair(newSplit->id, newSplit));
    newSplit->vertical = vertical;
    if (before) {
      newSplit->panes_or_splits = {newPane->id, sourcePaneId};
      newSplit->sizes = {fraction, 1.0f - fraction};
    } else {
      newSplit->panes_or_splits = {sourcePaneId, newPane->id};
      newSplit->sizes = {1.0f - fraction, fraction};
    }
    newSplit->parentId = sourcePane->parentId;
    replaceChild(sourcePane->parentId, sourcePaneId, newSplit->id);
    sourcePane->parentId = newSplit->id;
    newPane->parentId = newSplit->id;
  }

  tab->activePaneId = newPane->id;
  tab->zoomedPaneId = NO_PANE;
  getWindow(windowId)->activeTabId = tab->id;
  LOG(INFO) << "Split pane " << sourcePaneId << " "
            << splitDirectionToString(direction) << " " << percent
            << "%, new pane " << newPane->id << " in tab " << tab->id;
  return true;
}

bool MultiplexerState::activatePane(PaneId paneId) {
  if (panes.find(paneId) == panes.end()) {
    return false;
  }
  auto tab = getTab(owningTab(paneId));
  if (tab->zoomedPaneId != NO_PANE && tab->zoomedPaneId != paneId) {
    VLOG(1) << "Unzooming tab " << tab->id << " to switch panes";
    tab->zoomedPaneId = NO_PANE;
  }
  tab->activePaneId = paneId;
  getWindow(tab->windowId)->activeTabId = tab->id;
  VLOG(1) << "Activated pane " << paneId << " in tab " << tab->id;
  return true;
}

void MultiplexerState::setZoomed(TabId tabId, bool zoomed) {
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    LOG(WARNING) << "Cannot change zoom of missing tab " << tabId;
    return;
  }
  auto tab = it->second;
  tab->zoomedPaneId = zoomed ? tab->activePaneId : NO_PANE;
  VLOG(1) << "Tab " << tabId << " zoomed pane: " << tab->zoomedPaneId;
}

vector<PaneInfo> MultiplexerState::panesWithInfo(TabId tabId) {
  vector<PaneInfo> retval;
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    return retval;
  }
  auto tab = it->second;
  vector<PaneId> paneIds;
  collectPanes(tab->pane_or_split_id, &paneIds);
  for (auto paneId : paneIds) {
    PaneInfo info;
    info.paneId = paneId;
    info.isActive = (paneId == tab->activePaneId);
    info.isZoomed = (paneId == tab->zoomedPaneId);
    retval.push_back(info);
  }
  return retval;
}

void MultiplexerState::closePane(PaneId paneId) {
  if (closed.find(paneId) != closed.end()) {
    return;  // Already closed
  }
  if (panes.find(paneId) == panes.end()) {
    STFATAL << "Tried to close a pane that doesn't exist: " << paneId;
  }
  auto pane = panes[paneId];
  WindowId windowId = getTab(owningTab(paneId))->windowId;
  detachPane(pane);
  panes.erase(panes.find(paneId));
  closed.insert(paneId);
  LOG(INFO) << "Closed pane " << paneId;

  auto window = getWindow(windowId);
  if (window->tabs.empty()) {
    LOG(INFO) << "Closing empty window " << windowId;
    windows.erase(windows.find(windowId));
    closed.insert(windowId);
  }
}

optional<TabId> MultiplexerState::movePaneToNewTab(PaneId paneId) {
  auto it = panes.find(paneId);
  if (it == panes.end()) {
    return nullopt;
  }
  auto pane = it->second;
  WindowId windowId = getTab(owningTab(paneId))->windowId;
  TabId oldTabId = detachPane(pane);
  TabId newTabId = attachNewTab(windowId, pane);
  LOG(INFO) << "Moved pane " << paneId << " from tab " << oldTabId
            << " to new tab " << newTabId;
  return newTabId;
}

TabId MultiplexerState::detachPane(shared_ptr<Pane> pane) {
  TabId tabId = owningTab(pane->id);
  auto tab = getTab(tabId);

  if (tabs.find(pane->parentId) != tabs.end()) {
    // Top-level pane, the whole tab goes away
    removeTab(tabId);
    return tabId;
  }

  auto split = getSplit(pane->parentId);
  for (size_t a = 0; a < split->panes_or_splits.size(); a++) {
    if (split->panes_or_splits[a] == pane->id) {
      split->panes_or_splits.erase(split->panes_or_splits.begin() + a);
      split->sizes.erase(split->sizes.begin() + a);
      break;
    }
    if (a + 1 == split->panes_or_splits.size()) {
      STFATAL << "Parent split " << split->id << " did not contain child pane "
              << pane->id;
    }
  }
  if (split->panes_or_splits.size() > 1) {
    // Normalize the sizes array
    float total = 0;
    for (auto size : split->sizes) {
      total += size;
    }
    for (auto &size : split->sizes) {
      size /= total;
    }
  } else {
    // The split collapses into its remaining child.
    int64_t childId = split->panes_or_splits[0];
    setParent(childId, split->parentId);
    replaceChild(split->parentId, split->id, childId);
    splits.erase(splits.find(split->id));
    closed.insert(split->id);
  }

  if (tab->activePaneId == pane->id) {
    tab->activePaneId = firstPane(tab->pane_or_split_id);
  }
  if (tab->zoomedPaneId == pane->id) {
    tab->zoomedPaneId = NO_PANE;
  }
  return tabId;
}

void MultiplexerState::removeTab(TabId tabId) {
  auto tab = getTab(tabId);
  auto window = getWindow(tab->windowId);
  auto position = std::find(window->tabs.begin(), window->tabs.end(), tabId);
  if (position == window->tabs.end()) {
    STFATAL << "Could not find tab " << tabId << " in window " << window->id;
  }
  size_t index = position - window->tabs.begin();
  window->tabs.erase(position);
  if (window->activeTabId == tabId) {
    if (window->tabs.empty()) {
      window->activeTabId = -1;
    } else {
      window->activeTabId = window->tabs[std::min(index, window->tabs.size() - 1)];
    }
  }
  tabs.erase(tabs.find(tabId));
  closed.insert(tabId);
  LOG(INFO) << "Removed tab " << tabId;
}

string MultiplexerState::toJsonString() {
  json state;
  state["windows"] = json::object();
  state["tabs"] = json::object();
  state["panes"] = json::object();
  state["splits"] = json::object();

  for (auto &it : windows) {
    state["windows"][to_string(it.first)] = it.second->toJson();
  }

  for (auto &it : tabs) {
    state["tabs"][to_string(it.first)] = it.second->toJson();
  }

  for (auto &it : panes) {
    state["panes"][to_string(it.first)] = it.second->toJson();
  }

  for (auto &it : splits) {
    state["splits"][to_string(it.first)] = it.second->toJson();
  }

  return state.dump();
}

TabId MultiplexerState::owningTab(int64_t paneOrSplitId) {
  int64_t id;
  auto paneIt = panes.find(paneOrSplitId);
  if (paneIt != panes.end()) {
    id = paneIt->second->parentId;
  } else {
    id = getSplit(paneOrSplitId)->parentId;
  }
  while (true) {
    auto splitIt = splits.find(id);
    if (splitIt == splits.end()) {
      break;
    }
    id = splitIt->second->parentId;
  }
  if (tabs.find(id) == tabs.end()) {
    STFATAL << "Node " << paneOrSplitId << " is not attached to a tab";
  }
  return id;
}

PaneId MultiplexerState::firstPane(int64_t paneOrSplitId) {
  while (panes.find(paneOrSplitId) == panes.end()) {
    paneOrSplitId = getSplit(paneOrSplitId)->panes_or_splits.front();
  }
  return paneOrSplitId;
}

void MultiplexerState::collectPanes(int64_t paneOrSplitId,
                                    vector<PaneId> *out) {
  if (panes.find(paneOrSplitId) != panes.end()) {
    out->push_back(paneOrSplitId);
    return;
  }
  for (auto child : getSplit(paneOrSplitId)->panes_or_splits) {
    collectPanes(child, out);
  }
}

void MultiplexerState::setParent(int64_t paneOrSplitId, int64_t parentId) {
  auto paneIt = panes.find(paneOrSplitId);
  if (paneIt != panes.end()) {
    paneIt->second->parentId = parentId;
  } else {
    getSplit(paneOrSplitId)->parentId = parentId;
  }
}

void MultiplexerState::replaceChild(int64_t parentId, int64_t oldId,
                                    int64_t newId) {
  auto tabIt = tabs.find(parentId);
  if (tabIt != tabs.end()) {
    // The parent is a tab, set the child id
    tabIt->second->pane_or_split_id = newId;
    return;
  }
  auto parentSplit = getSplit(parentId);
  for (size_t a = 0; a < parentSplit->panes_or_splits.size(); a++) {
    if (parentSplit->panes_or_splits[a] == oldId) {
      parentSplit->panes_or_splits[a] = newId;
      return;
    }
  }
  STFATAL << "Could not find " << oldId << " in parent split " << parentId;
}

}  // namespace tt

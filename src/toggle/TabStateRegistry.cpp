#include "TabStateRegistry.hpp"

namespace tt {
TabState& TabStateRegistry::getOrInit(TabId tabId) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = tabStates.find(tabId);
  if (it == tabStates.end()) {
    LOG(INFO) << "Initializing state for tab_id: " << tabId;
    it = tabStates.insert(make_pair(tabId, TabState())).first;
  }
  return it->second;
}

optional<TabState> TabStateRegistry::find(TabId tabId) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = tabStates.find(tabId);
  if (it == tabStates.end()) {
    return nullopt;
  }
  return it->second;
}

size_t TabStateRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return tabStates.size();
}
}  // namespace tt

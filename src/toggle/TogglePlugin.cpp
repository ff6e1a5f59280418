#include "TogglePlugin.hpp"

namespace tt {
shared_ptr<ToggleController> TogglePlugin::applyToConfig(
    KeyTable* keyTable, shared_ptr<PaneHost> paneHost,
    const json& userOverrides, const string& stateDirectory) {
  ToggleConfig config = ToggleConfig::withOverrides(userOverrides);
  LOG(INFO) << "Toggle terminal options: " << config.toJson().dump();

  auto controller = make_shared<ToggleController>(
      paneHost, make_shared<TabStateRegistry>(),
      make_shared<ToggleStateFile>(stateDirectory), config);
  keyTable->bind(config.key, config.mods,
                 [controller](WindowId windowId, PaneId paneId) {
                   ToggleAction action =
                       controller->onToggleTrigger(windowId, paneId);
                   VLOG(1) << "Toggle result: "
                           << toggleActionToString(action);
                 });
  return controller;
}
}  // namespace tt

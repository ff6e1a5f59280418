#include "ToggleController.hpp"

namespace tt {
string toggleActionToString(ToggleAction action) {
  switch (action) {
    case ToggleAction::CREATED:
      return "created";
    case ToggleAction::SHOWN:
      return "shown";
    case ToggleAction::HIDDEN:
      return "hidden";
    case ToggleAction::FAILED:
      return "failed";
  }
  return "failed";
}

ToggleController::ToggleController(shared_ptr<PaneHost> _paneHost,
                                   shared_ptr<TabStateRegistry> _registry,
                                   shared_ptr<ToggleStateFile> _stateFile,
                                   const ToggleConfig& _config)
    : paneHost(_paneHost),
      registry(_registry),
      stateFile(_stateFile),
      config(_config) {}

ToggleAction ToggleController::onToggleTrigger(WindowId windowId,
                                                PaneId invokingPaneId) {
  lock_guard<std::mutex> guard(toggleMutex);
  optional<TabId> currentTab = paneHost->getPaneTab(invokingPaneId);
  if (!currentTab) {
    LOG(ERROR) << "Toggle triggered from unknown pane " << invokingPaneId;
    return ToggleAction::FAILED;
  }
  TabId tabId = *currentTab;
  LOG(INFO) << "Toggle terminal action triggered in tab_id: " << tabId;

  TabState& state = registry->getOrInit(tabId);
  for (int attempt = 0; attempt <= MAX_RETRIES; attempt++) {
    if (state.invokerId == NO_PANE ||
        (config.changeInvokerIdEverytime && state.paneId != invokingPaneId)) {
      state.invokerId = invokingPaneId;
      LOG(INFO) << "Setting invoker pane ID for tab " << tabId << ": "
                << state.invokerId;
    }

    if (state.paneId != NO_PANE) {
      optional<TabId> terminalTab = paneHost->getPaneTab(state.paneId);
      if (!terminalTab) {
        LOG(INFO) << "Pane ID " << state.paneId << " for tab " << tabId
                  << " no longer exists or is invalid. Resetting state.";
        resetTabState(tabId, state);
      } else if (*terminalTab != tabId) {
        LOG(WARNING) << "Pane ID " << state.paneId
                     << " found, but belongs to a different tab ("
                     << *terminalTab << "). Resetting state for tab " << tabId;
        resetTabState(tabId, state);
      } else {
        VLOG(1) << "Found existing terminal pane for tab " << tabId
                << " via ID: " << state.paneId;
      }
    }

    if (state.paneId == NO_PANE) {
      return createTerminalPane(windowId, invokingPaneId, tabId, state);
    }
    if (state.paneId != invokingPaneId) {
      return showTerminalPane(tabId, state);
    }
    if (hideTerminalPane(tabId, state)) {
      return ToggleAction::HIDDEN;
    }

    // The invoker is gone or moved.  Forget it along with the terminal pane
    // so the next pass starts from a clean inactive state.
    LOG(WARNING) << "Could not find or activate invoker pane ID "
                 << state.invokerId << " (or it's in a different tab). "
                 << "Resetting tab " << tabId << " and retrying";
    state.invokerId = NO_PANE;
    resetTabState(tabId, state);
  }

  LOG(ERROR) << "Giving up toggling terminal pane for tab " << tabId;
  return ToggleAction::FAILED;
}

ToggleAction ToggleController::createTerminalPane(WindowId windowId,
                                                  PaneId invokingPaneId,
                                                  TabId tabId,
                                                  TabState& state) {
  LOG(INFO) << "Terminal pane not found for tab " << tabId
            << ". Creating a new one.";
  if (!paneHost->splitPane(windowId, invokingPaneId, config.direction,
                           config.sizePercent)) {
    LOG(ERROR) << "Failed to split pane " << invokingPaneId << " in tab "
               << tabId;
    resetTabState(tabId, state);
    return ToggleAction::FAILED;
  }

  optional<PaneId> newPane = paneHost->getActivePane(windowId);
  optional<TabId> newPaneTab;
  if (newPane) {
    newPaneTab = paneHost->getPaneTab(*newPane);
  }
  if (!newPane || *newPane == invokingPaneId || !newPaneTab ||
      *newPaneTab != tabId) {
    LOG(ERROR) << "Failed to create or identify new pane correctly in tab "
               << tabId;
    resetTabState(tabId, state);
    return ToggleAction::FAILED;
  }

  state.paneId = *newPane;
  if (state.invokerId == NO_PANE) {
    state.invokerId = invokingPaneId;
  }
  LOG(INFO) << "Created new terminal pane for tab " << tabId
            << ". ID: " << state.paneId << ", Invoker ID: " << state.invokerId;
  syncStateFile(tabId, state.paneId);
  if (config.zoom.autoZoomToggleTerminal) {
    paneHost->setZoomed(tabId, true);
  }
  return ToggleAction::CREATED;
}

ToggleAction ToggleController::showTerminalPane(TabId tabId,
                                                TabState& state) {
  paneHost->setZoomed(tabId, false);
  LOG(INFO) << "Activating existing terminal pane for tab " << tabId << ": "
            << state.paneId;
  if (!paneHost->activatePane(state.paneId)) {
    LOG(ERROR) << "Host refused to activate terminal pane " << state.paneId;
    resetTabState(tabId, state);
    return ToggleAction::FAILED;
  }
  if ((state.zoomed && config.zoom.rememberZoomed) ||
      config.zoom.autoZoomToggleTerminal) {
    paneHost->setZoomed(tabId, true);
  }
  syncStateFile(tabId, state.paneId);
  return ToggleAction::SHOWN;
}

bool ToggleController::hideTerminalPane(TabId tabId, TabState& state) {
  LOG(INFO) << "Currently in terminal pane for tab " << tabId
            << ". Attempting to activate invoker: " << state.invokerId;
  if (state.invokerId == NO_PANE) {
    return false;
  }
  optional<TabId> invokerTab = paneHost->getPaneTab(state.invokerId);
  if (!invokerTab || *invokerTab != tabId) {
    return false;
  }

  if (config.zoom.rememberZoomed) {
    for (const auto& info : paneHost->panesWithInfo(tabId)) {
      if (info.paneId == state.paneId) {
        state.zoomed = info.isZoomed;
        break;
      }
    }
  }
  paneHost->setZoomed(tabId, false);
  if (!paneHost->activatePane(state.invokerId)) {
    return false;
  }
  if (config.zoom.autoZoomInvokerPane) {
    paneHost->setZoomed(tabId, true);
  }
  // The marker file stays: the terminal pane is hidden, not gone.
  return true;
}

void ToggleController::resetTabState(TabId tabId, TabState& state) {
  state.paneId = NO_PANE;
  stateFile->clear(tabId);
}

void ToggleController::syncStateFile(TabId tabId, PaneId paneId) {
  if (paneHost->getPaneTab(paneId)) {
    stateFile->write(tabId, paneId);
  } else {
    LOG(WARNING) << "Attempted to write state for invalid pane ID " << paneId
                 << ". Clearing file: " << stateFile->getPath(tabId);
    stateFile->clear(tabId);
  }
}
}  // namespace tt

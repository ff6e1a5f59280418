#include "ScriptRunner.hpp"

namespace tt {
ScriptRunner::ScriptRunner(shared_ptr<MultiplexerState> _multiplexer,
                           KeyTable* _keyTable, WindowId _currentWindow)
    : multiplexer(_multiplexer),
      keyTable(_keyTable),
      currentWindow(_currentWindow) {}

int ScriptRunner::run(istream& in) {
  int failures = 0;
  string line;
  while (std::getline(in, line)) {
    if (!runLine(line)) {
      failures++;
    }
  }
  return failures;
}

bool ScriptRunner::runLine(const string& rawLine) {
  string line = rawLine;
  auto comment = line.find('#');
  if (comment != string::npos) {
    line = line.substr(0, comment);
  }
  vector<string> tokens;
  for (const auto& token : split(trim(line), ' ')) {
    if (!token.empty()) {
      tokens.push_back(token);
    }
  }
  if (tokens.empty()) {
    return true;
  }
  const string command = toLower(tokens[0]);
  VLOG(1) << "Script command: " << trim(line);

  if (command == "dump") {
    CLOG(INFO, "stdout") << multiplexer->toJsonString() << endl;
    return true;
  }
  if (command == "newtab") {
    if (multiplexer->getWindows().empty()) {
      currentWindow = multiplexer->newWindow();
    } else {
      multiplexer->newTab(currentWindow);
    }
    return true;
  }

  if (command == "key") {
    if (tokens.size() != 3) {
      LOG(WARNING) << "Usage: key <mods> <key>";
      return false;
    }
    optional<PaneId> pane = multiplexer->getActivePane(currentWindow);
    if (!pane) {
      LOG(WARNING) << "No active pane in window " << currentWindow;
      return false;
    }
    try {
      if (!keyTable->dispatch(tokens[2], tokens[1], currentWindow, *pane)) {
        CLOG(INFO, "stdout") << "No binding for " << tokens[1] << " "
                             << tokens[2] << endl;
      }
    } catch (const std::invalid_argument& e) {
      LOG(WARNING) << e.what();
      return false;
    }
    refreshCurrentWindow();
    return true;
  }

  if (command == "split") {
    if (tokens.size() < 2 || tokens.size() > 3) {
      LOG(WARNING) << "Usage: split <direction> [percent]";
      return false;
    }
    optional<PaneId> pane = multiplexer->getActivePane(currentWindow);
    if (!pane) {
      LOG(WARNING) << "No active pane in window " << currentWindow;
      return false;
    }
    try {
      SplitDirection direction = splitDirectionFromString(tokens[1]);
      int percent = tokens.size() == 3 ? stoi(tokens[2]) : 50;
      return multiplexer->splitPane(currentWindow, *pane, direction, percent);
    } catch (const std::logic_error& e) {
      LOG(WARNING) << "Bad split arguments: " << e.what();
      return false;
    }
  }

  if (command == "zoom") {
    optional<TabId> tab = multiplexer->getActiveTab(currentWindow);
    if (tokens.size() != 2 || !tab) {
      LOG(WARNING) << "Usage: zoom <on|off>";
      return false;
    }
    multiplexer->setZoomed(*tab, toLower(tokens[1]) == "on");
    return true;
  }

  if (command == "close" || command == "move" || command == "focus") {
    optional<PaneId> pane = parsePaneArgument(tokens);
    if (!pane) {
      return false;
    }
    if (command == "close") {
      multiplexer->closePane(*pane);
      refreshCurrentWindow();
      return true;
    }
    if (command == "move") {
      return bool(multiplexer->movePaneToNewTab(*pane));
    }
    optional<WindowId> window =
        multiplexer->getTabWindow(*multiplexer->getPaneTab(*pane));
    currentWindow = *window;
    return multiplexer->activatePane(*pane);
  }

  LOG(WARNING) << "Unknown command: " << tokens[0];
  CLOG(INFO, "stdout") << "Unknown command: " << tokens[0] << endl;
  return false;
}

optional<PaneId> ScriptRunner::parsePaneArgument(const vector<string>& tokens) {
  if (tokens.size() != 2) {
    LOG(WARNING) << "Usage: " << tokens[0] << " <pane>";
    return nullopt;
  }
  PaneId pane;
  try {
    pane = stoll(tokens[1]);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Invalid pane id: " << tokens[1];
    return nullopt;
  }
  if (!multiplexer->getPaneTab(pane)) {
    LOG(WARNING) << "No such pane: " << pane;
    return nullopt;
  }
  return pane;
}

void ScriptRunner::refreshCurrentWindow() {
  vector<WindowId> windows = multiplexer->getWindows();
  if (windows.empty() ||
      std::find(windows.begin(), windows.end(), currentWindow) !=
          windows.end()) {
    return;
  }
  currentWindow = windows.front();
  LOG(INFO) << "Current window is now " << currentWindow;
}
}  // namespace tt

#include "ToggleStateFile.hpp"

#include "JsonLib.hpp"

namespace tt {
namespace {
const string STATE_FILE_PREFIX = "toggle_pane_tab_";
const string STATE_FILE_SUFFIX = ".json";
}  // namespace

ToggleStateFile::ToggleStateFile(const string& _stateDirectory)
    : stateDirectory(_stateDirectory) {
  while (stateDirectory.size() > 1 && stateDirectory.back() == '/') {
    stateDirectory.pop_back();
  }
}

string ToggleStateFile::getDefaultStateDirectory() {
  return sago::getCacheDir() + "/toggleterm";
}

string ToggleStateFile::getPath(TabId tabId) const {
  return stateDirectory + "/" + STATE_FILE_PREFIX + to_string(tabId) +
         STATE_FILE_SUFFIX;
}

void ToggleStateFile::write(TabId tabId, PaneId paneId) {
  if (!ensureStateDirectory()) {
    return;
  }

  json state;
  state["pane_id"] = paneId;
  state["tab_id"] = tabId;
  state["active"] = true;
  state["timestamp"] = int64_t(::time(NULL));

  string path = getPath(tabId);
  LOG(INFO) << "Writing toggle pane state to file: " << path;
  ofstream out(path, ios::out | ios::trunc);
  if (!out.is_open()) {
    LOG(ERROR) << "Failed to open file for writing: " << path
               << " Error: " << strerror(errno);
    return;
  }
  out << state.dump();
  out.close();
  if (out.fail()) {
    LOG(ERROR) << "Failed to write to file: " << path;
  }
}

void ToggleStateFile::clear(TabId tabId) {
  string path = getPath(tabId);
  LOG(INFO) << "Clearing toggle pane state file: " << path;
  std::error_code ec;
  if (!fs::remove(path, ec)) {
    if (ec) {
      LOG(ERROR) << "Failed to delete file: " << path
                 << " - Error: " << ec.message();
    } else {
      VLOG(1) << "No state file to delete: " << path;
    }
  }
}

bool ToggleStateFile::ensureStateDirectory() {
  std::error_code ec;
  if (fs::is_directory(stateDirectory, ec)) {
    return true;
  }
  LOG(INFO) << "Directory does not exist, creating: " << stateDirectory;
  fs::create_directories(stateDirectory, ec);
  if (ec) {
    LOG(ERROR) << "Failed to create directory: " << stateDirectory
               << " - Error: " << ec.message();
    return false;
  }
  return true;
}
}  // namespace tt

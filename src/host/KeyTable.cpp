#include "KeyTable.hpp"

namespace tt {
namespace {
const map<string, string> MODIFIER_ALIASES = {
    {"CTRL", "CTRL"},   {"CONTROL", "CTRL"}, {"SHIFT", "SHIFT"},
    {"ALT", "ALT"},     {"OPT", "ALT"},      {"META", "ALT"},
    {"SUPER", "SUPER"}, {"CMD", "SUPER"},    {"WIN", "SUPER"},
    {"LEADER", "LEADER"},
};
}  // namespace

string KeyTable::normalizeMods(const string& mods) {
  string separated = mods;
  std::replace(separated.begin(), separated.end(), '+', '|');
  std::replace(separated.begin(), separated.end(), ' ', '|');

  set<string> canonical;
  for (const auto& token : split(separated, '|')) {
    string upper = toUpper(trim(token));
    if (upper.empty() || upper == "NONE") {
      continue;
    }
    auto it = MODIFIER_ALIASES.find(upper);
    if (it == MODIFIER_ALIASES.end()) {
      throw std::invalid_argument("Unknown key modifier: " + token);
    }
    canonical.insert(it->second);
  }

  string retval;
  for (const auto& mod : canonical) {
    if (!retval.empty()) {
      retval.push_back('|');
    }
    retval.append(mod);
  }
  return retval;
}

void KeyTable::bind(const string& key, const string& mods,
                    KeyCallback callback) {
  KeyBinding binding;
  binding.key = key;
  binding.mods = normalizeMods(mods);
  binding.callback = callback;
  LOG(INFO) << "Binding key '" << key << "' mods '" << binding.mods << "'";
  bindings.push_back(binding);
}

bool KeyTable::dispatch(const string& key, const string& mods,
                        WindowId windowId, PaneId paneId) {
  string normalized = normalizeMods(mods);
  for (auto it = bindings.rbegin(); it != bindings.rend(); ++it) {
    if (it->key == key && it->mods == normalized) {
      VLOG(1) << "Dispatching '" << key << "' to window " << windowId
              << " pane " << paneId;
      it->callback(windowId, paneId);
      return true;
    }
  }
  VLOG(1) << "No binding for key '" << key << "' mods '" << normalized << "'";
  return false;
}
}  // namespace tt

#ifndef __TT_KEY_TABLE__
#define __TT_KEY_TABLE__

#include "Headers.hpp"

namespace tt {
/** @brief Action bound to a chord, called with the focused window/pane. */
typedef std::function<void(WindowId, PaneId)> KeyCallback;

struct KeyBinding {
  string key;
  /** @brief Normalized modifier set, e.g. "CTRL|SHIFT". */
  string mods;
  KeyCallback callback;
};

/**
 * @brief Maps key chords to callbacks.  When the same chord is bound twice,
 * the most recent binding wins.
 */
class KeyTable {
 public:
  /**
   * @brief Canonicalizes a modifier string: upper case, aliases resolved,
   * sorted, joined with '|'.  "" and "NONE" mean no modifier.
   * @throws std::invalid_argument on an unknown modifier.
   */
  static string normalizeMods(const string& mods);

  void bind(const string& key, const string& mods, KeyCallback callback);
  /** @brief Runs the binding matching the chord, if any. */
  bool dispatch(const string& key, const string& mods, WindowId windowId,
                PaneId paneId);

  inline const vector<KeyBinding>& getBindings() const { return bindings; }

 protected:
  vector<KeyBinding> bindings;
};
}  // namespace tt

#endif  // __TT_KEY_TABLE__

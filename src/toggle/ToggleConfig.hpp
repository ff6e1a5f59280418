#ifndef __TT_TOGGLE_CONFIG__
#define __TT_TOGGLE_CONFIG__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PaneHost.hpp"

namespace tt {
struct ZoomConfig {
  /** @brief Zoom the terminal pane whenever it is created or shown. */
  bool autoZoomToggleTerminal = false;
  /** @brief Zoom the invoker pane when focus returns to it. */
  bool autoZoomInvokerPane = true;
  /** @brief Restore the terminal pane's zoom when it is shown again. */
  bool rememberZoomed = false;
};

/**
 * @brief Options of the toggle terminal.
 *
 * The JSON form mirrors the user-facing option names:
 * @code
 * { "key": ";", "mods": "CTRL", "direction": "Up", "size": {"percent": 20},
 *   "change_invoker_id_everytime": false,
 *   "zoom": { "auto_zoom_toggle_terminal": false,
 *             "auto_zoom_invoker_pane": true, "remember_zoomed": false } }
 * @endcode
 */
struct ToggleConfig {
  string key = ";";
  string mods = "CTRL";
  SplitDirection direction = SplitDirection::UP;
  int sizePercent = 20;
  /** @brief Re-capture the invoker on every toggle from a non-terminal pane.
   */
  bool changeInvokerIdEverytime = false;
  ZoomConfig zoom;

  json toJson() const;

  /** @brief The default options in JSON form. */
  static json defaultsJson();
  /**
   * @brief Merges `overrides` over `defaults`: objects merge recursively,
   * anything else in `overrides` replaces the default.
   */
  static json deepMerge(const json& defaults, const json& overrides);
  /**
   * @brief Builds a config from a complete JSON object.
   * @throws std::invalid_argument on a missing key, wrong type, unknown
   * direction, or a size outside 0..100 percent.
   */
  static ToggleConfig fromJson(const json& j);
  /** @brief Deep-merges user overrides over the defaults and parses them. */
  static ToggleConfig withOverrides(const json& overrides);
  /**
   * @brief Reads the [Toggle] and [Zoom] sections of an INI file into a JSON
   * override object.  Only keys present in the file are set.
   * @throws std::runtime_error if the file cannot be loaded.
   * @throws std::invalid_argument if a numeric or boolean value is malformed.
   */
  static json loadIniOverrides(const string& path);
};
}  // namespace tt

#endif  // __TT_TOGGLE_CONFIG__

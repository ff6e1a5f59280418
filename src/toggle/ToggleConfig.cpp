#include "ToggleConfig.hpp"

#include "SimpleIni.h"

namespace tt {
namespace {
int64_t parseIniInteger(const string& name, const string& rawValue) {
  string value = trim(rawValue);
  size_t consumed = 0;
  int64_t result = 0;
  try {
    result = stoll(value, &consumed);
  } catch (const std::logic_error& e) {
    throw std::invalid_argument("Invalid integer for " + name + ": " +
                                rawValue);
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("Invalid integer for " + name + ": " +
                                rawValue);
  }
  return result;
}

bool parseIniBool(const string& name, const string& rawValue) {
  string value = toLower(trim(rawValue));
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return false;
  }
  throw std::invalid_argument("Invalid boolean for " + name + ": " + rawValue);
}
}  // namespace

json ToggleConfig::toJson() const {
  json j;
  j["key"] = key;
  j["mods"] = mods;
  j["direction"] = splitDirectionToString(direction);
  j["size"]["percent"] = sizePercent;
  j["change_invoker_id_everytime"] = changeInvokerIdEverytime;
  j["zoom"]["auto_zoom_toggle_terminal"] = zoom.autoZoomToggleTerminal;
  j["zoom"]["auto_zoom_invoker_pane"] = zoom.autoZoomInvokerPane;
  j["zoom"]["remember_zoomed"] = zoom.rememberZoomed;
  return j;
}

json ToggleConfig::defaultsJson() { return ToggleConfig().toJson(); }

json ToggleConfig::deepMerge(const json& defaults, const json& overrides) {
  json merged = defaults;
  if (!overrides.is_object()) {
    return merged;
  }
  for (auto it = overrides.begin(); it != overrides.end(); ++it) {
    auto existing = merged.find(it.key());
    if (it.value().is_object() && existing != merged.end() &&
        existing->is_object()) {
      merged[it.key()] = deepMerge(*existing, it.value());
    } else {
      merged[it.key()] = it.value();
    }
  }
  return merged;
}

ToggleConfig ToggleConfig::fromJson(const json& j) {
  ToggleConfig config;
  try {
    config.key = j.at("key").get<string>();
    config.mods = j.at("mods").get<string>();
    config.direction =
        splitDirectionFromString(j.at("direction").get<string>());
    const json& percent = j.at("size").at("percent");
    if (!percent.is_number_integer()) {
      throw std::invalid_argument("Split size must be an integer percent: " +
                                  percent.dump());
    }
    int64_t sizePercent = percent.get<int64_t>();
    if (sizePercent < 0 || sizePercent > 100) {
      throw std::invalid_argument(
          "Split size must be within 0..100 percent: " +
          to_string(sizePercent));
    }
    config.sizePercent = int(sizePercent);
    config.changeInvokerIdEverytime =
        j.at("change_invoker_id_everytime").get<bool>();
    const json& zoom = j.at("zoom");
    config.zoom.autoZoomToggleTerminal =
        zoom.at("auto_zoom_toggle_terminal").get<bool>();
    config.zoom.autoZoomInvokerPane =
        zoom.at("auto_zoom_invoker_pane").get<bool>();
    config.zoom.rememberZoomed = zoom.at("remember_zoomed").get<bool>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(string("Invalid toggle options: ") + e.what());
  }
  if (config.key.empty()) {
    throw std::invalid_argument("Toggle key must not be empty");
  }
  return config;
}

ToggleConfig ToggleConfig::withOverrides(const json& overrides) {
  return fromJson(deepMerge(defaultsJson(), overrides));
}

json ToggleConfig::loadIniOverrides(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  json overrides = json::object();
  const char* value = ini.GetValue("Toggle", "key", NULL);
  if (value) {
    overrides["key"] = string(value);
  }
  value = ini.GetValue("Toggle", "mods", NULL);
  if (value) {
    overrides["mods"] = string(value);
  }
  value = ini.GetValue("Toggle", "direction", NULL);
  if (value) {
    overrides["direction"] = string(value);
  }
  value = ini.GetValue("Toggle", "size_percent", NULL);
  if (value) {
    overrides["size"]["percent"] = parseIniInteger("size_percent", value);
  }
  value = ini.GetValue("Toggle", "change_invoker_id_everytime", NULL);
  if (value) {
    overrides["change_invoker_id_everytime"] =
        parseIniBool("change_invoker_id_everytime", value);
  }

  const char* zoomKeys[] = {"auto_zoom_toggle_terminal",
                            "auto_zoom_invoker_pane", "remember_zoomed"};
  for (const char* zoomKey : zoomKeys) {
    value = ini.GetValue("Zoom", zoomKey, NULL);
    if (value) {
      overrides["zoom"][zoomKey] = parseIniBool(zoomKey, value);
    }
  }
  LOG(INFO) << "Loaded toggle overrides from " << path << ": "
            << overrides.dump();
  return overrides;
}
}  // namespace tt

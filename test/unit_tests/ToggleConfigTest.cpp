#include "TestHeaders.hpp"
#include "ToggleConfig.hpp"

using namespace tt;

TEST_CASE("Default toggle options", "[ToggleConfig]") {
  ToggleConfig config = ToggleConfig::fromJson(ToggleConfig::defaultsJson());
  REQUIRE(config.key == ";");
  REQUIRE(config.mods == "CTRL");
  REQUIRE(config.direction == SplitDirection::UP);
  REQUIRE(config.sizePercent == 20);
  REQUIRE(config.changeInvokerIdEverytime == false);
  REQUIRE(config.zoom.autoZoomToggleTerminal == false);
  REQUIRE(config.zoom.autoZoomInvokerPane == true);
  REQUIRE(config.zoom.rememberZoomed == false);
}

TEST_CASE("Overrides merge recursively", "[ToggleConfig]") {
  json defaults = ToggleConfig::defaultsJson();

  json merged = ToggleConfig::deepMerge(
      defaults, json::parse(R"({"zoom": {"remember_zoomed": true}})"));
  REQUIRE(merged["zoom"]["remember_zoomed"] == true);
  REQUIRE(merged["zoom"]["auto_zoom_invoker_pane"] == true);
  REQUIRE(merged["zoom"]["auto_zoom_toggle_terminal"] == false);
  REQUIRE(merged["key"] == ";");

  SECTION("Scalars replace") {
    json replaced = ToggleConfig::deepMerge(
        defaults, json::parse(R"({"key": "t", "size": {"percent": 35}})"));
    REQUIRE(replaced["key"] == "t");
    REQUIRE(replaced["size"]["percent"] == 35);
  }

  SECTION("Unknown keys are carried along") {
    json extra =
        ToggleConfig::deepMerge(defaults, json::parse(R"({"extra": [1]})"));
    REQUIRE(extra["extra"] == json::parse("[1]"));
  }

  SECTION("Null overrides leave defaults alone") {
    REQUIRE(ToggleConfig::deepMerge(defaults, json()) == defaults);
  }
}

TEST_CASE("Overrides produce a config", "[ToggleConfig]") {
  ToggleConfig config = ToggleConfig::withOverrides(json::parse(R"({
    "key": "t",
    "mods": "ALT|SHIFT",
    "direction": "right",
    "size": {"percent": 35},
    "change_invoker_id_everytime": true,
    "zoom": {"auto_zoom_toggle_terminal": true, "remember_zoomed": true}
  })"));
  REQUIRE(config.key == "t");
  REQUIRE(config.mods == "ALT|SHIFT");
  REQUIRE(config.direction == SplitDirection::RIGHT);
  REQUIRE(config.sizePercent == 35);
  REQUIRE(config.changeInvokerIdEverytime == true);
  REQUIRE(config.zoom.autoZoomToggleTerminal == true);
  REQUIRE(config.zoom.autoZoomInvokerPane == true);
  REQUIRE(config.zoom.rememberZoomed == true);

  REQUIRE(ToggleConfig::withOverrides(config.toJson()).toJson() ==
          config.toJson());
}

TEST_CASE("Invalid options are rejected", "[ToggleConfig]") {
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"direction": "Sideways"})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"size": {"percent": 150}})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"size": {"percent": -1}})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"zoom": true})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"key": 5})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(ToggleConfig::withOverrides(json::parse(R"({"key": ""})")),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"size": {"percent": 20.9}})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"size": {"percent": true}})")),
      std::invalid_argument);
  REQUIRE_THROWS_AS(ToggleConfig::withOverrides(
                        json::parse(R"({"size": {"percent": 4294967316}})")),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      ToggleConfig::withOverrides(json::parse(R"({"size": {"percent": "20"}})")),
      std::invalid_argument);
}

TEST_CASE("INI file overrides", "[ToggleConfig]") {
  string directory = createTempTestDirectory("tt_config");
  string path = directory + "/toggleterm.ini";
  {
    ofstream out(path);
    out << "[Toggle]\n"
        << "key = t\n"
        << "direction = Left\n"
        << "size_percent = 40\n"
        << "\n"
        << "[Zoom]\n"
        << "remember_zoomed = true\n"
        << "auto_zoom_invoker_pane = false\n";
  }

  json overrides = ToggleConfig::loadIniOverrides(path);
  REQUIRE(overrides["key"] == "t");
  REQUIRE(overrides["direction"] == "Left");
  REQUIRE(overrides["size"]["percent"] == 40);
  REQUIRE_FALSE(overrides.contains("mods"));
  REQUIRE_FALSE(overrides.contains("change_invoker_id_everytime"));
  REQUIRE(overrides["zoom"]["remember_zoomed"] == true);
  REQUIRE(overrides["zoom"]["auto_zoom_invoker_pane"] == false);
  REQUIRE_FALSE(overrides["zoom"].contains("auto_zoom_toggle_terminal"));

  ToggleConfig config = ToggleConfig::withOverrides(overrides);
  REQUIRE(config.mods == "CTRL");
  REQUIRE(config.direction == SplitDirection::LEFT);
  REQUIRE(config.sizePercent == 40);
  REQUIRE(config.zoom.autoZoomToggleTerminal == false);

  REQUIRE_THROWS_AS(ToggleConfig::loadIniOverrides(directory + "/missing.ini"),
                    std::runtime_error);
  fs::remove_all(directory);
}

TEST_CASE("INI values are parsed strictly", "[ToggleConfig]") {
  string directory = createTempTestDirectory("tt_config_strict");
  string path = directory + "/toggleterm.ini";
  auto writeIni = [&path](const string& contents) {
    ofstream out(path, std::ios::trunc);
    out << contents;
  };

  SECTION("Boolean spellings") {
    writeIni(
        "[Toggle]\nchange_invoker_id_everytime = Yes\n"
        "[Zoom]\nauto_zoom_toggle_terminal = on\n"
        "auto_zoom_invoker_pane = 0\nremember_zoomed = FALSE\n");
    json overrides = ToggleConfig::loadIniOverrides(path);
    REQUIRE(overrides["change_invoker_id_everytime"] == true);
    REQUIRE(overrides["zoom"]["auto_zoom_toggle_terminal"] == true);
    REQUIRE(overrides["zoom"]["auto_zoom_invoker_pane"] == false);
    REQUIRE(overrides["zoom"]["remember_zoomed"] == false);
  }

  SECTION("Non-numeric size") {
    writeIni("[Toggle]\nsize_percent = abc\n");
    REQUIRE_THROWS_AS(ToggleConfig::loadIniOverrides(path),
                      std::invalid_argument);
  }

  SECTION("Trailing garbage after the size") {
    writeIni("[Toggle]\nsize_percent = 30%\n");
    REQUIRE_THROWS_AS(ToggleConfig::loadIniOverrides(path),
                      std::invalid_argument);
  }

  SECTION("Unknown boolean word") {
    writeIni("[Zoom]\nremember_zoomed = maybe\n");
    REQUIRE_THROWS_AS(ToggleConfig::loadIniOverrides(path),
                      std::invalid_argument);
  }

  SECTION("Out of range size is caught when applied") {
    writeIni("[Toggle]\nsize_percent = 250\n");
    json overrides = ToggleConfig::loadIniOverrides(path);
    REQUIRE_THROWS_AS(ToggleConfig::withOverrides(overrides),
                      std::invalid_argument);
  }

  fs::remove_all(directory);
}

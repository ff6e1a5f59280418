#include "KeyTable.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("Modifier strings are normalized", "[KeyTable]") {
  REQUIRE(KeyTable::normalizeMods("CTRL") == "CTRL");
  REQUIRE(KeyTable::normalizeMods("shift|ctrl") == "CTRL|SHIFT");
  REQUIRE(KeyTable::normalizeMods("CMD+opt") == "ALT|SUPER");
  REQUIRE(KeyTable::normalizeMods(" Control | Shift ") == "CTRL|SHIFT");
  REQUIRE(KeyTable::normalizeMods("") == "");
  REQUIRE(KeyTable::normalizeMods("NONE") == "");
  REQUIRE_THROWS_AS(KeyTable::normalizeMods("HYPER"), std::invalid_argument);
}

TEST_CASE("Dispatch runs the matching binding", "[KeyTable]") {
  KeyTable keyTable;
  WindowId seenWindow = -1;
  PaneId seenPane = NO_PANE;
  int calls = 0;
  keyTable.bind(";", "CTRL", [&](WindowId windowId, PaneId paneId) {
    seenWindow = windowId;
    seenPane = paneId;
    calls++;
  });
  REQUIRE(keyTable.getBindings().size() == 1);

  REQUIRE(keyTable.dispatch(";", "ctrl", 3, 7));
  REQUIRE(calls == 1);
  REQUIRE(seenWindow == 3);
  REQUIRE(seenPane == 7);

  REQUIRE_FALSE(keyTable.dispatch(";", "CTRL|SHIFT", 3, 7));
  REQUIRE_FALSE(keyTable.dispatch("'", "CTRL", 3, 7));
  REQUIRE(calls == 1);
}

TEST_CASE("Latest binding of a chord wins", "[KeyTable]") {
  KeyTable keyTable;
  string winner;
  keyTable.bind("t", "ALT", [&](WindowId, PaneId) { winner = "first"; });
  keyTable.bind("t", "META", [&](WindowId, PaneId) { winner = "second"; });

  REQUIRE(keyTable.dispatch("t", "ALT", 0, 0));
  REQUIRE(winner == "second");
}

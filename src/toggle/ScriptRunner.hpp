#ifndef __TT_SCRIPT_RUNNER__
#define __TT_SCRIPT_RUNNER__

#include "Headers.hpp"
#include "KeyTable.hpp"
#include "MultiplexerState.hpp"

namespace tt {
/**
 * @brief Replays a line-based script of user events against an in-process
 * multiplexer.
 *
 * Commands (one per line, '#' starts a comment):
 *   key <mods> <key>               press a chord in the current window
 *   split <up|down|left|right> [percent]
 *   newtab
 *   close <pane>
 *   move <pane>                    move a pane into a new tab
 *   focus <pane>
 *   zoom <on|off>                  zoom the active pane of the active tab
 *   dump                           print the multiplexer state as JSON
 */
class ScriptRunner {
 public:
  ScriptRunner(shared_ptr<MultiplexerState> _multiplexer, KeyTable* _keyTable,
               WindowId _currentWindow);

  /** @brief Runs one command, returning false if it could not be applied. */
  bool runLine(const string& line);
  /** @brief Runs every line of a stream, returning the number of failures. */
  int run(istream& in);

  inline WindowId getCurrentWindow() const { return currentWindow; }

 protected:
  shared_ptr<MultiplexerState> multiplexer;
  KeyTable* keyTable;
  WindowId currentWindow;

  optional<PaneId> parsePaneArgument(const vector<string>& tokens);
  /** @brief Moves to another window if the current one was closed. */
  void refreshCurrentWindow();
};
}  // namespace tt

#endif  // __TT_SCRIPT_RUNNER__

#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "MultiplexerState.hpp"
#include "ScriptRunner.hpp"
#include "TogglePlugin.hpp"

using namespace tt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);

  cxxopts::Options options("toggleterm",
                           "Per-tab toggleable terminal pane for a multiplexer");
  int failures = 0;
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the INI config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("statedir", "Directory for the per-tab state files",
         cxxopts::value<std::string>()->default_value(
             ToggleStateFile::getDefaultStateDirectory()))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(GetTempDirectory() +
                                                      "toggleterm"))  //
        ("logtostdout", "log to stdout")                              //
        ("script", "Script of events to replay instead of stdin",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "toggleterm version " << TT_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    string logFile = LogHandler::setupLogFiles(
        &defaultConf, result["logdir"].as<string>(), "toggleterm",
        result.count("logtostdout") > 0, true);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    VLOG(1) << "Writing log to " << logFile;

    json overrides = json::object();
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        overrides = ToggleConfig::loadIniOverrides(cfgfilename);
      } catch (const std::runtime_error &e) {
        STFATAL << e.what();
      } catch (const std::invalid_argument &e) {
        CLOG(ERROR, "stdout") << e.what() << endl;
        exit(1);
      }
    }

    shared_ptr<MultiplexerState> multiplexer(new MultiplexerState());
    WindowId window = multiplexer->newWindow();
    KeyTable keyTable;
    try {
      TogglePlugin::applyToConfig(&keyTable, multiplexer, overrides,
                                  result["statedir"].as<string>());
    } catch (const std::invalid_argument &e) {
      CLOG(ERROR, "stdout") << e.what() << endl;
      exit(1);
    }

    ScriptRunner runner(multiplexer, &keyTable, window);
    string scriptFilename = result["script"].as<string>();
    if (scriptFilename.empty()) {
      failures = runner.run(std::cin);
    } else {
      ifstream script(scriptFilename);
      if (!script.is_open()) {
        CLOG(ERROR, "stdout") << "Cannot open script " << scriptFilename
                              << endl;
        exit(1);
      }
      failures = runner.run(script);
    }
    LOG(INFO) << "Script finished with " << failures << " failed commands";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return failures == 0 ? 0 : 1;
}

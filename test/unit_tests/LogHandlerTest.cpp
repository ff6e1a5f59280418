#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("Log files are created inside a new directory", "[LogHandler]") {
  string directory = createTempTestDirectory("tt_log");
  string logDirectory = directory + "/nested/logs";
  el::Configurations conf;
  conf.setToDefault();

  string logFile = LogHandler::setupLogFiles(&conf, logDirectory, "toggleterm",
                                             false, true, "1024");
  REQUIRE(fs::exists(logFile));
  REQUIRE(fs::path(logFile).parent_path() == fs::path(logDirectory));
  string filename = fs::path(logFile).filename().string();
  REQUIRE(filename.find("toggleterm-") == 0);
  REQUIRE(filename.find("_" + to_string(getpid()) + ".log") !=
          string::npos);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Filename)
              ->value() == logFile);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::ToFile)
              ->value() == "true");

  fs::remove_all(directory);
}

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace capterm;

TEST_CASE("LogHandler setupLogFiles", "[LogHandler]") {
  string dirPattern = GetTempDirectory() + string("capterm_loghandler_XXXXXXXX");
  string logDirectory = string(mkdtemp(&dirPattern[0]));
  // A directory that does not exist yet is created
  string nestedDirectory = logDirectory + "/nested";

  el::Configurations conf;
  conf.setToDefault();
  LogHandler::setupLogFiles(&conf, nestedDirectory, "unit", false, "1024");

  string filename =
      conf.get(el::Level::Info, el::ConfigurationType::Filename)->value();
  REQUIRE(filename.find(nestedDirectory + "/unit-") == 0);
  string pidSuffix = "_" + to_string(getpid()) + ".log";
  REQUIRE(filename.size() > pidSuffix.size());
  REQUIRE(filename.substr(filename.size() - pidSuffix.size()) == pidSuffix);
  REQUIRE(fs::exists(filename));

  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::ToFile)->value() ==
          "true");
  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::MaxLogFileSize)
              ->value() == "1024");
  REQUIRE(conf.get(el::Level::Info, el::ConfigurationType::ToStandardOutput)
              ->value() == "false");

  SECTION("Logging to stdout on request") {
    el::Configurations stdoutConf;
    stdoutConf.setToDefault();
    LogHandler::setupLogFiles(&stdoutConf, logDirectory, "stdout", true);
    REQUIRE(stdoutConf
                .get(el::Level::Info, el::ConfigurationType::ToStandardOutput)
                ->value() == "true");
    REQUIRE(stdoutConf
                .get(el::Level::Info, el::ConfigurationType::MaxLogFileSize)
                ->value() == LogHandler::DEFAULT_MAX_LOG_SIZE);
  }

  fs::remove_all(logDirectory);
}

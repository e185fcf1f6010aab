#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LogHandler.hpp"
#include "SimpleIni.h"
#include "TerminalSession.hpp"

using namespace capterm;

namespace {
void handleParseException(const std::exception& e,
                          cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int exitCodeFor(const CaptureResult& result) {
  switch (result.error_type()) {
    case NO_ERROR:
      return 0;
    case SETUP_ERROR:
      return 1;
    case RUNTIME_ERROR:
      if (result.has_term_signal()) {
        return 128 + result.term_signal();
      }
      return result.has_exit_code() ? result.exit_code() : 1;
  }
  return 1;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  HandleTerminate();

  // A closed stdout must not kill us while the program is still running
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "capterm", "Run a command on a pty and capture its final screen");
  try {
    options.positional_help("[--] command [args...]").show_positional_help();

    options.add_options()         //
        ("h,help", "Print help")  //
        ("version", "Print version")  //
        ("v,verbose", "Enable verbose logging", cxxopts::value<int>())  //
        ("logtostdout", "Write log to stdout")       //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("o,output", "Also write the captured screen to this file",
         cxxopts::value<std::string>())  //
        ("q,quiet", "Do not print the captured screen after the run")  //
        ("command", "Command line to run",
         cxxopts::value<std::vector<std::string>>())  //
        ;

    options.parse_positional({"command"});

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "capterm version " << CAPTERM_VERSION << endl;
      exit(0);
    }
    if (result.count("command") == 0) {
      CLOG(INFO, "stdout") << "Missing command" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    string maxlogsize = LogHandler::DEFAULT_MAX_LOG_SIZE;
    string logDirectory = GetTempDirectory() + "capterm";
    bool silent = false;
    int verbose = 0;

    if (result.count("cfgfile")) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (vlevel) {
          verbose = atoi(vlevel);
        }

        const char* silentValue = ini.GetValue("Debug", "silent", NULL);
        if (silentValue && atoi(silentValue) != 0) {
          silent = true;
        }

        const char* logsize = ini.GetValue("Debug", "logsize", NULL);
        if (logsize && atoi(logsize) != 0) {
          // make sure maxlogsize is a string of int value
          maxlogsize = string(logsize);
        }

        const char* logdir = ini.GetValue("Debug", "logdir", NULL);
        if (logdir && strlen(logdir)) {
          logDirectory = string(logdir);
        }
      } else {
        CLOG(INFO, "stdout") << "Invalid config file: " << cfgfilename
                             << endl;
        exit(1);
      }
    }

    // Command line options win over the config file
    if (result.count("verbose")) {
      verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      logDirectory = result["logdir"].as<string>();
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, logDirectory, "capterm",
                              result.count("logtostdout") > 0, maxlogsize);
    LogHandler::applyLogSettings(&defaultConf, silent, verbose, "capterm-main");

    // Words are rejoined with single spaces; execute() splits them again.
    string commandLine =
        join(result["command"].as<std::vector<std::string>>(), " ");

    TerminalSession session;
    CaptureResult capture = session.execute(commandLine);

    if (capture.error_type() == SETUP_ERROR) {
      CLOG(INFO, "stdout") << "Error executing command: " << capture.error()
                           << endl;
    } else {
      if (!result.count("quiet")) {
        CLOG(INFO, "stdout") << endl << "Captured output:" << endl;
        CLOG(INFO, "stdout") << capture.output() << endl;
      }
      if (capture.error_type() == RUNTIME_ERROR) {
        CLOG(INFO, "stdout") << "Error: " << capture.error() << endl;
      }
    }

    if (result.count("output")) {
      string outputPath = result["output"].as<string>();
      std::ofstream outputFile(outputPath.c_str());
      if (!outputFile) {
        CLOG(INFO, "stdout") << "Cannot open output file " << outputPath
                             << endl;
        exit(1);
      }
      outputFile << capture.output() << endl;
    }

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return exitCodeFor(capture);
  } catch (const std::exception& e) {
    handleParseException(e, options);
  }
  return 1;
}

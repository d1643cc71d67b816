#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace rsub;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      rsub::LogHandler::setupLogHandler(&argc, &argv);
  rsub::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  rsub::HandleTerminate();

  // Broken client sockets must fail writes, not kill the runner
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectoryPattern =
      GetTempDirectory() + string("rsub_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  rsub::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}

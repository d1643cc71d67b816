#include <cxxopts.hpp>

#include "CommandEditorHost.hpp"
#include "EditorDispatcher.hpp"
#include "EditorEventRouter.hpp"
#include "LogHandler.hpp"
#include "RsubServer.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"
#include "TcpSocketHandler.hpp"

using namespace rsub;

namespace {
RsubServer *runningServer = NULL;

void StopServerSignalHandler(int sig) {
  if (runningServer) {
    runningServer->shutdown();
  }
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  rsub::HandleTerminate();

  // Client disconnects surface as write errors, not signals
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("rsubd",
                           "Opens files sent by rmate clients in a local "
                           "editor and sends saves back");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Interface to listen on", cxxopts::value<string>())  //
        ("port", "Port to listen on", cxxopts::value<int>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("editor", "Command used to open files", cxxopts::value<std::string>())  //
        ("goto-line", "Pass path:line to the editor when a line is sent")  //
        ("no-wait",
         "The editor command returns immediately; never treat its exit as a "
         "close")  //
        ("tmpdir", "Directory that holds the files being edited",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files", cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "rsubd version " << RSUB_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    if (result.count("cfgfile")) {
      config.loadConfigFile(result["cfgfile"].as<string>());
    }

    // Command line options win over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("editor")) {
      config.editorCommand = result["editor"].as<string>();
    }
    if (result.count("goto-line")) {
      config.gotoLine = true;
    }
    if (result.count("no-wait")) {
      config.editorWaits = false;
    }
    if (result.count("tmpdir")) {
      config.tempRoot = result["tmpdir"].as<string>();
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    config.validate();

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    string tempRoot =
        config.tempRoot.empty() ? GetTempDirectory() : config.tempRoot;
    string logDirectory = config.logDirectory.empty()
                              ? GetTempDirectory() + "rsubd"
                              : config.logDirectory;

    // Set log file for rsubd process here.
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "rsubd",
                              result.count("logtostdout") > 0,
                              config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("rsubd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    shared_ptr<EditorDispatcher> dispatcher(new EditorDispatcher());
    shared_ptr<SessionRegistry> registry(new SessionRegistry());
    shared_ptr<CommandEditorHost> editorHost(new CommandEditorHost(
        config.editorCommand, config.gotoLine, config.editorWaits, dispatcher));
    editorHost->setEventSink(
        shared_ptr<EditorEventRouter>(new EditorEventRouter(registry)));

    SocketEndpoint serverEndpoint(config.host, config.port);
    {
      RsubServer server(tcpSocketHandler, serverEndpoint, editorHost,
                        dispatcher, registry, tempRoot);
      runningServer = &server;
      ::signal(SIGINT, StopServerSignalHandler);
      ::signal(SIGTERM, StopServerSignalHandler);
      server.run();
      ::signal(SIGINT, SIG_DFL);
      ::signal(SIGTERM, SIG_DFL);
      runningServer = NULL;
    }

    editorHost->stopWatching();
    dispatcher->shutdown();
    LOG(INFO) << "rsubd exiting";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(ERROR, "stdout") << "rsubd: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

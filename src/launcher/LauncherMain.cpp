#include <cxxopts.hpp>

#include "HeadlessWorkload.hpp"
#include "Launcher.hpp"
#include "LauncherConfig.hpp"
#include "LogHandler.hpp"

using namespace cm;

int main(int argc, char **argv) {
  // Keep the output parseable: nothing but the version line, before logging
  // or configuration are touched
  if (Launcher::isVersionRequested(argc, argv)) {
    cout << Launcher::versionString() << endl;
    return 0;
  }
  auto startupTime = std::chrono::steady_clock::now();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  cm::HandleTerminate();

  // Let the workload wind down so the IPC endpoint gets released
  ::signal(SIGINT, cm::InterruptSignalHandler);
  ::signal(SIGTERM, cm::InterruptSignalHandler);

  cxxopts::Options options("cryptomator-launcher",
                           "Starts Cryptomator or hands files to the running "
                           "instance");
  int exitCode = 1;
  try {
    LauncherConfig::addOptions(&options);
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    LauncherConfig config;
    config.load(result);
    config.setUnrecognisedOptions(argc, argv);

    if (config.isSilent()) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    el::Loggers::setVerboseLevel(config.getVerboseLevel());

    // A client instance and the running instance share the log directory,
    // so each process gets its own file
    LogHandler::setupLogFiles(&defaultConf, config.getLogDirectory(),
                              "cryptomator", config.isLogToStdout(), false,
                              true, config.getMaxLogSize());
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("cm-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    for (const auto &option : config.getUnrecognisedOptions()) {
      LOG(WARNING) << "Ignoring unknown option " << option;
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    shared_ptr<ShutdownHook> shutdownHook(new ShutdownHook());
    shutdownHook->installAtExit();

    shared_ptr<IpcSocketPath> socketPath(new IpcSocketPath());
    socketPath->setPathOverrides(config.getSocketPaths());
    shared_ptr<PipeSocketHandler> pipeSocketHandler(new PipeSocketHandler());
    shared_ptr<HeadlessWorkload> workload(new HeadlessWorkload());

    Launcher launcher(pipeSocketHandler, socketPath, workload, shutdownHook,
                      startupTime);
    exitCode = launcher.run(config.getFiles());
    shutdownHook->runHooks();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(ERROR, "stdout") << re.what() << endl;
    exitCode = 1;
  }

  LOG(INFO) << "Exit " << exitCode;
  return exitCode;
}

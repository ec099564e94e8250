#include "Launcher.hpp"

namespace cm {
Launcher::Launcher(shared_ptr<PipeSocketHandler> _socketHandler,
                   shared_ptr<IpcSocketPath> _socketPath,
                   shared_ptr<Workload> _workload,
                   shared_ptr<ShutdownHook> _shutdownHook,
                   std::chrono::steady_clock::time_point _startupTime)
    : socketHandler(_socketHandler),
      socketPath(_socketPath),
      workload(_workload),
      shutdownHook(_shutdownHook),
      startupTime(_startupTime) {}

bool Launcher::isVersionRequested(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
      return true;
    }
  }
  return false;
}

string Launcher::versionString() {
  return APPLICATION_NAME + " version " + CM_VERSION + " (build " + CM_BUILD +
         ")";
}

int Launcher::run(const vector<string>& args) {
  LOG(INFO) << "Starting " << APPLICATION_NAME << " " << CM_VERSION << " on "
            << GetOsDescription();
  try {
    socketPath->createDirectoriesIfRequired();
    vector<SocketEndpoint> candidates = socketPath->getCandidates();

    // Declared before the communicator: the accept loop must be stopped
    // before its worker thread is joined.
    shared_ptr<ThreadPool> runner;
    shared_ptr<IpcCommunicator> communicator =
        IpcCommunicator::create(socketHandler, candidates);

    if (communicator->isClient()) {
      communicator->sendHandleLaunchArgs(args);
      communicator->sendRevealRunningApp();
      LOG(INFO) << "Found running application instance. Shutting down...";
      communicator->close();
      return 0;
    }

    weak_ptr<IpcCommunicator> weakCommunicator = communicator;
    shutdownHook->runOnShutdown([weakCommunicator]() {
      auto lockedCommunicator = weakCommunicator.lock();
      if (lockedCommunicator) {
        lockedCommunicator->closeUnchecked();
      }
    });

    runner.reset(new ThreadPool(1));
    auto handler = make_shared<IpcMessageHandler>(workload);
    handler->handleLaunchArgs(args);
    communicator->listen(handler, runner);
    VLOG(1) << "Did not find running application instance. Launching "
               "workload...";
    int exitCode = runWorkload();
    communicator->close();
    return exitCode;
  } catch (const EndpointError& ee) {
    LOG(ERROR) << "Unable to reach or become the running instance: "
               << ee.what();
    return 1;
  } catch (const std::exception& e) {
    STERROR << "Running application failed: " << e.what();
    return 1;
  }
}

int Launcher::runWorkload() {
  LifecycleHooks hooks;
  hooks.onReady = [this]() {
    LOG(INFO) << "Workload started after " << MillisecondsSince(startupTime)
              << "ms";
  };
  hooks.onTerminate = []() { LOG(INFO) << "Workload stopped"; };
  try {
    workload->run(hooks);
    LOG(INFO) << "Workload shut down";
    return 0;
  } catch (const WorkloadError& we) {
    LOG(ERROR) << "Terminating due to error: " << we.what();
    return 1;
  } catch (const std::exception& e) {
    STERROR << "Terminating due to unexpected error: " << e.what();
    return 1;
  }
}
}  // namespace cm

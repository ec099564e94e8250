#ifndef __CM_LAUNCHER_H__
#define __CM_LAUNCHER_H__

#include "Headers.hpp"
#include "IpcCommunicator.hpp"
#include "IpcMessageHandler.hpp"
#include "IpcSocketPath.hpp"
#include "PipeSocketHandler.hpp"
#include "ShutdownHook.hpp"
#include "Workload.hpp"

namespace cm {
/**
 * @brief Decides whether this process becomes the running instance or hands
 * its arguments to the one that already runs.
 */
class Launcher {
 public:
  Launcher(shared_ptr<PipeSocketHandler> _socketHandler,
           shared_ptr<IpcSocketPath> _socketPath,
           shared_ptr<Workload> _workload,
           shared_ptr<ShutdownHook> _shutdownHook,
           std::chrono::steady_clock::time_point _startupTime);

  /**
   * @brief Runs the launcher with the given launch arguments.
   *
   * As a client, forwards `args` to the running instance and returns right
   * away.  As the running instance, processes `args` itself and blocks until
   * the workload finishes.
   * @return The process exit code: 0 on success, 1 on any failure.
   */
  int run(const vector<string>& args);

  /** @brief True if any argument asks for the version only. */
  static bool isVersionRequested(int argc, char** argv);

  /** @brief The single line printed for -v/--version. */
  static string versionString();

 protected:
  int runWorkload();

  shared_ptr<PipeSocketHandler> socketHandler;
  shared_ptr<IpcSocketPath> socketPath;
  shared_ptr<Workload> workload;
  shared_ptr<ShutdownHook> shutdownHook;
  std::chrono::steady_clock::time_point startupTime;
};
}  // namespace cm

#endif  // __CM_LAUNCHER_H__

#ifndef __CM_IPC_SOCKET_PATH__
#define __CM_IPC_SOCKET_PATH__

#include "Headers.hpp"

namespace cm {

/**
 * A helper class that computes the ordered list of socket paths the launcher
 * tries when looking for (or becoming) the running instance.
 *
 * Without overrides the list is:
 * - $XDG_RUNTIME_DIR/Cryptomator/ipc.socket, when XDG_RUNTIME_DIR is set to an
 *   absolute path.  The runtime directory is private to the user and cleaned
 *   on logout, which makes it the preferred location.
 * - <config home>/Cryptomator/ipc.socket, as reported by PlatformFolders.
 *
 * Overrides come from the command line or the config file and replace the
 * defaults entirely.
 */
class IpcSocketPath {
 public:
  IpcSocketPath();

  /**
   * Replaces the default candidates.  A leading `~` is expanded to $HOME and
   * empty entries are ignored.  Passing only empty entries keeps the
   * defaults.
   */
  void setPathOverrides(const vector<string>& paths);

  /**
   * Creates the missing parent directory of every candidate with mode 0700.
   * Failures are logged and otherwise ignored: the affected candidate will
   * fail later when it is used.
   */
  void createDirectoriesIfRequired();

  /** @brief Candidate paths in the order they should be tried. */
  vector<string> getPaths();

  /** @brief Same as getPaths(), as endpoints for the socket handler. */
  vector<SocketEndpoint> getCandidates();

 private:
  optional<vector<string>> pathOverrides;
};

}  // namespace cm

#endif  // __CM_IPC_SOCKET_PATH__

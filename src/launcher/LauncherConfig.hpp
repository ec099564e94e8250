#ifndef __CM_LAUNCHER_CONFIG_H__
#define __CM_LAUNCHER_CONFIG_H__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace cm {
/**
 * @brief Launcher settings from the command line and the optional INI file.
 *
 * Command line values take precedence over the file.  The file uses the
 * following keys:
 *
 *   [Ipc]
 *   socket_paths = /run/user/1000/cryptomator.socket:~/.cryptomator.socket
 *   [Logging]
 *   directory = ~/.local/share/Cryptomator/logs
 *   logsize = 20971520
 *   [Debug]
 *   verbose = 0
 *   silent = 0
 */
class LauncherConfig {
 public:
  LauncherConfig();

  /** @brief Registers the launcher options with a cxxopts parser. */
  static void addOptions(cxxopts::Options* options);

  /**
   * @brief Reads the config file named by --cfgfile, if any, then applies the
   * command line.
   * @throws std::runtime_error when the config file cannot be loaded.
   */
  void load(const cxxopts::ParseResult& result);

  /** @brief Applies the values found in an INI file. */
  void loadIniFile(const string& cfgfilename);

  /**
   * @brief Keeps the options the parser did not recognise.
   *
   * cxxopts leaves them in argv after parse(), behind the program name.
   */
  void setUnrecognisedOptions(int argc, char** argv);

  inline const vector<string>& getSocketPaths() const { return socketPaths; }
  inline const string& getLogDirectory() const { return logDirectory; }
  inline const string& getMaxLogSize() const { return maxLogSize; }
  inline int getVerboseLevel() const { return verboseLevel; }
  inline bool isLogToStdout() const { return logToStdout; }
  inline bool isSilent() const { return silent; }
  /** @brief Positional arguments, forwarded to the running instance. */
  inline const vector<string>& getFiles() const { return files; }
  inline const vector<string>& getUnrecognisedOptions() const {
    return unrecognisedOptions;
  }

 protected:
  vector<string> socketPaths;
  string logDirectory;
  string maxLogSize;
  int verboseLevel;
  bool logToStdout;
  bool silent;
  vector<string> files;
  vector<string> unrecognisedOptions;
};
}  // namespace cm

#endif  // __CM_LAUNCHER_CONFIG_H__

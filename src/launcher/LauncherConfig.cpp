#include "LauncherConfig.hpp"

#include "SimpleIni.h"

namespace cm {
LauncherConfig::LauncherConfig()
    : logDirectory(sago::getDataHome() + "/" + APPLICATION_NAME + "/logs"),
      // default max log file size is 20MB
      maxLogSize("20971520"),
      verboseLevel(0),
      logToStdout(false),
      silent(false) {}

void LauncherConfig::addOptions(cxxopts::Options* options) {
  options->allow_unrecognised_options();
  options->add_options()             //
      ("h,help", "Print help")       //
      ("v,version", "Print version")  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("ipcsocket",
       "Socket path used to reach the running instance, may be repeated",
       cxxopts::value<std::vector<std::string>>())  //
      ("logdir", "Directory for log files",
       cxxopts::value<std::string>())  //
      ("logtostdout", "log to stdout")  //
      ("verbose", "Enable verbose logging", cxxopts::value<int>(),
       "LEVEL")  //
      ("files", "Files to open",
       cxxopts::value<std::vector<std::string>>())  //
      ;
  options->parse_positional({"files"});
  options->positional_help("[FILE...]");
}

void LauncherConfig::load(const cxxopts::ParseResult& result) {
  if (result.count("cfgfile")) {
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      loadIniFile(ExpandTilde(cfgfilename));
    }
  }

  if (result.count("ipcsocket")) {
    socketPaths = result["ipcsocket"].as<vector<string>>();
  }
  if (result.count("logdir")) {
    logDirectory = ExpandTilde(result["logdir"].as<string>());
  }
  if (result.count("logtostdout")) {
    logToStdout = true;
  }
  // read verbose level (prioritize command line option over cfgfile)
  if (result.count("verbose")) {
    verboseLevel = result["verbose"].as<int>();
  }
  if (result.count("files")) {
    files = result["files"].as<vector<string>>();
  }
}

void LauncherConfig::setUnrecognisedOptions(int argc, char** argv) {
  unrecognisedOptions.clear();
  for (int i = 1; i < argc; i++) {
    unrecognisedOptions.push_back(argv[i]);
  }
}

void LauncherConfig::loadIniFile(const string& cfgfilename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(cfgfilename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + cfgfilename);
  }

  const char* socketPathsString = ini.GetValue("Ipc", "socket_paths", NULL);
  if (socketPathsString) {
    socketPaths = split(string(socketPathsString), ':');
  }

  const char* directory = ini.GetValue("Logging", "directory", NULL);
  if (directory && strlen(directory) > 0) {
    logDirectory = ExpandTilde(directory);
  }
  // read log file size limit
  const char* logsize = ini.GetValue("Logging", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    maxLogSize = to_string(atoi(logsize));
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verboseLevel = atoi(vlevel);
  }
  // read silent setting
  const char* silentString = ini.GetValue("Debug", "silent", NULL);
  if (silentString && atoi(silentString) != 0) {
    silent = true;
  }
}
}  // namespace cm

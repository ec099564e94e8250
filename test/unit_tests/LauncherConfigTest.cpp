#include "LauncherConfig.hpp"
#include "TestHeaders.hpp"

using namespace cm;

namespace {
cxxopts::ParseResult ParseArgs(cxxopts::Options* options,
                               vector<string> args) {
  args.insert(args.begin(), "cryptomator-launcher");
  vector<char*> argvStorage;
  for (auto& arg : args) {
    argvStorage.push_back(&arg[0]);
  }
  argvStorage.push_back(NULL);
  int argc = int(args.size());
  char** argv = &argvStorage[0];
  return options->parse(argc, argv);
}

string WriteConfigFile(const string& directory, const string& contents) {
  string path = directory + "/cryptomator.cfg";
  std::ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("Defaults without arguments", "[LauncherConfig]") {
  cxxopts::Options options("cryptomator-launcher", "test");
  LauncherConfig::addOptions(&options);
  auto result = ParseArgs(&options, {});

  LauncherConfig config;
  config.load(result);
  REQUIRE(config.getSocketPaths().empty());
  REQUIRE(config.getLogDirectory() ==
          sago::getDataHome() + "/Cryptomator/logs");
  REQUIRE(config.getMaxLogSize() == "20971520");
  REQUIRE(config.getVerboseLevel() == 0);
  REQUIRE(!config.isLogToStdout());
  REQUIRE(!config.isSilent());
  REQUIRE(config.getFiles().empty());
}

TEST_CASE("Command line options", "[LauncherConfig]") {
  cxxopts::Options options("cryptomator-launcher", "test");
  LauncherConfig::addOptions(&options);
  auto result = ParseArgs(
      &options, {"--ipcsocket", "/run/a.socket", "--ipcsocket",
                 "/run/b.socket", "--logdir", "/var/log/cm", "--verbose", "3",
                 "--logtostdout", "/vaults/one", "/vaults/two"});

  LauncherConfig config;
  config.load(result);
  REQUIRE(config.getSocketPaths() ==
          vector<string>({"/run/a.socket", "/run/b.socket"}));
  REQUIRE(config.getLogDirectory() == "/var/log/cm");
  REQUIRE(config.getVerboseLevel() == 3);
  REQUIRE(config.isLogToStdout());
  REQUIRE(config.getFiles() == vector<string>({"/vaults/one", "/vaults/two"}));
}

TEST_CASE("Unknown options are kept aside", "[LauncherConfig]") {
  cxxopts::Options options("cryptomator-launcher", "test");
  LauncherConfig::addOptions(&options);
  vector<string> args = {"cryptomator-launcher", "--unknown", "/vault"};
  vector<char*> argvStorage;
  for (auto& arg : args) {
    argvStorage.push_back(&arg[0]);
  }
  argvStorage.push_back(NULL);
  int argc = int(args.size());
  char** argv = &argvStorage[0];
  auto result = options.parse(argc, argv);

  LauncherConfig config;
  config.load(result);
  config.setUnrecognisedOptions(argc, argv);
  REQUIRE(config.getFiles() == vector<string>({"/vault"}));
  REQUIRE(config.getUnrecognisedOptions() == vector<string>({"--unknown"}));
}

TEST_CASE("Config file", "[LauncherConfig]") {
  const string directory = CreateTestDirectory("cm_test_config");
  const string cfgfile = WriteConfigFile(directory,
                                         "[Ipc]\n"
                                         "socket_paths = /x.socket:/y.socket\n"
                                         "[Logging]\n"
                                         "directory = /srv/logs\n"
                                         "logsize = 1024\n"
                                         "[Debug]\n"
                                         "verbose = 2\n"
                                         "silent = 1\n");
  cxxopts::Options options("cryptomator-launcher", "test");
  LauncherConfig::addOptions(&options);

  SECTION("Values from the file") {
    auto result = ParseArgs(&options, {"--cfgfile", cfgfile});
    LauncherConfig config;
    config.load(result);
    REQUIRE(config.getSocketPaths() ==
            vector<string>({"/x.socket", "/y.socket"}));
    REQUIRE(config.getLogDirectory() == "/srv/logs");
    REQUIRE(config.getMaxLogSize() == "1024");
    REQUIRE(config.getVerboseLevel() == 2);
    REQUIRE(config.isSilent());
  }

  SECTION("Command line wins") {
    auto result = ParseArgs(&options, {"--cfgfile", cfgfile, "--verbose", "5",
                                       "--ipcsocket", "/z.socket"});
    LauncherConfig config;
    config.load(result);
    REQUIRE(config.getSocketPaths() == vector<string>({"/z.socket"}));
    REQUIRE(config.getVerboseLevel() == 5);
    REQUIRE(config.getLogDirectory() == "/srv/logs");
  }

  std::error_code ec;
  fs::remove_all(directory, ec);
}

TEST_CASE("Missing config file", "[LauncherConfig]") {
  cxxopts::Options options("cryptomator-launcher", "test");
  LauncherConfig::addOptions(&options);
  auto result =
      ParseArgs(&options, {"--cfgfile", "/nonexistent/cryptomator.cfg"});

  LauncherConfig config;
  REQUIRE_THROWS_AS(config.load(result), std::runtime_error);
}

#include "ServerConfig.hpp"
#include "TestFixtures.hpp"

using namespace rsub;

namespace {
struct ConfigFile {
  explicit ConfigFile(const string& contents) {
    directory = makeTestDirectory("rsub_config_test");
    path = directory + "/rsubd.cfg";
    writeFile(path, contents);
  }
  ~ConfigFile() { fs::remove_all(directory); }

  string directory;
  string path;
};
}  // namespace

TEST_CASE("Defaults match the rmate client defaults", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.host == "localhost");
  REQUIRE(config.port == 52698);
  REQUIRE(config.editorCommand == "xdg-open");
  REQUIRE_FALSE(config.gotoLine);
  REQUIRE_FALSE(config.editorWaits);
  REQUIRE(config.tempRoot.empty());
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config file overrides the defaults", "[ServerConfig]") {
  ConfigFile file(
      "[Networking]\nhost = 0.0.0.0\nport = 60000\n"
      "[Editor]\ncommand = subl -w\ngoto_line = true\nwaits = yes\n"
      "[Storage]\ntmpdir = /tmp\n"
      "[Debug]\nverbose = 3\nsilent = 1\nlogsize = 1048576\n"
      "logdir = /tmp/rsubd-logs\n");
  ServerConfig config;
  config.loadConfigFile(file.path);

  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.port == 60000);
  REQUIRE(config.editorCommand == "subl -w");
  REQUIRE(config.gotoLine);
  REQUIRE(config.editorWaits);
  REQUIRE(config.tempRoot == "/tmp");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1048576");
  REQUIRE(config.logDirectory == "/tmp/rsubd-logs");
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Keys missing from the file keep their values", "[ServerConfig]") {
  ConfigFile file("[Networking]\nport = 4000\n");
  ServerConfig config;
  config.loadConfigFile(file.path);
  REQUIRE(config.port == 4000);
  REQUIRE(config.host == "localhost");
  REQUIRE(config.editorCommand == "xdg-open");
  REQUIRE(config.maxLogSize == "20971520");
}

TEST_CASE("Bad config values are rejected", "[ServerConfig]") {
  SECTION("Non-numeric port") {
    ConfigFile file("[Networking]\nport = http\n");
    ServerConfig config;
    REQUIRE_THROWS_AS(config.loadConfigFile(file.path), std::runtime_error);
  }
  SECTION("Trailing garbage after the port") {
    ConfigFile file("[Networking]\nport = 80x\n");
    ServerConfig config;
    REQUIRE_THROWS_AS(config.loadConfigFile(file.path), std::runtime_error);
  }
  SECTION("Missing file") {
    ServerConfig config;
    REQUIRE_THROWS_AS(config.loadConfigFile("/nonexistent/rsubd.cfg"),
                      std::runtime_error);
  }
}

TEST_CASE("Validation catches unusable settings", "[ServerConfig]") {
  ServerConfig config;
  config.port = 0;
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  config.port = 65536;
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  config.port = 65535;
  REQUIRE_NOTHROW(config.validate());

  config.editorCommand = "  ";
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
  config.editorCommand = "vim";

  config.tempRoot = "/nonexistent/rsub/root";
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

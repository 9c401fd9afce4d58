#include "ServerConfig.hpp"

#include "TestHeaders.hpp"

using namespace mrm;

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.port == DEFAULT_PORT);
  REQUIRE(config.pipePath.empty());
  REQUIRE(config.maxProtocolViolations == DEFAULT_MAX_PROTOCOL_VIOLATIONS);
  REQUIRE(config.ttlSeconds == DEFAULT_TRANSACTION_TTL_SECONDS);
  REQUIRE(config.maxFragmentSize == DEFAULT_MAX_FRAGMENT_SIZE);
  REQUIRE(config.maxTotalLength == DEFAULT_MAX_MESSAGE_LENGTH);

  SessionConfig sessionConfig = config.getSessionConfig();
  REQUIRE(sessionConfig.transactionTtl ==
          std::chrono::seconds(DEFAULT_TRANSACTION_TTL_SECONDS));
  REQUIRE(sessionConfig.maxTotalLength ==
          uint64_t(DEFAULT_MAX_MESSAGE_LENGTH));
}

TEST_CASE("ServerConfig reads INI files", "[ServerConfig]") {
  ServerConfig config;

  SECTION("Present keys override defaults") {
    config.loadString(
        "[Networking]\n"
        "port = 7000\n"
        "bind_ip = 127.0.0.1\n"
        "max_protocol_violations = 3\n"
        "[Transactions]\n"
        "ttl_seconds = 5\n"
        "max_fragment_size = 1024\n"
        "max_total_length = 65536\n"
        "[Debug]\n"
        "verbose = 2\n"
        "silent = 1\n"
        "logsize = 1000\n");
    REQUIRE(config.port == 7000);
    REQUIRE(config.bindIp == "127.0.0.1");
    REQUIRE(config.maxProtocolViolations == 3);
    REQUIRE(config.ttlSeconds == 5);
    REQUIRE(config.maxFragmentSize == 1024);
    REQUIRE(config.maxTotalLength == 65536);
    REQUIRE(config.verbose == 2);
    REQUIRE(config.silent);
    REQUIRE(config.logsize == "1000");
    REQUIRE(config.getSessionConfig().transactionTtl ==
            std::chrono::seconds(5));
  }

  SECTION("Missing keys keep defaults") {
    config.loadString("[Networking]\npipe = /tmp/mrmux.sock\n");
    REQUIRE(config.pipePath == "/tmp/mrmux.sock");
    REQUIRE(config.port == DEFAULT_PORT);
    REQUIRE(config.ttlSeconds == DEFAULT_TRANSACTION_TTL_SECONDS);
  }

  SECTION("Bad values are rejected") {
    REQUIRE_THROWS_AS(config.loadString("[Transactions]\nttl_seconds = soon\n"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(config.loadString("[Transactions]\nttl_seconds = 0\n"),
                      std::runtime_error);
  }

  SECTION("Files are loaded from disk") {
    string pattern = GetTempDirectory() + string("mrm_config_XXXXXXXX");
    string directory = string(mkdtemp(&pattern[0]));
    string path = directory + "/mrmux.ini";
    {
      std::ofstream out(path);
      out << "[Networking]\nport = 7100\n";
    }
    config.loadFile(path);
    REQUIRE(config.port == 7100);
    REQUIRE_THROWS_AS(config.loadFile(directory + "/missing.ini"),
                      std::runtime_error);
    fs::remove_all(directory);
  }
}

#include <cxxopts.hpp>

#include "DeviceResponder.hpp"
#include "LogHandler.hpp"
#include "MuxServer.hpp"
#include "PipeSocketHandler.hpp"
#include "ServerConfig.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"

using namespace mrm;

namespace {
DeviceInfoMessage createDeviceInfo() {
  DeviceInfoMessage deviceInfo;
  char hostname[256];
  if (gethostname(hostname, sizeof(hostname)) == 0) {
    hostname[sizeof(hostname) - 1] = '\0';
    deviceInfo.set_name(hostname);
  } else {
    deviceInfo.set_name("mrmuxd");
  }
  deviceInfo.set_unique_identifier(
      genRandomAlphaNum(TRANSACTION_IDENTIFIER_LENGTH));
  deviceInfo.set_localized_model_name("mrmuxd");
  deviceInfo.set_system_build_version(MRM_VERSION);
  deviceInfo.set_protocol_version(1);
  return deviceInfo;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  mrm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, mrm::InterruptSignalHandler);

  cxxopts::Options options("mrmuxd",
                           "Media remote protocol multiplexing daemon");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("pipe", "Listen on this UNIX socket path instead of TCP",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "mrmuxd version " << MRM_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config.loadFile(cfgfilename);
      } catch (const std::runtime_error &re) {
        STFATAL << re.what();
      }
    }

    // Command line values win over the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("pipe")) {
      config.pipePath = result["pipe"].as<string>();
    }
    if (result.count("logdir")) {
      config.logdir = result["logdir"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    if (config.port == 0) {
      config.port = DEFAULT_PORT;
    }

    LogHandler::setupLogFiles(&defaultConf, config.logdir, "mrmuxd",
                              bool(result.count("logtostdout")), false,
                              config.logsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("mrmuxd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<SocketHandler> socketHandler;
    SocketEndpoint serverEndpoint;
    if (!config.pipePath.empty()) {
      socketHandler.reset(new PipeSocketHandler());
      serverEndpoint.set_name(config.pipePath);
    } else {
      socketHandler.reset(new TcpSocketHandler());
      serverEndpoint.set_port(config.port);
      if (config.bindIp.length()) {
        serverEndpoint.set_name(config.bindIp);
      }
    }

    LOG(INFO) << "Starting mrmuxd " << MRM_VERSION;
    MuxServer server(socketHandler, serverEndpoint,
                     MessageCatalog::createDefault(), config);
    DeviceResponder responder(&server, createDeviceInfo());
    server.setPayloadHandler(
        [&responder](const string &peerId, const Payload &payload) {
          responder.onPayload(peerId, payload);
        });
    server.setDeviceSetHandler(
        [&responder](const string &peerId, const DeviceSetChange &change) {
          responder.onDeviceSetChange(peerId, change);
        });
    server.run();

  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
}

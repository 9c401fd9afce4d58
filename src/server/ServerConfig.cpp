#include "ServerConfig.hpp"

namespace mrm {
namespace {
int64_t getInteger(const CSimpleIniA& ini, const char* section,
                   const char* key, int64_t defaultValue, int64_t minimum) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  int64_t result;
  try {
    result = stoll(value);
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
  if (result < minimum) {
    throw std::runtime_error(string("[") + section + "] " + key +
                             " must be at least " + to_string(minimum));
  }
  return result;
}
}  // namespace

ServerConfig::ServerConfig()
    : port(DEFAULT_PORT),
      maxProtocolViolations(DEFAULT_MAX_PROTOCOL_VIOLATIONS),
      ttlSeconds(DEFAULT_TRANSACTION_TTL_SECONDS),
      maxFragmentSize(DEFAULT_MAX_FRAGMENT_SIZE),
      maxTotalLength(DEFAULT_MAX_MESSAGE_LENGTH),
      verbose(0),
      silent(false),
      logsize("20971520"),
      logdir(GetTempDirectory()) {}

void ServerConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error(string("Invalid config file: ") + path);
  }
  loadIni(ini);
}

void ServerConfig::loadString(const string& text) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(text);
  if (rc < 0) {
    throw std::runtime_error("Invalid config data");
  }
  loadIni(ini);
}

void ServerConfig::loadIni(const CSimpleIniA& ini) {
  port = int(getInteger(ini, "Networking", "port", port, 0));
  const char* bindIpPtr = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIpPtr) {
    bindIp = string(bindIpPtr);
  }
  const char* pipePtr = ini.GetValue("Networking", "pipe", NULL);
  if (pipePtr) {
    pipePath = string(pipePtr);
  }
  maxProtocolViolations = int(getInteger(
      ini, "Networking", "max_protocol_violations", maxProtocolViolations, 0));

  ttlSeconds =
      int(getInteger(ini, "Transactions", "ttl_seconds", ttlSeconds, 1));
  maxFragmentSize = int(
      getInteger(ini, "Transactions", "max_fragment_size", maxFragmentSize, 1));
  maxTotalLength = getInteger(ini, "Transactions", "max_total_length",
                              maxTotalLength, 0);

  verbose = int(getInteger(ini, "Debug", "verbose", verbose, 0));
  silent = getInteger(ini, "Debug", "silent", silent ? 1 : 0, 0) != 0;
  // make sure logsize is a string of int value
  const char* logsizePtr = ini.GetValue("Debug", "logsize", NULL);
  if (logsizePtr && atoi(logsizePtr) != 0) {
    logsize = string(logsizePtr);
  }
  const char* logdirPtr = ini.GetValue("Debug", "logdir", NULL);
  if (logdirPtr && logdirPtr[0]) {
    logdir = string(logdirPtr);
  }
}

SessionConfig ServerConfig::getSessionConfig() const {
  SessionConfig sessionConfig;
  sessionConfig.transactionTtl = std::chrono::seconds(ttlSeconds);
  sessionConfig.maxTotalLength = uint64_t(maxTotalLength);
  return sessionConfig;
}
}  // namespace mrm

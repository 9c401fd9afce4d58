#ifndef __MRM_SERVER_CONFIG__
#define __MRM_SERVER_CONFIG__

#include "Headers.hpp"
#include "PeerSession.hpp"
#include "SimpleIni.h"

namespace mrm {
static const int DEFAULT_PORT = 49152;
static const int DEFAULT_MAX_PROTOCOL_VIOLATIONS = 16;

/**
 * @brief Settings of one mrmuxd instance, merged from the config file and
 * the command line.
 */
struct ServerConfig {
  // [Networking]
  int port;
  string bindIp;
  /** @brief UNIX socket path; when set the server does not listen on TCP. */
  string pipePath;
  int maxProtocolViolations;

  // [Transactions]
  int ttlSeconds;
  int maxFragmentSize;
  int64_t maxTotalLength;

  // [Debug]
  int verbose;
  bool silent;
  string logsize;
  string logdir;

  ServerConfig();

  /**
   * @brief Overwrites the fields present in an INI file.
   * @throws std::runtime_error if the file cannot be read or holds an
   * out-of-range value.
   */
  void loadFile(const string& path);

  /** @brief Same as loadFile but reads INI text from memory. */
  void loadString(const string& ini);

  SessionConfig getSessionConfig() const;

 protected:
  void loadIni(const CSimpleIniA& ini);
};
}  // namespace mrm

#endif  // __MRM_SERVER_CONFIG__

#ifndef __MRM_PIPE_SOCKET_HANDLER__
#define __MRM_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace mrm {
/**
 * @brief UNIX-domain sockets addressed by the filesystem path in the
 * endpoint name.  The socket file is created by listen() and removed by
 * stopListening().
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a listening path.
   * @return The connected fd, or -1 if nobody is listening there.
   */
  int connect(const SocketEndpoint& endpoint);

  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  virtual string endpointKey(const SocketEndpoint& endpoint);
  static sockaddr_un makeAddress(const string& path);
};
}  // namespace mrm

#endif  // __MRM_PIPE_SOCKET_HANDLER__

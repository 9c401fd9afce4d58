#ifndef __MRM_TCP_SOCKET_HANDLER__
#define __MRM_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace mrm {
/**
 * @brief IPv4/IPv6 listener.  The endpoint name is the bind address (every
 * interface when empty) and the endpoint port is the TCP port.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  virtual ~TcpSocketHandler() {}

  virtual set<int> listen(const SocketEndpoint& endpoint);

 protected:
  virtual string endpointKey(const SocketEndpoint& endpoint);
  /** @brief Also disables Nagle so small replies go out immediately. */
  virtual void initSocket(int fd);
};
}  // namespace mrm

#endif  // __MRM_TCP_SOCKET_HANDLER__

#ifndef __MRM_UNIX_SOCKET_HANDLER__
#define __MRM_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace mrm {
/**
 * @brief POSIX socket plumbing shared by the TCP and UNIX-domain handlers.
 *
 * Keeps the set of open connections and the listening fds of each endpoint.
 * Subclasses only know how to create listeners and how to name an endpoint.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  virtual ~UnixSocketHandler() {}

  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);

  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief Number of accepted or connected sockets not yet closed. */
  size_t numOpenSockets();

 protected:
  /** @brief Key under which an endpoint's listening fds are stored. */
  virtual string endpointKey(const SocketEndpoint& endpoint) = 0;

  /** @brief Throws if the endpoint already has listeners. */
  void checkNotListening(const SocketEndpoint& endpoint);
  void addListeners(const SocketEndpoint& endpoint, const set<int>& fds);

  /** @brief Starts tracking a connected socket. */
  void addOpenSocket(int fd);
  bool isOpen(int fd);

  /** @brief Non-blocking mode for every socket we hand out. */
  virtual void initSocket(int fd);
  /** @brief initSocket() plus SO_REUSEADDR for listeners. */
  void initServerSocket(int fd);

  std::mutex socketMutex;
  set<int> openSockets;
  map<string, set<int>> listeners;
};
}  // namespace mrm

#endif  // __MRM_UNIX_SOCKET_HANDLER__

#ifndef __MRM_SOCKET_HANDLER__
#define __MRM_SOCKET_HANDLER__

#include "Headers.hpp"
#include "MessageFramer.hpp"

namespace mrm {
/**
 * @brief Stream transport used by the mux server: listening endpoints,
 * accepted connections, and length-delimited frames on top of raw reads and
 * writes.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief Reads up to count bytes from fd. */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /** @brief Writes up to count bytes to fd. */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to give up after the transfer timeout.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Writes every byte, throwing if the operation times out or fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Blocks until one varint length-delimited message has been read.
   * @throws ProtocolError on an invalid prefix or a length above
   * `maxLength`, std::runtime_error on socket failure.
   */
  string readFrame(int fd, bool timeout,
                   int64_t maxLength = DEFAULT_MAX_MESSAGE_LENGTH);

  /** @brief Writes `message` with its varint length prefix. */
  inline void writeFrame(int fd, const string& message) {
    string s = MessageFramer::frame(message);
    writeAllOrThrow(fd, &s[0], s.length(), true);
  }

  /**
   * @brief Starts listening on the endpoint.
   * @return The listening fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /** @brief Listening fds created by an earlier listen() on the endpoint. */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on a listening fd.
   * @return The new connection, or -1 if none was pending.
   */
  virtual int accept(int fd) = 0;
  /** @brief Closes the endpoint's listening fds. */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;
};
}  // namespace mrm

#endif  // __MRM_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace mrm {
ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  if (!isOpen(fd)) {
    VLOG(1) << "Read from closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  ssize_t bytesRead = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (bytesRead < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading from " << fd << ": " << localErrno << " "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  if (!isOpen(fd)) {
    VLOG(1) << "Write to closed socket " << fd;
    SetErrno(EPIPE);
    return -1;
  }
  // writeAllOrThrow retries short writes and EAGAIN
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_storage client;
  socklen_t clientLength = sizeof(client);
  int fd = ::accept(listenFd, (sockaddr *)&client, &clientLength);
  if (fd < 0) {
    auto acceptErrno = GetErrno();
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
        acceptErrno != EINTR) {
      LOG(WARNING) << "accept() on " << listenFd
                   << " failed: " << strerror(acceptErrno);
    }
    SetErrno(acceptErrno);
    return -1;
  }
  initSocket(fd);
  addOpenSocket(fd);
  VLOG(3) << "Accepted fd " << fd << " on " << listenFd;
  return fd;
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<std::mutex> guard(socketMutex);
  if (openSockets.erase(fd) == 0) {
    STERROR << "Tried to close a socket that is not open: " << fd;
    return;
  }
  VLOG(1) << "Closing socket " << fd;
  FATAL_FAIL(::close(fd));
}

set<int> UnixSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::mutex> guard(socketMutex);
  auto it = listeners.find(endpointKey(endpoint));
  if (it == listeners.end()) {
    STFATAL << "No listeners for " << endpoint << ", call listen() first";
  }
  return it->second;
}

void UnixSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::mutex> guard(socketMutex);
  auto it = listeners.find(endpointKey(endpoint));
  if (it == listeners.end()) {
    STFATAL << "Tried to stop listening on " << endpoint
            << " which is not listening";
  }
  for (int fd : it->second) {
    FATAL_FAIL(::close(fd));
  }
  listeners.erase(it);
  LOG(INFO) << "Stopped listening on " << endpoint;
}

size_t UnixSocketHandler::numOpenSockets() {
  lock_guard<std::mutex> guard(socketMutex);
  return openSockets.size();
}

void UnixSocketHandler::checkNotListening(const SocketEndpoint &endpoint) {
  lock_guard<std::mutex> guard(socketMutex);
  if (listeners.count(endpointKey(endpoint))) {
    throw std::runtime_error(string("Already listening on ") +
                             endpointKey(endpoint));
  }
}

void UnixSocketHandler::addListeners(const SocketEndpoint &endpoint,
                                     const set<int> &fds) {
  lock_guard<std::mutex> guard(socketMutex);
  listeners[endpointKey(endpoint)] = fds;
}

void UnixSocketHandler::addOpenSocket(int fd) {
  lock_guard<std::mutex> guard(socketMutex);
  if (!openSockets.insert(fd).second) {
    STFATAL << "Socket " << fd << " is already open";
  }
}

bool UnixSocketHandler::isOpen(int fd) {
  lock_guard<std::mutex> guard(socketMutex);
  return openSockets.count(fd) > 0;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int flag = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&flag, sizeof(int)));
}
}  // namespace mrm

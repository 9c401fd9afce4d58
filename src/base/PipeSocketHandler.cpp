#include "PipeSocketHandler.hpp"

namespace mrm {
int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  sockaddr_un remote = makeAddress(endpoint.name());
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  // Local connects finish or fail immediately, so connect before going
  // non-blocking
  if (::connect(fd, (sockaddr*)&remote, sizeof(sockaddr_un)) == -1) {
    auto connectErrno = GetErrno();
    LOG(INFO) << "Cannot connect to " << endpoint << ": "
              << strerror(connectErrno);
    FATAL_FAIL(::close(fd));
    SetErrno(connectErrno);
    return -1;
  }
  initSocket(fd);
  addOpenSocket(fd);
  VLOG(1) << "Connected to " << endpoint << " with fd " << fd;
  return fd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  checkNotListening(endpoint);
  sockaddr_un local = makeAddress(endpoint.name());
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  // A stale socket file from an earlier run would make bind fail
  ::unlink(local.sun_path);
  if (::bind(fd, (sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    string error = string("Cannot bind ") + endpoint.name() + ": " +
                   strerror(GetErrno());
    ::close(fd);
    throw std::runtime_error(error);
  }
  FATAL_FAIL(::listen(fd, 16));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));
  LOG(INFO) << "Listening on " << endpoint.name();

  set<int> fds({fd});
  addListeners(endpoint, fds);
  return fds;
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  UnixSocketHandler::stopListening(endpoint);
  ::unlink(endpoint.name().c_str());
}

string PipeSocketHandler::endpointKey(const SocketEndpoint& endpoint) {
  return endpoint.name();
}

sockaddr_un PipeSocketHandler::makeAddress(const string& path) {
  sockaddr_un address;
  memset(&address, 0, sizeof(sockaddr_un));
  address.sun_family = AF_UNIX;
  if (path.length() >= sizeof(address.sun_path)) {
    throw std::runtime_error(string("Socket path too long: ") + path);
  }
  strncpy(address.sun_path, path.c_str(), sizeof(address.sun_path) - 1);
  return address;
}
}  // namespace mrm

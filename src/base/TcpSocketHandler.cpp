#include "TcpSocketHandler.hpp"

namespace mrm {
set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  checkNotListening(endpoint);

  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  string portName = to_string(endpoint.port());
  const char *bindName = NULL;
  if (endpoint.has_name() && !endpoint.name().empty()) {
    bindName = endpoint.name().c_str();
  }

  addrinfo *results = NULL;
  int rc = getaddrinfo(bindName, portName.c_str(), &hints, &results);
  if (rc != 0) {
    throw std::runtime_error(string("Cannot resolve ") + endpointKey(endpoint) +
                             ": " + gai_strerror(rc));
  }

  // One listener per resolved address, so IPv4 and IPv6 are both served
  set<int> fds;
  for (addrinfo *p = results; p != NULL; p = p->ai_next) {
    int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd == -1) {
      VLOG(1) << "Skipping address family " << p->ai_family << ": "
              << strerror(GetErrno());
      continue;
    }
    initServerSocket(fd);
    if (p->ai_family == AF_INET6) {
      int flag = 1;
      FATAL_FAIL(setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }
    if (::bind(fd, p->ai_addr, p->ai_addrlen) == -1) {
      string error = string("Cannot bind ") + endpointKey(endpoint) + ": " +
                     strerror(GetErrno());
      ::close(fd);
      for (int open : fds) {
        ::close(open);
      }
      freeaddrinfo(results);
      throw std::runtime_error(error);
    }
    FATAL_FAIL(::listen(fd, 32));
    fds.insert(fd);
  }
  freeaddrinfo(results);

  if (fds.empty()) {
    throw std::runtime_error(string("Could not listen on ") +
                             endpointKey(endpoint));
  }
  LOG(INFO) << "Listening on " << endpointKey(endpoint) << " with "
            << fds.size() << " sockets";
  addListeners(endpoint, fds);
  return fds;
}

string TcpSocketHandler::endpointKey(const SocketEndpoint &endpoint) {
  return (endpoint.has_name() ? endpoint.name() : string()) + ":" +
         to_string(endpoint.port());
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace mrm

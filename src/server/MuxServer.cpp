#include "MuxServer.hpp"

#define BUF_SIZE (16 * 1024)

namespace mrm {
MuxServer::MuxServer(shared_ptr<SocketHandler> _socketHandler,
                     const SocketEndpoint& _serverEndpoint,
                     shared_ptr<const MessageCatalog> _catalog,
                     const ServerConfig& _config)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      catalog(_catalog),
      config(_config),
      fragmenter(size_t(_config.maxFragmentSize)),
      nextPeerNumber(0),
      halt(false) {
  socketHandler->listen(serverEndpoint);
}

MuxServer::~MuxServer() {
  vector<shared_ptr<PeerConnection>> remaining;
  {
    lock_guard<std::mutex> guard(peerMutex);
    halt = true;
    for (const auto& it : peers) {
      remaining.push_back(it.second);
    }
  }
  for (const auto& peer : remaining) {
    if (peer->peerThread && peer->peerThread->joinable()) {
      peer->peerThread->join();
    }
  }
}

void MuxServer::run() {
  LOG(INFO) << "Listening on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  if (serverPortFds.size() > FD_SETSIZE) {
    STFATAL << "Tried to select() on too many FDs";
  }
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (true) {
    {
      lock_guard<std::mutex> guard(peerMutex);
      if (halt) {
        break;
      }
    }
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet > 0) {
      for (int i : serverPortFds) {
        if (FD_ISSET(i, &rfds)) {
          acceptNewConnection(i);
        }
      }
    }
    reapPeers();
  }

  LOG(INFO) << "Shutting down server";
  socketHandler->stopListening(serverEndpoint);
  vector<shared_ptr<PeerConnection>> remaining;
  {
    lock_guard<std::mutex> guard(peerMutex);
    for (const auto& it : peers) {
      remaining.push_back(it.second);
    }
  }
  for (const auto& peer : remaining) {
    if (peer->peerThread && peer->peerThread->joinable()) {
      peer->peerThread->join();
    }
  }
  lock_guard<std::mutex> guard(peerMutex);
  peers.clear();
}

void MuxServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return;
  }
  shared_ptr<PeerConnection> peer(new PeerConnection());
  peer->fd = clientSocketFd;

  lock_guard<std::mutex> guard(peerMutex);
  peer->id = string("peer-") + to_string(++nextPeerNumber);
  peer->session.reset(
      new PeerSession(peer->id, catalog, config.getSessionConfig()));
  peer->session->setPayloadHandler(payloadHandler);
  peer->session->setDeviceSetHandler(deviceSetHandler);
  peers[peer->id] = peer;
  peer->peerThread.reset(new thread(&MuxServer::runPeer, this, peer));
  LOG(INFO) << "Accepted " << peer->id << " on fd " << clientSocketFd;
}

void MuxServer::runPeer(shared_ptr<PeerConnection> peer) {
  el::Helpers::setThreadName(peer->id);
  MessageFramer framer(config.maxTotalLength);
  char buf[BUF_SIZE];
  auto lastExpiry = TransactionReassembler::Clock::now();
  bool run = true;

  try {
    while (run) {
      {
        lock_guard<std::mutex> guard(peerMutex);
        if (halt) {
          break;
        }
      }
      fd_set rfd;
      FD_ZERO(&rfd);
      FD_SET(peer->fd, &rfd);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 10000;
      int numFdsSet = select(peer->fd + 1, &rfd, NULL, NULL, &tv);
      if (numFdsSet < 0 && GetErrno() != EINTR) {
        throw std::runtime_error(string("select failed: ") +
                                 strerror(GetErrno()));
      }

      if (numFdsSet > 0 && FD_ISSET(peer->fd, &rfd)) {
        ssize_t bytesRead = socketHandler->read(peer->fd, buf, BUF_SIZE);
        if (bytesRead == 0) {
          LOG(INFO) << peer->id << " disconnected";
          break;
        }
        if (bytesRead < 0) {
          if (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK) {
            continue;
          }
          LOG(WARNING) << peer->id
                       << " read failed: " << strerror(GetErrno());
          break;
        }
        framer.push(buf, size_t(bytesRead));
        string frame;
        while (framer.pop(&frame)) {
          peer->session->handleFrame(frame);
          if (peer->session->getProtocolViolations() >
              config.maxProtocolViolations) {
            LOG(WARNING) << "Disconnecting " << peer->id << " after "
                         << peer->session->getProtocolViolations()
                         << " protocol violations";
            run = false;
            break;
          }
        }
      }

      auto now = TransactionReassembler::Clock::now();
      if (now - lastExpiry >= std::chrono::seconds(1)) {
        peer->session->expireTransactions(now);
        lastExpiry = now;
      }
    }
  } catch (const ProtocolError& pe) {
    LOG(WARNING) << "Disconnecting " << peer->id
                 << ", cannot resync stream: " << pe.what();
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Error on " << peer->id << ": " << re.what();
  }

  peer->session->close();
  lock_guard<std::mutex> guard(peer->writeMutex);
  peer->done = true;
  socketHandler->close(peer->fd);
}

void MuxServer::reapPeers() {
  vector<shared_ptr<PeerConnection>> finished;
  {
    lock_guard<std::mutex> guard(peerMutex);
    for (auto it = peers.begin(); it != peers.end();) {
      if (it->second->done) {
        finished.push_back(it->second);
        it = peers.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& peer : finished) {
    peer->peerThread->join();
    VLOG(1) << "Reaped " << peer->id;
  }
}

bool MuxServer::writeEnvelope(shared_ptr<PeerConnection> peer,
                              const ProtocolEnvelope& envelope) {
  string bytes = protoToString(envelope);
  lock_guard<std::mutex> guard(peer->writeMutex);
  if (peer->done) {
    VLOG(1) << "Dropping write to closed " << peer->id;
    return false;
  }
  try {
    if (fragmenter.needsSplitting(bytes.length())) {
      for (const auto& fragment :
           fragmenter.split(bytes, envelope.identifier())) {
        socketHandler->writeFrame(peer->fd, protoToString(fragment));
      }
    } else {
      socketHandler->writeFrame(peer->fd, bytes);
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Write to " << peer->id << " failed: " << re.what();
    return false;
  }
  return true;
}

bool MuxServer::sendMessage(const string& peerId, uint32_t tag,
                            const google::protobuf::MessageLite& message,
                            const string& identifier) {
  shared_ptr<PeerConnection> peer = getPeer(peerId);
  if (peer.get() == NULL) {
    VLOG(1) << "Cannot send to unknown peer " << peerId;
    return false;
  }
  ProtocolEnvelope envelope =
      peer->session->getCodec().encode(tag, message, identifier);
  VLOG(2) << peerId << " -> " << catalog->describe(tag);
  return writeEnvelope(peer, envelope);
}

bool MuxServer::isInterested(const string& peerId, UpdateCategory category) {
  shared_ptr<PeerConnection> peer = getPeer(peerId);
  if (peer.get() == NULL) {
    return false;
  }
  return peer->session->getInterestTracker().isInterested(category);
}

vector<string> MuxServer::getPeerIds() {
  lock_guard<std::mutex> guard(peerMutex);
  vector<string> ids;
  for (const auto& it : peers) {
    if (!it.second->done) {
      ids.push_back(it.first);
    }
  }
  return ids;
}

int MuxServer::numPeers() { return int(getPeerIds().size()); }

shared_ptr<PeerSession> MuxServer::getSession(const string& peerId) {
  shared_ptr<PeerConnection> peer = getPeer(peerId);
  if (peer.get() == NULL) {
    return shared_ptr<PeerSession>();
  }
  return peer->session;
}

shared_ptr<MuxServer::PeerConnection> MuxServer::getPeer(
    const string& peerId) {
  lock_guard<std::mutex> guard(peerMutex);
  auto it = peers.find(peerId);
  if (it == peers.end() || it->second->done) {
    return shared_ptr<PeerConnection>();
  }
  return it->second;
}
}  // namespace mrm

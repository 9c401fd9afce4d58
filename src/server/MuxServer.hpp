#ifndef __MRM_MUX_SERVER__
#define __MRM_MUX_SERVER__

#include "Headers.hpp"
#include "MessageCatalog.hpp"
#include "MessageFramer.hpp"
#include "MessageSender.hpp"
#include "PeerSession.hpp"
#include "ServerConfig.hpp"
#include "SocketHandler.hpp"
#include "TransactionFragmenter.hpp"

namespace mrm {
/**
 * @brief Accepts peer connections and runs one PeerSession per peer.
 *
 * `run()` owns the accept loop.  Every accepted socket gets its own thread
 * that reads frames into the peer's session until the peer disconnects, the
 * framing breaks, or the peer exceeds the allowed number of protocol
 * violations.
 */
class MuxServer : public MessageSender {
 public:
  MuxServer(shared_ptr<SocketHandler> _socketHandler,
            const SocketEndpoint& _serverEndpoint,
            shared_ptr<const MessageCatalog> _catalog,
            const ServerConfig& _config);
  virtual ~MuxServer();

  /** @brief Called for every message a peer delivers. */
  void setPayloadHandler(PayloadHandler handler) { payloadHandler = handler; }
  /** @brief Called when a peer changes its output devices. */
  void setDeviceSetHandler(DeviceSetHandler handler) {
    deviceSetHandler = handler;
  }

  /** @brief Accept loop.  Returns after shutdown() once every peer thread
   * has been joined. */
  void run();

  void shutdown() {
    lock_guard<std::mutex> guard(peerMutex);
    halt = true;
  }

  virtual bool sendMessage(const string& peerId, uint32_t tag,
                           const google::protobuf::MessageLite& message,
                           const string& identifier = "");
  virtual bool isInterested(const string& peerId, UpdateCategory category);
  virtual vector<string> getPeerIds();

  int numPeers();

  /** @brief Returns the session of a connected peer, or NULL. */
  shared_ptr<PeerSession> getSession(const string& peerId);

 protected:
  struct PeerConnection {
    string id;
    int fd;
    shared_ptr<PeerSession> session;
    shared_ptr<thread> peerThread;
    std::mutex writeMutex;
    std::atomic<bool> done;

    PeerConnection() : fd(-1), done(false) {}
  };

  void acceptNewConnection(int fd);
  void runPeer(shared_ptr<PeerConnection> peer);
  /** @brief Joins and forgets peers whose thread has finished. */
  void reapPeers();
  bool writeEnvelope(shared_ptr<PeerConnection> peer,
                     const ProtocolEnvelope& envelope);
  shared_ptr<PeerConnection> getPeer(const string& peerId);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<const MessageCatalog> catalog;
  ServerConfig config;
  TransactionFragmenter fragmenter;
  PayloadHandler payloadHandler;
  DeviceSetHandler deviceSetHandler;

  /** @brief Guards `peers`, `nextPeerNumber` and the halt flag. */
  std::mutex peerMutex;
  map<string, shared_ptr<PeerConnection>> peers;
  int nextPeerNumber;
  bool halt;
};
}  // namespace mrm

#endif  // __MRM_MUX_SERVER__

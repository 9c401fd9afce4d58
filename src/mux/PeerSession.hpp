#ifndef __MRM_PEER_SESSION__
#define __MRM_PEER_SESSION__

#include "DeviceSetNegotiator.hpp"
#include "EnvelopeCodec.hpp"
#include "Headers.hpp"
#include "MessageCatalog.hpp"
#include "Payload.hpp"
#include "ProtocolError.hpp"
#include "TransactionReassembler.hpp"
#include "UpdateInterestTracker.hpp"

namespace mrm {
// Transactions may carry envelopes that are themselves transactions, but
// only this many levels deep.
static const int MAX_ENVELOPE_DEPTH = 4;

struct SessionConfig {
  std::chrono::seconds transactionTtl;
  uint64_t maxTotalLength;

  SessionConfig()
      : transactionTtl(DEFAULT_TRANSACTION_TTL_SECONDS),
        maxTotalLength(DEFAULT_MAX_MESSAGE_LENGTH) {}
};

typedef std::function<void(const string& peerId, const Payload& payload)>
    PayloadHandler;
typedef std::function<void(const string& peerId, const DeviceSetChange& change)>
    DeviceSetHandler;

/**
 * @brief All protocol state belonging to one connected peer.
 *
 * Owns the peer's reassembler, interest tracker and device-set negotiator.
 * Frames are processed in the order they are handed in.  Internal messages
 * (transactions, subscriptions, device changes) update that state first;
 * every decoded top-level message then reaches the payload handler exactly
 * once, after the frame has been fully processed.  A ProtocolError drops the
 * offending message, is counted, and leaves the session usable.  Exceptions
 * thrown by the handlers are logged and are not counted.
 */
class PeerSession {
 public:
  PeerSession(const string& _peerId, shared_ptr<const MessageCatalog> catalog,
              const SessionConfig& _config = SessionConfig());

  void setPayloadHandler(PayloadHandler handler) { payloadHandler = handler; }
  void setDeviceSetHandler(DeviceSetHandler handler) {
    deviceSetHandler = handler;
  }

  /**
   * @brief Processes one whole envelope read off the stream.
   * @return false if the envelope was rejected.
   */
  bool handleFrame(const string& bytes);

  /**
   * @brief Processes one fragment the transport already classified.
   * @return false if the fragment was rejected.
   */
  bool handleFragment(const TransactionFragment& fragment);

  /** @brief Drops transactions idle for longer than the configured TTL. */
  vector<TransactionKeyId> expireTransactions(
      TransactionReassembler::Clock::time_point now);
  vector<TransactionKeyId> expireTransactions() {
    return expireTransactions(TransactionReassembler::Clock::now());
  }

  /** @brief Releases every in-flight transaction.  Later frames are ignored. */
  void close();
  bool isClosed() const { return closed; }

  int getProtocolViolations() const { return protocolViolations; }

  const string& getPeerId() const { return peerId; }
  const SessionConfig& getConfig() const { return config; }
  const EnvelopeCodec& getCodec() const { return codec; }
  TransactionReassembler& getReassembler() { return reassembler; }
  UpdateInterestTracker& getInterestTracker() { return interestTracker; }
  DeviceSetNegotiator& getDeviceSetNegotiator() { return deviceSetNegotiator; }

 protected:
  // A decoded message waiting for the application handlers
  struct Delivery {
    Payload payload;
    shared_ptr<DeviceSetChange> deviceSetChange;
  };

  void route(const Payload& payload, int depth, vector<Delivery>* ready);
  void submitFragment(const TransactionFragment& fragment, int depth,
                      vector<Delivery>* ready);
  void deliver(const vector<Delivery>& ready);
  void logHandlerFailure(const Payload& payload, const std::exception& e);
  void recordViolation(const ProtocolError& error);

  string peerId;
  SessionConfig config;
  EnvelopeCodec codec;
  TransactionReassembler reassembler;
  UpdateInterestTracker interestTracker;
  DeviceSetNegotiator deviceSetNegotiator;
  PayloadHandler payloadHandler;
  DeviceSetHandler deviceSetHandler;
  std::atomic<int> protocolViolations;
  std::atomic<bool> closed;
};
}  // namespace mrm

#endif  // __MRM_PEER_SESSION__

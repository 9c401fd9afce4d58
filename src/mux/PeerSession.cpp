#include "PeerSession.hpp"

namespace mrm {
PeerSession::PeerSession(const string& _peerId,
                         shared_ptr<const MessageCatalog> catalog,
                         const SessionConfig& _config)
    : peerId(_peerId),
      config(_config),
      codec(catalog),
      reassembler(_config.maxTotalLength),
      protocolViolations(0),
      closed(false) {}

bool PeerSession::handleFrame(const string& bytes) {
  if (closed) {
    VLOG(1) << "Ignoring frame for closed session " << peerId;
    return false;
  }
  vector<Delivery> ready;
  bool accepted = true;
  try {
    route(codec.decodeBytes(bytes), 0, &ready);
  } catch (const ProtocolError& error) {
    recordViolation(error);
    accepted = false;
  }
  deliver(ready);
  return accepted;
}

bool PeerSession::handleFragment(const TransactionFragment& fragment) {
  if (closed) {
    VLOG(1) << "Ignoring fragment for closed session " << peerId;
    return false;
  }
  vector<Delivery> ready;
  bool accepted = true;
  try {
    submitFragment(fragment, 0, &ready);
  } catch (const ProtocolError& error) {
    recordViolation(error);
    accepted = false;
  }
  deliver(ready);
  return accepted;
}

void PeerSession::submitFragment(const TransactionFragment& fragment,
                                 int depth, vector<Delivery>* ready) {
  ReassemblyOutcome outcome = reassembler.submit(fragment);
  if (!outcome.complete) {
    return;
  }
  if (depth >= MAX_ENVELOPE_DEPTH) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_PAYLOAD,
                        string("transactions nested more than ") +
                            to_string(MAX_ENVELOPE_DEPTH) + " levels deep");
  }
  Payload payload = codec.decodeBytes(outcome.blob);
  if (payload.getIdentifier().empty()) {
    payload.setIdentifier(outcome.contentIdentifier);
  }
  route(payload, depth + 1, ready);
}

void PeerSession::route(const Payload& payload, int depth,
                        vector<Delivery>* ready) {
  VLOG(2) << peerId << " <- "
          << codec.getCatalog()->describe(payload.getTag());
  Delivery delivery;
  delivery.payload = payload;
  // Opaque payloads are never routed internally, whatever their tag
  switch (payload.isOpaque() ? uint32_t(UNKNOWN_MESSAGE) : payload.getTag()) {
    case TRANSACTION_MESSAGE: {
      const TransactionMessage& message = payload.as<TransactionMessage>();
      for (const auto& packet : message.packets().packets()) {
        submitFragment(TransactionFragment::fromPacket(packet), depth, ready);
      }
      // The assembled payload is delivered, the carrier is not
      return;
    }
    case TRANSACTION_CANCEL_MESSAGE: {
      const TransactionCancelMessage& message =
          payload.as<TransactionCancelMessage>();
      reassembler.cancel(TransactionKeyId(message.key()));
      return;
    }
    case CLIENT_UPDATES_CONFIG_MESSAGE:
      interestTracker.apply(payload.as<ClientUpdatesConfigMessage>());
      break;
    case MODIFY_OUTPUT_CONTEXT_REQUEST_MESSAGE:
      delivery.deviceSetChange.reset(
          new DeviceSetChange(deviceSetNegotiator.apply(
              payload.as<ModifyOutputContextRequestMessage>())));
      break;
    default:
      break;
  }
  ready->push_back(delivery);
}

void PeerSession::deliver(const vector<Delivery>& ready) {
  // Handler failures are logged and never counted against the peer
  for (const auto& delivery : ready) {
    if (delivery.deviceSetChange && deviceSetHandler) {
      try {
        deviceSetHandler(peerId, *delivery.deviceSetChange);
      } catch (const std::exception& e) {
        logHandlerFailure(delivery.payload, e);
      }
    }
    if (payloadHandler) {
      try {
        payloadHandler(peerId, delivery.payload);
      } catch (const std::exception& e) {
        logHandlerFailure(delivery.payload, e);
      }
    }
  }
}

void PeerSession::logHandlerFailure(const Payload& payload,
                                    const std::exception& e) {
  STERROR << peerId << ": handler failed on "
          << codec.getCatalog()->describe(payload.getTag()) << ": "
          << e.what();
}

vector<TransactionKeyId> PeerSession::expireTransactions(
    TransactionReassembler::Clock::time_point now) {
  vector<TransactionKeyId> expired =
      reassembler.expire(now, config.transactionTtl);
  if (!expired.empty()) {
    LOG(INFO) << peerId << ": " << expired.size()
              << " transactions timed out";
  }
  return expired;
}

void PeerSession::close() {
  if (closed.exchange(true)) {
    return;
  }
  reassembler.clear();
  LOG(INFO) << "Closed session " << peerId << " after " << protocolViolations
            << " protocol violations";
}

void PeerSession::recordViolation(const ProtocolError& error) {
  int count = ++protocolViolations;
  LOG(WARNING) << peerId << ": dropped message (" << error.what()
               << "), violation " << count;
}
}  // namespace mrm

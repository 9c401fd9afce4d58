#include "TransactionFragmenter.hpp"

namespace mrm {
TransactionFragmenter::TransactionFragmenter(size_t _maxFragmentSize)
    : maxFragmentSize(_maxFragmentSize) {
  if (maxFragmentSize == 0) {
    STFATAL << "Fragment size must be positive";
  }
}

vector<ProtocolEnvelope> TransactionFragmenter::split(
    const string& blob, const TransactionKeyId& key,
    const string& contentIdentifier) const {
  vector<ProtocolEnvelope> envelopes;
  uint64_t total = blob.length();
  uint64_t position = 0;
  // An empty blob still needs one packet to announce a zero-length transaction
  do {
    uint64_t length = min(uint64_t(maxFragmentSize), total - position);

    TransactionMessage message;
    TransactionPacket* packet = message.mutable_packets()->add_packets();
    *(packet->mutable_key()) = key.toProto();
    packet->set_packet_data(blob.substr(position, length));
    packet->set_total_length(total);
    packet->set_total_write_position(position);
    if (!contentIdentifier.empty()) {
      packet->set_identifier(contentIdentifier);
    }

    ProtocolEnvelope envelope;
    envelope.set_tag(TRANSACTION_MESSAGE);
    envelope.set_payload(protoToString(message));
    envelopes.push_back(envelope);

    position += length;
  } while (position < total);

  VLOG(1) << "Split " << total << " bytes into " << envelopes.size()
          << " fragments for transaction " << key;
  return envelopes;
}
}  // namespace mrm

#include "EnvelopeCodec.hpp"

namespace mrm {
ProtocolEnvelope EnvelopeCodec::encode(
    uint32_t tag, const google::protobuf::MessageLite& payload,
    const string& identifier) const {
  const CatalogEntry* entry = catalog->find(tag);
  if (entry == NULL) {
    throw ProtocolError(ProtocolErrorCode::UNKNOWN_TAG,
                        string("Cannot encode ") + payload.GetTypeName() +
                            " with unregistered tag " + to_string(tag));
  }
  if (entry->typeName != payload.GetTypeName()) {
    throw std::runtime_error(string("Tag ") + to_string(tag) + " carries " +
                             entry->typeName + ", got " +
                             payload.GetTypeName());
  }
  return encodeOpaque(tag, entry->encode(payload), identifier);
}

ProtocolEnvelope EnvelopeCodec::encodeOpaque(uint32_t tag, const string& bytes,
                                             const string& identifier) const {
  ProtocolEnvelope envelope;
  envelope.set_tag(tag);
  envelope.set_payload(bytes);
  if (!identifier.empty()) {
    envelope.set_identifier(identifier);
  }
  return envelope;
}

Payload EnvelopeCodec::decode(const ProtocolEnvelope& envelope) const {
  uint32_t tag = envelope.tag();
  const CatalogEntry* entry = catalog->find(tag);
  Payload payload;
  if (entry == NULL) {
    VLOG(1) << "Passing through payload with unknown tag " << tag << " ("
            << envelope.payload().length() << " bytes)";
    payload = Payload::opaque(tag, envelope.payload());
  } else {
    payload = Payload(tag, entry->decode(envelope.payload()));
  }
  payload.setIdentifier(envelope.identifier());
  return payload;
}

ProtocolEnvelope EnvelopeCodec::parseEnvelope(const string& bytes) {
  ProtocolEnvelope envelope;
  if (!envelope.ParseFromString(bytes)) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_PAYLOAD,
                        string("Invalid envelope (") +
                            to_string(bytes.length()) +
                            " bytes): " + hexDump(bytes));
  }
  return envelope;
}
}  // namespace mrm

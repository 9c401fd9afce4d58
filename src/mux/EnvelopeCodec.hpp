#ifndef __MRM_ENVELOPE_CODEC__
#define __MRM_ENVELOPE_CODEC__

#include "Headers.hpp"
#include "MessageCatalog.hpp"
#include "Payload.hpp"
#include "ProtocolError.hpp"

namespace mrm {
/**
 * @brief Wraps payloads in a ProtocolEnvelope and unwraps them again.
 *
 * Stateless apart from the shared, read-only catalog.
 */
class EnvelopeCodec {
 public:
  explicit EnvelopeCodec(shared_ptr<const MessageCatalog> _catalog)
      : catalog(_catalog) {}

  /**
   * @brief Serializes `payload` into an envelope tagged `tag`.
   * @throws ProtocolError (UNKNOWN_TAG) if the catalog has no such tag.
   */
  ProtocolEnvelope encode(uint32_t tag,
                          const google::protobuf::MessageLite& payload,
                          const string& identifier = "") const;

  /**
   * @brief Builds an envelope around bytes the caller already serialized.
   * The tag does not need to be registered.
   */
  ProtocolEnvelope encodeOpaque(uint32_t tag, const string& bytes,
                                const string& identifier = "") const;

  /**
   * @brief Decodes the envelope's payload through the catalog.
   *
   * Unregistered tags come back as opaque payloads.
   * @throws ProtocolError (MALFORMED_PAYLOAD) if a registered payload does not
   * parse.
   */
  Payload decode(const ProtocolEnvelope& envelope) const;

  /** @brief Parses envelope bytes and decodes the payload they carry. */
  Payload decodeBytes(const string& bytes) const {
    return decode(parseEnvelope(bytes));
  }

  /**
   * @brief Parses envelope bytes without touching the payload.
   * @throws ProtocolError (MALFORMED_PAYLOAD) if the bytes are not an envelope.
   */
  static ProtocolEnvelope parseEnvelope(const string& bytes);

  shared_ptr<const MessageCatalog> getCatalog() const { return catalog; }

 protected:
  shared_ptr<const MessageCatalog> catalog;
};
}  // namespace mrm

#endif  // __MRM_ENVELOPE_CODEC__

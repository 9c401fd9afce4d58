#ifndef __MRM_MESSAGE_FRAMER__
#define __MRM_MESSAGE_FRAMER__

#include "Headers.hpp"
#include "ProtocolError.hpp"

namespace mrm {
/**
 * @brief Splits a byte stream into varint length-delimited messages.
 *
 * Each message on the wire is `varint32(length) || bytes`.  Bytes arrive in
 * arbitrary chunks from the socket; `push()` accumulates them and `pop()`
 * yields complete messages in arrival order.
 */
class MessageFramer {
 public:
  explicit MessageFramer(int64_t _maxMessageLength = DEFAULT_MAX_MESSAGE_LENGTH)
      : maxMessageLength(_maxMessageLength) {}

  /** @brief Prefixes `message` with its varint length. */
  static string frame(const string& message);

  /**
   * @brief Decodes a varint length prefix at the start of `data`.
   * @return Number of prefix bytes consumed, 0 if more bytes are needed.
   * @throws ProtocolError (MALFORMED_FRAME) if the prefix can never be valid.
   */
  static int decodeLength(const char* data, size_t size, uint32_t* length);

  /** @brief Appends raw bytes read from the stream. */
  void push(const char* buf, size_t count) { partialMessage.append(buf, count); }
  void push(const string& s) { partialMessage.append(s); }

  /**
   * @brief Removes the next complete message from the buffer.
   * @return false when the buffer does not yet hold a whole message.
   * @throws ProtocolError (MALFORMED_FRAME) on an invalid or oversized length.
   */
  bool pop(string* message);

  size_t bufferedBytes() const { return partialMessage.length(); }

  void clear() { partialMessage.clear(); }

 protected:
  int64_t maxMessageLength;
  string partialMessage;
};
}  // namespace mrm

#endif  // __MRM_MESSAGE_FRAMER__

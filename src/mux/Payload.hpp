#ifndef __MRM_PAYLOAD__
#define __MRM_PAYLOAD__

#include "Headers.hpp"

namespace mrm {
/**
 * @brief A decoded envelope: either a typed message from the catalog or the
 * raw bytes of a tag the catalog does not know.
 */
class Payload {
 public:
  Payload() : tag(0) {}

  Payload(uint32_t _tag,
          shared_ptr<const google::protobuf::MessageLite> _message)
      : tag(_tag), message(_message) {}

  static Payload opaque(uint32_t tag, const string& bytes) {
    Payload p;
    p.tag = tag;
    p.opaqueBytes = bytes;
    return p;
  }

  uint32_t getTag() const { return tag; }

  bool isOpaque() const { return message.get() == NULL; }

  const string& getOpaqueBytes() const { return opaqueBytes; }

  shared_ptr<const google::protobuf::MessageLite> getMessage() const {
    return message;
  }

  /** @brief Identifier the peer used to correlate request and response. */
  const string& getIdentifier() const { return identifier; }
  void setIdentifier(const string& _identifier) { identifier = _identifier; }

  /** @brief True if the payload is a typed message of type `T`. */
  template <typename T>
  bool is() const {
    return message.get() != NULL &&
           message->GetTypeName() == T::default_instance().GetTypeName();
  }

  /**
   * @brief Returns the typed message.
   * @throws std::runtime_error if the payload is opaque or of another type.
   */
  template <typename T>
  const T& as() const {
    if (!is<T>()) {
      throw std::runtime_error(
          string("Payload for tag ") + to_string(tag) + " is " +
          (message.get() ? message->GetTypeName() : string("opaque")) +
          ", not " + T::default_instance().GetTypeName());
    }
    return static_cast<const T&>(*message);
  }

 protected:
  uint32_t tag;
  shared_ptr<const google::protobuf::MessageLite> message;
  string opaqueBytes;
  string identifier;
};
}  // namespace mrm

#endif  // __MRM_PAYLOAD__

#ifndef __MRM_MESSAGE_CATALOG__
#define __MRM_MESSAGE_CATALOG__

#include "Headers.hpp"
#include "ProtocolError.hpp"

namespace mrm {
/** @brief Parses payload bytes into a typed message or throws ProtocolError. */
typedef std::function<shared_ptr<google::protobuf::MessageLite>(const string&)>
    PayloadDecoder;
/** @brief Serializes a typed message into payload bytes. */
typedef std::function<string(const google::protobuf::MessageLite&)>
    PayloadEncoder;

struct CatalogEntry {
  uint32_t tag;
  string typeName;
  PayloadDecoder decode;
  PayloadEncoder encode;
};

/**
 * @brief Static table from envelope tag to the payload type it carries.
 *
 * Built once at startup and shared read-only by every connection.  Tags that
 * are not registered are still valid on the wire; they are carried as opaque
 * bytes.
 */
class MessageCatalog {
 public:
  MessageCatalog() {}

  /**
   * @brief Adds a payload kind.
   * @throws std::runtime_error if the tag is already registered.
   */
  void registerType(uint32_t tag, const string& typeName,
                    PayloadDecoder decoder, PayloadEncoder encoder);

  /**
   * @brief Registers protobuf message `T` under `tag`.
   *
   * The decoder rejects bytes that do not parse or leave a required field
   * unset, which includes required enums holding an unnumbered value.
   */
  template <typename T>
  void registerProto(uint32_t tag) {
    string typeName = T::default_instance().GetTypeName();
    registerType(
        tag, typeName,
        [typeName](const string& bytes)
            -> shared_ptr<google::protobuf::MessageLite> {
          shared_ptr<T> t(new T());
          if (!t->ParseFromString(bytes)) {
            throw ProtocolError(ProtocolErrorCode::MALFORMED_PAYLOAD,
                                string("Could not parse ") + typeName + " (" +
                                    to_string(bytes.length()) + " bytes)");
          }
          return t;
        },
        [](const google::protobuf::MessageLite& message) {
          string s;
          if (!message.IsInitialized() || !message.SerializeToString(&s)) {
            throw ProtocolError(
                ProtocolErrorCode::MALFORMED_PAYLOAD,
                string("Could not serialize ") + message.GetTypeName() +
                    ", missing: " + message.InitializationErrorString());
          }
          return s;
        });
  }

  /** @brief Returns the entry for `tag`, or NULL when the tag is unknown. */
  const CatalogEntry* find(uint32_t tag) const;

  bool contains(uint32_t tag) const { return find(tag) != NULL; }

  size_t size() const { return entries.size(); }

  /** @brief Human readable name for log lines. */
  string describe(uint32_t tag) const;

  /** @brief Builds the catalog of every payload kind this project knows. */
  static shared_ptr<MessageCatalog> createDefault();

 protected:
  map<uint32_t, CatalogEntry> entries;
};
}  // namespace mrm

#endif  // __MRM_MESSAGE_CATALOG__

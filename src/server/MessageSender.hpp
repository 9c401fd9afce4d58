#ifndef __MRM_MESSAGE_SENDER__
#define __MRM_MESSAGE_SENDER__

#include "Headers.hpp"
#include "UpdateInterestTracker.hpp"

namespace mrm {
/**
 * @brief Outbound half of the server, as seen by code that answers peers.
 */
class MessageSender {
 public:
  virtual ~MessageSender() {}

  /**
   * @brief Encodes and writes a message to one peer, fragmenting it when the
   * envelope is larger than the fragment size.
   * @return false if the peer is gone or the write failed.
   * @throws ProtocolError (UNKNOWN_TAG) if `tag` is not in the catalog.
   */
  virtual bool sendMessage(const string& peerId, uint32_t tag,
                           const google::protobuf::MessageLite& message,
                           const string& identifier = "") = 0;

  /** @brief True if the peer subscribed to `category`. */
  virtual bool isInterested(const string& peerId, UpdateCategory category) = 0;

  /**
   * @brief Sends a push update, but only if the peer subscribed to its
   * category.  Suppressed updates are dropped.
   * @return true if the message was written.
   */
  virtual bool pushNotification(const string& peerId, UpdateCategory category,
                                uint32_t tag,
                                const google::protobuf::MessageLite& message) {
    if (!isInterested(peerId, category)) {
      VLOG(2) << "Suppressed " << updateCategoryName(category)
              << " update for " << peerId;
      return false;
    }
    return sendMessage(peerId, tag, message);
  }

  virtual vector<string> getPeerIds() = 0;
};
}  // namespace mrm

#endif  // __MRM_MESSAGE_SENDER__

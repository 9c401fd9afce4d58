#ifndef __MRM_DEVICE_RESPONDER__
#define __MRM_DEVICE_RESPONDER__

#include "DeviceSetNegotiator.hpp"
#include "Headers.hpp"
#include "MessageSender.hpp"
#include "Payload.hpp"

namespace mrm {
/**
 * @brief The media device mrmuxd pretends to be.
 *
 * Answers requests that expect a reply (device info, heartbeats, commands),
 * keeps a small playback and volume state, and pushes the resulting updates
 * to peers that subscribed to them.
 */
class DeviceResponder {
 public:
  DeviceResponder(MessageSender* _sender, const DeviceInfoMessage& _deviceInfo);

  void onPayload(const string& peerId, const Payload& payload);
  void onDeviceSetChange(const string& peerId, const DeviceSetChange& change);

  PlaybackState getPlaybackState();
  float getVolume();

 protected:
  void handleCommand(const string& peerId, const Payload& payload);
  void handleSetVolume(const SetVolumeMessage& request);
  /** @brief Sends `message` to every peer subscribed to `category`. */
  void broadcast(UpdateCategory category, uint32_t tag,
                 const google::protobuf::MessageLite& message);

  MessageSender* sender;
  DeviceInfoMessage deviceInfo;
  std::mutex stateMutex;
  PlaybackState playbackState;
  float volume;
};
}  // namespace mrm

#endif  // __MRM_DEVICE_RESPONDER__

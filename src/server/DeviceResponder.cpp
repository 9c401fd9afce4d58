#include "DeviceResponder.hpp"

namespace mrm {
DeviceResponder::DeviceResponder(MessageSender* _sender,
                                 const DeviceInfoMessage& _deviceInfo)
    : sender(_sender),
      deviceInfo(_deviceInfo),
      playbackState(STOPPED),
      volume(0.5f) {}

void DeviceResponder::onPayload(const string& peerId, const Payload& payload) {
  if (payload.isOpaque()) {
    VLOG(1) << peerId << " sent opaque tag " << payload.getTag() << " ("
            << payload.getOpaqueBytes().length() << " bytes), ignoring";
    return;
  }
  switch (payload.getTag()) {
    case DEVICE_INFO_MESSAGE:
      LOG(INFO) << peerId << " is "
                << payload.as<DeviceInfoMessage>().unique_identifier();
      sender->sendMessage(peerId, DEVICE_INFO_MESSAGE, deviceInfo,
                          payload.getIdentifier());
      break;
    case GENERIC_MESSAGE:
      // Heartbeat: answer with the same message and identifier
      sender->sendMessage(peerId, GENERIC_MESSAGE, *(payload.getMessage()),
                          payload.getIdentifier());
      break;
    case SEND_COMMAND_MESSAGE:
      handleCommand(peerId, payload);
      break;
    case SET_VOLUME_MESSAGE:
      handleSetVolume(payload.as<SetVolumeMessage>());
      break;
    default:
      VLOG(2) << peerId << ": nothing to do for tag " << payload.getTag();
      break;
  }
}

void DeviceResponder::handleCommand(const string& peerId,
                                    const Payload& payload) {
  const SendCommandMessage& command = payload.as<SendCommandMessage>();
  SendCommandResultMessage result;
  PlaybackState newState;
  {
    lock_guard<std::mutex> guard(stateMutex);
    newState = playbackState;
    switch (command.command()) {
      case PLAY:
        newState = PLAYING;
        break;
      case PAUSE:
        newState = PAUSED;
        break;
      case TOGGLE_PLAY_PAUSE:
        newState = (playbackState == PLAYING) ? PAUSED : PLAYING;
        break;
      case STOP:
        newState = STOPPED;
        break;
      default:
        break;
    }
    playbackState = newState;
  }
  result.set_error_code(NO_ERROR);
  sender->sendMessage(peerId, SEND_COMMAND_RESULT_MESSAGE, result,
                      payload.getIdentifier());

  SetStateMessage state;
  state.set_playback_state(newState);
  state.set_display_name(deviceInfo.name());
  broadcast(UpdateCategory::NOW_PLAYING, SET_STATE_MESSAGE, state);
}

void DeviceResponder::handleSetVolume(const SetVolumeMessage& request) {
  float newVolume = max(0.0f, min(1.0f, request.volume()));
  {
    lock_guard<std::mutex> guard(stateMutex);
    volume = newVolume;
  }
  VolumeDidChangeMessage changed;
  changed.set_volume(newVolume);
  if (request.has_output_device_uid()) {
    changed.set_output_device_uid(request.output_device_uid());
  }
  broadcast(UpdateCategory::VOLUME, VOLUME_DID_CHANGE_MESSAGE, changed);
}

void DeviceResponder::onDeviceSetChange(const string& peerId,
                                        const DeviceSetChange& change) {
  if (!change.endpoint.delta.empty()) {
    UpdateOutputDeviceMessage update;
    for (const auto& id : change.endpoint.devices.getDevices()) {
      update.add_output_devices()->set_unique_identifier(id);
    }
    sender->pushNotification(peerId, UpdateCategory::OUTPUT_DEVICE,
                             UPDATE_OUTPUT_DEVICE_MESSAGE, update);
  }
  if (!change.cluster.delta.empty()) {
    UpdateOutputDeviceMessage update;
    update.set_cluster_aware(true);
    for (const auto& id : change.cluster.devices.getDevices()) {
      update.add_output_devices()->set_unique_identifier(id);
    }
    sender->pushNotification(peerId, UpdateCategory::OUTPUT_DEVICE,
                             UPDATE_OUTPUT_DEVICE_MESSAGE, update);
  }
}

void DeviceResponder::broadcast(UpdateCategory category, uint32_t tag,
                                const google::protobuf::MessageLite& message) {
  int sent = 0;
  for (const auto& peerId : sender->getPeerIds()) {
    if (sender->pushNotification(peerId, category, tag, message)) {
      sent++;
    }
  }
  VLOG(1) << "Pushed " << updateCategoryName(category) << " update to "
          << sent << " peers";
}

PlaybackState DeviceResponder::getPlaybackState() {
  lock_guard<std::mutex> guard(stateMutex);
  return playbackState;
}

float DeviceResponder::getVolume() {
  lock_guard<std::mutex> guard(stateMutex);
  return volume;
}
}  // namespace mrm

#include "UpdateInterestTracker.hpp"

namespace mrm {
const char* updateCategoryName(UpdateCategory category) {
  switch (category) {
    case UpdateCategory::ARTWORK:
      return "artwork";
    case UpdateCategory::NOW_PLAYING:
      return "now_playing";
    case UpdateCategory::VOLUME:
      return "volume";
    case UpdateCategory::KEYBOARD:
      return "keyboard";
    case UpdateCategory::OUTPUT_DEVICE:
      return "output_device";
  }
  return "unknown";
}

bool UpdateInterestSet::get(UpdateCategory category) const {
  switch (category) {
    case UpdateCategory::ARTWORK:
      return artwork;
    case UpdateCategory::NOW_PLAYING:
      return nowPlaying;
    case UpdateCategory::VOLUME:
      return volume;
    case UpdateCategory::KEYBOARD:
      return keyboard;
    case UpdateCategory::OUTPUT_DEVICE:
      return outputDevice;
  }
  return false;
}

UpdateInterestSet UpdateInterestTracker::apply(
    const ClientUpdatesConfigMessage& config) {
  lock_guard<std::mutex> guard(interestMutex);
  if (config.has_artwork_updates()) {
    interests.artwork = config.artwork_updates();
  }
  if (config.has_now_playing_updates()) {
    interests.nowPlaying = config.now_playing_updates();
  }
  if (config.has_volume_updates()) {
    interests.volume = config.volume_updates();
  }
  if (config.has_keyboard_updates()) {
    interests.keyboard = config.keyboard_updates();
  }
  if (config.has_output_device_updates()) {
    interests.outputDevice = config.output_device_updates();
  }
  VLOG(1) << "Interests now artwork=" << interests.artwork
          << " now_playing=" << interests.nowPlaying
          << " volume=" << interests.volume
          << " keyboard=" << interests.keyboard
          << " output_device=" << interests.outputDevice;
  return interests;
}

bool UpdateInterestTracker::isInterested(UpdateCategory category) {
  lock_guard<std::mutex> guard(interestMutex);
  return interests.get(category);
}

UpdateInterestSet UpdateInterestTracker::getInterests() {
  lock_guard<std::mutex> guard(interestMutex);
  return interests;
}

bool UpdateInterestTracker::categoryForTag(uint32_t tag,
                                           UpdateCategory* category) {
  switch (tag) {
    case SET_ARTWORK_MESSAGE:
      *category = UpdateCategory::ARTWORK;
      return true;
    case SET_STATE_MESSAGE:
      *category = UpdateCategory::NOW_PLAYING;
      return true;
    case VOLUME_DID_CHANGE_MESSAGE:
      *category = UpdateCategory::VOLUME;
      return true;
    case KEYBOARD_MESSAGE:
      *category = UpdateCategory::KEYBOARD;
      return true;
    case UPDATE_OUTPUT_DEVICE_MESSAGE:
      *category = UpdateCategory::OUTPUT_DEVICE;
      return true;
    default:
      return false;
  }
}
}  // namespace mrm

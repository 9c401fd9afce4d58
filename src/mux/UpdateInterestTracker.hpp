#ifndef __MRM_UPDATE_INTEREST_TRACKER__
#define __MRM_UPDATE_INTEREST_TRACKER__

#include "Headers.hpp"

namespace mrm {
enum class UpdateCategory {
  ARTWORK,
  NOW_PLAYING,
  VOLUME,
  KEYBOARD,
  OUTPUT_DEVICE,
};

const char* updateCategoryName(UpdateCategory category);

struct UpdateInterestSet {
  bool artwork;
  bool nowPlaying;
  bool volume;
  bool keyboard;
  bool outputDevice;

  UpdateInterestSet()
      : artwork(false),
        nowPlaying(false),
        volume(false),
        keyboard(false),
        outputDevice(false) {}

  bool get(UpdateCategory category) const;
};

/**
 * @brief Remembers which push categories a peer subscribed to.
 *
 * A fresh peer is subscribed to nothing.  Each ClientUpdatesConfigMessage only
 * changes the flags it carries.
 */
class UpdateInterestTracker {
 public:
  UpdateInterestTracker() {}

  UpdateInterestSet apply(const ClientUpdatesConfigMessage& config);

  bool isInterested(UpdateCategory category);

  UpdateInterestSet getInterests();

  /**
   * @brief Finds the category that gates messages with `tag`.
   * @return false if the tag is not a push notification.
   */
  static bool categoryForTag(uint32_t tag, UpdateCategory* category);

 protected:
  UpdateInterestSet interests;
  std::mutex interestMutex;
};
}  // namespace mrm

#endif  // __MRM_UPDATE_INTEREST_TRACKER__

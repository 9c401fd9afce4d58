#ifndef __MRM_DEVICE_SET_NEGOTIATOR__
#define __MRM_DEVICE_SET_NEGOTIATOR__

#include "Headers.hpp"

namespace mrm {
/**
 * @brief An ordered set of device identifiers.  Insertion order is kept so
 * replies list devices the way the peer named them.
 */
class DeviceSet {
 public:
  DeviceSet() {}
  DeviceSet(std::initializer_list<string> ids) {
    for (const auto& id : ids) {
      add(id);
    }
  }

  /** @return false if the device was already present. */
  bool add(const string& id);
  /** @return false if the device was not present. */
  bool remove(const string& id);
  bool contains(const string& id) const {
    return std::find(devices.begin(), devices.end(), id) != devices.end();
  }
  void clear() { devices.clear(); }

  size_t size() const { return devices.size(); }
  bool empty() const { return devices.empty(); }
  const vector<string>& getDevices() const { return devices; }

  /** @brief Devices not in `other`, in this set's order. */
  vector<string> difference(const DeviceSet& other) const;

  bool operator==(const DeviceSet& other) const;

 protected:
  vector<string> devices;
};

struct DeviceSetDelta {
  /** @brief True if the request replaced the whole set. */
  bool replaced;
  vector<string> added;
  vector<string> removed;

  DeviceSetDelta() : replaced(false) {}

  bool empty() const { return !replaced && added.empty() && removed.empty(); }
};

struct DeviceSetUpdate {
  DeviceSet devices;
  DeviceSetDelta delta;
};

struct DeviceSetChange {
  DeviceSetUpdate endpoint;
  DeviceSetUpdate cluster;
};

/**
 * @brief Applies ModifyOutputContextRequest messages to a peer's active
 * output devices.
 *
 * Within one list the order is setting (replace), then adding, then
 * removing.  The cluster-aware lists act on a separate cluster set with the
 * same rules.  When a replace happened the delta is measured against the
 * replaced set, otherwise against the set before the request.
 */
class DeviceSetNegotiator {
 public:
  DeviceSetNegotiator() {}

  DeviceSetChange apply(const ModifyOutputContextRequestMessage& request);

  DeviceSet getEndpointDevices();
  DeviceSet getClusterDevices();

 protected:
  static DeviceSetUpdate applyLists(
      DeviceSet* devices,
      const google::protobuf::RepeatedPtrField<string>& setting,
      const google::protobuf::RepeatedPtrField<string>& adding,
      const google::protobuf::RepeatedPtrField<string>& removing);

  DeviceSet endpointDevices;
  DeviceSet clusterDevices;
  std::mutex deviceMutex;
};
}  // namespace mrm

#endif  // __MRM_DEVICE_SET_NEGOTIATOR__

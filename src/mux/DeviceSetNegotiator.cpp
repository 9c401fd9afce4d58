#include "DeviceSetNegotiator.hpp"

namespace mrm {
bool DeviceSet::add(const string& id) {
  if (contains(id)) {
    return false;
  }
  devices.push_back(id);
  return true;
}

bool DeviceSet::remove(const string& id) {
  auto it = std::find(devices.begin(), devices.end(), id);
  if (it == devices.end()) {
    return false;
  }
  devices.erase(it);
  return true;
}

vector<string> DeviceSet::difference(const DeviceSet& other) const {
  vector<string> result;
  for (const auto& id : devices) {
    if (!other.contains(id)) {
      result.push_back(id);
    }
  }
  return result;
}

bool DeviceSet::operator==(const DeviceSet& other) const {
  if (devices.size() != other.devices.size()) {
    return false;
  }
  for (const auto& id : devices) {
    if (!other.contains(id)) {
      return false;
    }
  }
  return true;
}

DeviceSetUpdate DeviceSetNegotiator::applyLists(
    DeviceSet* devices,
    const google::protobuf::RepeatedPtrField<string>& setting,
    const google::protobuf::RepeatedPtrField<string>& adding,
    const google::protobuf::RepeatedPtrField<string>& removing) {
  DeviceSetUpdate update;
  DeviceSet base = *devices;
  // Repeated fields have no presence, so an empty setting list means no
  // replace rather than "replace with nothing"
  if (!setting.empty()) {
    update.delta.replaced = true;
    devices->clear();
    for (const auto& id : setting) {
      devices->add(id);
    }
    base = *devices;
  }
  for (const auto& id : adding) {
    devices->add(id);
  }
  for (const auto& id : removing) {
    devices->remove(id);
  }
  update.delta.added = devices->difference(base);
  update.delta.removed = base.difference(*devices);
  update.devices = *devices;
  return update;
}

DeviceSetChange DeviceSetNegotiator::apply(
    const ModifyOutputContextRequestMessage& request) {
  lock_guard<std::mutex> guard(deviceMutex);
  DeviceSetChange change;
  change.endpoint =
      applyLists(&endpointDevices, request.setting_devices(),
                 request.adding_devices(), request.removing_devices());
  change.cluster = applyLists(&clusterDevices,
                              request.cluster_aware_setting_devices(),
                              request.cluster_aware_adding_devices(),
                              request.cluster_aware_removing_devices());
  VLOG(1) << "Output devices: " << endpointDevices.size() << " endpoint (+"
          << change.endpoint.delta.added.size() << "/-"
          << change.endpoint.delta.removed.size() << "), "
          << clusterDevices.size() << " cluster (+"
          << change.cluster.delta.added.size() << "/-"
          << change.cluster.delta.removed.size() << ")";
  return change;
}

DeviceSet DeviceSetNegotiator::getEndpointDevices() {
  lock_guard<std::mutex> guard(deviceMutex);
  return endpointDevices;
}

DeviceSet DeviceSetNegotiator::getClusterDevices() {
  lock_guard<std::mutex> guard(deviceMutex);
  return clusterDevices;
}
}  // namespace mrm

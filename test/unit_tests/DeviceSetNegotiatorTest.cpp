#include "DeviceSetNegotiator.hpp"

#include "TestHeaders.hpp"

using namespace mrm;

TEST_CASE("DeviceSetNegotiator applies requests", "[DeviceSetNegotiator]") {
  DeviceSetNegotiator negotiator;

  SECTION("Replace then add") {
    ModifyOutputContextRequestMessage request;
    request.add_setting_devices("A");
    request.add_setting_devices("B");
    request.add_adding_devices("C");
    DeviceSetChange change = negotiator.apply(request);

    REQUIRE(change.endpoint.devices.getDevices() ==
            vector<string>({"A", "B", "C"}));
    REQUIRE(change.endpoint.delta.replaced);
    REQUIRE(change.endpoint.delta.added == vector<string>({"C"}));
    REQUIRE(change.endpoint.delta.removed.empty());
    REQUIRE(change.cluster.delta.empty());
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"A", "B", "C"}));
  }

  SECTION("Adds and removes are idempotent") {
    ModifyOutputContextRequestMessage first;
    first.add_adding_devices("A");
    first.add_adding_devices("B");
    first.add_adding_devices("A");
    DeviceSetChange change = negotiator.apply(first);
    REQUIRE(change.endpoint.devices.size() == 2);
    REQUIRE_FALSE(change.endpoint.delta.replaced);
    REQUIRE(change.endpoint.delta.added == vector<string>({"A", "B"}));

    ModifyOutputContextRequestMessage again;
    again.add_adding_devices("B");
    again.add_removing_devices("Z");
    change = negotiator.apply(again);
    REQUIRE(change.endpoint.delta.empty());
    REQUIRE(change.endpoint.devices.size() == 2);

    ModifyOutputContextRequestMessage remove;
    remove.add_removing_devices("A");
    remove.add_removing_devices("A");
    change = negotiator.apply(remove);
    REQUIRE(change.endpoint.delta.removed == vector<string>({"A"}));
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"B"}));
  }

  SECTION("Replace is measured against the replaced set") {
    ModifyOutputContextRequestMessage first;
    first.add_adding_devices("A");
    negotiator.apply(first);

    ModifyOutputContextRequestMessage replace;
    replace.add_setting_devices("X");
    replace.add_setting_devices("Y");
    replace.add_removing_devices("Y");
    DeviceSetChange change = negotiator.apply(replace);
    REQUIRE(change.endpoint.delta.replaced);
    REQUIRE(change.endpoint.delta.added.empty());
    REQUIRE(change.endpoint.delta.removed == vector<string>({"Y"}));
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"X"}));
  }

  SECTION("Cluster set is independent") {
    ModifyOutputContextRequestMessage request;
    request.add_adding_devices("A");
    request.add_cluster_aware_setting_devices("K1");
    request.add_cluster_aware_adding_devices("K2");
    DeviceSetChange change = negotiator.apply(request);
    REQUIRE(change.cluster.delta.replaced);
    REQUIRE(change.cluster.delta.added == vector<string>({"K2"}));
    REQUIRE(negotiator.getClusterDevices() == DeviceSet({"K1", "K2"}));
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"A"}));

    ModifyOutputContextRequestMessage removeCluster;
    removeCluster.add_cluster_aware_removing_devices("K1");
    removeCluster.add_cluster_aware_removing_devices("A");
    negotiator.apply(removeCluster);
    REQUIRE(negotiator.getClusterDevices() == DeviceSet({"K2"}));
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"A"}));
  }

  SECTION("An empty setting list does not clear the set") {
    ModifyOutputContextRequestMessage fill;
    fill.add_adding_devices("A");
    fill.add_adding_devices("B");
    negotiator.apply(fill);

    ModifyOutputContextRequestMessage empty;
    DeviceSetChange change = negotiator.apply(empty);
    REQUIRE_FALSE(change.endpoint.delta.replaced);
    REQUIRE(change.endpoint.delta.empty());
    REQUIRE(negotiator.getEndpointDevices() == DeviceSet({"A", "B"}));

    ModifyOutputContextRequestMessage clear;
    clear.add_removing_devices("A");
    clear.add_removing_devices("B");
    change = negotiator.apply(clear);
    REQUIRE(negotiator.getEndpointDevices().empty());
    REQUIRE(change.endpoint.delta.removed == vector<string>({"A", "B"}));
  }

  SECTION("Insertion order is kept") {
    ModifyOutputContextRequestMessage request;
    request.add_adding_devices("Z");
    request.add_adding_devices("M");
    request.add_adding_devices("A");
    negotiator.apply(request);
    REQUIRE(negotiator.getEndpointDevices().getDevices() ==
            vector<string>({"Z", "M", "A"}));
  }
}

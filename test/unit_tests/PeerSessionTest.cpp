#include "PeerSession.hpp"

#include "TestHeaders.hpp"
#include "TransactionFragmenter.hpp"

using namespace mrm;

namespace {
class RecordingSession {
 public:
  RecordingSession()
      : codec(MessageCatalog::createDefault()),
        session("peer-test", MessageCatalog::createDefault()) {
    session.setPayloadHandler(
        [this](const string& peerId, const Payload& payload) {
          REQUIRE(peerId == "peer-test");
          delivered.push_back(payload);
        });
    session.setDeviceSetHandler(
        [this](const string& peerId, const DeviceSetChange& change) {
          deviceChanges.push_back(change);
        });
  }

  bool send(uint32_t tag, const google::protobuf::MessageLite& message,
            const string& identifier = "") {
    return session.handleFrame(
        protoToString(codec.encode(tag, message, identifier)));
  }

  EnvelopeCodec codec;
  PeerSession session;
  vector<Payload> delivered;
  vector<DeviceSetChange> deviceChanges;
};

// Wraps an envelope into a single-packet transaction envelope
ProtocolEnvelope wrapInTransaction(const ProtocolEnvelope& inner) {
  TransactionFragmenter fragmenter(DEFAULT_MAX_FRAGMENT_SIZE);
  vector<ProtocolEnvelope> envelopes = fragmenter.split(protoToString(inner));
  REQUIRE(envelopes.size() == 1);
  return envelopes[0];
}
}  // namespace

TEST_CASE("PeerSession delivers whole messages", "[PeerSession]") {
  RecordingSession r;

  SECTION("Typed payloads keep their identifier") {
    SendCommandMessage command;
    command.set_command(PLAY);
    REQUIRE(r.send(SEND_COMMAND_MESSAGE, command, "cmd-1"));
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].getTag() == SEND_COMMAND_MESSAGE);
    REQUIRE(r.delivered[0].getIdentifier() == "cmd-1");
    REQUIRE(r.delivered[0].as<SendCommandMessage>().command() == PLAY);
  }

  SECTION("Unknown tags are delivered opaque") {
    REQUIRE(r.session.handleFrame(
        protoToString(r.codec.encodeOpaque(1234, "blob"))));
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].isOpaque());
    REQUIRE(r.delivered[0].getOpaqueBytes() == "blob");
  }

  SECTION("Malformed payloads are dropped and counted") {
    REQUIRE_FALSE(r.session.handleFrame(
        protoToString(r.codec.encodeOpaque(SET_VOLUME_MESSAGE, ""))));
    REQUIRE_FALSE(r.session.handleFrame("\xff"));
    REQUIRE(r.delivered.empty());
    REQUIRE(r.session.getProtocolViolations() == 2);

    // The session keeps working
    GenericMessage heartbeat;
    REQUIRE(r.send(GENERIC_MESSAGE, heartbeat, "hb"));
    REQUIRE(r.delivered.size() == 1);
  }

  SECTION("Handler failures are not counted against the peer") {
    int calls = 0;
    r.session.setPayloadHandler(
        [&calls](const string& peerId, const Payload& payload) {
          calls++;
          if (calls == 1) {
            throw ProtocolError(ProtocolErrorCode::UNKNOWN_TAG,
                                "no encoder for reply");
          }
          throw std::out_of_range("reply table");
        });
    GenericMessage heartbeat;
    REQUIRE(r.send(GENERIC_MESSAGE, heartbeat, "hb-1"));
    REQUIRE(r.send(GENERIC_MESSAGE, heartbeat, "hb-2"));
    REQUIRE(calls == 2);
    REQUIRE(r.session.getProtocolViolations() == 0);
    REQUIRE_FALSE(r.session.isClosed());
  }

  SECTION("Device handler failures still deliver the request") {
    r.session.setDeviceSetHandler(
        [](const string& peerId, const DeviceSetChange& change) {
          throw ProtocolError(ProtocolErrorCode::MALFORMED_PAYLOAD,
                              "cannot encode device update");
        });
    ModifyOutputContextRequestMessage request;
    request.add_adding_devices("A");
    REQUIRE(r.send(MODIFY_OUTPUT_CONTEXT_REQUEST_MESSAGE, request));
    REQUIRE(r.session.getProtocolViolations() == 0);
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.session.getDeviceSetNegotiator().getEndpointDevices() ==
            DeviceSet({"A"}));
  }

  SECTION("Subscriptions update the tracker and are delivered") {
    ClientUpdatesConfigMessage config;
    config.set_now_playing_updates(true);
    REQUIRE(r.send(CLIENT_UPDATES_CONFIG_MESSAGE, config));
    REQUIRE(r.session.getInterestTracker().isInterested(
        UpdateCategory::NOW_PLAYING));
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].getTag() == CLIENT_UPDATES_CONFIG_MESSAGE);
  }

  SECTION("Device requests reach the negotiator and the device handler") {
    ModifyOutputContextRequestMessage request;
    request.add_setting_devices("A");
    request.add_adding_devices("B");
    REQUIRE(r.send(MODIFY_OUTPUT_CONTEXT_REQUEST_MESSAGE, request));
    REQUIRE(r.deviceChanges.size() == 1);
    REQUIRE(r.deviceChanges[0].endpoint.devices == DeviceSet({"A", "B"}));
    REQUIRE(r.session.getDeviceSetNegotiator().getEndpointDevices() ==
            DeviceSet({"A", "B"}));
    REQUIRE(r.delivered.size() == 1);
  }
}

TEST_CASE("PeerSession reassembles transactions", "[PeerSession]") {
  RecordingSession r;
  SetArtworkMessage artwork;
  artwork.set_jpeg_data(string(100, '\x42'));
  artwork.set_identifier("cover");
  ProtocolEnvelope inner = r.codec.encode(SET_ARTWORK_MESSAGE, artwork, "art");
  TransactionFragmenter fragmenter(8);

  SECTION("Fragments deliver one assembled message") {
    vector<ProtocolEnvelope> fragments =
        fragmenter.split(protoToString(inner), "content-1");
    REQUIRE(fragments.size() > 1);
    for (const auto& fragment : fragments) {
      REQUIRE(r.session.handleFrame(protoToString(fragment)));
    }
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].getTag() == SET_ARTWORK_MESSAGE);
    REQUIRE(r.delivered[0].getIdentifier() == "art");
    REQUIRE(r.delivered[0].as<SetArtworkMessage>().jpeg_data() ==
            artwork.jpeg_data());
    REQUIRE(r.session.getReassembler().pendingCount() == 0);
  }

  SECTION("Content identifier fills in a missing envelope identifier") {
    ProtocolEnvelope anonymous = r.codec.encode(SET_ARTWORK_MESSAGE, artwork);
    for (const auto& fragment :
         fragmenter.split(protoToString(anonymous), "content-2")) {
      r.session.handleFrame(protoToString(fragment));
    }
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].getIdentifier() == "content-2");
  }

  SECTION("Classified fragments are accepted directly") {
    string blob = protoToString(inner);
    TransactionKeyId key("xfer-1", "");
    size_t third = blob.length() / 3;
    REQUIRE(r.session.handleFragment(TransactionFragment(
        key, blob.substr(third), blob.length(), third)));
    REQUIRE(r.delivered.empty());
    REQUIRE(r.session.handleFragment(
        TransactionFragment(key, blob.substr(0, third), blob.length(), 0)));
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.delivered[0].is<SetArtworkMessage>());
  }

  SECTION("Length mismatch is a violation") {
    string blob = protoToString(inner);
    TransactionKeyId key("bad", "");
    REQUIRE(r.session.handleFragment(
        TransactionFragment(key, blob.substr(0, 4), blob.length(), 0)));
    REQUIRE_FALSE(r.session.handleFragment(
        TransactionFragment(key, blob.substr(4, 4), blob.length() + 1, 4)));
    REQUIRE(r.session.getProtocolViolations() == 1);
    REQUIRE(r.session.getReassembler().pendingCount() == 0);
    REQUIRE(r.delivered.empty());
  }

  SECTION("Peers can cancel a transaction") {
    vector<ProtocolEnvelope> fragments =
        fragmenter.split(protoToString(inner));
    REQUIRE(r.session.handleFrame(protoToString(fragments[0])));
    REQUIRE(r.session.getReassembler().pendingCount() == 1);

    TransactionMessage first =
        stringToProto<TransactionMessage>(fragments[0].payload());
    TransactionCancelMessage cancel;
    *(cancel.mutable_key()) = first.packets().packets(0).key();
    REQUIRE(r.send(TRANSACTION_CANCEL_MESSAGE, cancel));
    REQUIRE(r.session.getReassembler().pendingCount() == 0);
    REQUIRE(r.delivered.empty());
  }

  SECTION("Idle transactions expire") {
    vector<ProtocolEnvelope> fragments =
        fragmenter.split(protoToString(inner));
    r.session.handleFrame(protoToString(fragments[0]));
    auto later = TransactionReassembler::Clock::now() +
                 r.session.getConfig().transactionTtl +
                 std::chrono::seconds(1);
    REQUIRE(r.session.expireTransactions(later).size() == 1);
    REQUIRE(r.session.getReassembler().bufferedBytes() == 0);
  }

  SECTION("Nesting is limited") {
    ProtocolEnvelope nested = inner;
    for (int i = 0; i < MAX_ENVELOPE_DEPTH; i++) {
      nested = wrapInTransaction(nested);
    }
    REQUIRE(r.session.handleFrame(protoToString(nested)));
    REQUIRE(r.delivered.size() == 1);

    nested = wrapInTransaction(nested);
    REQUIRE_FALSE(r.session.handleFrame(protoToString(nested)));
    REQUIRE(r.delivered.size() == 1);
    REQUIRE(r.session.getProtocolViolations() == 1);
  }

  SECTION("Closed sessions drop state and ignore input") {
    vector<ProtocolEnvelope> fragments =
        fragmenter.split(protoToString(inner));
    r.session.handleFrame(protoToString(fragments[0]));
    r.session.close();
    REQUIRE(r.session.isClosed());
    REQUIRE(r.session.getReassembler().pendingCount() == 0);
    REQUIRE_FALSE(r.session.handleFrame(protoToString(fragments[1])));
  }
}

#include "TransactionReassembler.hpp"

#include "TestHeaders.hpp"

using namespace mrm;

namespace {
TransactionFragment makeFragment(const string& id, const string& bytes,
                                 uint64_t total, uint64_t position) {
  return TransactionFragment(TransactionKeyId(id, ""), bytes, total, position);
}

void requireError(TransactionReassembler* reassembler,
                  const TransactionFragment& fragment,
                  ProtocolErrorCode expected) {
  try {
    reassembler->submit(fragment);
    FAIL("Expected a ProtocolError");
  } catch (const ProtocolError& pe) {
    REQUIRE(pe.getCode() == expected);
  }
}
}  // namespace

TEST_CASE("Out of order fragments reassemble", "[TransactionReassembler]") {
  TransactionReassembler reassembler;
  TransactionKeyId key("xfer-1", "");

  ReassemblyOutcome outcome =
      reassembler.submit(makeFragment("xfer-1", "def", 9, 3));
  REQUIRE_FALSE(outcome.complete);
  REQUIRE(reassembler.getContiguousPosition(key) == 0);

  outcome = reassembler.submit(makeFragment("xfer-1", "abc", 9, 0));
  REQUIRE_FALSE(outcome.complete);
  REQUIRE(reassembler.getContiguousPosition(key) == 6);
  REQUIRE(reassembler.pendingCount() == 1);

  outcome = reassembler.submit(makeFragment("xfer-1", "ghi", 9, 6));
  REQUIRE(outcome.complete);
  REQUIRE(outcome.key == key);
  REQUIRE(outcome.blob == "abcdefghi");
  REQUIRE(reassembler.pendingCount() == 0);
  REQUIRE_FALSE(reassembler.contains(key));
  REQUIRE(reassembler.getContiguousPosition(key) == -1);
}

TEST_CASE("Every arrival order yields the same blob",
          "[TransactionReassembler]") {
  const string expected = "abcdefghijkl";
  vector<uint64_t> positions = {0, 3, 6, 9};
  int orders = 0;
  do {
    TransactionReassembler reassembler;
    ReassemblyOutcome outcome;
    for (size_t i = 0; i < positions.size(); i++) {
      outcome = reassembler.submit(makeFragment(
          "xfer-1", expected.substr(positions[i], 3), expected.length(),
          positions[i]));
      REQUIRE(outcome.complete == (i + 1 == positions.size()));
    }
    REQUIRE(outcome.blob == expected);
    REQUIRE(reassembler.pendingCount() == 0);
    orders++;
  } while (std::next_permutation(positions.begin(), positions.end()));
  REQUIRE(orders == 24);
}

TEST_CASE("Reassembly edge cases", "[TransactionReassembler]") {
  TransactionReassembler reassembler(64);
  TransactionKeyId key("t", "");

  SECTION("A single fragment covering everything completes at once") {
    ReassemblyOutcome outcome =
        reassembler.submit(makeFragment("t", "whole", 5, 0));
    REQUIRE(outcome.complete);
    REQUIRE(outcome.blob == "whole");
  }

  SECTION("A zero length transaction completes at once") {
    ReassemblyOutcome outcome = reassembler.submit(makeFragment("t", "", 0, 0));
    REQUIRE(outcome.complete);
    REQUIRE(outcome.blob.empty());
    REQUIRE(reassembler.pendingCount() == 0);
  }

  SECTION("Keys with different user data are different transactions") {
    reassembler.submit(
        TransactionFragment(TransactionKeyId("t", "a"), "x", 2, 0));
    reassembler.submit(
        TransactionFragment(TransactionKeyId("t", "b"), "y", 2, 0));
    REQUIRE(reassembler.pendingCount() == 2);
    ReassemblyOutcome outcome = reassembler.submit(
        TransactionFragment(TransactionKeyId("t", "a"), "z", 2, 1));
    REQUIRE(outcome.complete);
    REQUIRE(outcome.blob == "xz");
    REQUIRE(reassembler.contains(TransactionKeyId("t", "b")));
  }

  SECTION("Mismatched total length discards the transaction") {
    reassembler.submit(makeFragment("t", "abc", 9, 0));
    requireError(&reassembler, makeFragment("t", "def", 10, 3),
                 ProtocolErrorCode::TOTAL_LENGTH_MISMATCH);
    REQUIRE_FALSE(reassembler.contains(key));
    REQUIRE(reassembler.bufferedBytes() == 0);
  }

  SECTION("Duplicate fragments are no-ops") {
    reassembler.submit(makeFragment("t", "abc", 9, 0));
    ReassemblyOutcome outcome =
        reassembler.submit(makeFragment("t", "abc", 9, 0));
    REQUIRE_FALSE(outcome.complete);
    REQUIRE(reassembler.getContiguousPosition(key) == 3);
    reassembler.submit(makeFragment("t", "def", 9, 3));
    outcome = reassembler.submit(makeFragment("t", "ghi", 9, 6));
    REQUIRE(outcome.complete);
    REQUIRE(outcome.blob == "abcdefghi");
  }

  SECTION("Overlap with matching bytes is accepted") {
    reassembler.submit(makeFragment("t", "abcd", 9, 0));
    reassembler.submit(makeFragment("t", "cdef", 9, 2));
    REQUIRE(reassembler.getContiguousPosition(key) == 6);
  }

  SECTION("Overlap with different bytes is a conflict") {
    reassembler.submit(makeFragment("t", "abc", 9, 0));
    requireError(&reassembler, makeFragment("t", "bX", 9, 1),
                 ProtocolErrorCode::CONFLICTING_FRAGMENT);
    REQUIRE_FALSE(reassembler.contains(key));
  }

  SECTION("Fragments past the declared end are out of bounds") {
    requireError(&reassembler, makeFragment("t", "abc", 9, 8),
                 ProtocolErrorCode::FRAGMENT_OUT_OF_BOUNDS);
    REQUIRE(reassembler.pendingCount() == 0);

    reassembler.submit(makeFragment("t", "abc", 9, 0));
    requireError(&reassembler, makeFragment("t", "x", 9, 10),
                 ProtocolErrorCode::FRAGMENT_OUT_OF_BOUNDS);
    REQUIRE_FALSE(reassembler.contains(key));
  }

  SECTION("Declared lengths above the limit are out of bounds") {
    requireError(&reassembler, makeFragment("t", "abc", 65, 0),
                 ProtocolErrorCode::FRAGMENT_OUT_OF_BOUNDS);
    REQUIRE(reassembler.bufferedBytes() == 0);
  }

  SECTION("Cancel discards the transaction") {
    reassembler.submit(makeFragment("t", "abc", 9, 0));
    REQUIRE(reassembler.cancel(key));
    REQUIRE_FALSE(reassembler.cancel(key));
    REQUIRE(reassembler.pendingCount() == 0);
    // A new transaction under the same key starts from scratch
    ReassemblyOutcome outcome =
        reassembler.submit(makeFragment("t", "xy", 2, 0));
    REQUIRE(outcome.complete);
    REQUIRE(outcome.blob == "xy");
  }

  SECTION("Clear discards everything") {
    reassembler.submit(makeFragment("a", "abc", 9, 0));
    reassembler.submit(makeFragment("b", "abc", 9, 0));
    reassembler.clear();
    REQUIRE(reassembler.pendingCount() == 0);
    REQUIRE(reassembler.bufferedBytes() == 0);
  }
}

TEST_CASE("Idle transactions expire", "[TransactionReassembler]") {
  typedef TransactionReassembler::Clock Clock;
  TransactionReassembler reassembler;
  Clock::time_point start = Clock::now();
  std::chrono::seconds ttl(10);

  reassembler.submit(makeFragment("slow", "abc", 9, 0), start);
  reassembler.submit(makeFragment("stalled", "abc", 9, 0), start);
  REQUIRE(reassembler.bufferedBytes() >= 18);

  REQUIRE(reassembler.expire(start + std::chrono::seconds(5), ttl).empty());

  // Traffic on "slow" keeps it alive
  reassembler.submit(makeFragment("slow", "def", 9, 3),
                     start + std::chrono::seconds(8));

  vector<TransactionKeyId> expired =
      reassembler.expire(start + std::chrono::seconds(15), ttl);
  REQUIRE(expired.size() == 1);
  REQUIRE(expired[0] == TransactionKeyId("stalled", ""));
  REQUIRE(reassembler.contains(TransactionKeyId("slow", "")));

  expired = reassembler.expire(start + std::chrono::seconds(30), ttl);
  REQUIRE(expired.size() == 1);
  REQUIRE(reassembler.pendingCount() == 0);
  REQUIRE(reassembler.bufferedBytes() == 0);
}

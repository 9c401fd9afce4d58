#ifndef __MRM_TRANSACTION_REASSEMBLER__
#define __MRM_TRANSACTION_REASSEMBLER__

#include "Headers.hpp"
#include "ProtocolError.hpp"

namespace mrm {
/**
 * @brief Value form of a TransactionKey, usable as a map key.
 *
 * Two keys are equal only if both the identifier and the user data match.
 */
struct TransactionKeyId {
  string identifier;
  string userData;

  TransactionKeyId() {}
  TransactionKeyId(const string& _identifier, const string& _userData)
      : identifier(_identifier), userData(_userData) {}
  explicit TransactionKeyId(const TransactionKey& key)
      : identifier(key.identifier()), userData(key.user_data()) {}

  TransactionKey toProto() const {
    TransactionKey key;
    key.set_identifier(identifier);
    key.set_user_data(userData);
    return key;
  }

  bool operator<(const TransactionKeyId& other) const {
    if (identifier != other.identifier) {
      return identifier < other.identifier;
    }
    return userData < other.userData;
  }

  bool operator==(const TransactionKeyId& other) const {
    return identifier == other.identifier && userData == other.userData;
  }

  bool operator!=(const TransactionKeyId& other) const {
    return !(*this == other);
  }
};

inline std::ostream& operator<<(std::ostream& os, const TransactionKeyId& key) {
  os << key.identifier;
  if (!key.userData.empty()) {
    os << "/" << hexDump(key.userData, 8);
  }
  return os;
}

/** @brief One positional slice of a transaction. */
struct TransactionFragment {
  TransactionKeyId key;
  string bytes;
  uint64_t totalLength;
  uint64_t writePosition;
  /** @brief Content identifier the sender attached, if any. */
  string contentIdentifier;

  TransactionFragment() : totalLength(0), writePosition(0) {}
  TransactionFragment(const TransactionKeyId& _key, const string& _bytes,
                      uint64_t _totalLength, uint64_t _writePosition)
      : key(_key),
        bytes(_bytes),
        totalLength(_totalLength),
        writePosition(_writePosition) {}

  static TransactionFragment fromPacket(const TransactionPacket& packet) {
    TransactionFragment fragment(TransactionKeyId(packet.key()),
                                 packet.packet_data(), packet.total_length(),
                                 packet.total_write_position());
    fragment.contentIdentifier = packet.identifier();
    return fragment;
  }
};

struct ReassemblyOutcome {
  bool complete;
  TransactionKeyId key;
  /** @brief The assembled bytes; empty unless complete. */
  string blob;
  string contentIdentifier;

  ReassemblyOutcome() : complete(false) {}
};

/**
 * @brief Collects transaction fragments until every byte of the declared
 * total length has been written, then hands back the assembled blob.
 *
 * Writes are positional, so fragments may arrive in any order.  A
 * transaction is discarded (and its buffer freed) when it completes, when a
 * fragment violates the protocol, when it is cancelled, or when it sees no
 * traffic for longer than the TTL passed to expire().  All methods are
 * serialized by one mutex.
 */
class TransactionReassembler {
 public:
  typedef std::chrono::steady_clock Clock;

  explicit TransactionReassembler(
      uint64_t _maxTotalLength = DEFAULT_MAX_MESSAGE_LENGTH)
      : maxTotalLength(_maxTotalLength) {}

  /**
   * @brief Writes one fragment into its transaction.
   * @return A complete outcome carrying the blob once the last gap is filled,
   * a pending outcome otherwise.
   * @throws ProtocolError (TOTAL_LENGTH_MISMATCH, CONFLICTING_FRAGMENT,
   * FRAGMENT_OUT_OF_BOUNDS); the transaction is discarded before throwing.
   */
  ReassemblyOutcome submit(const TransactionFragment& fragment) {
    return submit(fragment, Clock::now());
  }
  ReassemblyOutcome submit(const TransactionFragment& fragment,
                           Clock::time_point now);

  /**
   * @brief Aborts every transaction idle for longer than `ttl`.
   * @return Keys of the evicted transactions.
   */
  vector<TransactionKeyId> expire(Clock::time_point now, Clock::duration ttl);

  /** @brief Discards a transaction on request of the peer. */
  bool cancel(const TransactionKeyId& key);

  /** @brief Discards every transaction (connection teardown). */
  void clear();

  int pendingCount();
  bool contains(const TransactionKeyId& key);
  /** @brief Sum of the buffers held by in-flight transactions. */
  uint64_t bufferedBytes();
  /**
   * @brief End of the filled prefix of a transaction's buffer, or -1 if the
   * transaction is not in flight.
   */
  int64_t getContiguousPosition(const TransactionKeyId& key);

 protected:
  struct ReassemblyState {
    string buffer;
    /** @brief Disjoint, non-adjacent filled ranges: start -> end. */
    map<uint64_t, uint64_t> filled;
    uint64_t contiguousPosition;
    Clock::time_point createdAt;
    Clock::time_point lastActivity;
    string contentIdentifier;
  };

  /** @brief Throws CONFLICTING_FRAGMENT if the fragment rewrites bytes. */
  void checkOverlap(const TransactionKeyId& key, const ReassemblyState& state,
                    const TransactionFragment& fragment);
  /** @brief Copies the fragment into the buffer and updates the ranges. */
  void write(ReassemblyState* state, const TransactionFragment& fragment);
  void abort(const TransactionKeyId& key, ProtocolErrorCode code,
             const string& message);

  uint64_t maxTotalLength;
  map<TransactionKeyId, shared_ptr<ReassemblyState>> transactions;
  std::mutex reassemblyMutex;
};
}  // namespace mrm

#endif  // __MRM_TRANSACTION_REASSEMBLER__

#ifndef __MRM_TRANSACTION_FRAGMENTER__
#define __MRM_TRANSACTION_FRAGMENTER__

#include "Headers.hpp"
#include "TransactionReassembler.hpp"

namespace mrm {
/**
 * @brief Sender side of a transaction: cuts a blob into TRANSACTION_MESSAGE
 * envelopes of at most `maxFragmentSize` payload bytes each.
 */
class TransactionFragmenter {
 public:
  explicit TransactionFragmenter(
      size_t _maxFragmentSize = DEFAULT_MAX_FRAGMENT_SIZE);

  /**
   * @brief Splits `blob` under a freshly generated key.
   * @return Envelopes whose packets cover [0, blob.length()) in order.
   */
  vector<ProtocolEnvelope> split(const string& blob,
                                 const string& contentIdentifier = "") const {
    return split(blob, generateKey(), contentIdentifier);
  }

  vector<ProtocolEnvelope> split(const string& blob,
                                 const TransactionKeyId& key,
                                 const string& contentIdentifier) const;

  bool needsSplitting(size_t length) const { return length > maxFragmentSize; }

  size_t getMaxFragmentSize() const { return maxFragmentSize; }

  static TransactionKeyId generateKey() {
    return TransactionKeyId(genRandomAlphaNum(TRANSACTION_IDENTIFIER_LENGTH),
                            "");
  }

 protected:
  size_t maxFragmentSize;
};
}  // namespace mrm

#endif  // __MRM_TRANSACTION_FRAGMENTER__

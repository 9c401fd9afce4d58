#ifndef __MRM_PROTOCOL_ERROR__
#define __MRM_PROTOCOL_ERROR__

#include "Headers.hpp"

namespace mrm {
enum class ProtocolErrorCode {
  UNKNOWN_TAG,
  MALFORMED_PAYLOAD,
  MALFORMED_FRAME,
  TOTAL_LENGTH_MISMATCH,
  CONFLICTING_FRAGMENT,
  FRAGMENT_OUT_OF_BOUNDS,
  REASSEMBLY_TIMEOUT,
};

inline const char* protocolErrorName(ProtocolErrorCode code) {
  switch (code) {
    case ProtocolErrorCode::UNKNOWN_TAG:
      return "UnknownTag";
    case ProtocolErrorCode::MALFORMED_PAYLOAD:
      return "MalformedPayload";
    case ProtocolErrorCode::MALFORMED_FRAME:
      return "MalformedFrame";
    case ProtocolErrorCode::TOTAL_LENGTH_MISMATCH:
      return "TotalLengthMismatch";
    case ProtocolErrorCode::CONFLICTING_FRAGMENT:
      return "ConflictingFragment";
    case ProtocolErrorCode::FRAGMENT_OUT_OF_BOUNDS:
      return "FragmentOutOfBounds";
    case ProtocolErrorCode::REASSEMBLY_TIMEOUT:
      return "ReassemblyTimeout";
  }
  return "Unknown";
}

/**
 * @brief A peer sent something that violates the wire protocol.
 *
 * None of these are fatal to the connection: the session that catches one
 * drops the offending message or transaction and keeps reading.
 */
class ProtocolError : public std::runtime_error {
 public:
  ProtocolError(ProtocolErrorCode _code, const string& message)
      : std::runtime_error(string(protocolErrorName(_code)) + ": " + message),
        code(_code) {}

  ProtocolErrorCode getCode() const { return code; }

 protected:
  ProtocolErrorCode code;
};
}  // namespace mrm

#endif  // __MRM_PROTOCOL_ERROR__

#include "MessageFramer.hpp"

#include <google/protobuf/io/coded_stream.h>

namespace mrm {
namespace {
// A varint32 never needs more than five bytes
const size_t MAX_VARINT32_BYTES = 5;
}  // namespace

string MessageFramer::frame(const string& message) {
  using google::protobuf::io::CodedOutputStream;
  uint32_t length = uint32_t(message.length());
  size_t prefixSize = CodedOutputStream::VarintSize32(length);
  string s(prefixSize, '\0');
  CodedOutputStream::WriteVarint32ToArray(length, (uint8_t*)&s[0]);
  s.append(message);
  return s;
}

int MessageFramer::decodeLength(const char* data, size_t size,
                                uint32_t* length) {
  int limit = int(min(size, MAX_VARINT32_BYTES));
  int terminator = -1;
  for (int i = 0; i < limit; ++i) {
    if (!(uint8_t(data[i]) & 0x80)) {
      terminator = i;
      break;
    }
  }
  if (terminator < 0) {
    if (limit < int(MAX_VARINT32_BYTES)) {
      // Need more bytes
      return 0;
    }
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME,
                        "Length prefix is longer than five bytes");
  }
  if (terminator == int(MAX_VARINT32_BYTES) - 1 &&
      (uint8_t(data[terminator]) & 0xf0)) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME,
                        "Length prefix does not fit in 32 bits");
  }

  google::protobuf::io::CodedInputStream input(
      reinterpret_cast<const uint8_t*>(data), terminator + 1);
  if (!input.ReadVarint32(length)) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME,
                        "Unreadable length prefix");
  }
  return input.CurrentPosition();
}

bool MessageFramer::pop(string* message) {
  uint32_t length;
  int prefixSize = decodeLength(partialMessage.data(), partialMessage.length(),
                                &length);
  if (prefixSize == 0) {
    return false;
  }
  if (int64_t(length) > maxMessageLength) {
    string s = string("Frame too large: ") + to_string(length) + " > " +
               to_string(maxMessageLength);
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME, s);
  }
  if (partialMessage.length() < size_t(prefixSize) + length) {
    return false;
  }
  *message = partialMessage.substr(prefixSize, length);
  partialMessage.erase(0, prefixSize + length);
  VLOG(4) << "Framer popped message of " << length << " bytes, "
          << partialMessage.length() << " bytes still buffered";
  return true;
}
}  // namespace mrm

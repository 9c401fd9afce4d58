#include "SocketHandler.hpp"

namespace mrm {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd)) {
      time_t currentTime = time(NULL);
      if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // Connection is closed
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        VLOG(3) << "Got EAGAIN, waiting...";
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to readAll");
      }
    } else {
      pos += bytesRead;
      startTime = time(NULL);
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        VLOG(3) << "Got EAGAIN, waiting...";
        // This is fine, just keep retrying at 10hz
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}

string SocketHandler::readFrame(int fd, bool timeout, int64_t maxLength) {
  // The prefix is read a byte at a time so no message bytes are consumed
  char prefix[5];
  uint32_t length = 0;
  int prefixSize = 0;
  for (int i = 0; i < 5 && prefixSize == 0; i++) {
    readAll(fd, &prefix[i], 1, timeout);
    prefixSize = MessageFramer::decodeLength(prefix, i + 1, &length);
  }
  if (prefixSize == 0) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME,
                        "Unterminated length prefix");
  }
  if (int64_t(length) > maxLength) {
    throw ProtocolError(ProtocolErrorCode::MALFORMED_FRAME,
                        string("Frame too large: ") + to_string(length) +
                            " > " + to_string(maxLength));
  }
  string s(length, '\0');
  if (length > 0) {
    readAll(fd, &s[0], length, timeout);
  }
  return s;
}
}  // namespace mrm

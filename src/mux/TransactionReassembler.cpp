#include "TransactionReassembler.hpp"

namespace mrm {
ReassemblyOutcome TransactionReassembler::submit(
    const TransactionFragment& fragment, Clock::time_point now) {
  lock_guard<std::mutex> guard(reassemblyMutex);
  const TransactionKeyId& key = fragment.key;
  uint64_t length = fragment.bytes.length();

  auto it = transactions.find(key);
  if (it != transactions.end() &&
      it->second->buffer.length() != fragment.totalLength) {
    abort(key, ProtocolErrorCode::TOTAL_LENGTH_MISMATCH,
          string("declared ") + to_string(fragment.totalLength) +
              " bytes, transaction has " +
              to_string(it->second->buffer.length()));
  }
  if (fragment.totalLength > maxTotalLength ||
      fragment.writePosition > fragment.totalLength ||
      length > fragment.totalLength - fragment.writePosition) {
    abort(key, ProtocolErrorCode::FRAGMENT_OUT_OF_BOUNDS,
          string("fragment [") + to_string(fragment.writePosition) + ", +" +
              to_string(length) + ") of " + to_string(fragment.totalLength) +
              " bytes");
  }

  shared_ptr<ReassemblyState> state;
  if (it == transactions.end()) {
    state.reset(new ReassemblyState());
    state->buffer.assign(fragment.totalLength, '\0');
    state->contiguousPosition = 0;
    state->createdAt = now;
    state->contentIdentifier = fragment.contentIdentifier;
    transactions.insert(make_pair(key, state));
    VLOG(1) << "New transaction " << key << " of " << fragment.totalLength
            << " bytes";
  } else {
    state = it->second;
    checkOverlap(key, *state, fragment);
  }
  state->lastActivity = now;
  write(state.get(), fragment);

  ReassemblyOutcome outcome;
  outcome.key = key;
  if (state->contiguousPosition == state->buffer.length()) {
    outcome.complete = true;
    outcome.blob.swap(state->buffer);
    outcome.contentIdentifier = state->contentIdentifier;
    transactions.erase(key);
    VLOG(1) << "Transaction " << key << " complete (" << outcome.blob.length()
            << " bytes)";
  }
  return outcome;
}

void TransactionReassembler::checkOverlap(const TransactionKeyId& key,
                                          const ReassemblyState& state,
                                          const TransactionFragment& fragment) {
  uint64_t start = fragment.writePosition;
  uint64_t end = start + fragment.bytes.length();
  if (start == end) {
    return;
  }
  auto it = state.filled.upper_bound(start);
  if (it != state.filled.begin()) {
    auto prev = std::prev(it);
    if (prev->second > start) {
      it = prev;
    }
  }
  for (; it != state.filled.end() && it->first < end; ++it) {
    uint64_t overlapStart = max(start, it->first);
    uint64_t overlapEnd = min(end, it->second);
    if (overlapStart >= overlapEnd) {
      continue;
    }
    if (memcmp(&state.buffer[overlapStart],
               &fragment.bytes[overlapStart - start],
               overlapEnd - overlapStart) != 0) {
      abort(key, ProtocolErrorCode::CONFLICTING_FRAGMENT,
            string("bytes [") + to_string(overlapStart) + ", " +
                to_string(overlapEnd) + ") differ from an earlier fragment");
    }
    VLOG(2) << "Transaction " << key << " re-sent bytes [" << overlapStart
            << ", " << overlapEnd << ")";
  }
}

void TransactionReassembler::write(ReassemblyState* state,
                                   const TransactionFragment& fragment) {
  uint64_t start = fragment.writePosition;
  uint64_t end = start + fragment.bytes.length();
  if (start == end) {
    return;
  }
  memcpy(&state->buffer[start], fragment.bytes.data(), end - start);

  // Merge with every range that overlaps or touches [start, end)
  auto it = state->filled.upper_bound(start);
  if (it != state->filled.begin()) {
    auto prev = std::prev(it);
    if (prev->second >= start) {
      start = prev->first;
      end = max(end, prev->second);
      it = state->filled.erase(prev);
    }
  }
  while (it != state->filled.end() && it->first <= end) {
    end = max(end, it->second);
    it = state->filled.erase(it);
  }
  state->filled[start] = end;

  auto first = state->filled.begin();
  state->contiguousPosition = (first->first == 0) ? first->second : 0;
}

void TransactionReassembler::abort(const TransactionKeyId& key,
                                   ProtocolErrorCode code,
                                   const string& message) {
  auto it = transactions.find(key);
  if (it != transactions.end()) {
    transactions.erase(it);
  }
  LOG(WARNING) << "Aborting transaction " << key << ": "
               << protocolErrorName(code) << " (" << message << ")";
  throw ProtocolError(code, string("transaction ") + key.identifier + ": " +
                                message);
}

vector<TransactionKeyId> TransactionReassembler::expire(Clock::time_point now,
                                                        Clock::duration ttl) {
  lock_guard<std::mutex> guard(reassemblyMutex);
  vector<TransactionKeyId> expired;
  for (auto it = transactions.begin(); it != transactions.end();) {
    if (now - it->second->lastActivity > ttl) {
      LOG(WARNING) << "Aborting transaction " << it->first << ": "
                   << protocolErrorName(ProtocolErrorCode::REASSEMBLY_TIMEOUT)
                   << " (" << it->second->contiguousPosition << " of "
                   << it->second->buffer.length() << " bytes contiguous)";
      expired.push_back(it->first);
      it = transactions.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

bool TransactionReassembler::cancel(const TransactionKeyId& key) {
  lock_guard<std::mutex> guard(reassemblyMutex);
  auto it = transactions.find(key);
  if (it == transactions.end()) {
    VLOG(1) << "Cancel for unknown transaction " << key;
    return false;
  }
  LOG(INFO) << "Transaction " << key << " cancelled by peer";
  transactions.erase(it);
  return true;
}

void TransactionReassembler::clear() {
  lock_guard<std::mutex> guard(reassemblyMutex);
  if (!transactions.empty()) {
    LOG(INFO) << "Dropping " << transactions.size()
              << " unfinished transactions";
  }
  transactions.clear();
}

int TransactionReassembler::pendingCount() {
  lock_guard<std::mutex> guard(reassemblyMutex);
  return int(transactions.size());
}

bool TransactionReassembler::contains(const TransactionKeyId& key) {
  lock_guard<std::mutex> guard(reassemblyMutex);
  return transactions.find(key) != transactions.end();
}

uint64_t TransactionReassembler::bufferedBytes() {
  lock_guard<std::mutex> guard(reassemblyMutex);
  uint64_t total = 0;
  for (const auto& it : transactions) {
    total += it.second->buffer.capacity();
  }
  return total;
}

int64_t TransactionReassembler::getContiguousPosition(
    const TransactionKeyId& key) {
  lock_guard<std::mutex> guard(reassemblyMutex);
  auto it = transactions.find(key);
  if (it == transactions.end()) {
    return -1;
  }
  return int64_t(it->second->contiguousPosition);
}
}  // namespace mrm

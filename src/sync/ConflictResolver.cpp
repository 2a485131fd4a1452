#include "ConflictResolver.hpp"

namespace ssp {
uint64_t operationLength(const Operation& op) {
  switch (op.kind()) {
    case INSERT:
      return op.text().length();
    case DELETE:
    case RETAIN:
      return op.count();
  }
  return 0;
}

void applyOperation(const Operation& op, string* buffer) {
  uint64_t position = std::min<uint64_t>(op.position(), buffer->length());
  switch (op.kind()) {
    case INSERT:
      buffer->insert(position, op.text());
      break;
    case DELETE:
      buffer->erase(position, op.count());
      break;
    case RETAIN:
      break;
  }
}

ConflictResolver::ConflictResolver(shared_ptr<Clock> _clock,
                                   const string& _siteId)
    : clock(_clock), siteId(_siteId), serverRevision(0) {}

TransformResult ConflictResolver::transform(const Operation& a,
                                            const Operation& b) {
  if (a.kind() == INSERT && b.kind() == INSERT) {
    return transformInsertInsert(a, b);
  }
  if (a.kind() == DELETE && b.kind() == DELETE) {
    return transformDeleteDelete(a, b);
  }
  if (a.kind() == INSERT && b.kind() == DELETE) {
    return transformInsertDelete(a, b);
  }
  if (a.kind() == DELETE && b.kind() == INSERT) {
    TransformResult swapped = transformInsertDelete(b, a);
    return TransformResult{swapped.second, swapped.first};
  }
  // Retain does not move anything
  return TransformResult{a, b};
}

TransformResult ConflictResolver::transformInsertInsert(const Operation& a,
                                                        const Operation& b) {
  bool aFirst;
  if (a.position() != b.position()) {
    aFirst = a.position() < b.position();
  } else {
    // Same position: the smaller origin is treated as the earlier insert
    aFirst = a.origin() < b.origin();
  }

  TransformResult result{a, b};
  if (aFirst) {
    result.second.set_position(b.position() + a.text().length());
  } else {
    result.first.set_position(a.position() + b.text().length());
  }
  return result;
}

TransformResult ConflictResolver::transformDeleteDelete(const Operation& a,
                                                        const Operation& b) {
  uint64_t startA = a.position();
  uint64_t endA = startA + a.count();
  uint64_t startB = b.position();
  uint64_t endB = startB + b.count();

  TransformResult result{a, b};
  if (endA <= startB) {
    result.second.set_position(startB - a.count());
    return result;
  }
  if (endB <= startA) {
    result.first.set_position(startA - b.count());
    return result;
  }

  // Overlap: each side only deletes what the other has not already removed
  uint64_t overlap = std::min(endA, endB) - std::max(startA, startB);
  uint64_t start = std::min(startA, startB);
  result.first.set_position(start);
  result.first.set_count(a.count() - overlap);
  result.second.set_position(start);
  result.second.set_count(b.count() - overlap);
  return result;
}

TransformResult ConflictResolver::transformInsertDelete(
    const Operation& insertOp, const Operation& deleteOp) {
  uint64_t insertPos = insertOp.position();
  uint64_t deleteStart = deleteOp.position();
  uint64_t deleteEnd = deleteStart + deleteOp.count();

  TransformResult result{insertOp, deleteOp};
  if (insertPos <= deleteStart) {
    result.second.set_position(deleteStart + insertOp.text().length());
    return result;
  }
  if (insertPos >= deleteEnd) {
    result.first.set_position(insertPos - deleteOp.count());
    return result;
  }
  // Insert lands inside the deleted range: pin it to the start
  result.first.set_position(deleteStart);
  return result;
}

Operation ConflictResolver::makeOperation(OperationKind kind,
                                          uint64_t position) {
  Operation op;
  op.set_kind(kind);
  op.set_position(position);
  op.set_origin(siteId);
  op.set_issued_at(uint64_t(clock->now()));
  op.set_base_revision(serverRevision);
  return op;
}

Operation ConflictResolver::applyLocalInsert(uint64_t position,
                                             const string& text,
                                             const string& ackKey) {
  Operation op = makeOperation(INSERT, position);
  op.set_text(text);
  return applyLocal(op, ackKey);
}

Operation ConflictResolver::applyLocalDelete(uint64_t position, uint64_t count,
                                             const string& ackKey) {
  Operation op = makeOperation(DELETE, position);
  op.set_count(count);
  return applyLocal(op, ackKey);
}

Operation ConflictResolver::applyLocal(const Operation& op,
                                       const string& ackKey) {
  applyOperation(op, &buffer);
  pending.push_back(op);
  pendingKeys.push_back(ackKey);
  return op;
}

void ConflictResolver::applyOutput(uint64_t position, const string& text) {
  Operation op;
  op.set_kind(INSERT);
  op.set_position(position);
  op.set_text(text);
  applyOperation(op, &buffer);
}

void ConflictResolver::onServerAck() {
  serverRevision++;
  if (!pending.empty()) {
    pending.pop_front();
    pendingKeys.pop_front();
  }
}

bool ConflictResolver::onServerAck(const string& ackKey) {
  if (!dropPending(ackKey)) {
    return false;
  }
  serverRevision++;
  return true;
}

bool ConflictResolver::dropPending(const string& ackKey) {
  for (size_t i = 0; i < pendingKeys.size(); i++) {
    if (pendingKeys[i] == ackKey) {
      pending.erase(pending.begin() + i);
      pendingKeys.erase(pendingKeys.begin() + i);
      return true;
    }
  }
  VLOG(2) << "No pending operation for " << ackKey;
  return false;
}

Operation ConflictResolver::onRemoteOperation(const Operation& remoteOp) {
  Operation transformed = remoteOp;
  for (auto& it : pending) {
    TransformResult result = transform(it, transformed);
    it = result.first;
    transformed = result.second;
  }
  VLOG(2) << "Applying remote op from " << remoteOp.origin() << " at "
          << transformed.position() << " (was " << remoteOp.position()
          << ", " << pending.size() << " pending)";
  applyOperation(transformed, &buffer);
  serverRevision++;
  return transformed;
}

ConflictResolverStats ConflictResolver::getStats() const {
  ConflictResolverStats stats;
  stats.siteId = siteId;
  stats.serverRevision = serverRevision;
  stats.pendingCount = pending.size();
  stats.bufferLength = buffer.length();
  return stats;
}
}  // namespace ssp

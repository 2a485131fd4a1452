#ifndef __SSP_CONFLICT_RESOLVER__
#define __SSP_CONFLICT_RESOLVER__

#include "Clock.hpp"
#include "Headers.hpp"

namespace ssp {
/**
 * @brief Pair of operations produced by transforming two concurrent edits.
 *
 * For a transform of (a, b): applying a then `second` yields the same
 * buffer as applying b then `first`.
 */
struct TransformResult {
  Operation first;
  Operation second;
};

struct ConflictResolverStats {
  string siteId;
  uint64_t serverRevision;
  size_t pendingCount;
  size_t bufferLength;
};

/** @brief Length an insert adds or a delete removes. */
uint64_t operationLength(const Operation& op);

/**
 * @brief Applies `op` to `buffer`. Positions past the end are clamped.
 */
void applyOperation(const Operation& op, string* buffer);

/**
 * @brief Operational-transform engine for optimistic local edits.
 *
 * Local edits are applied immediately and kept in a pending queue until the
 * authority acknowledges them. Remote operations are transformed through the
 * whole pending queue before they are applied, and each pending entry is
 * replaced by its transformed counterpart.
 */
class ConflictResolver {
 public:
  ConflictResolver(shared_ptr<Clock> _clock, const string& _siteId);

  /**
   * @brief Transforms two operations issued against the same revision.
   */
  static TransformResult transform(const Operation& a, const Operation& b);

  /**
   * @brief Builds an insert, applies it to the local buffer and queues it.
   * @param ackKey Identifies the acknowledgment that retires the operation.
   */
  Operation applyLocalInsert(uint64_t position, const string& text,
                             const string& ackKey = string());

  /**
   * @brief Builds a delete of `count` characters, applies it and queues it.
   */
  Operation applyLocalDelete(uint64_t position, uint64_t count,
                             const string& ackKey = string());

  /**
   * @brief Applies an already-built local operation and queues it.
   */
  Operation applyLocal(const Operation& op, const string& ackKey = string());

  /**
   * @brief Inserts process output into the local buffer. Output is not
   * pending and is never transformed.
   */
  void applyOutput(uint64_t position, const string& text);

  /**
   * @brief Drops the oldest pending operation once the authority has
   * accepted it.
   */
  void onServerAck();

  /**
   * @brief Drops the pending operation queued under `ackKey` once the
   * authority has accepted it.
   * @return false if no pending operation carries that key.
   */
  bool onServerAck(const string& ackKey);

  /**
   * @brief Forgets the pending operation queued under `ackKey` without
   * advancing the server revision. Used when its packet is abandoned.
   */
  bool dropPending(const string& ackKey);

  /**
   * @brief Transforms `remoteOp` through the pending queue and applies it.
   * @return The operation actually applied to the local buffer.
   */
  Operation onRemoteOperation(const Operation& remoteOp);

  const string& getBuffer() const { return buffer; }
  const deque<Operation>& getPending() const { return pending; }
  uint64_t getServerRevision() const { return serverRevision; }
  const string& getSiteId() const { return siteId; }

  ConflictResolverStats getStats() const;

 protected:
  static TransformResult transformInsertInsert(const Operation& a,
                                               const Operation& b);
  static TransformResult transformDeleteDelete(const Operation& a,
                                               const Operation& b);
  static TransformResult transformInsertDelete(const Operation& insertOp,
                                               const Operation& deleteOp);

  Operation makeOperation(OperationKind kind, uint64_t position);

  shared_ptr<Clock> clock;
  string siteId;
  uint64_t serverRevision;
  deque<Operation> pending;
  /** @brief Acknowledgment key of each entry in `pending`. */
  deque<string> pendingKeys;
  string buffer;
};
}  // namespace ssp

#endif  // __SSP_CONFLICT_RESOLVER__

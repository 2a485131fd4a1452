#ifndef __SSP_REPLICATED_BUFFER__
#define __SSP_REPLICATED_BUFFER__

#include "Headers.hpp"

namespace ssp {
struct ReplicatedBufferStats {
  string siteId;
  uint64_t clock;
  size_t totalChars;
  size_t visibleChars;
  size_t tombstones;
  size_t parked;
  uint64_t outputChars;
};

/**
 * @brief Total order on character ids: clock first, then site.
 * @return <0, 0 or >0 like strcmp.
 */
int compareCharIds(const CharId& a, const CharId& b);

/** @brief Stable string key for a character id, "site:clock". */
string charIdKey(const CharId& id);

/**
 * @brief Replicated growable array holding the terminal content.
 *
 * Every character carries a unique (site, clock) id and the id of the
 * character it was inserted after. The sequence is the pre-order walk of the
 * resulting tree with siblings placed by descending id, so every replica
 * that has seen the same characters holds them in the same order. Deleted
 * characters stay in the sequence as tombstones.
 *
 * Characters whose predecessor has not arrived yet are parked and integrated
 * as soon as the predecessor shows up.
 */
class ReplicatedBuffer {
 public:
  /**
   * @brief Site of characters produced by process output. Sorts before every
   * real site id.
   */
  static const string OUTPUT_SITE;

  explicit ReplicatedBuffer(const string& _siteId);

  /**
   * @brief Inserts `value` so that it becomes visible character `position`.
   * Positions past the end append.
   * @return The new record, ready to be shipped to other replicas.
   */
  CharacterRecord insert(size_t position, const string& value);

  /**
   * @brief Appends process output after the previous output character.
   *
   * Output characters are numbered by their offset in the output stream, so
   * every replica that applies the same output in the same order assigns the
   * same ids and can anchor later input on them.
   * @return Visible position of the first appended character.
   */
  uint64_t appendOutput(const string& text);

  /**
   * @brief Tombstones visible character `position`.
   * @return false if there is no such character.
   */
  bool remove(size_t position, CharacterRecord* removed);

  /**
   * @brief Integrates a record produced by another replica. Merging the same
   * record twice has no further effect.
   */
  void merge(const CharacterRecord& foreign);

  /** @brief Concatenation of every non-tombstoned character. */
  string getContent() const;

  /** @brief Every record in sequence order, tombstones included. */
  const vector<CharacterRecord>& getAllRecords() const { return records; }

  size_t visibleSize() const;
  uint64_t getOutputLength() const { return outputLength; }
  uint64_t getClock() const { return clock; }
  const string& getSiteId() const { return siteId; }

  ReplicatedBufferStats getStats() const;

 protected:
  /**
   * @brief Places `record` in the sequence.
   * @return false if its predecessor is unknown.
   */
  bool integrate(const CharacterRecord& record);
  /** @brief Retries parked records until none can be placed. */
  void integrateParked();
  /** @brief Index in `records` of the visible character `position`. */
  int64_t visibleIndex(size_t position) const;
  int64_t findIndex(const CharId& id) const;
  /** @brief Visible position of `id`, or the visible size if it is hidden. */
  uint64_t visiblePositionOf(const CharId& id) const;

  string siteId;
  uint64_t clock;
  /** @brief Output characters appended so far. */
  uint64_t outputLength;
  vector<CharacterRecord> records;
  unordered_set<string> knownIds;
  /** @brief Records waiting for their predecessor, keyed by id. */
  map<string, CharacterRecord> parked;
};
}  // namespace ssp

#endif  // __SSP_REPLICATED_BUFFER__

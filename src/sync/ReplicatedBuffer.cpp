#include "ReplicatedBuffer.hpp"

namespace ssp {
namespace {
const string ROOT_KEY = "root";

inline string predecessorKey(const CharacterRecord& record) {
  if (!record.has_insert_after()) {
    return ROOT_KEY;
  }
  return charIdKey(record.insert_after());
}
}  // namespace

int compareCharIds(const CharId& a, const CharId& b) {
  if (a.clock() != b.clock()) {
    return a.clock() < b.clock() ? -1 : 1;
  }
  return a.site().compare(b.site());
}

string charIdKey(const CharId& id) {
  return id.site() + ":" + to_string(id.clock());
}

const string ReplicatedBuffer::OUTPUT_SITE = "";

ReplicatedBuffer::ReplicatedBuffer(const string& _siteId)
    : siteId(_siteId), clock(0), outputLength(0) {}

CharacterRecord ReplicatedBuffer::insert(size_t position, const string& value) {
  CharacterRecord record;
  record.mutable_id()->set_site(siteId);
  record.mutable_id()->set_clock(++clock);
  record.set_value(value);
  record.set_tombstoned(false);

  size_t visible = visibleSize();
  if (position > visible) {
    position = visible;
  }
  if (position > 0) {
    int64_t index = visibleIndex(position - 1);
    *(record.mutable_insert_after()) = records[index].id();
  }

  if (!integrate(record)) {
    STFATAL << "Local insert lost its predecessor: " << charIdKey(record.id());
  }
  return record;
}

uint64_t ReplicatedBuffer::appendOutput(const string& text) {
  if (text.empty()) {
    return visibleSize();
  }

  CharId first;
  first.set_site(OUTPUT_SITE);
  first.set_clock(outputLength + 1);
  for (char c : text) {
    CharacterRecord record;
    record.mutable_id()->set_site(OUTPUT_SITE);
    record.mutable_id()->set_clock(outputLength + 1);
    record.set_value(string(1, c));
    record.set_tombstoned(false);
    if (outputLength > 0) {
      record.mutable_insert_after()->set_site(OUTPUT_SITE);
      record.mutable_insert_after()->set_clock(outputLength);
    }
    outputLength++;
    clock = std::max(clock, outputLength);

    string key = charIdKey(record.id());
    if (knownIds.find(key) != knownIds.end() ||
        parked.find(key) != parked.end()) {
      continue;
    }
    if (!integrate(record)) {
      parked[key] = record;
    }
  }

  // Input anchored on this output was parked until now
  integrateParked();
  return visiblePositionOf(first);
}

bool ReplicatedBuffer::remove(size_t position, CharacterRecord* removed) {
  int64_t index = visibleIndex(position);
  if (index < 0) {
    return false;
  }
  records[index].set_tombstoned(true);
  if (removed) {
    *removed = records[index];
  }
  return true;
}

void ReplicatedBuffer::merge(const CharacterRecord& foreign) {
  if (!foreign.has_id()) {
    VLOG(1) << "Dropping character record without an id";
    return;
  }
  // Lamport rule
  clock = std::max(clock, foreign.id().clock());

  string key = charIdKey(foreign.id());
  if (knownIds.find(key) != knownIds.end()) {
    if (foreign.tombstoned()) {
      records[findIndex(foreign.id())].set_tombstoned(true);
    }
    return;
  }

  auto parkedIt = parked.find(key);
  if (parkedIt != parked.end()) {
    if (foreign.tombstoned()) {
      parkedIt->second.set_tombstoned(true);
    }
    return;
  }

  if (!integrate(foreign)) {
    VLOG(2) << "Parking " << key << " until " << predecessorKey(foreign)
            << " arrives";
    parked[key] = foreign;
    return;
  }
  integrateParked();
}

bool ReplicatedBuffer::integrate(const CharacterRecord& record) {
  string parentKey = predecessorKey(record);
  int64_t parentIndex = -1;
  if (record.has_insert_after()) {
    parentIndex = findIndex(record.insert_after());
    if (parentIndex < 0) {
      return false;
    }
  }

  // Walk the subtree of the predecessor. Siblings are ordered by descending
  // id; the subtree of every skipped sibling is skipped with it.
  unordered_set<string> subtree;
  subtree.insert(parentKey);
  size_t index = size_t(parentIndex + 1);
  while (index < records.size()) {
    const CharacterRecord& existing = records[index];
    string existingParent = predecessorKey(existing);
    if (subtree.find(existingParent) == subtree.end()) {
      break;
    }
    if (existingParent == parentKey &&
        compareCharIds(existing.id(), record.id()) < 0) {
      break;
    }
    subtree.insert(charIdKey(existing.id()));
    index++;
  }

  records.insert(records.begin() + index, record);
  knownIds.insert(charIdKey(record.id()));
  return true;
}

void ReplicatedBuffer::integrateParked() {
  bool progress = true;
  while (progress && !parked.empty()) {
    progress = false;
    for (auto it = parked.begin(); it != parked.end();) {
      if (integrate(it->second)) {
        it = parked.erase(it);
        progress = true;
      } else {
        ++it;
      }
    }
  }
}

string ReplicatedBuffer::getContent() const {
  string s;
  for (const auto& it : records) {
    if (!it.tombstoned()) {
      s += it.value();
    }
  }
  return s;
}

size_t ReplicatedBuffer::visibleSize() const {
  size_t visible = 0;
  for (const auto& it : records) {
    if (!it.tombstoned()) {
      visible++;
    }
  }
  return visible;
}

int64_t ReplicatedBuffer::visibleIndex(size_t position) const {
  size_t seen = 0;
  for (size_t i = 0; i < records.size(); i++) {
    if (records[i].tombstoned()) {
      continue;
    }
    if (seen == position) {
      return int64_t(i);
    }
    seen++;
  }
  return -1;
}

int64_t ReplicatedBuffer::findIndex(const CharId& id) const {
  if (knownIds.find(charIdKey(id)) == knownIds.end()) {
    return -1;
  }
  for (size_t i = 0; i < records.size(); i++) {
    if (records[i].id().clock() == id.clock() &&
        records[i].id().site() == id.site()) {
      return int64_t(i);
    }
  }
  STFATAL << "Known id missing from the sequence: " << charIdKey(id);
  return -1;
}

uint64_t ReplicatedBuffer::visiblePositionOf(const CharId& id) const {
  int64_t index = findIndex(id);
  if (index < 0 || records[index].tombstoned()) {
    return visibleSize();
  }
  uint64_t position = 0;
  for (int64_t i = 0; i < index; i++) {
    if (!records[i].tombstoned()) {
      position++;
    }
  }
  return position;
}

ReplicatedBufferStats ReplicatedBuffer::getStats() const {
  ReplicatedBufferStats stats;
  stats.siteId = siteId;
  stats.clock = clock;
  stats.totalChars = records.size();
  stats.visibleChars = visibleSize();
  stats.tombstones = stats.totalChars - stats.visibleChars;
  stats.parked = parked.size();
  stats.outputChars = outputLength;
  return stats;
}
}  // namespace ssp

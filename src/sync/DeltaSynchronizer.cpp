#include "DeltaSynchronizer.hpp"

namespace ssp {
namespace {
string toHex(const unsigned char* bin, size_t length) {
  string hex(length * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.length(), bin, length);
  hex.resize(length * 2);
  return hex;
}

bool fromHex(const string& hex, string* bin) {
  string out(hex.length() / 2 + 1, '\0');
  size_t binLength = 0;
  if (sodium_hex2bin((unsigned char*)&out[0], out.length(), hex.c_str(),
                     hex.length(), NULL, &binLength, NULL) != 0) {
    return false;
  }
  if (binLength * 2 != hex.length()) {
    return false;
  }
  out.resize(binLength);
  *bin = out;
  return true;
}

// Raw digest bytes when `hash` is one of ours, the text itself otherwise
string digestBytes(const string& hash) {
  string bin;
  if (hash.length() == DeltaSynchronizer::DIGEST_BYTES * 2 &&
      fromHex(hash, &bin)) {
    return bin;
  }
  return hash;
}

vector<string> nextLevel(const vector<string>& level) {
  vector<string> parents;
  for (size_t i = 0; i < level.size(); i += 2) {
    const string& left = level[i];
    const string& right = i + 1 < level.size() ? level[i + 1] : left;
    parents.push_back(DeltaSynchronizer::hashPair(left, right));
  }
  return parents;
}
}  // namespace

DeltaSynchronizer::DeltaSynchronizer() {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

string DeltaSynchronizer::hashBytes(const string& data) {
  unsigned char digest[crypto_hash_sha256_BYTES];
  crypto_hash_sha256(digest, (const unsigned char*)data.data(),
                     data.length());
  return toHex(digest, DIGEST_BYTES);
}

string DeltaSynchronizer::hashPair(const string& left, const string& right) {
  return hashBytes(digestBytes(left) + digestBytes(right));
}

string DeltaSynchronizer::addLeaf(const string& payload) {
  string hash = hashLeaf(payload);
  HashNode node;
  node.set_hash(hash);
  node.set_leaf_payload(payload);
  nodes[hash] = node;
  leaves.push_back(hash);
  return hash;
}

string DeltaSynchronizer::buildTree() {
  // Interior nodes of the previous tree no longer describe the leaves
  for (auto it = nodes.begin(); it != nodes.end();) {
    if (it->second.has_leaf_payload()) {
      ++it;
    } else {
      it = nodes.erase(it);
    }
  }
  if (leaves.empty()) {
    return hashBytes("");
  }

  vector<string> level = leaves;
  while (level.size() > 1) {
    vector<string> parents;
    for (size_t i = 0; i < level.size(); i += 2) {
      const string& left = level[i];
      bool hasRight = i + 1 < level.size();
      const string& right = hasRight ? level[i + 1] : left;

      string parentHash = hashPair(left, right);
      HashNode node;
      node.set_hash(parentHash);
      node.set_left(left);
      if (hasRight) {
        node.set_right(right);
      }
      nodes[parentHash] = node;
      parents.push_back(parentHash);
    }
    level.swap(parents);
  }
  return level[0];
}

vector<string> DeltaSynchronizer::findDiff(const string& localRoot,
                                           const string& remoteRoot,
                                           const NodeTable& remoteNodes) const {
  vector<string> diff;
  if (localRoot == remoteRoot) {
    return diff;
  }

  set<string> reported;
  // An empty local hash means "no local counterpart"
  deque<pair<string, string>> queue;
  queue.push_back(make_pair(localRoot, remoteRoot));

  while (!queue.empty()) {
    string localHash = queue.front().first;
    string remoteHash = queue.front().second;
    queue.pop_front();

    if (localHash == remoteHash) {
      continue;
    }

    auto remoteIt = remoteNodes.nodes().find(remoteHash);
    if (remoteIt == remoteNodes.nodes().end()) {
      VLOG(2) << "Remote node " << remoteHash << " not in table, skipping";
      continue;
    }
    const HashNode& remoteNode = remoteIt->second;

    if (remoteNode.has_leaf_payload()) {
      auto localIt = nodes.find(remoteHash);
      bool haveLeaf = localIt != nodes.end() &&
                      localIt->second.has_leaf_payload();
      if (!haveLeaf && reported.insert(remoteHash).second) {
        diff.push_back(remoteHash);
      }
      continue;
    }

    auto localIt = nodes.find(localHash);
    bool localInterior =
        localIt != nodes.end() && !localIt->second.has_leaf_payload();
    if (localInterior) {
      const HashNode& localNode = localIt->second;
      if (remoteNode.has_left()) {
        queue.push_back(make_pair(localNode.left(), remoteNode.left()));
      }
      if (remoteNode.has_right()) {
        queue.push_back(make_pair(
            localNode.has_right() ? localNode.right() : string(),
            remoteNode.right()));
      }
    } else {
      // No matching local subtree: everything below the remote node is new
      if (remoteNode.has_left()) {
        queue.push_back(make_pair(string(), remoteNode.left()));
      }
      if (remoteNode.has_right()) {
        queue.push_back(make_pair(string(), remoteNode.right()));
      }
    }
  }

  return diff;
}

bool DeltaSynchronizer::getProof(const string& leafHash,
                                 MerkleProof* proof) const {
  auto it = std::find(leaves.begin(), leaves.end(), leafHash);
  if (it == leaves.end()) {
    return false;
  }

  proof->leafIndex = int64_t(it - leaves.begin());
  proof->siblings.clear();

  vector<string> level = leaves;
  size_t index = size_t(proof->leafIndex);
  while (level.size() > 1) {
    size_t siblingIndex = index % 2 == 0 ? index + 1 : index - 1;
    // The last node of an odd level is paired with itself
    proof->siblings.push_back(siblingIndex < level.size() ? level[siblingIndex]
                                                          : level[index]);
    level = nextLevel(level);
    index /= 2;
  }
  return true;
}

bool DeltaSynchronizer::verifyProof(const string& leafHash,
                                    const MerkleProof& proof,
                                    const string& root) {
  if (proof.leafIndex < 0) {
    return false;
  }
  string current = leafHash;
  int64_t index = proof.leafIndex;
  for (const auto& sibling : proof.siblings) {
    if (index % 2 == 0) {
      current = hashPair(current, sibling);
    } else {
      current = hashPair(sibling, current);
    }
    index /= 2;
  }
  return current == root;
}

bool DeltaSynchronizer::getNode(const string& hash, HashNode* node) const {
  auto it = nodes.find(hash);
  if (it == nodes.end()) {
    return false;
  }
  *node = it->second;
  return true;
}

NodeTable DeltaSynchronizer::getAllNodes() const {
  NodeTable table;
  for (const auto& it : nodes) {
    (*table.mutable_nodes())[it.first] = it.second;
  }
  return table;
}

DeltaSyncStats DeltaSynchronizer::getStats() const {
  DeltaSyncStats stats;
  stats.leafCount = leaves.size();
  stats.nodeCount = nodes.size();
  stats.treeDepth =
      size_t(std::ceil(std::log2(std::max<size_t>(1, leaves.size())))) + 1;
  return stats;
}
}  // namespace ssp

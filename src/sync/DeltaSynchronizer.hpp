#ifndef __SSP_DELTA_SYNCHRONIZER__
#define __SSP_DELTA_SYNCHRONIZER__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Inclusion proof for one leaf: its index and the sibling hash at
 * every level from the leaves up.
 */
struct MerkleProof {
  int64_t leafIndex;
  vector<string> siblings;
};

struct DeltaSyncStats {
  size_t leafCount;
  size_t nodeCount;
  size_t treeDepth;
};

/**
 * @brief Binary hash tree over an ordered list of encoded units, used to find
 * which units a peer is missing.
 *
 * Digests are SHA-256 truncated to 16 bytes, rendered as lowercase hex.
 * Interior hashes cover the concatenated raw child digests; an odd node at
 * the end of a level is paired with itself. Nodes are content addressed, so
 * two subtrees with the same hash are identical.
 */
class DeltaSynchronizer {
 public:
  /** @brief Number of digest bytes kept from SHA-256. */
  static constexpr size_t DIGEST_BYTES = 16;

  DeltaSynchronizer();

  /** @brief Digest of an arbitrary byte string. */
  static string hashBytes(const string& data);
  /** @brief Digest of a leaf payload. Same as hashBytes. */
  static string hashLeaf(const string& payload) { return hashBytes(payload); }
  /** @brief Digest of an interior node from its children's digests. */
  static string hashPair(const string& left, const string& right);

  /** @brief Appends a leaf and returns its digest. */
  string addLeaf(const string& payload);

  /**
   * @brief Rebuilds the interior nodes from the current leaves.
   * @return The root digest. An empty tree hashes the empty string.
   */
  string buildTree();

  /**
   * @brief Lists the remote leaf digests this tree does not have.
   *
   * Only subtree pairs whose digests differ are visited. Nodes missing from
   * `remoteNodes` are skipped, so an incomplete table yields a partial
   * (still valid) answer. Call buildTree() first.
   */
  vector<string> findDiff(const string& localRoot, const string& remoteRoot,
                          const NodeTable& remoteNodes) const;

  /**
   * @brief Builds the inclusion proof of the first leaf with this digest.
   * @return false if no leaf has this digest.
   */
  bool getProof(const string& leafHash, MerkleProof* proof) const;

  /** @brief Recomputes the root from a leaf and its proof. */
  static bool verifyProof(const string& leafHash, const MerkleProof& proof,
                          const string& root);

  /** @brief Looks up a node by digest. */
  bool getNode(const string& hash, HashNode* node) const;

  /** @brief Snapshot of every node, for handing to a peer. */
  NodeTable getAllNodes() const;

  const vector<string>& getLeaves() const { return leaves; }

  DeltaSyncStats getStats() const;

 protected:
  unordered_map<string, HashNode> nodes;
  vector<string> leaves;
};
}  // namespace ssp

#endif  // __SSP_DELTA_SYNCHRONIZER__

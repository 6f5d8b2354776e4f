#pragma once

#include "CircuitConfig.h"
#include "Nullifier.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace civic {
namespace zkp {

/**
 * Root from a leaf and its authentication path.
 *
 * path[i] is the sibling at level i counted from the leaf; bit i of
 * index (least significant first) is 1 when the running node is the
 * right child. No range check on index.
 */
FieldT computeRootFromPath(
    const FieldT& leaf,
    std::uint64_t index,
    const std::vector<FieldT>& path);

/**
 * @throws MalformedInputError if path.size() != depth or index >= 2^depth
 */
bool verifyPath(
    const FieldT& leaf,
    std::uint64_t index,
    const std::vector<FieldT>& path,
    const FieldT& root,
    std::size_t depth);

/**
 * Witness for Merkle tree membership proofs
 */
struct MerkleWitness {
    static constexpr std::uint8_t FORMAT_VERSION = 1;

    FieldT leaf;
    std::vector<FieldT> path;
    std::uint64_t index = 0;
    FieldT root;

    bool verify() const;

    /**
     * Layout: version (1) | depth (1) | index (8, big-endian) |
     * leaf (32) | root (32) | path (depth x 32). Field elements are
     * big-endian canonical encodings.
     */
    std::vector<std::uint8_t> serialize() const;

    /// @throws MalformedInputError on truncated or non-canonical data
    static MerkleWitness deserialize(const std::vector<std::uint8_t>& data);
};

enum class DuplicateLeaves {
    Reject,
    Allow,
};

/**
 * Perfect binary Poseidon Merkle tree over a fixed leaf set.
 *
 * Positions past the supplied leaves hold the zero leaf; subtrees made
 * only of padding are not stored and resolve to precomputed empty
 * hashes, so sparse trees of depth up to 32 stay small.
 */
class DistrictTree {
public:
    /**
     * A repeated leaf can only ever be found at its first position, so
     * identity trees reject duplicates. The global tree of district roots
     * passes DuplicateLeaves::Allow.
     *
     * @throws MalformedInputError for bad depth, more than 2^depth leaves
     *         or a rejected duplicate
     */
    static DistrictTree build(
        const std::vector<FieldT>& leaves,
        std::size_t depth,
        DuplicateLeaves duplicates = DuplicateLeaves::Reject);

    /// Hashes each commitment with computeLeaf() first. Duplicates are rejected.
    static DistrictTree fromIdentities(
        const std::vector<FieldT>& identityCommitments,
        std::size_t depth);

    const FieldT& root() const { return root_; }
    std::size_t depth() const { return depth_; }

    /// Number of supplied (non-padding) leaves.
    std::uint64_t size() const { return levels_[0].size(); }
    std::uint64_t capacity() const { return std::uint64_t(1) << depth_; }

    /// @throws std::out_of_range past capacity()
    const FieldT& leaf(std::uint64_t position) const;
    const FieldT& node(std::size_t level, std::uint64_t position) const;

    /// @throws std::out_of_range past capacity()
    std::vector<FieldT> authPath(std::uint64_t position) const;
    MerkleWitness witness(std::uint64_t position) const;

    /// Position of a supplied leaf; padding is never found.
    std::optional<std::uint64_t> find(const FieldT& leaf) const;

    /// Root of the all-padding tree at each level.
    const std::vector<FieldT>& emptyHashes() const { return emptyHashes_; }

private:
    DistrictTree(std::size_t depth, std::vector<std::vector<FieldT>> levels);

    std::size_t depth_;
    std::vector<std::vector<FieldT>> levels_;
    std::vector<FieldT> emptyHashes_;
    FieldT root_;
};

/**
 * Single-tier witness for the identity at `position`.
 *
 * @throws MalformedInputError if the leaf there is not computeLeaf(identity)
 */
MembershipWitness makeMembershipWitness(
    const DistrictTree& district,
    std::uint64_t position,
    const FieldT& identityCommitment,
    const ActionScope& scope);

/**
 * Single-tier witness for an identity, located with DistrictTree::find().
 *
 * @throws MalformedInputError if the identity is not in the tree
 */
MembershipWitness makeMembershipWitness(
    const DistrictTree& district,
    const FieldT& identityCommitment,
    const ActionScope& scope);

/**
 * District trees plus a global tree whose leaves are the district roots.
 */
class TwoTierAtlas {
public:
    /// @throws MalformedInputError if districts differ in depth or do not fit
    TwoTierAtlas(std::vector<DistrictTree> districts, std::size_t globalDepth);

    std::size_t districtCount() const { return districts_.size(); }
    const DistrictTree& district(std::size_t index) const;
    const DistrictTree& global() const { return global_; }

    CircuitConfig config() const;

    /**
     * Full two-tier witness: district path for the leaf and global path
     * for the district root.
     */
    MembershipWitness membership(
        std::size_t districtIndex,
        std::uint64_t leafIndex,
        const FieldT& identityCommitment,
        const ActionScope& scope) const;

private:
    std::vector<DistrictTree> districts_;
    DistrictTree global_;
};

} // namespace zkp
} // namespace civic

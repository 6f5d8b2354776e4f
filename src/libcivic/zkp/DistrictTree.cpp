#include "DistrictTree.h"
#include "PoseidonHash.h"
#include "ZkErrors.h"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace civic {
namespace zkp {

namespace {

void checkTreeDepth(std::size_t depth) {
    if (depth < CircuitConfig::MIN_DEPTH || depth > CircuitConfig::MAX_DEPTH) {
        throw MalformedInputError(
            "Tree depth must be in [1, 32], got " + std::to_string(depth));
    }
}

std::vector<FieldT> computeEmptyHashes(std::size_t depth) {
    std::vector<FieldT> empty(depth + 1);
    empty[0] = FieldT::zero();
    for (std::size_t i = 1; i <= depth; ++i) {
        empty[i] = hashPair(empty[i - 1], empty[i - 1]);
    }
    return empty;
}

void appendBytes(std::vector<std::uint8_t>& out, const FieldT& element) {
    const FieldBytes bytes = fieldToBytes(element);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void checkDistinct(const std::vector<FieldT>& leaves) {
    std::set<FieldBytes> seen;
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        if (!seen.insert(fieldToBytes(leaves[i])).second) {
            throw MalformedInputError("Duplicate leaf at position " + std::to_string(i));
        }
    }
}

FieldT readField(const std::vector<std::uint8_t>& data, std::size_t offset) {
    FieldBytes bytes;
    std::copy(data.begin() + offset, data.begin() + offset + bytes.size(), bytes.begin());
    return fieldFromBytes(bytes);
}

DistrictTree buildGlobal(const std::vector<DistrictTree>& districts, std::size_t globalDepth) {
    if (districts.empty()) {
        throw MalformedInputError("Two-tier atlas needs at least one district");
    }
    std::vector<FieldT> roots;
    roots.reserve(districts.size());
    for (const auto& d : districts) {
        if (d.depth() != districts.front().depth()) {
            throw MalformedInputError("All district trees must share one depth");
        }
        roots.push_back(d.root());
    }
    // Districts with identical membership share a root.
    return DistrictTree::build(roots, globalDepth, DuplicateLeaves::Allow);
}

} // namespace

FieldT computeRootFromPath(
    const FieldT& leaf,
    std::uint64_t index,
    const std::vector<FieldT>& path)
{
    FieldT current = leaf;
    for (std::size_t level = 0; level < path.size(); ++level) {
        const bool isRight = level < 64 && ((index >> level) & 1);
        if (isRight)
            current = hashPair(path[level], current);
        else
            current = hashPair(current, path[level]);
    }
    return current;
}

bool verifyPath(
    const FieldT& leaf,
    std::uint64_t index,
    const std::vector<FieldT>& path,
    const FieldT& root,
    std::size_t depth)
{
    checkTreeDepth(depth);
    if (path.size() != depth) {
        throw MalformedInputError(
            "Path has " + std::to_string(path.size()) + " siblings, expected " +
            std::to_string(depth));
    }
    if (index >= (std::uint64_t(1) << depth)) {
        throw MalformedInputError(
            "Index " + std::to_string(index) + " out of range for depth " +
            std::to_string(depth));
    }
    return computeRootFromPath(leaf, index, path) == root;
}

bool MerkleWitness::verify() const {
    try {
        return verifyPath(leaf, index, path, root, path.size());
    } catch (const MalformedInputError& e) {
        std::cerr << "MerkleWitness::verify: " << e.what() << std::endl;
        return false;
    }
}

std::vector<std::uint8_t> MerkleWitness::serialize() const {
    if (path.size() > CircuitConfig::MAX_DEPTH) {
        throw MalformedInputError("Witness path too long to serialize");
    }

    std::vector<std::uint8_t> data;
    data.reserve(2 + 8 + 32 * (2 + path.size()));
    data.push_back(FORMAT_VERSION);
    data.push_back(static_cast<std::uint8_t>(path.size()));
    for (int shift = 56; shift >= 0; shift -= 8) {
        data.push_back(static_cast<std::uint8_t>((index >> shift) & 0xFF));
    }
    appendBytes(data, leaf);
    appendBytes(data, root);
    for (const auto& sibling : path) {
        appendBytes(data, sibling);
    }
    return data;
}

MerkleWitness MerkleWitness::deserialize(const std::vector<std::uint8_t>& data) {
    constexpr std::size_t HEADER = 2 + 8;
    if (data.size() < HEADER + 64) {
        throw MalformedInputError("Invalid serialized witness size");
    }
    if (data[0] != FORMAT_VERSION) {
        throw MalformedInputError(
            "Unsupported witness format version " + std::to_string(data[0]));
    }

    const std::size_t depth = data[1];
    if (data.size() != HEADER + 32 * (2 + depth)) {
        throw MalformedInputError("Serialized witness length does not match its depth");
    }

    MerkleWitness w;
    for (std::size_t i = 0; i < 8; ++i) {
        w.index = (w.index << 8) | data[2 + i];
    }
    std::size_t offset = HEADER;
    w.leaf = readField(data, offset);
    offset += 32;
    w.root = readField(data, offset);
    offset += 32;
    w.path.reserve(depth);
    for (std::size_t i = 0; i < depth; ++i, offset += 32) {
        w.path.push_back(readField(data, offset));
    }
    return w;
}

DistrictTree::DistrictTree(std::size_t depth, std::vector<std::vector<FieldT>> levels)
    : depth_(depth)
    , levels_(std::move(levels))
    , emptyHashes_(computeEmptyHashes(depth))
{
    root_ = levels_[depth_].empty() ? emptyHashes_[depth_] : levels_[depth_][0];
}

DistrictTree DistrictTree::build(
    const std::vector<FieldT>& leaves,
    std::size_t depth,
    DuplicateLeaves duplicates)
{
    checkTreeDepth(depth);
    if (leaves.size() > (std::uint64_t(1) << depth)) {
        throw MalformedInputError(
            std::to_string(leaves.size()) + " leaves do not fit a tree of depth " +
            std::to_string(depth));
    }
    if (duplicates == DuplicateLeaves::Reject)
        checkDistinct(leaves);

    const std::vector<FieldT> empty = computeEmptyHashes(depth);

    std::vector<std::vector<FieldT>> levels(depth + 1);
    levels[0] = leaves;
    for (std::size_t level = 0; level < depth; ++level) {
        const std::vector<FieldT>& current = levels[level];
        const std::size_t parents = (current.size() + 1) / 2;

        std::vector<FieldT> lefts(parents);
        std::vector<FieldT> rights(parents);
        for (std::size_t i = 0; i < parents; ++i) {
            lefts[i] = current[2 * i];
            rights[i] = 2 * i + 1 < current.size() ? current[2 * i + 1] : empty[level];
        }
        levels[level + 1] = hashPairsBatch(lefts, rights);
    }

    return DistrictTree(depth, std::move(levels));
}

DistrictTree DistrictTree::fromIdentities(
    const std::vector<FieldT>& identityCommitments,
    std::size_t depth)
{
    return build(hashSinglesBatch(identityCommitments), depth);
}

const FieldT& DistrictTree::leaf(std::uint64_t position) const {
    return node(0, position);
}

const FieldT& DistrictTree::node(std::size_t level, std::uint64_t position) const {
    if (level > depth_) {
        throw std::out_of_range("Level " + std::to_string(level) + " not in tree");
    }
    if (position >= (std::uint64_t(1) << (depth_ - level))) {
        throw std::out_of_range("Position " + std::to_string(position) + " not in tree");
    }
    const auto& nodes = levels_[level];
    return position < nodes.size() ? nodes[position] : emptyHashes_[level];
}

std::vector<FieldT> DistrictTree::authPath(std::uint64_t position) const {
    if (position >= capacity()) {
        throw std::out_of_range("Position not in tree");
    }

    std::vector<FieldT> path;
    path.reserve(depth_);
    std::uint64_t pos = position;
    for (std::size_t level = 0; level < depth_; ++level) {
        path.push_back(node(level, pos ^ 1));
        pos >>= 1;
    }
    return path;
}

MerkleWitness DistrictTree::witness(std::uint64_t position) const {
    MerkleWitness w;
    w.leaf = leaf(position);
    w.path = authPath(position);
    w.index = position;
    w.root = root_;
    return w;
}

std::optional<std::uint64_t> DistrictTree::find(const FieldT& leaf) const {
    const auto& leaves = levels_[0];
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        if (leaves[i] == leaf)
            return i;
    }
    return std::nullopt;
}

MembershipWitness makeMembershipWitness(
    const DistrictTree& district,
    std::uint64_t position,
    const FieldT& identityCommitment,
    const ActionScope& scope)
{
    if (position >= district.capacity()) {
        throw MalformedInputError("Leaf position " + std::to_string(position) + " not in tree");
    }
    if (district.leaf(position) != computeLeaf(identityCommitment)) {
        throw MalformedInputError(
            "Identity commitment does not match leaf " + std::to_string(position));
    }

    MembershipWitness w;
    w.identityCommitment = identityCommitment;
    w.actionId = scope.actionId;
    w.templateTag = scope.templateTag;
    w.districtIndex = position;
    w.districtPath = district.authPath(position);
    w.districtRoot = district.root();
    return w;
}

MembershipWitness makeMembershipWitness(
    const DistrictTree& district,
    const FieldT& identityCommitment,
    const ActionScope& scope)
{
    const auto position = district.find(computeLeaf(identityCommitment));
    if (!position) {
        throw MalformedInputError("Identity commitment is not a member of the district");
    }
    return makeMembershipWitness(district, *position, identityCommitment, scope);
}

TwoTierAtlas::TwoTierAtlas(std::vector<DistrictTree> districts, std::size_t globalDepth)
    : districts_(std::move(districts))
    , global_(buildGlobal(districts_, globalDepth))
{
}

const DistrictTree& TwoTierAtlas::district(std::size_t index) const {
    if (index >= districts_.size()) {
        throw std::out_of_range("District " + std::to_string(index) + " not in atlas");
    }
    return districts_[index];
}

CircuitConfig TwoTierAtlas::config() const {
    return CircuitConfig::twoTier(districts_.front().depth(), global_.depth());
}

MembershipWitness TwoTierAtlas::membership(
    std::size_t districtIndex,
    std::uint64_t leafIndex,
    const FieldT& identityCommitment,
    const ActionScope& scope) const
{
    const DistrictTree& d = district(districtIndex);
    MembershipWitness w = makeMembershipWitness(d, leafIndex, identityCommitment, scope);
    w.globalIndex = districtIndex;
    w.globalPath = global_.authPath(districtIndex);
    w.globalRoot = global_.root();
    return w;
}

} // namespace zkp
} // namespace civic

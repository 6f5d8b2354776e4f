#pragma once

#include <libcivic/zkp/circuits/PoseidonGadget.h>
#include <libcivic/zkp/circuits/SelectGadget.h>

namespace civic {
namespace zkp {

/**
 * Decomposes a leaf index into `depth` bits, least significant first.
 *
 * Each bit is constrained boolean and the bits must recompose to the
 * index, so an index >= 2^depth cannot be satisfied.
 */
class IndexBitsGadget : public gadget<FieldT> {
public:
    IndexBitsGadget(
        protoboard<FieldT>& pb,
        const pb_variable<FieldT>& index,
        std::size_t depth,
        const std::string& annotation_prefix);

    void generate_r1cs_constraints();

    /// Fills bits from the low `depth` bits of the assigned index.
    void generate_r1cs_witness();

    const pb_variable_array<FieldT>& bits() const { return bits_; }

private:
    pb_variable<FieldT> index_;
    pb_variable_array<FieldT> bits_;
};

/**
 * Merkle inclusion check.
 *
 * Level i hashes the running node with siblings[i] in both orders and
 * selects with index bit i (0: running node is the left child). The
 * final node is written to `computedRoot`; binding it to a public root
 * is left to the caller.
 */
class MerklePathGadget : public gadget<FieldT> {
public:
    MerklePathGadget(
        protoboard<FieldT>& pb,
        std::size_t depth,
        const pb_variable<FieldT>& leaf,
        const pb_variable<FieldT>& index,
        const pb_variable_array<FieldT>& siblings,
        const pb_variable<FieldT>& computedRoot,
        const std::string& annotation_prefix);

    void generate_r1cs_constraints();

    /// Requires leaf, index and siblings to be assigned.
    void generate_r1cs_witness();

    std::size_t depth() const { return depth_; }
    const pb_variable_array<FieldT>& indexBits() const { return indexBits_->bits(); }

private:
    std::size_t depth_;
    pb_variable_array<FieldT> siblings_;

    std::unique_ptr<IndexBitsGadget> indexBits_;
    pb_variable_array<FieldT> asLeft_;
    pb_variable_array<FieldT> asRight_;
    pb_variable_array<FieldT> intermediate_;

    std::vector<std::unique_ptr<HashPairGadget>> leftHashers_;
    std::vector<std::unique_ptr<HashPairGadget>> rightHashers_;
    std::vector<std::unique_ptr<SelectGadget>> selectors_;
};

} // namespace zkp
} // namespace civic

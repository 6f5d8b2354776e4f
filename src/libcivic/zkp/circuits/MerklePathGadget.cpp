#include "MerklePathGadget.h"
#include <libcivic/zkp/ZkErrors.h>
#include <libff/common/utils.hpp>
#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

namespace civic {
namespace zkp {

IndexBitsGadget::IndexBitsGadget(
    protoboard<FieldT>& pb,
    const pb_variable<FieldT>& index,
    std::size_t depth,
    const std::string& annotation_prefix)
    : gadget<FieldT>(pb, annotation_prefix)
    , index_(index)
{
    bits_.allocate(pb, depth, FMT(this->annotation_prefix, " bits"));
}

void IndexBitsGadget::generate_r1cs_constraints() {
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(
            this->pb, bits_[i], FMT(this->annotation_prefix, " bit_%zu_boolean", i));
    }

    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldT>(
            1,
            libsnark::pb_packing_sum<FieldT>(libsnark::pb_linear_combination_array<FieldT>(bits_)),
            index_),
        FMT(this->annotation_prefix, " recompose"));
}

void IndexBitsGadget::generate_r1cs_witness() {
    bits_.fill_with_bits_of_field_element(this->pb, this->pb.val(index_));
}

MerklePathGadget::MerklePathGadget(
    protoboard<FieldT>& pb,
    std::size_t depth,
    const pb_variable<FieldT>& leaf,
    const pb_variable<FieldT>& index,
    const pb_variable_array<FieldT>& siblings,
    const pb_variable<FieldT>& computedRoot,
    const std::string& annotation_prefix)
    : gadget<FieldT>(pb, annotation_prefix)
    , depth_(depth)
    , siblings_(siblings)
{
    if (depth == 0 || siblings.size() != depth) {
        throw MalformedInputError(
            "Merkle path gadget needs depth >= 1 and one sibling per level");
    }

    indexBits_ = std::make_unique<IndexBitsGadget>(
        pb, index, depth, FMT(this->annotation_prefix, " index"));

    asLeft_.allocate(pb, depth, FMT(this->annotation_prefix, " as_left"));
    asRight_.allocate(pb, depth, FMT(this->annotation_prefix, " as_right"));
    intermediate_.allocate(pb, depth - 1, FMT(this->annotation_prefix, " node"));

    for (std::size_t i = 0; i < depth; ++i) {
        const pb_variable<FieldT>& current = i == 0 ? leaf : intermediate_[i - 1];
        const pb_variable<FieldT>& next = i + 1 == depth ? computedRoot : intermediate_[i];

        leftHashers_.push_back(std::make_unique<HashPairGadget>(
            pb,
            HashPairGadget::Inputs{current, siblings_[i]},
            asLeft_[i],
            FMT(this->annotation_prefix, " level_%zu_left", i)));
        rightHashers_.push_back(std::make_unique<HashPairGadget>(
            pb,
            HashPairGadget::Inputs{siblings_[i], current},
            asRight_[i],
            FMT(this->annotation_prefix, " level_%zu_right", i)));

        // bit 1 means the running node is the right child
        selectors_.push_back(std::make_unique<SelectGadget>(
            pb,
            indexBits_->bits()[i],
            asRight_[i],
            asLeft_[i],
            next,
            FMT(this->annotation_prefix, " level_%zu_select", i)));
    }
}

void MerklePathGadget::generate_r1cs_constraints() {
    indexBits_->generate_r1cs_constraints();
    for (std::size_t i = 0; i < depth_; ++i) {
        leftHashers_[i]->generate_r1cs_constraints();
        rightHashers_[i]->generate_r1cs_constraints();
        selectors_[i]->generate_r1cs_constraints();
    }
}

void MerklePathGadget::generate_r1cs_witness() {
    indexBits_->generate_r1cs_witness();
    for (std::size_t i = 0; i < depth_; ++i) {
        leftHashers_[i]->generate_r1cs_witness();
        rightHashers_[i]->generate_r1cs_witness();
        selectors_[i]->generate_r1cs_witness();
    }
}

} // namespace zkp
} // namespace civic

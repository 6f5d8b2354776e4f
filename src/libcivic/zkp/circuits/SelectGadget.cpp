#include "SelectGadget.h"
#include <libff/common/utils.hpp>

namespace civic {
namespace zkp {

SelectGadget::SelectGadget(
    protoboard<FieldT>& pb,
    const pb_variable<FieldT>& bit,
    const pb_variable<FieldT>& ifTrue,
    const pb_variable<FieldT>& ifFalse,
    const pb_variable<FieldT>& out,
    const std::string& annotation_prefix)
    : gadget<FieldT>(pb, annotation_prefix)
    , bit_(bit)
    , ifTrue_(ifTrue)
    , ifFalse_(ifFalse)
    , out_(out)
{
}

void SelectGadget::generate_r1cs_constraints() {
    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldT>(
            bit_,
            linear_combination<FieldT>(ifTrue_) - linear_combination<FieldT>(ifFalse_),
            linear_combination<FieldT>(out_) - linear_combination<FieldT>(ifFalse_)),
        FMT(this->annotation_prefix, " select"));
}

void SelectGadget::generate_r1cs_witness() {
    const FieldT b = this->pb.val(bit_);
    this->pb.val(out_) = b * (this->pb.val(ifTrue_) - this->pb.val(ifFalse_)) + this->pb.val(ifFalse_);
}

} // namespace zkp
} // namespace civic

#pragma once

#include <libcivic/zkp/circuits/PoseidonGadget.h>

namespace civic {
namespace zkp {

/**
 * out = bit ? ifTrue : ifFalse, as bit * (ifTrue - ifFalse) = out - ifFalse.
 *
 * The bit is not constrained here; callers must make it boolean.
 */
class SelectGadget : public gadget<FieldT> {
public:
    SelectGadget(
        protoboard<FieldT>& pb,
        const pb_variable<FieldT>& bit,
        const pb_variable<FieldT>& ifTrue,
        const pb_variable<FieldT>& ifFalse,
        const pb_variable<FieldT>& out,
        const std::string& annotation_prefix);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

private:
    pb_variable<FieldT> bit_;
    pb_variable<FieldT> ifTrue_;
    pb_variable<FieldT> ifFalse_;
    pb_variable<FieldT> out_;
};

} // namespace zkp
} // namespace civic

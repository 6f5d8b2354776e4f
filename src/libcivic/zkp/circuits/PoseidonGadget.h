#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libcivic/zkp/PoseidonHash.h>

namespace civic {
namespace zkp {

using libsnark::gadget;
using libsnark::linear_combination;
using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::protoboard;
using libsnark::r1cs_constraint;

/**
 * Poseidon permutation in R1CS.
 *
 * Inputs are linear combinations so the sponge can feed absorbed state
 * straight in. Round constants and the MDS mix stay inside linear
 * combinations; only S-boxes allocate variables, three per S-box
 * (x^2, x^4, x^5), one constraint each.
 */
class PoseidonPermutationGadget : public gadget<FieldT> {
public:
    using State = std::array<linear_combination<FieldT>, PoseidonParams::width>;

    PoseidonPermutationGadget(
        protoboard<FieldT>& pb,
        const State& input,
        const std::string& annotation_prefix);

    void generate_r1cs_constraints();

    /**
     * Assign the S-box variables.
     * @param inputValues values of the input linear combinations
     */
    void generate_r1cs_witness(const PoseidonState& inputValues);

    const State& outputs() const { return output_; }
    const PoseidonState& outputValues() const { return outputValues_; }

private:
    struct SboxVars {
        linear_combination<FieldT> in;
        pb_variable<FieldT> x2;
        pb_variable<FieldT> x4;
        pb_variable<FieldT> x5;
    };

    State output_;
    std::vector<SboxVars> sboxes_;
    PoseidonState outputValues_;
};

/**
 * Fixed-arity Poseidon sponge bound to an output variable. Follows the
 * native absorption schedule exactly.
 */
template <std::size_t Arity>
class PoseidonSpongeGadget : public gadget<FieldT> {
    static_assert(Arity >= 1 && Arity <= 3, "Poseidon sponge arity must be 1, 2 or 3");

public:
    using Inputs = std::array<pb_variable<FieldT>, Arity>;

    PoseidonSpongeGadget(
        protoboard<FieldT>& pb,
        const Inputs& inputs,
        const pb_variable<FieldT>& output,
        const std::string& annotation_prefix);

    void generate_r1cs_constraints();

    /// Requires input values to be assigned. Sets the output variable.
    void generate_r1cs_witness();

private:
    Inputs inputs_;
    pb_variable<FieldT> output_;
    std::vector<std::unique_ptr<PoseidonPermutationGadget>> permutations_;
};

using HashSingleGadget = PoseidonSpongeGadget<1>;
using HashPairGadget = PoseidonSpongeGadget<2>;
using HashTripleGadget = PoseidonSpongeGadget<3>;

extern template class PoseidonSpongeGadget<1>;
extern template class PoseidonSpongeGadget<2>;
extern template class PoseidonSpongeGadget<3>;

} // namespace zkp
} // namespace civic

#include "PoseidonGadget.h"
#include <libff/common/utils.hpp>

namespace civic {
namespace zkp {

PoseidonPermutationGadget::PoseidonPermutationGadget(
    protoboard<FieldT>& pb,
    const State& input,
    const std::string& annotation_prefix)
    : gadget<FieldT>(pb, annotation_prefix)
{
    const PoseidonParams& params = poseidonParams();

    State state = input;
    for (std::size_t r = 0; r < PoseidonParams::totalRounds; ++r) {
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            state[i] = state[i] + linear_combination<FieldT>(params.roundConstants[r][i]);
        }

        const std::size_t lanes = PoseidonParams::isFullRound(r) ? PoseidonParams::width : 1;
        for (std::size_t i = 0; i < lanes; ++i) {
            SboxVars sbox;
            sbox.in = state[i];
            sbox.x2.allocate(pb, FMT(this->annotation_prefix, " r%zu_l%zu_x2", r, i));
            sbox.x4.allocate(pb, FMT(this->annotation_prefix, " r%zu_l%zu_x4", r, i));
            sbox.x5.allocate(pb, FMT(this->annotation_prefix, " r%zu_l%zu_x5", r, i));
            state[i] = linear_combination<FieldT>(sbox.x5);
            sboxes_.push_back(sbox);
        }

        State mixed;
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            linear_combination<FieldT> acc;
            for (std::size_t j = 0; j < PoseidonParams::width; ++j) {
                acc = acc + params.mds[i][j] * state[j];
            }
            mixed[i] = acc;
        }
        state = mixed;
    }
    output_ = state;
}

void PoseidonPermutationGadget::generate_r1cs_constraints() {
    for (std::size_t k = 0; k < sboxes_.size(); ++k) {
        const SboxVars& s = sboxes_[k];
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(s.in, s.in, s.x2),
            FMT(this->annotation_prefix, " sbox_%zu_square", k));
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(s.x2, s.x2, s.x4),
            FMT(this->annotation_prefix, " sbox_%zu_quad", k));
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(s.x4, s.in, s.x5),
            FMT(this->annotation_prefix, " sbox_%zu_quint", k));
    }
}

void PoseidonPermutationGadget::generate_r1cs_witness(const PoseidonState& inputValues) {
    const PoseidonParams& params = poseidonParams();

    PoseidonState state = inputValues;
    std::size_t k = 0;
    for (std::size_t r = 0; r < PoseidonParams::totalRounds; ++r) {
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            state[i] += params.roundConstants[r][i];
        }

        const std::size_t lanes = PoseidonParams::isFullRound(r) ? PoseidonParams::width : 1;
        for (std::size_t i = 0; i < lanes; ++i, ++k) {
            const FieldT x2 = state[i].squared();
            const FieldT x4 = x2.squared();
            const FieldT x5 = x4 * state[i];
            this->pb.val(sboxes_[k].x2) = x2;
            this->pb.val(sboxes_[k].x4) = x4;
            this->pb.val(sboxes_[k].x5) = x5;
            state[i] = x5;
        }

        PoseidonState mixed;
        for (std::size_t i = 0; i < PoseidonParams::width; ++i) {
            FieldT acc = FieldT::zero();
            for (std::size_t j = 0; j < PoseidonParams::width; ++j) {
                acc += params.mds[i][j] * state[j];
            }
            mixed[i] = acc;
        }
        state = mixed;
    }
    outputValues_ = state;
}

template <std::size_t Arity>
PoseidonSpongeGadget<Arity>::PoseidonSpongeGadget(
    protoboard<FieldT>& pb,
    const Inputs& inputs,
    const pb_variable<FieldT>& output,
    const std::string& annotation_prefix)
    : gadget<FieldT>(pb, annotation_prefix)
    , inputs_(inputs)
    , output_(output)
{
    PoseidonPermutationGadget::State state = {
        linear_combination<FieldT>(detail::spongeCapacity()),
        linear_combination<FieldT>(FieldT::zero()),
        linear_combination<FieldT>(FieldT::zero())};

    const auto& schedule = detail::absorptionSchedule(Arity);
    for (std::size_t p = 0; p < schedule.size(); ++p) {
        for (const Absorption& step : schedule[p]) {
            if (step.padding)
                state[step.lane] = state[step.lane] + linear_combination<FieldT>(FieldT::one());
            else
                state[step.lane] = state[step.lane] + linear_combination<FieldT>(inputs_[step.input]);
        }
        permutations_.push_back(std::make_unique<PoseidonPermutationGadget>(
            pb, state, FMT(this->annotation_prefix, " permutation_%zu", p)));
        state = permutations_.back()->outputs();
    }
}

template <std::size_t Arity>
void PoseidonSpongeGadget<Arity>::generate_r1cs_constraints() {
    for (auto& permutation : permutations_) {
        permutation->generate_r1cs_constraints();
    }

    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldT>(1, permutations_.back()->outputs()[1], output_),
        FMT(this->annotation_prefix, " squeeze"));
}

template <std::size_t Arity>
void PoseidonSpongeGadget<Arity>::generate_r1cs_witness() {
    PoseidonState state{detail::spongeCapacity(), FieldT::zero(), FieldT::zero()};

    const auto& schedule = detail::absorptionSchedule(Arity);
    for (std::size_t p = 0; p < schedule.size(); ++p) {
        for (const Absorption& step : schedule[p]) {
            state[step.lane] += step.padding ? FieldT::one() : this->pb.val(inputs_[step.input]);
        }
        permutations_[p]->generate_r1cs_witness(state);
        state = permutations_[p]->outputValues();
    }

    this->pb.val(output_) = state[1];
}

template class PoseidonSpongeGadget<1>;
template class PoseidonSpongeGadget<2>;
template class PoseidonSpongeGadget<3>;

} // namespace zkp
} // namespace civic

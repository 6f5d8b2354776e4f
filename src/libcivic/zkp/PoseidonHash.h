#pragma once

#include "PoseidonConstants.h"
#include <array>
#include <utility>
#include <vector>

namespace civic {
namespace zkp {

using PoseidonState = std::array<FieldT, PoseidonParams::width>;

/**
 * One absorption step of the sponge: input `input` (or the constant 1
 * when `padding` is set) is added into state lane `lane`.
 */
struct Absorption {
    std::size_t lane;
    std::size_t input;
    bool padding;
};

namespace detail {

/**
 * Absorption steps for an input of `arity` elements, one inner vector
 * per permutation call. Shared by the native hasher and the gadget so
 * both follow the same padding rule.
 */
const std::vector<std::vector<Absorption>>& absorptionSchedule(std::size_t arity);

/// Initial capacity lane, 2^64.
const FieldT& spongeCapacity();

} // namespace detail

/// In-place Poseidon permutation.
void poseidonPermute(PoseidonState& state);

/**
 * Sponge hashes with fixed arity. Each arity has its own entry point so
 * hashes of different lengths never share a domain.
 */
FieldT hashSingle(const FieldT& a);
FieldT hashPair(const FieldT& left, const FieldT& right);
FieldT hashTriple(const FieldT& a, const FieldT& b, const FieldT& c);

/**
 * Hash many pairs. Output i equals hashPair(lefts[i], rights[i]).
 * Runs in parallel when built with MULTICORE.
 *
 * @throws MalformedInputError if the input lengths differ.
 */
std::vector<FieldT> hashPairsBatch(
    const std::vector<FieldT>& lefts,
    const std::vector<FieldT>& rights);

std::vector<FieldT> hashPairsBatch(
    const std::vector<std::pair<FieldT, FieldT>>& pairs);

std::vector<FieldT> hashSinglesBatch(const std::vector<FieldT>& inputs);

} // namespace zkp
} // namespace civic

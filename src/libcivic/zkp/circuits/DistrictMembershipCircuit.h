#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libcivic/zkp/CircuitConfig.h>

namespace civic {
namespace zkp {

/**
 * District Membership Circuit
 * ============================================
 *
 * Proves that a private identity commitment is a leaf of a district tree
 * (and, for two-tier circuits, that the district root is a leaf of a
 * global tree) and derives a nullifier bound to the action.
 *
 * PUBLIC INPUTS (in order):
 *   SingleTierV1: [district_root, nullifier, action_id]
 *   TwoTierV1:    [district_root, global_root, nullifier, action_id]
 *
 * PRIVATE INPUTS:
 *   identity commitment, template tag, district index + path,
 *   global index + path (two-tier)
 *
 * CONSTRAINTS:
 *   leaf = H1(identity)
 *   MerklePath(leaf, district_index, district_path) = district_root
 *   MerklePath(district_root, global_index, global_path) = global_root
 *   nullifier = H3(identity, action_id, template_tag)
 */
class DistrictMembershipCircuit {
public:
    /// @throws MalformedInputError for an invalid configuration.
    explicit DistrictMembershipCircuit(const CircuitConfig& config);

    ~DistrictMembershipCircuit();

    DistrictMembershipCircuit(const DistrictMembershipCircuit&) = delete;
    DistrictMembershipCircuit& operator=(const DistrictMembershipCircuit&) = delete;

    /**
     * Build all gadgets and emit their constraints. Must be called once
     * before generateWitness.
     */
    void generateConstraints();

    /**
     * Assign every variable from the witness and run each gadget's
     * witness generator. Does not check satisfaction; see isSatisfied().
     *
     * Index ranges are not checked here; an out-of-range index is left
     * to the recomposition constraint.
     *
     * @throws MalformedInputError if a path has the wrong length
     * @throws std::logic_error if constraints were not generated
     * @return the auxiliary input
     */
    libsnark::r1cs_auxiliary_input<FieldT> generateWitness(const MembershipWitness& witness);

    bool isSatisfied() const;

    PublicInputs getPublicInputs() const;

    /// Roots as computed from the private paths, before binding to publics.
    FieldT getComputedDistrictRoot() const;
    std::optional<FieldT> getComputedGlobalRoot() const;

    const CircuitConfig& config() const;
    std::size_t numConstraints() const;
    std::size_t numVariables() const;
    std::size_t numInputs() const;

    // Circuit system accessors
    libsnark::r1cs_constraint_system<FieldT> getConstraintSystem() const;
    libsnark::r1cs_primary_input<FieldT> getPrimaryInput() const;
    libsnark::r1cs_auxiliary_input<FieldT> getAuxiliaryInput() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace zkp
} // namespace civic

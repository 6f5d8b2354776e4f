#include "DistrictMembershipCircuit.h"
#include "MerklePathGadget.h"
#include "PoseidonGadget.h"
#include <libcivic/zkp/ZkErrors.h>
#include <libff/common/utils.hpp>
#include <stdexcept>

namespace civic {
namespace zkp {

class DistrictMembershipCircuit::Impl {
public:
    explicit Impl(const CircuitConfig& config)
        : config_(config)
    {
        config_.validate();
        pb_ = std::make_shared<protoboard<FieldT>>();

        // Public inputs first, in the order fixed by the circuit version.
        districtRoot_.allocate(*pb_, "district_root");
        if (config_.isTwoTier())
            globalRoot_.allocate(*pb_, "global_root");
        nullifier_.allocate(*pb_, "nullifier");
        actionId_.allocate(*pb_, "action_id");
        pb_->set_input_sizes(config_.numPublicInputs());

        identity_.allocate(*pb_, "identity_commitment");
        templateTag_.allocate(*pb_, "template_tag");
        leaf_.allocate(*pb_, "leaf");

        districtIndex_.allocate(*pb_, "district_index");
        districtPath_.allocate(*pb_, config_.districtDepth, "district_path");
        computedDistrictRoot_.allocate(*pb_, "computed_district_root");

        if (config_.isTwoTier()) {
            globalIndex_.allocate(*pb_, "global_index");
            globalPath_.allocate(*pb_, config_.globalDepth, "global_path");
            computedGlobalRoot_.allocate(*pb_, "computed_global_root");
        }
    }

    void generateConstraints() {
        if (constraintsGenerated_)
            return;

        leafHasher_ = std::make_unique<HashSingleGadget>(
            *pb_, HashSingleGadget::Inputs{identity_}, leaf_, "leaf_hash");
        districtVerifier_ = std::make_unique<MerklePathGadget>(
            *pb_,
            config_.districtDepth,
            leaf_,
            districtIndex_,
            districtPath_,
            computedDistrictRoot_,
            "district_membership");
        if (config_.isTwoTier()) {
            globalVerifier_ = std::make_unique<MerklePathGadget>(
                *pb_,
                config_.globalDepth,
                districtRoot_,
                globalIndex_,
                globalPath_,
                computedGlobalRoot_,
                "global_membership");
        }
        nullifierHasher_ = std::make_unique<HashTripleGadget>(
            *pb_,
            HashTripleGadget::Inputs{identity_, actionId_, templateTag_},
            nullifier_,
            "nullifier_hash");

        leafHasher_->generate_r1cs_constraints();
        districtVerifier_->generate_r1cs_constraints();
        pb_->add_r1cs_constraint(
            r1cs_constraint<FieldT>(computedDistrictRoot_, 1, districtRoot_),
            "district_root_binding");

        if (globalVerifier_) {
            globalVerifier_->generate_r1cs_constraints();
            pb_->add_r1cs_constraint(
                r1cs_constraint<FieldT>(computedGlobalRoot_, 1, globalRoot_),
                "global_root_binding");
        }

        nullifierHasher_->generate_r1cs_constraints();
        constraintsGenerated_ = true;
    }

    libsnark::r1cs_auxiliary_input<FieldT> generateWitness(const MembershipWitness& w) {
        if (!constraintsGenerated_) {
            throw std::logic_error("generateConstraints() must be called before generateWitness()");
        }
        if (w.districtPath.size() != config_.districtDepth) {
            throw MalformedInputError(
                "District path has " + std::to_string(w.districtPath.size()) +
                " siblings, expected " + std::to_string(config_.districtDepth));
        }
        if (config_.isTwoTier() && w.globalPath.size() != config_.globalDepth) {
            throw MalformedInputError(
                "Global path has " + std::to_string(w.globalPath.size()) +
                " siblings, expected " + std::to_string(config_.globalDepth));
        }

        pb_->val(identity_) = w.identityCommitment;
        pb_->val(templateTag_) = w.templateTag;
        pb_->val(actionId_) = w.actionId;

        pb_->val(districtIndex_) = fieldFromUint64(w.districtIndex);
        districtPath_.fill_with_field_elements(*pb_, w.districtPath);
        pb_->val(districtRoot_) = w.districtRoot;

        leafHasher_->generate_r1cs_witness();
        districtVerifier_->generate_r1cs_witness();

        if (globalVerifier_) {
            pb_->val(globalIndex_) = fieldFromUint64(w.globalIndex);
            globalPath_.fill_with_field_elements(*pb_, w.globalPath);
            pb_->val(globalRoot_) = w.globalRoot;
            globalVerifier_->generate_r1cs_witness();
        }

        nullifierHasher_->generate_r1cs_witness();

        return pb_->auxiliary_input();
    }

    PublicInputs getPublicInputs() const {
        PublicInputs publics;
        publics.districtRoot = pb_->val(districtRoot_);
        if (config_.isTwoTier())
            publics.globalRoot = pb_->val(globalRoot_);
        publics.nullifier = pb_->val(nullifier_);
        publics.actionId = pb_->val(actionId_);
        return publics;
    }

    FieldT getComputedDistrictRoot() const {
        return pb_->val(computedDistrictRoot_);
    }

    std::optional<FieldT> getComputedGlobalRoot() const {
        if (!config_.isTwoTier())
            return std::nullopt;
        return pb_->val(computedGlobalRoot_);
    }

    const CircuitConfig& config() const { return config_; }
    std::shared_ptr<protoboard<FieldT>> protoboardPtr() const { return pb_; }

private:
    CircuitConfig config_;
    std::shared_ptr<protoboard<FieldT>> pb_;
    bool constraintsGenerated_ = false;

    // Public
    pb_variable<FieldT> districtRoot_;
    pb_variable<FieldT> globalRoot_;
    pb_variable<FieldT> nullifier_;
    pb_variable<FieldT> actionId_;

    // Private
    pb_variable<FieldT> identity_;
    pb_variable<FieldT> templateTag_;
    pb_variable<FieldT> leaf_;
    pb_variable<FieldT> districtIndex_;
    pb_variable_array<FieldT> districtPath_;
    pb_variable<FieldT> computedDistrictRoot_;
    pb_variable<FieldT> globalIndex_;
    pb_variable_array<FieldT> globalPath_;
    pb_variable<FieldT> computedGlobalRoot_;

    std::unique_ptr<HashSingleGadget> leafHasher_;
    std::unique_ptr<MerklePathGadget> districtVerifier_;
    std::unique_ptr<MerklePathGadget> globalVerifier_;
    std::unique_ptr<HashTripleGadget> nullifierHasher_;
};

DistrictMembershipCircuit::DistrictMembershipCircuit(const CircuitConfig& config)
    : pImpl_(std::make_unique<Impl>(config))
{
}

DistrictMembershipCircuit::~DistrictMembershipCircuit() = default;

void DistrictMembershipCircuit::generateConstraints() {
    pImpl_->generateConstraints();
}

libsnark::r1cs_auxiliary_input<FieldT>
DistrictMembershipCircuit::generateWitness(const MembershipWitness& witness) {
    return pImpl_->generateWitness(witness);
}

bool DistrictMembershipCircuit::isSatisfied() const {
    return pImpl_->protoboardPtr()->is_satisfied();
}

PublicInputs DistrictMembershipCircuit::getPublicInputs() const {
    return pImpl_->getPublicInputs();
}

FieldT DistrictMembershipCircuit::getComputedDistrictRoot() const {
    return pImpl_->getComputedDistrictRoot();
}

std::optional<FieldT> DistrictMembershipCircuit::getComputedGlobalRoot() const {
    return pImpl_->getComputedGlobalRoot();
}

const CircuitConfig& DistrictMembershipCircuit::config() const { return pImpl_->config(); }

std::size_t DistrictMembershipCircuit::numConstraints() const {
    return pImpl_->protoboardPtr()->num_constraints();
}

std::size_t DistrictMembershipCircuit::numVariables() const {
    return pImpl_->protoboardPtr()->num_variables();
}

std::size_t DistrictMembershipCircuit::numInputs() const {
    return pImpl_->protoboardPtr()->num_inputs();
}

libsnark::r1cs_constraint_system<FieldT> DistrictMembershipCircuit::getConstraintSystem() const {
    return pImpl_->protoboardPtr()->get_constraint_system();
}

libsnark::r1cs_primary_input<FieldT> DistrictMembershipCircuit::getPrimaryInput() const {
    return pImpl_->protoboardPtr()->primary_input();
}

libsnark::r1cs_auxiliary_input<FieldT> DistrictMembershipCircuit::getAuxiliaryInput() const {
    return pImpl_->protoboardPtr()->auxiliary_input();
}

} // namespace zkp
} // namespace civic

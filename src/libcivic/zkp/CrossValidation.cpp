#include "CrossValidation.h"
#include "DistrictTree.h"
#include "Nullifier.h"
#include "PoseidonHash.h"
#include "ZkErrors.h"
#include <libcivic/zkp/circuits/DistrictMembershipCircuit.h>
#include <libcivic/zkp/circuits/PoseidonGadget.h>
#include <iostream>

namespace civic {
namespace zkp {

namespace {

template <std::size_t Arity>
FieldT evaluateGadget(const std::array<FieldT, Arity>& values) {
    protoboard<FieldT> pb;
    typename PoseidonSpongeGadget<Arity>::Inputs inputs;
    for (std::size_t i = 0; i < Arity; ++i) {
        inputs[i].allocate(pb, "input");
        pb.val(inputs[i]) = values[i];
    }
    pb_variable<FieldT> output;
    output.allocate(pb, "output");

    PoseidonSpongeGadget<Arity> hasher(pb, inputs, output, "hash");
    hasher.generate_r1cs_constraints();
    hasher.generate_r1cs_witness();

    if (!pb.is_satisfied()) {
        throw ParameterMismatchError("Hash gadget is unsatisfied by its own witness");
    }
    return pb.val(output);
}

void compare(
    std::vector<std::string>& mismatches,
    const std::string& name,
    const FieldT& native,
    const FieldT& constrained)
{
    if (native != constrained) {
        mismatches.push_back(
            name + ": native " + fieldToHex(native) + " != constrained " + fieldToHex(constrained));
    }
}

} // namespace

CrossValidationReport crossValidate(const CircuitConfig& config, const MembershipWitness& witness) {
    validateMembershipWitness(config, witness);

    CrossValidationReport report;

    const FieldT leaf = computeLeaf(witness.identityCommitment);
    report.native.districtRoot = computeRootFromPath(leaf, witness.districtIndex, witness.districtPath);
    if (config.isTwoTier()) {
        report.native.globalRoot =
            computeRootFromPath(witness.districtRoot, witness.globalIndex, witness.globalPath);
    }
    report.native.nullifier =
        computeNullifier(witness.identityCommitment, witness.actionId, witness.templateTag);
    report.native.actionId = witness.actionId;

    DistrictMembershipCircuit circuit(config);
    circuit.generateConstraints();
    circuit.generateWitness(witness);
    report.satisfied = circuit.isSatisfied();

    const PublicInputs publics = circuit.getPublicInputs();
    report.constrained.districtRoot = circuit.getComputedDistrictRoot();
    report.constrained.globalRoot = circuit.getComputedGlobalRoot();
    report.constrained.nullifier = publics.nullifier;
    report.constrained.actionId = publics.actionId;

    compare(report.mismatches, "district_root", report.native.districtRoot, report.constrained.districtRoot);
    if (config.isTwoTier()) {
        compare(report.mismatches, "global_root", *report.native.globalRoot, *report.constrained.globalRoot);
    }
    compare(report.mismatches, "nullifier", report.native.nullifier, report.constrained.nullifier);
    compare(report.mismatches, "action_id", report.native.actionId, report.constrained.actionId);

    return report;
}

void requireAgreement(const CrossValidationReport& report) {
    if (report.agrees())
        return;

    std::string message = "Native and constrained computations disagree";
    if (!report.satisfied)
        message += "; circuit unsatisfied";
    for (const auto& m : report.mismatches) {
        message += "; " + m;
    }
    std::cerr << message << std::endl;
    throw ParameterMismatchError(message);
}

std::vector<HashAgreement> crossValidateHashes(const std::vector<FieldT>& inputs) {
    std::vector<HashAgreement> results;
    const std::size_t n = inputs.size();
    for (std::size_t i = 0; i < n; ++i) {
        const FieldT& a = inputs[i];
        const FieldT& b = inputs[(i + 1) % n];
        const FieldT& c = inputs[(i + 2) % n];
        const std::string suffix = "[" + std::to_string(i) + "]";

        results.push_back({"single" + suffix, hashSingle(a), evaluateGadget<1>({a})});
        results.push_back({"pair" + suffix, hashPair(a, b), evaluateGadget<2>({a, b})});
        results.push_back({"triple" + suffix, hashTriple(a, b, c), evaluateGadget<3>({a, b, c})});
    }
    return results;
}

void requireHashAgreement(const std::vector<FieldT>& inputs) {
    for (const auto& result : crossValidateHashes(inputs)) {
        if (!result.agrees()) {
            const std::string message = "Poseidon " + result.label + " disagrees: native " +
                fieldToHex(result.native) + ", constrained " + fieldToHex(result.constrained);
            std::cerr << message << std::endl;
            throw ParameterMismatchError(message);
        }
    }
}

} // namespace zkp
} // namespace civic

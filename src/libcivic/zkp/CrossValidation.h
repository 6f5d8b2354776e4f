#pragma once

#include "CircuitConfig.h"
#include <string>
#include <vector>

namespace civic {
namespace zkp {

/**
 * Outcome of running one witness through the native code and the
 * constrained circuit side by side.
 */
struct CrossValidationReport {
    PublicInputs native;
    PublicInputs constrained;
    bool satisfied = false;
    std::vector<std::string> mismatches;

    bool agrees() const { return satisfied && mismatches.empty(); }
};

/**
 * Native roots and nullifier for the witness, compared against the
 * values the circuit derives from the same witness. Roots are the
 * computed ones, not the claimed roots in the witness.
 */
CrossValidationReport crossValidate(const CircuitConfig& config, const MembershipWitness& witness);

/// @throws ParameterMismatchError unless report.agrees()
void requireAgreement(const CrossValidationReport& report);

struct HashAgreement {
    std::string label;
    FieldT native;
    FieldT constrained;

    bool agrees() const { return native == constrained; }
};

/**
 * Evaluates single, pair and triple hashes over consecutive inputs with
 * both the native hasher and the gadgets on a scratch protoboard.
 */
std::vector<HashAgreement> crossValidateHashes(const std::vector<FieldT>& inputs);

/// @throws ParameterMismatchError on the first disagreement
void requireHashAgreement(const std::vector<FieldT>& inputs);

} // namespace zkp
} // namespace civic

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>
#include <libcivic/zkp/CircuitConfig.h>

namespace civic {
namespace zkp {

// Structure to hold proof + public inputs
struct ProofData {
    CircuitVersion version = CircuitVersion::SingleTierV1;
    std::vector<unsigned char> proof;
    PublicInputs publics;

    ProofData() = default;

    ProofData(CircuitVersion v, std::vector<unsigned char> p, PublicInputs pub)
        : version(v), proof(std::move(p)), publics(std::move(pub)) {}

    bool empty() const { return proof.empty(); }

    /**
     * Layout: circuit version (1) | proof length (4, big-endian) |
     * proof bytes | public inputs in circuit order (32 each, big-endian).
     *
     * @throws MalformedInputError if publics do not fit the version
     */
    std::vector<unsigned char> serialize() const;

    /// @throws MalformedInputError on unknown versions, bad lengths or unreduced inputs
    static ProofData deserialize(const std::vector<unsigned char>& data);
};

struct ProverOptions {
    /// Print progress lines.
    bool verbose = false;

    /// Where setup() looks for and stores keys. Empty disables persistence.
    std::string keyBasePath;
};

/**
 * Groth16 prover/verifier for one circuit configuration.
 *
 * Keys are immutable once generated or loaded, so prove() and verify()
 * may run concurrently on one instance. Each prove() builds its own
 * circuit. libff profiling stays off as initCurveParameters() left it.
 */
class DistrictProver {
public:
    using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
    using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;

    explicit DistrictProver(const CircuitConfig& config, const ProverOptions& options = {});

    const CircuitConfig& config() const { return config_; }
    bool hasKeys() const { return provingKey_ && verificationKey_; }

    /**
     * Load keys from options.keyBasePath, or generate and save them when
     * none exist there. Without a key path, keys are generated in memory.
     */
    bool setup();

    bool generateKeys();

    /// Writes <base>_pk, <base>_vk and <base>_meta.
    bool saveKeys(const std::string& basePath) const;

    /**
     * @return false if the key files are missing or unreadable
     * @throws ParameterMismatchError if the keys were made for another circuit
     */
    bool loadKeys(const std::string& basePath);

    /**
     * SHA-256 over the circuit version, depths, constraint, variable and
     * input counts, and the Poseidon parameter digest.
     */
    static std::string circuitFingerprint(const CircuitConfig& config);

    /**
     * @throws MalformedInputError for ill-shaped witnesses
     * @throws UnsatisfiedConstraintError if the witness violates the circuit
     * @throws std::logic_error if no proving key is available
     */
    ProofData prove(const MembershipWitness& witness) const;

    /// False for wrong version, malformed proof bytes or a failed check.
    bool verify(const ProofData& proofData) const;

    static std::vector<unsigned char> serializeProof(
        const libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>& proof);
    /**
     * Every point is checked before libff decompresses it.
     *
     * @throws MalformedInputError for a wrong length, bad flag bytes,
     *         unreduced coordinates or an x with no point on the curve
     */
    static libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> deserializeProof(
        const std::vector<unsigned char>& proofData);

private:
    CircuitConfig config_;
    ProverOptions options_;
    std::string fingerprint_;

    std::shared_ptr<const ProvingKey> provingKey_;
    std::shared_ptr<const VerificationKey> verificationKey_;
};

} // namespace zkp
} // namespace civic

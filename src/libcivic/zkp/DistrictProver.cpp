#include "DistrictProver.h"
#include "PoseidonConstants.h"
#include "ZkErrors.h"
#include <libcivic/zkp/circuits/DistrictMembershipCircuit.h>
#include <libff/algebra/curves/alt_bn128/alt_bn128_g1.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_g2.hpp>
#include <libff/common/profiling.hpp>
#include <libff/common/serialization.hpp>
#include <gmp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace civic {
namespace zkp {

namespace {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        ss << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return ss.str();
}

std::map<std::string, std::string> readMeta(std::istream& in) {
    std::map<std::string, std::string> meta;
    std::string line;
    while (std::getline(in, line)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        meta[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return meta;
}

// Closes the libff profiling block on every exit path.
class ProfilingBlock {
public:
    explicit ProfilingBlock(std::string name) : name_(std::move(name)) {
        libff::enter_block(name_);
    }
    ~ProfilingBlock() { libff::leave_block(name_); }

    ProfilingBlock(const ProfilingBlock&) = delete;
    ProfilingBlock& operator=(const ProfilingBlock&) = delete;

private:
    std::string name_;
};

bool isFlagByte(char c) {
    return c == '0' || c == '1';
}

bool isReduced(const libff::alt_bn128_Fq& x) {
    return mpn_cmp(x.mont_repr.data, libff::alt_bn128_modulus_q.data, libff::alt_bn128_q_limbs) < 0;
}

bool isReduced(const libff::alt_bn128_Fq2& x) {
    return isReduced(x.c0) && isReduced(x.c1);
}

// Euler's criterion. Neither BN254 group has a point with y = 0.
template <typename FieldType>
bool isNonZeroSquare(const FieldType& value) {
    return !value.is_zero() && (value ^ FieldType::euler) == FieldType::one();
}

/**
 * Walks one compressed point as libff writes it: zero flag, x, parity of
 * y. libff recovers y with a square root that never returns when
 * x^3 + b has none, so such an x must be refused before parsing.
 */
template <typename FieldType>
void checkCompressedPoint(std::istream& in, const FieldType& coeffB, const std::string& name) {
    char isZero = 0;
    in.read(&isZero, 1);
    libff::consume_OUTPUT_SEPARATOR(in);
    FieldType x;
    in >> x;
    libff::consume_OUTPUT_SEPARATOR(in);
    char yParity = 0;
    in.read(&yParity, 1);
    libff::consume_OUTPUT_NEWLINE(in);

    if (!in || !isFlagByte(isZero) || !isFlagByte(yParity)) {
        throw MalformedInputError("Truncated or malformed proof point " + name);
    }
    if (!isReduced(x)) {
        throw MalformedInputError("Proof point " + name + " has an unreduced x coordinate");
    }
    if (isZero == '0' && !isNonZeroSquare(x.squared() * x + coeffB)) {
        throw MalformedInputError("Proof point " + name + " is not on the curve");
    }
}

std::size_t encodedProofSize() {
    static const std::size_t size = [] {
        libff::G1<DefaultCurve> a = libff::G1<DefaultCurve>::one();
        libff::G2<DefaultCurve> b = libff::G2<DefaultCurve>::one();
        libff::G1<DefaultCurve> c = libff::G1<DefaultCurve>::one();
        const libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> reference(
            std::move(a), std::move(b), std::move(c));
        return DistrictProver::serializeProof(reference).size();
    }();
    return size;
}

void checkProofEncoding(const std::string& bytes) {
    if (bytes.size() != encodedProofSize()) {
        throw MalformedInputError(
            "Proof is " + std::to_string(bytes.size()) + " bytes, expected " +
            std::to_string(encodedProofSize()));
    }

    std::istringstream in(bytes);
    checkCompressedPoint(in, libff::alt_bn128_coeff_b, "A");
    checkCompressedPoint(in, libff::alt_bn128_twist_coeff_b, "B");
    checkCompressedPoint(in, libff::alt_bn128_coeff_b, "C");
    if (in.peek() != std::char_traits<char>::eof()) {
        throw MalformedInputError("Trailing bytes after proof");
    }
}

void appendField(std::vector<unsigned char>& out, const FieldT& element) {
    const FieldBytes bytes = fieldToBytes(element);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

std::vector<unsigned char> ProofData::serialize() const {
    if (proof.size() > 0xFFFFFFFFu) {
        throw MalformedInputError("Proof too large to serialize");
    }
    if (publics.globalRoot.has_value() != (version == CircuitVersion::TwoTierV1)) {
        throw MalformedInputError("Public inputs do not match circuit version " + toString(version));
    }

    const std::vector<FieldT> inputs = publics.toFieldVector();
    std::vector<unsigned char> data;
    data.reserve(1 + 4 + proof.size() + 32 * inputs.size());
    data.push_back(static_cast<unsigned char>(version));

    const auto length = static_cast<std::uint32_t>(proof.size());
    for (int shift = 24; shift >= 0; shift -= 8) {
        data.push_back(static_cast<unsigned char>((length >> shift) & 0xFF));
    }
    data.insert(data.end(), proof.begin(), proof.end());
    for (const auto& input : inputs) {
        appendField(data, input);
    }
    return data;
}

ProofData ProofData::deserialize(const std::vector<unsigned char>& data) {
    constexpr std::size_t HEADER = 1 + 4;
    if (data.size() < HEADER) {
        throw MalformedInputError("Invalid serialized proof size");
    }

    const auto version = static_cast<CircuitVersion>(data[0]);
    if (version != CircuitVersion::SingleTierV1 && version != CircuitVersion::TwoTierV1) {
        throw MalformedInputError("Unknown circuit version " + std::to_string(data[0]));
    }

    std::uint32_t length = 0;
    for (std::size_t i = 1; i < HEADER; ++i) {
        length = (length << 8) | data[i];
    }

    const std::size_t numInputs = version == CircuitVersion::TwoTierV1 ? 4 : 3;
    if (data.size() != HEADER + std::size_t(length) + 32 * numInputs) {
        throw MalformedInputError("Serialized proof length does not match its header");
    }

    const auto proofBegin = data.begin() + HEADER;
    const auto proofEnd = proofBegin + length;
    std::vector<FieldT> inputs;
    inputs.reserve(numInputs);
    for (auto it = proofEnd; it != data.end(); it += 32) {
        FieldBytes bytes;
        std::copy(it, it + 32, bytes.begin());
        inputs.push_back(fieldFromBytes(bytes));
    }

    return ProofData(
        version,
        std::vector<unsigned char>(proofBegin, proofEnd),
        PublicInputs::fromFieldVector(version, inputs));
}

DistrictProver::DistrictProver(const CircuitConfig& config, const ProverOptions& options)
    : config_(config)
    , options_(options)
{
    initCurveParameters();
    config_.validate();
}

std::string DistrictProver::circuitFingerprint(const CircuitConfig& config) {
    DistrictMembershipCircuit circuit(config);
    circuit.generateConstraints();

    std::ostringstream ss;
    ss << "version=" << static_cast<int>(config.version)
       << ";district_depth=" << config.districtDepth
       << ";global_depth=" << config.globalDepth
       << ";constraints=" << circuit.numConstraints()
       << ";variables=" << circuit.numVariables()
       << ";inputs=" << circuit.numInputs()
       << ";poseidon=" << PoseidonParams::name << ":" << poseidonParamsDigest();
    return sha256Hex(ss.str());
}

bool DistrictProver::setup() {
    if (options_.keyBasePath.empty())
        return generateKeys();

    if (loadKeys(options_.keyBasePath))
        return true;

    return generateKeys() && saveKeys(options_.keyBasePath);
}

bool DistrictProver::generateKeys() {
    if (options_.verbose)
        std::cout << "Starting key generation for " << toString(config_.version) << "..." << std::endl;

    try {
        const ProfilingBlock block("Generate district membership keys");

        DistrictMembershipCircuit circuit(config_);
        circuit.generateConstraints();
        auto cs = circuit.getConstraintSystem();
        if (options_.verbose)
            std::cout << "Circuit has " << cs.num_constraints() << " constraints" << std::endl;

        auto keypair = libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(cs);

        provingKey_ = std::make_shared<ProvingKey>(std::move(keypair.pk));
        verificationKey_ = std::make_shared<VerificationKey>(std::move(keypair.vk));
        fingerprint_ = circuitFingerprint(config_);

        if (options_.verbose)
            std::cout << "Keys generated successfully!" << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error generating keys: " << e.what() << std::endl;
        return false;
    }
}

bool DistrictProver::saveKeys(const std::string& basePath) const {
    if (!hasKeys()) {
        std::cerr << "Error saving keys: no keys generated" << std::endl;
        return false;
    }

    std::ofstream pk_file(basePath + "_pk", std::ios::binary);
    pk_file << *provingKey_;

    std::ofstream vk_file(basePath + "_vk", std::ios::binary);
    vk_file << *verificationKey_;

    std::ofstream meta_file(basePath + "_meta");
    meta_file << "version=" << static_cast<int>(config_.version) << "\n"
              << "district_depth=" << config_.districtDepth << "\n"
              << "global_depth=" << config_.globalDepth << "\n"
              << "fingerprint=" << fingerprint_ << "\n";

    if (!pk_file || !vk_file || !meta_file) {
        std::cerr << "Error saving keys to " << basePath << std::endl;
        return false;
    }

    if (options_.verbose)
        std::cout << "Saved keys to " << basePath << std::endl;
    return true;
}

bool DistrictProver::loadKeys(const std::string& basePath) {
    std::ifstream meta_file(basePath + "_meta");
    std::ifstream pk_file(basePath + "_pk", std::ios::binary);
    std::ifstream vk_file(basePath + "_vk", std::ios::binary);

    if (!meta_file.good() || !pk_file.good() || !vk_file.good()) {
        if (options_.verbose)
            std::cout << "No existing keys found at " << basePath << std::endl;
        return false;
    }

    const auto meta = readMeta(meta_file);
    const std::string expected = circuitFingerprint(config_);
    const auto it = meta.find("fingerprint");
    if (it == meta.end() || it->second != expected) {
        const std::string found = it == meta.end() ? "<none>" : it->second;
        std::cerr << "ERROR: key fingerprint " << found << " doesn't match circuit fingerprint "
                  << expected << std::endl;
        throw ParameterMismatchError(
            "Keys at " + basePath + " were generated for a different circuit");
    }

    auto pk = std::make_shared<ProvingKey>();
    auto vk = std::make_shared<VerificationKey>();
    pk_file >> *pk;
    vk_file >> *vk;
    if (!pk_file || !vk_file) {
        std::cerr << "Error loading keys: unreadable key files at " << basePath << std::endl;
        return false;
    }

    DistrictMembershipCircuit circuit(config_);
    circuit.generateConstraints();
    if (pk->constraint_system.num_constraints() != circuit.numConstraints()) {
        std::cerr << "ERROR: circuit constraint count (" << circuit.numConstraints()
                  << ") doesn't match key constraint count ("
                  << pk->constraint_system.num_constraints() << ")" << std::endl;
        throw ParameterMismatchError("Proving key constraint count does not match circuit");
    }

    provingKey_ = std::move(pk);
    verificationKey_ = std::move(vk);
    fingerprint_ = expected;

    if (options_.verbose)
        std::cout << "Loaded keys with " << provingKey_->constraint_system.num_constraints()
                  << " constraints" << std::endl;
    return true;
}

ProofData DistrictProver::prove(const MembershipWitness& witness) const {
    if (!provingKey_) {
        throw std::logic_error("No proving key: call generateKeys() or loadKeys() first");
    }

    validateMembershipWitness(config_, witness);

    DistrictMembershipCircuit circuit(config_);
    circuit.generateConstraints();
    const auto auxiliary = circuit.generateWitness(witness);

    if (!circuit.isSatisfied()) {
        std::cerr << "Refusing to prove: witness does not satisfy the "
                  << toString(config_.version) << " circuit" << std::endl;
        throw UnsatisfiedConstraintError("Witness does not satisfy the membership circuit");
    }

    const ProfilingBlock block("Prove district membership");
    const auto primary = circuit.getPrimaryInput();
    const auto proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(*provingKey_, primary, auxiliary);

    return ProofData(config_.version, serializeProof(proof), circuit.getPublicInputs());
}

bool DistrictProver::verify(const ProofData& proofData) const {
    if (!verificationKey_) {
        std::cerr << "Error verifying proof: no verification key" << std::endl;
        return false;
    }
    if (proofData.version != config_.version) {
        std::cerr << "Error verifying proof: circuit version " << toString(proofData.version)
                  << " does not match " << toString(config_.version) << std::endl;
        return false;
    }
    if (proofData.empty()) {
        std::cerr << "Error verifying proof: Empty proof data" << std::endl;
        return false;
    }
    if (proofData.publics.globalRoot.has_value() != config_.isTwoTier()) {
        std::cerr << "Error verifying proof: public inputs do not match circuit layout" << std::endl;
        return false;
    }

    try {
        const auto proof = deserializeProof(proofData.proof);
        const libsnark::r1cs_primary_input<FieldT> primary = proofData.publics.toFieldVector();

        const bool result = libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(
            *verificationKey_, primary, proof);

        if (options_.verbose)
            std::cout << "Verification result: " << (result ? "PASS" : "FAIL") << std::endl;
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error verifying proof: " << e.what() << std::endl;
        return false;
    }
}

std::vector<unsigned char> DistrictProver::serializeProof(
    const libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>& proof)
{
    std::ostringstream oss;
    oss << proof;

    std::string str = oss.str();
    return std::vector<unsigned char>(str.begin(), str.end());
}

libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> DistrictProver::deserializeProof(
    const std::vector<unsigned char>& proofData)
{
    initCurveParameters();

    std::string str(proofData.begin(), proofData.end());
    checkProofEncoding(str);

    std::istringstream iss(str);

    libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> proof;
    iss >> proof;
    if (!iss) {
        throw MalformedInputError("Truncated or malformed proof bytes");
    }

    return proof;
}

} // namespace zkp
} // namespace civic

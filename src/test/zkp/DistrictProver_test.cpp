#include <gtest/gtest.h>
#include <libcivic/zkp/DistrictProver.h>
#include <libcivic/zkp/DistrictTree.h>
#include <libcivic/zkp/ZkErrors.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace civic {
namespace zkp {

namespace {

std::vector<FieldT> identities(std::size_t n, std::uint64_t offset) {
    std::vector<FieldT> ids;
    for (std::size_t i = 0; i < n; ++i) {
        ids.push_back(fieldFromUint64(offset + i));
    }
    return ids;
}

const ActionScope SCOPE{fieldFromUint64(77), fieldFromUint64(4)};

std::string tempKeyPath(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "civiczk_test_keys";
    std::filesystem::create_directories(dir);
    const std::string base = (dir / name).string();
    for (const char* suffix : {"_pk", "_vk", "_meta"}) {
        std::filesystem::remove(base + suffix);
    }
    return base;
}

template <typename T>
std::string encoded(const T& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// First x, stepping by `step`, for which x^3 + b has no square root.
template <typename FieldType>
FieldType xOffCurve(const FieldType& coeffB, const FieldType& step) {
    FieldType x = step;
    while (((x.squared() * x + coeffB) ^ FieldType::euler) == FieldType::one()) {
        x = x + step;
    }
    return x;
}

std::vector<unsigned char> overwrite(
    std::vector<unsigned char> bytes,
    std::size_t offset,
    const std::string& replacement)
{
    std::copy(replacement.begin(), replacement.end(), bytes.begin() + offset);
    return bytes;
}

} // namespace

// Keys are generated once for the whole suite.
class SingleTierProverTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        prover_ = std::make_unique<DistrictProver>(CircuitConfig::singleTier(2));
        ASSERT_TRUE(prover_->generateKeys());
        tree_ = std::make_unique<DistrictTree>(DistrictTree::fromIdentities(identities(4, 1), 2));
    }

    static void TearDownTestSuite() {
        prover_.reset();
        tree_.reset();
    }

    static MembershipWitness witnessFor(std::uint64_t position) {
        return makeMembershipWitness(*tree_, position, fieldFromUint64(position + 1), SCOPE);
    }

    static std::unique_ptr<DistrictProver> prover_;
    static std::unique_ptr<DistrictTree> tree_;
};

std::unique_ptr<DistrictProver> SingleTierProverTest::prover_;
std::unique_ptr<DistrictTree> SingleTierProverTest::tree_;

TEST_F(SingleTierProverTest, ProveAndVerify) {
    ASSERT_TRUE(prover_->hasKeys());

    const ProofData proof = prover_->prove(witnessFor(2));
    EXPECT_EQ(proof.version, CircuitVersion::SingleTierV1);
    EXPECT_FALSE(proof.empty());
    EXPECT_EQ(proof.publics.districtRoot, tree_->root());
    EXPECT_EQ(proof.publics.nullifier, computeNullifier(fieldFromUint64(3), SCOPE));
    EXPECT_EQ(proof.publics.actionId, SCOPE.actionId);
    EXPECT_FALSE(proof.publics.globalRoot.has_value());

    EXPECT_TRUE(prover_->verify(proof));
}

TEST_F(SingleTierProverTest, TamperedPublicInputsFail) {
    const ProofData proof = prover_->prove(witnessFor(0));
    ASSERT_TRUE(prover_->verify(proof));

    ProofData tampered = proof;
    tampered.publics.nullifier = proof.publics.nullifier + FieldT::one();
    EXPECT_FALSE(prover_->verify(tampered));

    tampered = proof;
    tampered.publics.districtRoot = proof.publics.districtRoot + FieldT::one();
    EXPECT_FALSE(prover_->verify(tampered));

    tampered = proof;
    tampered.publics.actionId = fieldFromUint64(78);
    EXPECT_FALSE(prover_->verify(tampered));
}

TEST_F(SingleTierProverTest, RejectsMismatchedEnvelope) {
    const ProofData proof = prover_->prove(witnessFor(1));

    ProofData wrongVersion = proof;
    wrongVersion.version = CircuitVersion::TwoTierV1;
    EXPECT_FALSE(prover_->verify(wrongVersion));

    ProofData empty = proof;
    empty.proof.clear();
    EXPECT_FALSE(prover_->verify(empty));

    ProofData extraRoot = proof;
    extraRoot.publics.globalRoot = FieldT::one();
    EXPECT_FALSE(prover_->verify(extraRoot));
}

TEST_F(SingleTierProverTest, DistinctScopesGiveDistinctNullifiers) {
    const MembershipWitness base = witnessFor(3);
    MembershipWitness other = base;
    other.actionId = fieldFromUint64(99);

    const ProofData first = prover_->prove(base);
    const ProofData second = prover_->prove(other);
    EXPECT_TRUE(prover_->verify(first));
    EXPECT_TRUE(prover_->verify(second));
    EXPECT_NE(first.publics.nullifier, second.publics.nullifier);
    EXPECT_EQ(first.publics.districtRoot, second.publics.districtRoot);
}

TEST_F(SingleTierProverTest, RefusesBadWitnesses) {
    MembershipWitness shortPath = witnessFor(0);
    shortPath.districtPath.pop_back();
    EXPECT_THROW(prover_->prove(shortPath), MalformedInputError);

    MembershipWitness outOfRange = witnessFor(0);
    outOfRange.districtIndex = 4;
    EXPECT_THROW(prover_->prove(outOfRange), MalformedInputError);

    MembershipWitness wrongIndex = witnessFor(2);
    wrongIndex.districtIndex = 3;
    EXPECT_THROW(prover_->prove(wrongIndex), UnsatisfiedConstraintError);

    MembershipWitness wrongRoot = witnessFor(2);
    wrongRoot.districtRoot = fieldFromUint64(5);
    EXPECT_THROW(prover_->prove(wrongRoot), UnsatisfiedConstraintError);
}

TEST_F(SingleTierProverTest, ProofBytesRoundTrip) {
    const ProofData proof = prover_->prove(witnessFor(1));
    const auto parsed = DistrictProver::deserializeProof(proof.proof);
    EXPECT_EQ(DistrictProver::serializeProof(parsed), proof.proof);
}

TEST_F(SingleTierProverTest, FlippedProofBytesFail) {
    const ProofData proof = prover_->prove(witnessFor(2));
    ASSERT_TRUE(prover_->verify(proof));

    for (std::size_t i = 0; i < proof.proof.size(); ++i) {
        for (unsigned char mask : {0x01, 0x80}) {
            ProofData tampered = proof;
            tampered.proof[i] ^= mask;
            EXPECT_FALSE(prover_->verify(tampered)) << "byte " << i << " mask " << int(mask);
        }
    }
}

TEST_F(SingleTierProverTest, PointsOffTheCurveAreRejected) {
    const ProofData proof = prover_->prove(witnessFor(1));
    const std::size_t g1Size = encoded(libff::G1<DefaultCurve>::one()).size();

    // x for A sits after its zero flag; B follows A.
    const std::string badA = encoded(xOffCurve(libff::alt_bn128_coeff_b, libff::alt_bn128_Fq::one()));
    const std::string badB = encoded(xOffCurve(
        libff::alt_bn128_twist_coeff_b,
        libff::alt_bn128_Fq2(libff::alt_bn128_Fq::one(), libff::alt_bn128_Fq::one())));

    for (const auto& bytes : {overwrite(proof.proof, 1, badA), overwrite(proof.proof, g1Size + 1, badB)}) {
        EXPECT_THROW(DistrictProver::deserializeProof(bytes), MalformedInputError);

        ProofData tampered = proof;
        tampered.proof = bytes;
        EXPECT_FALSE(prover_->verify(tampered));
    }
}

TEST_F(SingleTierProverTest, MalformedProofLengthsFail) {
    const ProofData proof = prover_->prove(witnessFor(0));

    ProofData truncated = proof;
    truncated.proof.pop_back();
    EXPECT_FALSE(prover_->verify(truncated));
    EXPECT_THROW(DistrictProver::deserializeProof(truncated.proof), MalformedInputError);

    ProofData extended = proof;
    extended.proof.push_back('0');
    EXPECT_FALSE(prover_->verify(extended));
    EXPECT_THROW(DistrictProver::deserializeProof(extended.proof), MalformedInputError);

    ProofData garbage = proof;
    std::fill(garbage.proof.begin(), garbage.proof.end(), 0xff);
    EXPECT_FALSE(prover_->verify(garbage));

    EXPECT_THROW(DistrictProver::deserializeProof({}), MalformedInputError);
}

TEST_F(SingleTierProverTest, ConcurrentProveAndVerify) {
    std::vector<ProofData> proofs(4);
    std::vector<std::thread> provers;
    for (std::size_t t = 0; t < proofs.size(); ++t) {
        provers.emplace_back([&proofs, t] { proofs[t] = prover_->prove(witnessFor(t)); });
    }
    for (auto& worker : provers) {
        worker.join();
    }

    std::vector<int> verified(proofs.size(), 0);
    std::vector<std::thread> verifiers;
    for (std::size_t t = 0; t < proofs.size(); ++t) {
        verifiers.emplace_back([&proofs, &verified, t] { verified[t] = prover_->verify(proofs[t]) ? 1 : 0; });
    }
    for (auto& worker : verifiers) {
        worker.join();
    }

    for (std::size_t t = 0; t < proofs.size(); ++t) {
        EXPECT_EQ(verified[t], 1) << "proof " << t;
        EXPECT_EQ(proofs[t].publics.nullifier, computeNullifier(fieldFromUint64(t + 1), SCOPE));
    }
}

TEST_F(SingleTierProverTest, ProofDataWireFormat) {
    const ProofData proof = prover_->prove(witnessFor(3));
    const std::vector<unsigned char> data = proof.serialize();
    ASSERT_EQ(data.size(), 1 + 4 + proof.proof.size() + 3 * 32);
    EXPECT_EQ(data[0], static_cast<unsigned char>(CircuitVersion::SingleTierV1));

    const ProofData back = ProofData::deserialize(data);
    EXPECT_EQ(back.version, proof.version);
    EXPECT_EQ(back.proof, proof.proof);
    EXPECT_EQ(back.publics, proof.publics);
    EXPECT_TRUE(prover_->verify(back));

    std::vector<unsigned char> otherVersion = data;
    otherVersion[0] = static_cast<unsigned char>(CircuitVersion::TwoTierV1);
    EXPECT_THROW(ProofData::deserialize(otherVersion), MalformedInputError);

    std::vector<unsigned char> unknownVersion = data;
    unknownVersion[0] = 7;
    EXPECT_THROW(ProofData::deserialize(unknownVersion), MalformedInputError);

    const std::vector<unsigned char> truncated(data.begin(), data.end() - 1);
    EXPECT_THROW(ProofData::deserialize(truncated), MalformedInputError);
    EXPECT_THROW(ProofData::deserialize({}), MalformedInputError);

    std::vector<unsigned char> unreduced = data;
    std::fill(unreduced.end() - 32, unreduced.end(), 0xff);
    EXPECT_THROW(ProofData::deserialize(unreduced), MalformedInputError);

    ProofData mislabeled = proof;
    mislabeled.version = CircuitVersion::TwoTierV1;
    EXPECT_THROW(mislabeled.serialize(), MalformedInputError);
}

TEST(DistrictProver, ProveWithoutKeysThrows) {
    const DistrictTree tree = DistrictTree::fromIdentities(identities(2, 1), 1);
    DistrictProver prover(CircuitConfig::singleTier(1));
    EXPECT_FALSE(prover.hasKeys());
    EXPECT_THROW(prover.prove(makeMembershipWitness(tree, 0, fieldFromUint64(1), SCOPE)), std::logic_error);

    ProofData proof(CircuitVersion::SingleTierV1, {1, 2, 3}, PublicInputs{});
    EXPECT_FALSE(prover.verify(proof));
    EXPECT_FALSE(prover.saveKeys(tempKeyPath("no_keys")));
}

TEST(DistrictProver, FingerprintTracksCircuitShape) {
    const std::string a = DistrictProver::circuitFingerprint(CircuitConfig::singleTier(2));
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a, DistrictProver::circuitFingerprint(CircuitConfig::singleTier(2)));
    EXPECT_NE(a, DistrictProver::circuitFingerprint(CircuitConfig::singleTier(3)));
    EXPECT_NE(a, DistrictProver::circuitFingerprint(CircuitConfig::twoTier(2, 1)));
    EXPECT_NE(
        DistrictProver::circuitFingerprint(CircuitConfig::twoTier(2, 1)),
        DistrictProver::circuitFingerprint(CircuitConfig::twoTier(1, 2)));
}

TEST(DistrictProver, SaveLoadRoundTrip) {
    const std::string base = tempKeyPath("single_tier_1");
    const DistrictTree tree = DistrictTree::fromIdentities(identities(2, 40), 1);
    const MembershipWitness witness = makeMembershipWitness(tree, 1, fieldFromUint64(41), SCOPE);

    DistrictProver generated(CircuitConfig::singleTier(1));
    ASSERT_TRUE(generated.generateKeys());
    ASSERT_TRUE(generated.saveKeys(base));
    const ProofData proof = generated.prove(witness);

    DistrictProver reloaded(CircuitConfig::singleTier(1));
    ASSERT_TRUE(reloaded.loadKeys(base));
    EXPECT_TRUE(reloaded.verify(proof));
    EXPECT_TRUE(generated.verify(reloaded.prove(witness)));

    // Keys from the single-tier depth 1 circuit belong to no other shape.
    DistrictProver deeper(CircuitConfig::singleTier(2));
    EXPECT_THROW(deeper.loadKeys(base), ParameterMismatchError);
    EXPECT_FALSE(deeper.hasKeys());

    DistrictProver missing(CircuitConfig::singleTier(1));
    EXPECT_FALSE(missing.loadKeys(tempKeyPath("absent")));
}

TEST(DistrictProver, SetupReusesPersistedKeys) {
    ProverOptions options;
    options.keyBasePath = tempKeyPath("setup_1");

    DistrictProver first(CircuitConfig::singleTier(1), options);
    ASSERT_TRUE(first.setup());
    EXPECT_TRUE(std::filesystem::exists(options.keyBasePath + "_meta"));

    const DistrictTree tree = DistrictTree::fromIdentities(identities(2, 7), 1);
    const ProofData proof = first.prove(makeMembershipWitness(tree, 0, fieldFromUint64(7), SCOPE));

    DistrictProver second(CircuitConfig::singleTier(1), options);
    ASSERT_TRUE(second.setup());
    EXPECT_TRUE(second.verify(proof));
}

TEST(DistrictProver, TwoTierProveAndVerify) {
    std::vector<DistrictTree> districts;
    districts.push_back(DistrictTree::fromIdentities(identities(2, 1), 1));
    districts.push_back(DistrictTree::fromIdentities(identities(2, 5), 1));
    districts.push_back(DistrictTree::fromIdentities(identities(1, 9), 1));
    const TwoTierAtlas atlas(std::move(districts), 2);

    DistrictProver prover(atlas.config());
    ASSERT_TRUE(prover.generateKeys());

    const ProofData proof = prover.prove(atlas.membership(1, 1, fieldFromUint64(6), SCOPE));
    EXPECT_EQ(proof.version, CircuitVersion::TwoTierV1);
    ASSERT_TRUE(proof.publics.globalRoot.has_value());
    EXPECT_EQ(*proof.publics.globalRoot, atlas.global().root());
    EXPECT_EQ(proof.publics.districtRoot, atlas.district(1).root());
    EXPECT_TRUE(prover.verify(proof));

    ProofData tampered = proof;
    tampered.publics.globalRoot = *proof.publics.globalRoot + FieldT::one();
    EXPECT_FALSE(prover.verify(tampered));

    tampered = proof;
    tampered.publics.districtRoot = atlas.district(0).root();
    EXPECT_FALSE(prover.verify(tampered));

    tampered = proof;
    tampered.publics.globalRoot.reset();
    EXPECT_FALSE(prover.verify(tampered));

    const ProofData back = ProofData::deserialize(proof.serialize());
    EXPECT_EQ(back.version, CircuitVersion::TwoTierV1);
    EXPECT_EQ(back.publics, proof.publics);
    EXPECT_TRUE(prover.verify(back));
}

} // namespace zkp
} // namespace civic

#include <gtest/gtest.h>
#include <libcivic/zkp/PoseidonHash.h>
#include <libcivic/zkp/ZkErrors.h>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace civic {
namespace zkp {

namespace {

// Canonical value from little-endian 64-bit limbs.
FieldT fromLimbs(const std::array<std::uint64_t, 4>& limbs) {
    BigIntT value;
    for (std::size_t i = 0; i < limbs.size(); ++i) {
        value.data[i] = static_cast<mp_limb_t>(limbs[i]);
    }
    return FieldT(value);
}

FieldT f(std::uint64_t v) {
    return fieldFromUint64(v);
}

} // namespace

TEST(PoseidonParams, TableShape) {
    const PoseidonParams& params = poseidonParams();
    EXPECT_EQ(params.roundConstants.size(), 65u);
    EXPECT_EQ(PoseidonParams::width, 3u);
    EXPECT_EQ(PoseidonParams::rate, 2u);
    EXPECT_EQ(std::string(PoseidonParams::name), "POSEIDON_BN254_T3_RF8_RP57");

    std::size_t full = 0;
    for (std::size_t r = 0; r < PoseidonParams::totalRounds; ++r) {
        if (PoseidonParams::isFullRound(r))
            ++full;
    }
    EXPECT_EQ(full, 8u);
    EXPECT_TRUE(PoseidonParams::isFullRound(3));
    EXPECT_FALSE(PoseidonParams::isFullRound(4));
    EXPECT_FALSE(PoseidonParams::isFullRound(60));
    EXPECT_TRUE(PoseidonParams::isFullRound(61));
}

TEST(PoseidonParams, KnownConstants) {
    const PoseidonParams& params = poseidonParams();
    EXPECT_EQ(
        fieldToHex(params.roundConstants[0][0]),
        "0x0ee9a592ba9a9518d05986d656f40c2114c4993c11bb29938d21d47304cd8e6e");
    EXPECT_EQ(
        fieldToHex(params.mds[0][0]),
        "0x109b7f411ba0e4c9b2b70caf5c36a7b194be7c11ad24378bfedb68592ba8118b");
}

TEST(PoseidonParams, DigestIsPinned) {
    EXPECT_EQ(
        poseidonParamsDigest(),
        "d580f0ebf5aec8825a0212c9db8fd20135155e1352e68809e2d7f2bc5440b86f");
}

TEST(PoseidonHash, PairGoldenVectors) {
    EXPECT_EQ(
        hashPair(f(1), f(2)),
        fromLimbs({0xa066cb6a69deff53ULL, 0xb8ad8a16953065fcULL, 0x91427aa9fd8ff8b8ULL, 0x305df2f9f9f1c0b5ULL}));
    EXPECT_EQ(
        hashPair(f(0), f(0)),
        fromLimbs({0x11a7076780eeb04fULL, 0x5e20a1b94cf2195bULL, 0xd745d0d54ba961a4ULL, 0x2b2ceb8eb042a119ULL}));
    EXPECT_EQ(
        hashPair(f(12345), f(67890)),
        fromLimbs({0x041225c78530a49aULL, 0x3f0db95e6e618ed4ULL, 0xeb81fcf923da131eULL, 0x1a52400b0566a6d2ULL}));
    EXPECT_EQ(
        hashPair(f(111), f(222)),
        fromLimbs({0x6d68cec1a35db045ULL, 0x9cdb9e7919eef702ULL, 0x40c19add1d71dd85ULL, 0x17c68f6c89627ea2ULL}));
    EXPECT_EQ(
        hashPair(f(222), f(111)),
        fromLimbs({0x1968f59cbef6138bULL, 0xf76543741970fd80ULL, 0x8e47d46a0b244e6dULL, 0x22389408454ff123ULL}));
}

TEST(PoseidonHash, SingleGoldenVectors) {
    EXPECT_EQ(
        hashSingle(f(0)),
        fromLimbs({0x21813f629a6b5f50ULL, 0xf01a4d84edb01e6cULL, 0x3a70dfde3329ef18ULL, 0x0ac6c5f29f518747ULL}));
    EXPECT_EQ(
        hashSingle(f(42)),
        fromLimbs({0x98a9735ee6adf6e4ULL, 0x9ad381da034d14ecULL, 0xcf99b91273f3afbeULL, 0x2afd87ed06c84a96ULL}));
    EXPECT_EQ(
        hashSingle(f(12345)),
        fromLimbs({0x02dbf90e4a9b1332ULL, 0x7a8f0a001a3f07eaULL, 0xf7bb31a1ef06995fULL, 0x090a329435cce4d6ULL}));
}

TEST(PoseidonHash, TripleAndBoundaryVectors) {
    EXPECT_EQ(
        fieldToHex(hashTriple(f(1), f(2), f(3))),
        "0x1e771e80490bde52a453e40889e14665d5396a81ff3076ac798ce39ef71b6cf1");
    EXPECT_EQ(
        fieldToHex(hashSingle(fieldMaxValue())),
        "0x04842009585ef4b4dfeb8984840016628fb2c967542eac14016dd01777f4a14c");
    EXPECT_EQ(
        fieldToHex(hashPair(fieldMaxValue(), fieldMaxValue())),
        "0x2d88e5e300b4872c95eb4750ac19ee3f65bf86a5c88a24ac0f0e452e0ae5602b");
}

TEST(PoseidonHash, Deterministic) {
    const FieldT a = FieldT::random_element();
    const FieldT b = FieldT::random_element();
    EXPECT_EQ(hashPair(a, b), hashPair(a, b));
    EXPECT_EQ(hashSingle(a), hashSingle(a));
    EXPECT_EQ(hashTriple(a, b, a), hashTriple(a, b, a));
}

TEST(PoseidonHash, PairIsNotCommutative) {
    EXPECT_NE(hashPair(f(1), f(2)), hashPair(f(2), f(1)));
    for (int i = 0; i < 10; ++i) {
        const FieldT a = FieldT::random_element();
        const FieldT b = FieldT::random_element();
        if (a == b)
            continue;
        EXPECT_NE(hashPair(a, b), hashPair(b, a));
    }
}

TEST(PoseidonHash, AritiesAreDomainSeparated) {
    const std::vector<FieldT> samples = {
        f(0), f(1), f(42), fieldMaxValue(), FieldT::random_element()};
    for (const auto& x : samples) {
        const FieldT single = hashSingle(x);
        EXPECT_NE(single, hashPair(x, f(0)));
        EXPECT_NE(single, hashPair(f(0), x));
        EXPECT_NE(hashPair(x, f(0)), hashTriple(x, f(0), f(0)));
    }
}

TEST(PoseidonHash, PermutationChangesEveryLane) {
    PoseidonState state{f(0), f(0), f(0)};
    poseidonPermute(state);
    EXPECT_NE(state[0], f(0));
    EXPECT_NE(state[1], f(0));
    EXPECT_NE(state[2], f(0));
}

TEST(PoseidonHash, AbsorptionSchedulePadsFullChunks) {
    // Two inputs fill the rate, so a padding-only block follows.
    const auto& pair = detail::absorptionSchedule(2);
    ASSERT_EQ(pair.size(), 2u);
    ASSERT_EQ(pair[1].size(), 1u);
    EXPECT_TRUE(pair[1][0].padding);
    EXPECT_EQ(pair[1][0].lane, 1u);

    const auto& single = detail::absorptionSchedule(1);
    ASSERT_EQ(single.size(), 1u);
    ASSERT_EQ(single[0].size(), 2u);
    EXPECT_TRUE(single[0][1].padding);
    EXPECT_EQ(single[0][1].lane, 2u);

    EXPECT_EQ(detail::absorptionSchedule(3).size(), 2u);
}

TEST(PoseidonBatch, MatchesSequential) {
    std::vector<FieldT> lefts;
    std::vector<FieldT> rights;
    for (std::uint64_t i = 0; i < 64; ++i) {
        lefts.push_back(f(i));
        rights.push_back(f(1000 + i * 7));
    }

    const auto out = hashPairsBatch(lefts, rights);
    ASSERT_EQ(out.size(), lefts.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i], hashPair(lefts[i], rights[i]));
    }

    const auto singles = hashSinglesBatch(lefts);
    ASSERT_EQ(singles.size(), lefts.size());
    for (std::size_t i = 0; i < singles.size(); ++i) {
        EXPECT_EQ(singles[i], hashSingle(lefts[i]));
    }
}

TEST(PoseidonBatch, PairOverload) {
    const std::vector<std::pair<FieldT, FieldT>> pairs = {
        {f(1), f(2)}, {f(222), f(111)}, {f(0), f(0)}};
    const auto out = hashPairsBatch(pairs);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], hashPair(f(1), f(2)));
    EXPECT_EQ(out[1], hashPair(f(222), f(111)));
    EXPECT_EQ(out[2], hashPair(f(0), f(0)));
}

TEST(PoseidonBatch, RejectsLengthMismatch) {
    EXPECT_THROW(hashPairsBatch({f(1), f(2)}, {f(3)}), MalformedInputError);
    EXPECT_TRUE(hashPairsBatch(std::vector<FieldT>{}, std::vector<FieldT>{}).empty());
}

} // namespace zkp
} // namespace civic

#include <gtest/gtest.h>
#include <libcivic/zkp/FieldCodec.h>
#include <libcivic/zkp/ZkErrors.h>
#include <libff/common/profiling.hpp>
#include <string>

namespace civic {
namespace zkp {

namespace {

const std::string P_MINUS_ONE =
    "0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000000";
const std::string P =
    "0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

} // namespace

TEST(FieldCodec, HexRoundTrip) {
    const std::string hex =
        "0x1a52400b0566a6d2eb81fcf923da131e3f0db95e6e618ed4041225c78530a49a";
    EXPECT_EQ(fieldToHex(fieldFromHex(hex)), hex);

    EXPECT_EQ(fieldToHex(fieldFromUint64(0)), "0x" + std::string(64, '0'));
    EXPECT_EQ(
        fieldToHex(fieldFromUint64(0xdeadbeef)),
        "0x00000000000000000000000000000000000000000000000000000000deadbeef");
}

TEST(FieldCodec, AcceptsUpperCaseDigits) {
    EXPECT_EQ(
        fieldFromHex("0x00000000000000000000000000000000000000000000000000000000DEADBEEF"),
        fieldFromUint64(0xdeadbeef));
}

TEST(FieldCodec, MaxValueIsPMinusOne) {
    EXPECT_EQ(fieldToHex(fieldMaxValue()), P_MINUS_ONE);
    EXPECT_EQ(fieldFromHex(P_MINUS_ONE), fieldMaxValue());
    EXPECT_EQ(fieldMaxValue() + FieldT::one(), FieldT::zero());
}

TEST(FieldCodec, RejectsOutOfRange) {
    EXPECT_THROW(fieldFromHex(P), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0x" + std::string(64, 'f')), MalformedInputError);
}

TEST(FieldCodec, RejectsMalformedHex) {
    const std::string digits(64, '1');
    EXPECT_THROW(fieldFromHex(digits), MalformedInputError);
    EXPECT_THROW(fieldFromHex("1x" + digits.substr(1)), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0X" + digits), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0x" + digits.substr(1)), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0x" + digits + "1"), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0x" + digits.substr(1) + "g"), MalformedInputError);
    EXPECT_THROW(fieldFromHex(""), MalformedInputError);
    EXPECT_THROW(fieldFromHex("0x"), MalformedInputError);
}

TEST(FieldCodec, BytesRoundTrip) {
    const FieldT x = FieldT::random_element();
    EXPECT_EQ(fieldFromBytes(fieldToBytes(x)), x);

    FieldBytes allOnes;
    allOnes.fill(0xff);
    EXPECT_THROW(fieldFromBytes(allOnes), MalformedInputError);

    const FieldBytes one = fieldToBytes(FieldT::one());
    EXPECT_EQ(one[31], 1);
    EXPECT_EQ(one[0], 0);
}

TEST(FieldCodec, InitLeavesProfilingOff) {
    initCurveParameters();
    initCurveParameters();
    EXPECT_TRUE(libff::inhibit_profiling_info);
    EXPECT_TRUE(libff::inhibit_profiling_counters);
}

} // namespace zkp
} // namespace civic

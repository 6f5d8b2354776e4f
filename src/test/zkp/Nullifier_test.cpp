#include <gtest/gtest.h>
#include <libcivic/zkp/Nullifier.h>
#include <libcivic/zkp/PoseidonHash.h>
#include <set>
#include <string>

namespace civic {
namespace zkp {

TEST(Nullifier, PinnedValue) {
    EXPECT_EQ(
        fieldToHex(computeNullifier(fieldFromUint64(7), fieldFromUint64(11), fieldFromUint64(13))),
        "0x2b603267fe13ed9301c75d8919bcc20458fc30003c371719ea3db28a0a4ccd59");
}

TEST(Nullifier, Deterministic) {
    const FieldT identity = FieldT::random_element();
    const ActionScope scope{FieldT::random_element(), fieldFromUint64(3)};

    EXPECT_EQ(computeNullifier(identity, scope), computeNullifier(identity, scope));
    EXPECT_EQ(
        computeNullifier(identity, scope),
        computeNullifier(identity, scope.actionId, scope.templateTag));
    EXPECT_EQ(
        computeNullifier(identity, scope),
        hashTriple(identity, scope.actionId, scope.templateTag));
}

TEST(Nullifier, UnlinkableAcrossActions) {
    const FieldT identity = fieldFromUint64(123456789);
    const FieldT tag = fieldFromUint64(1);

    std::set<std::string> seen;
    for (std::uint64_t action = 0; action < 1000; ++action) {
        seen.insert(fieldToHex(computeNullifier(identity, fieldFromUint64(action), tag)));
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(Nullifier, DistinctAcrossIdentitiesAndTemplates) {
    const FieldT action = fieldFromUint64(42);

    std::set<std::string> seen;
    for (std::uint64_t id = 0; id < 200; ++id) {
        for (std::uint64_t tag = 0; tag < 5; ++tag) {
            seen.insert(fieldToHex(computeNullifier(fieldFromUint64(id), action, fieldFromUint64(tag))));
        }
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(Nullifier, SeparatedFromLeafHash) {
    const FieldT identity = fieldFromUint64(5);
    EXPECT_EQ(computeLeaf(identity), hashSingle(identity));
    EXPECT_NE(
        computeLeaf(identity),
        computeNullifier(identity, FieldT::zero(), FieldT::zero()));
}

} // namespace zkp
} // namespace civic

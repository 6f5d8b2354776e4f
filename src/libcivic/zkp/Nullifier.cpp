#include "Nullifier.h"
#include "PoseidonHash.h"

namespace civic {
namespace zkp {

FieldT computeLeaf(const FieldT& identityCommitment) {
    return hashSingle(identityCommitment);
}

FieldT computeNullifier(const FieldT& identityCommitment, const ActionScope& scope) {
    return computeNullifier(identityCommitment, scope.actionId, scope.templateTag);
}

FieldT computeNullifier(
    const FieldT& identityCommitment,
    const FieldT& actionId,
    const FieldT& templateTag)
{
    return hashTriple(identityCommitment, actionId, templateTag);
}

} // namespace zkp
} // namespace civic

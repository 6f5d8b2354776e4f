#pragma once

#include "FieldCodec.h"

namespace civic {
namespace zkp {

/**
 * What an action is scoped to: the action itself plus the template
 * (or atlas version) it was issued under.
 */
struct ActionScope {
    FieldT actionId;
    FieldT templateTag;
};

/// Tree leaf for an identity commitment: hashSingle(identity).
FieldT computeLeaf(const FieldT& identityCommitment);

/**
 * Nullifier = hashTriple(identity, action_id, template_tag).
 *
 * Same identity and scope always yield the same value; a different
 * action or template yields an unlinkable one.
 */
FieldT computeNullifier(const FieldT& identityCommitment, const ActionScope& scope);

FieldT computeNullifier(
    const FieldT& identityCommitment,
    const FieldT& actionId,
    const FieldT& templateTag);

} // namespace zkp
} // namespace civic

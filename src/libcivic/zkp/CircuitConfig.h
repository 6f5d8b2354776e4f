#pragma once

#include "FieldCodec.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace civic {
namespace zkp {

/**
 * Circuit layout versions. The version fixes the public input tuple:
 *
 *   SingleTierV1: (district_root, nullifier, action_id)
 *   TwoTierV1:    (district_root, global_root, nullifier, action_id)
 */
enum class CircuitVersion : std::uint8_t {
    SingleTierV1 = 1,
    TwoTierV1 = 2,
};

enum class JurisdictionTier {
    Municipal,
    State,
    Federal,
};

std::string toString(CircuitVersion version);

struct CircuitConfig {
    static constexpr std::size_t MIN_DEPTH = 1;
    static constexpr std::size_t MAX_DEPTH = 32;
    static constexpr std::size_t DEFAULT_GLOBAL_DEPTH = 8;

    CircuitVersion version = CircuitVersion::SingleTierV1;
    std::size_t districtDepth = 12;
    std::size_t globalDepth = 0;

    static CircuitConfig singleTier(std::size_t districtDepth);
    static CircuitConfig twoTier(
        std::size_t districtDepth,
        std::size_t globalDepth = DEFAULT_GLOBAL_DEPTH);

    /// Tier preset: municipal 12, state 16, federal 20.
    static CircuitConfig forTier(JurisdictionTier tier, bool twoTier = false);

    bool isTwoTier() const { return version == CircuitVersion::TwoTierV1; }
    std::size_t numPublicInputs() const { return isTwoTier() ? 4 : 3; }

    /// @throws MalformedInputError for depths outside [1, 32].
    void validate() const;

    bool operator==(const CircuitConfig& other) const;
    bool operator!=(const CircuitConfig& other) const { return !(*this == other); }
};

std::size_t districtDepthForTier(JurisdictionTier tier);

/**
 * Public statement of a membership proof, in circuit order.
 * globalRoot is present exactly for two-tier circuits.
 */
struct PublicInputs {
    FieldT districtRoot;
    std::optional<FieldT> globalRoot;
    FieldT nullifier;
    FieldT actionId;

    /// Fixed order: district_root, [global_root], nullifier, action_id.
    std::vector<FieldT> toFieldVector() const;
    std::vector<std::string> toHex() const;

    static PublicInputs fromFieldVector(
        CircuitVersion version,
        const std::vector<FieldT>& values);
    static PublicInputs fromHex(
        CircuitVersion version,
        const std::vector<std::string>& values);

    bool operator==(const PublicInputs& other) const;
};

/**
 * Everything the prover needs: private values plus the claimed roots.
 * Global fields are ignored for single-tier circuits.
 */
struct MembershipWitness {
    FieldT identityCommitment;
    FieldT actionId;
    FieldT templateTag;

    std::uint64_t districtIndex = 0;
    std::vector<FieldT> districtPath;
    FieldT districtRoot;

    std::uint64_t globalIndex = 0;
    std::vector<FieldT> globalPath;
    FieldT globalRoot;
};

/**
 * Shape checks done before any constraint work: path lengths and index
 * ranges against the configured depths.
 *
 * @throws MalformedInputError
 */
void validateMembershipWitness(const CircuitConfig& config, const MembershipWitness& witness);

} // namespace zkp
} // namespace civic

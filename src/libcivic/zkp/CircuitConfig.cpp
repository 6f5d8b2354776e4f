#include "CircuitConfig.h"
#include "ZkErrors.h"

namespace civic {
namespace zkp {

namespace {

void checkDepth(const char* name, std::size_t depth) {
    if (depth < CircuitConfig::MIN_DEPTH || depth > CircuitConfig::MAX_DEPTH) {
        throw MalformedInputError(
            std::string(name) + " depth must be in [1, 32], got " + std::to_string(depth));
    }
}

void checkPath(
    const char* name,
    std::uint64_t index,
    const std::vector<FieldT>& path,
    std::size_t depth)
{
    if (path.size() != depth) {
        throw MalformedInputError(
            std::string(name) + " path has " + std::to_string(path.size()) +
            " siblings, expected " + std::to_string(depth));
    }
    if (depth < 64 && index >= (std::uint64_t(1) << depth)) {
        throw MalformedInputError(
            std::string(name) + " index " + std::to_string(index) +
            " out of range for depth " + std::to_string(depth));
    }
}

} // namespace

std::string toString(CircuitVersion version) {
    switch (version) {
        case CircuitVersion::SingleTierV1:
            return "single-tier-v1";
        case CircuitVersion::TwoTierV1:
            return "two-tier-v1";
    }
    return "unknown";
}

std::size_t districtDepthForTier(JurisdictionTier tier) {
    switch (tier) {
        case JurisdictionTier::Municipal:
            return 12;
        case JurisdictionTier::State:
            return 16;
        case JurisdictionTier::Federal:
            return 20;
    }
    throw MalformedInputError("Unknown jurisdiction tier");
}

CircuitConfig CircuitConfig::singleTier(std::size_t districtDepth) {
    CircuitConfig config;
    config.version = CircuitVersion::SingleTierV1;
    config.districtDepth = districtDepth;
    config.globalDepth = 0;
    config.validate();
    return config;
}

CircuitConfig CircuitConfig::twoTier(std::size_t districtDepth, std::size_t globalDepth) {
    CircuitConfig config;
    config.version = CircuitVersion::TwoTierV1;
    config.districtDepth = districtDepth;
    config.globalDepth = globalDepth;
    config.validate();
    return config;
}

CircuitConfig CircuitConfig::forTier(JurisdictionTier tier, bool twoTier) {
    const std::size_t depth = districtDepthForTier(tier);
    return twoTier ? CircuitConfig::twoTier(depth) : CircuitConfig::singleTier(depth);
}

void CircuitConfig::validate() const {
    switch (version) {
        case CircuitVersion::SingleTierV1:
            checkDepth("District", districtDepth);
            if (globalDepth != 0) {
                throw MalformedInputError("Single-tier circuit takes no global depth");
            }
            return;
        case CircuitVersion::TwoTierV1:
            checkDepth("District", districtDepth);
            checkDepth("Global", globalDepth);
            return;
    }
    throw MalformedInputError("Unknown circuit version");
}

bool CircuitConfig::operator==(const CircuitConfig& other) const {
    return version == other.version && districtDepth == other.districtDepth &&
        globalDepth == other.globalDepth;
}

std::vector<FieldT> PublicInputs::toFieldVector() const {
    std::vector<FieldT> values;
    values.push_back(districtRoot);
    if (globalRoot)
        values.push_back(*globalRoot);
    values.push_back(nullifier);
    values.push_back(actionId);
    return values;
}

std::vector<std::string> PublicInputs::toHex() const {
    return fieldsToHex(toFieldVector());
}

PublicInputs PublicInputs::fromFieldVector(
    CircuitVersion version,
    const std::vector<FieldT>& values)
{
    const std::size_t expected = version == CircuitVersion::TwoTierV1 ? 4 : 3;
    if (values.size() != expected) {
        throw MalformedInputError(
            "Expected " + std::to_string(expected) + " public inputs for " +
            toString(version) + ", got " + std::to_string(values.size()));
    }

    PublicInputs publics;
    std::size_t i = 0;
    publics.districtRoot = values[i++];
    if (version == CircuitVersion::TwoTierV1)
        publics.globalRoot = values[i++];
    publics.nullifier = values[i++];
    publics.actionId = values[i++];
    return publics;
}

PublicInputs PublicInputs::fromHex(
    CircuitVersion version,
    const std::vector<std::string>& values)
{
    std::vector<FieldT> fields;
    fields.reserve(values.size());
    for (const auto& hex : values) {
        fields.push_back(fieldFromHex(hex));
    }
    return fromFieldVector(version, fields);
}

bool PublicInputs::operator==(const PublicInputs& other) const {
    return districtRoot == other.districtRoot && globalRoot == other.globalRoot &&
        nullifier == other.nullifier && actionId == other.actionId;
}

void validateMembershipWitness(const CircuitConfig& config, const MembershipWitness& witness) {
    config.validate();
    checkPath("District", witness.districtIndex, witness.districtPath, config.districtDepth);
    if (config.isTwoTier()) {
        checkPath("Global", witness.globalIndex, witness.globalPath, config.globalDepth);
    }
}

} // namespace zkp
} // namespace civic

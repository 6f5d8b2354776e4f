#pragma once

#include "FieldCodec.h"
#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace civic {
namespace zkp {

/**
 * Poseidon parameter set over the BN254 scalar field.
 *
 * Width 3 (capacity 1, rate 2), S-box x^5, 8 full rounds split 4/4
 * around 57 partial rounds. Constants come from the Grain LFSR
 * construction of the Poseidon reference generator; the MDS matrix is
 * the matching Cauchy matrix.
 */
struct PoseidonParams {
    static constexpr const char* name = "POSEIDON_BN254_T3_RF8_RP57";

    static constexpr std::size_t width = 3;
    static constexpr std::size_t rate = 2;
    static constexpr std::size_t fullRounds = 8;
    static constexpr std::size_t partialRounds = 57;
    static constexpr std::size_t totalRounds = fullRounds + partialRounds;

    /// Full rounds apply the S-box to every lane, partial rounds to lane 0.
    static bool isFullRound(std::size_t round);

    std::vector<std::array<FieldT, width>> roundConstants;
    std::array<std::array<FieldT, width>, width> mds;
};

/**
 * Process-wide parameter table, built once on first use.
 * Calls initCurveParameters() itself.
 */
const PoseidonParams& poseidonParams();

/**
 * SHA-256 (lowercase hex) over every round constant followed by every
 * MDS entry, each as 32 big-endian bytes, row-major. Lets deployments
 * assert both sides of a boundary share one parameter table.
 */
std::string poseidonParamsDigest();

} // namespace zkp
} // namespace civic

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <libff/algebra/curves/alt_bn128/alt_bn128_init.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

namespace civic {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;
using BigIntT = libff::bigint<libff::alt_bn128_r_limbs>;

/// 32-byte big-endian encoding of a field element.
using FieldBytes = std::array<std::uint8_t, 32>;

/**
 * Initialize alt_bn128 curve parameters and switch off libff's profiling
 * output, whose block counters are unsynchronized process state.
 * MUST be called before any field element is constructed.
 * Thread-safe and idempotent.
 */
void initCurveParameters();

/**
 * Parse a field element from the hex bridge format.
 *
 * Accepts exactly "0x" followed by 64 hex digits (either case),
 * big-endian. Values >= p are rejected rather than reduced.
 *
 * @throws MalformedInputError on any deviation from the format.
 */
FieldT fieldFromHex(const std::string& hex);

/**
 * Render a field element as "0x" + 64 lowercase hex digits.
 */
std::string fieldToHex(const FieldT& element);

/**
 * Big-endian bytes to field element. Rejects values >= p.
 */
FieldT fieldFromBytes(const FieldBytes& bytes);

FieldBytes fieldToBytes(const FieldT& element);

FieldT fieldFromUint64(std::uint64_t value);

/// p - 1, the largest representable field element.
FieldT fieldMaxValue();

std::vector<std::string> fieldsToHex(const std::vector<FieldT>& elements);

} // namespace zkp
} // namespace civic

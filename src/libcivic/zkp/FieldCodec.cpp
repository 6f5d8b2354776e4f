#include "FieldCodec.h"
#include "ZkErrors.h"
#include <gmp.h>
#include <libff/common/profiling.hpp>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace civic {
namespace zkp {

namespace {

constexpr std::size_t LIMB_BYTES = sizeof(mp_limb_t);

int hexDigit(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

BigIntT bytesToBigint(const FieldBytes& bytes) {
    BigIntT result;
    for (std::size_t limb = 0; limb < libff::alt_bn128_r_limbs; ++limb) {
        mp_limb_t value = 0;
        for (std::size_t b = 0; b < LIMB_BYTES; ++b) {
            // limb 0 holds the least significant bytes (end of the array)
            const std::size_t idx = bytes.size() - 1 - (limb * LIMB_BYTES + b);
            value |= static_cast<mp_limb_t>(bytes[idx]) << (8 * b);
        }
        result.data[limb] = value;
    }
    return result;
}

} // namespace

void initCurveParameters() {
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        DefaultCurve::init_public_params();
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
    });
}

FieldT fieldFromBytes(const FieldBytes& bytes) {
    BigIntT value = bytesToBigint(bytes);
    if (mpn_cmp(value.data, libff::alt_bn128_modulus_r.data, libff::alt_bn128_r_limbs) >= 0) {
        throw MalformedInputError("Field element is not reduced modulo p");
    }
    return FieldT(value);
}

FieldBytes fieldToBytes(const FieldT& element) {
    FieldBytes bytes{};
    const BigIntT value = element.as_bigint();
    for (std::size_t limb = 0; limb < libff::alt_bn128_r_limbs; ++limb) {
        for (std::size_t b = 0; b < LIMB_BYTES; ++b) {
            const std::size_t idx = bytes.size() - 1 - (limb * LIMB_BYTES + b);
            bytes[idx] = static_cast<std::uint8_t>((value.data[limb] >> (8 * b)) & 0xFF);
        }
    }
    return bytes;
}

FieldT fieldFromHex(const std::string& hex) {
    if (hex.size() < 2 || hex[0] != '0' || hex[1] != 'x') {
        throw MalformedInputError("Hex field element must start with 0x");
    }
    if (hex.size() != 2 + 64) {
        throw MalformedInputError(
            "Hex field element must have 64 digits, got " + std::to_string(hex.size() - 2));
    }

    FieldBytes bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        const int hi = hexDigit(hex[2 + 2 * i]);
        const int lo = hexDigit(hex[2 + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw MalformedInputError("Invalid hex digit in field element: " + hex);
        }
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return fieldFromBytes(bytes);
}

std::string fieldToHex(const FieldT& element) {
    const FieldBytes bytes = fieldToBytes(element);
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setfill('0');
    for (std::uint8_t byte : bytes) {
        ss << std::setw(2) << static_cast<unsigned int>(byte);
    }
    return ss.str();
}

FieldT fieldFromUint64(std::uint64_t value) {
    BigIntT result;
    result.data[0] = static_cast<mp_limb_t>(value);
    return FieldT(result);
}

FieldT fieldMaxValue() {
    return FieldT::zero() - FieldT::one();
}

std::vector<std::string> fieldsToHex(const std::vector<FieldT>& elements) {
    std::vector<std::string> out;
    out.reserve(elements.size());
    for (const auto& e : elements) {
        out.push_back(fieldToHex(e));
    }
    return out;
}

} // namespace zkp
} // namespace civic

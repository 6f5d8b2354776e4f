#pragma once

#include <stdexcept>
#include <string>

namespace civic {
namespace zkp {

/**
 * Rejected input: bad hex encoding, out-of-range index, wrong-length path,
 * invalid circuit configuration. Raised before any constraint is built.
 */
class MalformedInputError : public std::invalid_argument {
public:
    explicit MalformedInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * The supplied witness does not satisfy the circuit. No proof is produced.
 */
class UnsatisfiedConstraintError : public std::runtime_error {
public:
    explicit UnsatisfiedConstraintError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Native and constrained computations disagree, or persisted keys were
 * derived from a different circuit. Always a defect, never user error.
 */
class ParameterMismatchError : public std::logic_error {
public:
    explicit ParameterMismatchError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace zkp
} // namespace civic

#pragma once

#include <stdexcept>
#include <string>

namespace clt {

// Ply properties outside the physically admissible range
class InvalidMaterialProperty : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Per-ply input arrays of unequal length
class MismatchedArrayLength : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Numerical failure after validation (non-finite or zero compliance terms)
class ComputationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Average laminate stiffness Q* cannot be inverted
class SingularStiffness : public ComputationError {
public:
    using ComputationError::ComputationError;
};

}  // namespace clt

#pragma once

#include <stdexcept>
#include <string>

namespace posetal {

// Base class for every error raised while building or validating
// orders, games and beliefs. Errors propagate immediately to the caller.
class PosetalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed relation input: pair outside the ground set, duplicate labels,
// or a relation that is not a preorder where one is required
class InvalidRelationError : public PosetalError {
public:
    using PosetalError::PosetalError;
};

// Antisymmetry required but violated
class NotAPartialOrderError : public PosetalError {
public:
    using PosetalError::PosetalError;
};

// Inconsistent player / metric / action-space construction
class InvalidGameError : public PosetalError {
public:
    using PosetalError::PosetalError;
};

// A player was declared without any action
class EmptyActionSpaceError : public InvalidGameError {
public:
    using InvalidGameError::InvalidGameError;
};

// Exhaustive order enumeration requested over too many elements
class EnumerationLimitError : public PosetalError {
public:
    using PosetalError::PosetalError;
};

// Invalid prior or candidate set handed to the learning engine
class InvalidBeliefError : public PosetalError {
public:
    using PosetalError::PosetalError;
};

} // namespace posetal

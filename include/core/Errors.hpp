#pragma once
#include "core/Common.hpp"

// Bad construction parameters (non-positive grid dimensions).
class ValidationError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Operation not allowed in the grid's current lifecycle state.
class InvalidStateError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

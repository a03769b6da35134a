#pragma once

#include <stdexcept>
#include <string>

namespace animcanon
{

// Thrown when an upstream stage hands the canonicalizer data that breaks a
// contract it relies on (empty timelines, unknown easing or segment tags).
// Not recoverable: the current generation run should be abandoned.
class InvariantViolation : public std::runtime_error
{
   public:
    explicit InvariantViolation(const std::string& what) : std::runtime_error(what) {}
};

}   // namespace animcanon

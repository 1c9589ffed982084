#pragma once

#include <stdexcept>
#include <string>

namespace cutgraph {

// Raised when an operation's inputs violate its contract: non-positive
// durations, truncation past the source window, mixing incompatible framings.
class PreconditionError : public std::runtime_error {
  public:
    explicit PreconditionError(const std::string& message) : std::runtime_error(message) {}
};

// A MixedCut operand id that the resolving CutSet does not hold.
class UnresolvedReferenceError : public std::runtime_error {
  public:
    explicit UnresolvedReferenceError(const std::string& message) : std::runtime_error(message) {}
};

// Manifest record with a type discriminator other than a known cut kind.
class UnknownCutTypeError : public std::runtime_error {
  public:
    explicit UnknownCutTypeError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace cutgraph

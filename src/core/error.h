#pragma once
#ifndef MOBILITYKIT_ERROR_H
#define MOBILITYKIT_ERROR_H

#include <stdexcept>
#include <string>

namespace mobilitykit {

// Raised for out-of-range indices/percentiles and non-positive sizes.
// Always thrown before any state is mutated.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

}  // namespace mobilitykit

#endif  // MOBILITYKIT_ERROR_H

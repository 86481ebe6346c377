#pragma once

#include <stdexcept>
#include <string>

//──────────────────────────────────────────────────────────────────────────────
//  Failures reported by the solver. All of them are terminal for the run:
//  nothing is retried and no partial result is returned.
//──────────────────────────────────────────────────────────────────────────────

// Bad grid, mask or parameter. Raised before any lattice is allocated.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// The lattice does not fit in memory (or in the index space).
class ResourceExhaustion : public std::runtime_error {
public:
    explicit ResourceExhaustion(const std::string& what) : std::runtime_error(what) {}
};

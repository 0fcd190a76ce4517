// src/sim/sim_errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace sim {

// Input series do not satisfy the simulation preconditions
// (length mismatch, fewer than two samples, non-increasing time).
class InputShapeError : public std::runtime_error {
public:
    explicit InputShapeError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace sim

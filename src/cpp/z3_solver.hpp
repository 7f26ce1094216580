/**
 * \file z3_solver.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_Z3_SOLVER_HPP
#define CNEVO_Z3_SOLVER_HPP

#include "solver.hpp"

#include <cstdint>
#include <sstream>
#include <unordered_map>
#include <z3++.h>

namespace cnevo {

/**
 * MilpSolver backed by Z3's optimizing solver. Arithmetic is exact:
 * coefficients and bounds are converted to rationals through their
 * shortest round-tripping decimal representation.
 */
class Z3MilpSolver : public MilpSolver {
    z3::context ctx_;
    unsigned timeout_ms_;
    std::unordered_map<uint64_t, z3::expr> const_cache_;
    std::stringstream ss_;
    size_t num_solves_ = 0;

    SolveResult solve_(const MilpProblem& problem);

public:
    /** A timeout of 0 disables the time limit. */
    explicit Z3MilpSolver(unsigned timeout_ms = 5000);

    SolveResult solve(const MilpProblem& problem) override;
    std::string name() const override;

    inline unsigned timeout_ms() const { return timeout_ms_; }
    inline size_t num_solves() const { return num_solves_; }

    z3::expr& float_to_z3(FloatT value);
};

} // namespace cnevo

#endif // CNEVO_Z3_SOLVER_HPP

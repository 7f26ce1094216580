/**
 * \file solver.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_SOLVER_HPP
#define CNEVO_SOLVER_HPP

#include "milp.hpp"

#include <string>

namespace cnevo {

enum class SolveStatus {
    OPTIMAL,
    INFEASIBLE,
    UNBOUNDED,
    TIMEOUT,
    ERROR,
    OTHER,
};

std::ostream& operator<<(std::ostream& strm, SolveStatus s);
SolveStatus solve_status_from_str(const std::string& s);

struct SolveResult {
    SolveStatus status;

    /** Only meaningful when `status == OPTIMAL`. */
    FloatT value = 0.0;

    /** Solver specific explanation for non-optimal outcomes. */
    std::string reason;

    static inline SolveResult optimal(FloatT v) { return {SolveStatus::OPTIMAL, v, ""}; }
    static inline SolveResult failed(SolveStatus s, std::string reason = "") {
        return {s, 0.0, std::move(reason)};
    }

    inline bool is_optimal() const { return status == SolveStatus::OPTIMAL; }
};

std::ostream& operator<<(std::ostream& s, const SolveResult& r);

/**
 * A MILP backend. One problem in, one status (and value) out; the engine
 * never looks at solver internals.
 */
class MilpSolver {
public:
    virtual ~MilpSolver() { /* required, otherwise pybind11 memory leak */ }

    virtual SolveResult solve(const MilpProblem& problem) = 0;
    virtual std::string name() const = 0;
};

} // namespace cnevo

#endif // CNEVO_SOLVER_HPP

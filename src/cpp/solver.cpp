/**
 * \file solver.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "solver.hpp"

#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& strm, SolveStatus s)
{
#define CNEVO_SOLVE_STATUS_CASE(name) case SolveStatus::name: \
    strm << #name; \
    break;

    switch (s) {
        CNEVO_SOLVE_STATUS_CASE(OPTIMAL)
        CNEVO_SOLVE_STATUS_CASE(INFEASIBLE)
        CNEVO_SOLVE_STATUS_CASE(UNBOUNDED)
        CNEVO_SOLVE_STATUS_CASE(TIMEOUT)
        CNEVO_SOLVE_STATUS_CASE(ERROR)
        CNEVO_SOLVE_STATUS_CASE(OTHER)
    }

    return strm;
#undef CNEVO_SOLVE_STATUS_CASE
}

SolveStatus solve_status_from_str(const std::string& s)
{
    if (s == "OPTIMAL") return SolveStatus::OPTIMAL;
    if (s == "INFEASIBLE") return SolveStatus::INFEASIBLE;
    if (s == "UNBOUNDED") return SolveStatus::UNBOUNDED;
    if (s == "TIMEOUT") return SolveStatus::TIMEOUT;
    if (s == "ERROR") return SolveStatus::ERROR;
    if (s == "OTHER") return SolveStatus::OTHER;
    throw std::runtime_error("invalid solve status: " + s);
}

std::ostream& operator<<(std::ostream& s, const SolveResult& r)
{
    s << "SolveResult(" << r.status;
    if (r.is_optimal())
        s << ", value=" << r.value;
    if (!r.reason.empty())
        s << ", reason=" << r.reason;
    return s << ')';
}

} // namespace cnevo

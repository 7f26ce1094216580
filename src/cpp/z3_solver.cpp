/**
 * \file z3_solver.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "z3_solver.hpp"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace cnevo {

Z3MilpSolver::Z3MilpSolver(unsigned timeout_ms)
    : ctx_{}
    , timeout_ms_{timeout_ms}
{}

std::string
Z3MilpSolver::name() const
{
    return "z3";
}

z3::expr&
Z3MilpSolver::float_to_z3(FloatT value)
{
    static_assert(sizeof(FloatT) == sizeof(uint64_t));
    if (!std::isfinite(value))
        throw std::invalid_argument("non-finite constant in MILP");

    uint64_t i;
    std::memcpy(&i, &value, sizeof(FloatT));
    auto fd = const_cache_.find(i);

    if (fd != const_cache_.end())
        return fd->second;

    // z3 parses plain decimals only: fixed notation, shortest that round-trips
    auto to_fixed = [this](FloatT v, int precision) {
        ss_.seekp(0);
        ss_.seekg(0);
        ss_.str("");
        ss_.clear();
        ss_ << std::fixed << std::setprecision(precision) << v;
        return ss_.str();
    };

    std::string str;
    for (int precision = 0; precision <= 60; ++precision)
    {
        str = to_fixed(value, precision);
        if (std::stod(str) == value)
            break;
    }

    // tiny constants: the exact expansion of a double has at most 1074
    // fractional digits
    if (std::stod(str) != value)
        str = to_fixed(value, 1074);
    if (std::stod(str) != value)
        throw std::invalid_argument("cannot represent constant " + str + " exactly");

    return const_cache_.emplace(i, ctx_.real_val(str.c_str())).first->second;
}

SolveResult
Z3MilpSolver::solve(const MilpProblem& problem)
{
    ++num_solves_;
    try
    {
        return solve_(problem);
    }
    catch (const z3::exception& e)
    {
        return SolveResult::failed(SolveStatus::ERROR, e.msg());
    }
}

SolveResult
Z3MilpSolver::solve_(const MilpProblem& problem)
{
    z3::optimize opt(ctx_);
    if (timeout_ms_ > 0)
    {
        z3::params p(ctx_);
        p.set("timeout", timeout_ms_);
        opt.set(p);
    }

    // integer variables take part in the constraints as reals
    std::unordered_map<VarName, z3::expr> xvars;
    for (const MilpVariable& v : problem.variables())
    {
        z3::expr x = v.type == VarType::CONTINUOUS
            ? ctx_.real_const(v.name.c_str())
            : z3::to_real(ctx_.int_const(v.name.c_str()));
        if (!v.bounds.lo_is_unbound())
            opt.add(x >= float_to_z3(v.bounds.lo));
        if (!v.bounds.hi_is_unbound())
            opt.add(x <= float_to_z3(v.bounds.hi));
        xvars.emplace(v.name, x);
    }

    for (const LinConstraint& c : problem.constraints())
    {
        z3::expr lhs = ctx_.real_val(0);
        for (const LinTerm& t : c.terms)
            lhs = lhs + float_to_z3(t.coef) * xvars.at(t.var);
        const z3::expr& rhs = float_to_z3(c.rhs);
        switch (c.rel) {
        case Relation::LE: opt.add(lhs <= rhs); break;
        case Relation::GE: opt.add(lhs >= rhs); break;
        case Relation::EQ: opt.add(lhs == rhs); break;
        }
    }

    const z3::expr& objective = xvars.at(problem.objective());
    z3::optimize::handle h = problem.direction() == Direction::MIN
        ? opt.minimize(objective)
        : opt.maximize(objective);

    switch (opt.check()) {
    case z3::unsat:
        return SolveResult::failed(SolveStatus::INFEASIBLE);
    case z3::unknown:
    {
        std::string reason = Z3_optimize_get_reason_unknown(ctx_, opt);
        if (reason.find("timeout") != std::string::npos
                || reason.find("canceled") != std::string::npos)
            return SolveResult::failed(SolveStatus::TIMEOUT, reason);
        return SolveResult::failed(SolveStatus::ERROR, reason);
    }
    case z3::sat:
        break;
    }

    z3::expr bound = problem.direction() == Direction::MIN
        ? opt.lower(h)
        : opt.upper(h);

    double value;
    if (bound.is_numeral(value))
        return SolveResult::optimal(value);

    std::string bound_str = bound.to_string();
    if (bound_str.find("oo") != std::string::npos)
        return SolveResult::failed(SolveStatus::UNBOUNDED, bound_str);
    // epsilon terms: the optimum is not attained
    return SolveResult::failed(SolveStatus::OTHER, bound_str);
}

} // namespace cnevo

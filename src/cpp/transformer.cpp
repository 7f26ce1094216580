/**
 * \file transformer.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "transformer.hpp"

#include <sstream>

namespace cnevo {

std::ostream& operator<<(std::ostream& strm, TransformKind k)
{
    switch (k) {
    case TransformKind::PRE: return strm << "pre";
    case TransformKind::POST: return strm << "post";
    }
    return strm;
}

std::ostream& operator<<(std::ostream& strm, FailureKind k)
{
    switch (k) {
    case FailureKind::INFEASIBLE_MODEL: return strm << "InfeasibleModel";
    case FailureKind::UNBOUNDED_OBJECTIVE: return strm << "UnboundedObjective";
    case FailureKind::SOLVER_ERROR: return strm << "SolverError";
    case FailureKind::SOLVER_TIMEOUT: return strm << "SolverTimeout";
    case FailureKind::NON_OPTIMAL_STATUS: return strm << "NonOptimalStatus";
    }
    return strm;
}

FailureKind failure_kind_for(SolveStatus status)
{
    switch (status) {
    case SolveStatus::INFEASIBLE: return FailureKind::INFEASIBLE_MODEL;
    case SolveStatus::UNBOUNDED: return FailureKind::UNBOUNDED_OBJECTIVE;
    case SolveStatus::ERROR: return FailureKind::SOLVER_ERROR;
    case SolveStatus::TIMEOUT: return FailureKind::SOLVER_TIMEOUT;
    default: return FailureKind::NON_OPTIMAL_STATUS;
    }
}

std::ostream& operator<<(std::ostream& s, const EdgeContext& e)
{
    if (e.empty())
        return s << "(own model)";
    return s << e.producer << " -> " << e.consumer << " " << e.vars;
}

static std::string
failure_message(const std::string& component, TransformKind transform,
        const VarName& var, Direction direction, const SolveResult& result,
        int iteration)
{
    std::stringstream s;
    s << failure_kind_for(result.status) << ": " << component << ' '
        << transform << ' ' << direction << ' ' << var
        << " returned " << result.status;
    if (iteration >= 0)
        s << " (iteration " << iteration << ')';
    return s.str();
}

MilpFailure::MilpFailure(std::string component, TransformKind transform,
        VarName var, Direction direction, SolveResult result,
        std::string solver_name, Box source_box, MilpProblem problem,
        EdgeContext edge, int iteration)
    : std::runtime_error(failure_message(component, transform, var,
                direction, result, iteration))
    , kind(failure_kind_for(result.status))
    , component(std::move(component))
    , transform(transform)
    , var(std::move(var))
    , direction(direction)
    , result(std::move(result))
    , solver_name(std::move(solver_name))
    , source_box(std::move(source_box))
    , problem(std::move(problem))
    , edge(std::move(edge))
    , iteration(iteration)
{}

Transformer::Transformer(MilpSolver& solver) : solver_(solver) {}

void
Transformer::check_var_(const ComponentModel& model, TransformKind kind,
        const VarName& var) const
{
    bool ok = kind == TransformKind::POST ? model.is_output(var) : model.is_input(var);
    if (!ok)
    {
        std::stringstream s;
        s << kind << " of " << model.name() << ": " << var << " is not an "
            << (kind == TransformKind::POST ? "output" : "input");
        throw std::invalid_argument(s.str());
    }
}

FloatT
Transformer::solve_(const ComponentModel& model, TransformKind kind,
        const Box& source, const VarName& var, Direction dir,
        const EdgeContext& edge, std::string problem_name)
{
    MilpProblem problem = build_problem(model, source, var, dir, std::move(problem_name));
    SolveResult result = solver_.solve(problem);
    ++num_solves_;

    if (!result.is_optimal())
        throw MilpFailure(model.name(), kind, var, dir, std::move(result),
                solver_.name(), source, std::move(problem), edge, iteration);

    return result.value;
}

FloatT
Transformer::post(const ComponentModel& model, const Box& source,
        const VarName& var, Direction dir, const EdgeContext& edge)
{
    check_var_(model, TransformKind::POST, var);
    std::stringstream name;
    name << model.name() << "_post_" << var << '_' << dir;
    return solve_(model, TransformKind::POST, source, var, dir, edge, name.str());
}

FloatT
Transformer::pre(const ComponentModel& model, const Box& source,
        const VarName& var, Direction dir, const EdgeContext& edge)
{
    check_var_(model, TransformKind::PRE, var);
    std::stringstream name;
    name << model.name() << "_pre_" << var << '_' << dir;
    return solve_(model, TransformKind::PRE, source, var, dir, edge, name.str());
}

Region
Transformer::transform_(const ComponentModel& model, TransformKind kind,
        const Region& source, const std::vector<VarName>& vars,
        const EdgeContext& edge)
{
    for (const VarName& var : vars)
        check_var_(model, kind, var);

    Region result;
    for (size_t i = 0; i < source.size(); ++i)
    {
        Box out;
        for (const VarName& var : vars)
        {
            FloatT bounds[2];
            for (Direction dir : {Direction::MIN, Direction::MAX})
            {
                std::stringstream name;
                name << model.name() << '_' << kind << "_b" << i << '_'
                    << var << '_' << dir;
                bounds[dir == Direction::MAX] =
                    solve_(model, kind, source[i], var, dir, edge, name.str());
            }
            out.set(var, {bounds[0], bounds[1]});
        }
        result.insert(std::move(out));
    }
    return result;
}

Region
Transformer::post(const ComponentModel& model, const Region& source,
        const std::vector<VarName>& vars, const EdgeContext& edge)
{
    return transform_(model, TransformKind::POST, source, vars, edge);
}

Region
Transformer::pre(const ComponentModel& model, const Region& source,
        const std::vector<VarName>& vars, const EdgeContext& edge)
{
    return transform_(model, TransformKind::PRE, source, vars, edge);
}

} // namespace cnevo

/**
 * \file transformer.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_TRANSFORMER_HPP
#define CNEVO_TRANSFORMER_HPP

#include "milp.hpp"
#include "region.hpp"
#include "solver.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace cnevo {

enum class TransformKind { PRE, POST };

std::ostream& operator<<(std::ostream& strm, TransformKind k);

enum class FailureKind {
    INFEASIBLE_MODEL,
    UNBOUNDED_OBJECTIVE,
    SOLVER_ERROR,
    SOLVER_TIMEOUT,
    NON_OPTIMAL_STATUS,
};

std::ostream& operator<<(std::ostream& strm, FailureKind k);

/** Failure kind for a non-optimal solver status. */
FailureKind failure_kind_for(SolveStatus status);

/** The edge a transformer call was made for. Empty for own-model calls. */
struct EdgeContext {
    std::string producer;
    std::string consumer;
    std::vector<VarName> vars;

    inline bool empty() const { return producer.empty() && consumer.empty(); }
};

std::ostream& operator<<(std::ostream& s, const EdgeContext& e);

/**
 * Thrown by the transformers when a solve does not return OPTIMAL. Carries
 * everything needed to reproduce the failing solve.
 */
class MilpFailure : public std::runtime_error {
public:
    const FailureKind kind;
    const std::string component;
    const TransformKind transform;
    const VarName var;
    const Direction direction;
    const SolveResult result;
    const std::string solver_name;
    const Box source_box;
    const MilpProblem problem;
    const EdgeContext edge;
    const int iteration;

    MilpFailure(std::string component, TransformKind transform, VarName var,
            Direction direction, SolveResult result, std::string solver_name,
            Box source_box, MilpProblem problem, EdgeContext edge, int iteration);
};

/**
 * MILP-backed pre and post transformers.
 *
 * `post` bounds an output variable of a component, `pre` an input
 * variable, in both cases subject to the component's model constraints and
 * the bounds of one box of the source region. Every box, variable and
 * direction is a separate MilpProblem. Any non-optimal outcome throws a
 * MilpFailure; no bound is ever guessed.
 */
class Transformer {
    MilpSolver& solver_;
    size_t num_solves_ = 0;

    FloatT solve_(const ComponentModel& model, TransformKind kind,
            const Box& source, const VarName& var, Direction dir,
            const EdgeContext& edge, std::string problem_name);

    Region transform_(const ComponentModel& model, TransformKind kind,
            const Region& source, const std::vector<VarName>& vars,
            const EdgeContext& edge);

    void check_var_(const ComponentModel& model, TransformKind kind,
            const VarName& var) const;

public:
    /** Iteration index reported in failures, -1 outside of an evolution run. */
    int iteration = -1;

    explicit Transformer(MilpSolver& solver);

    inline MilpSolver& solver() { return solver_; }
    inline size_t num_solves() const { return num_solves_; }

    /** Tight bound of output `var` over the `source` box. */
    FloatT post(const ComponentModel& model, const Box& source,
            const VarName& var, Direction dir, const EdgeContext& edge = {});

    /** Tight bound of input `var` over the `source` box. */
    FloatT pre(const ComponentModel& model, const Box& source,
            const VarName& var, Direction dir, const EdgeContext& edge = {});

    /**
     * One result box over `vars` per box of `source`, min then max for each
     * variable in turn. The result is deduplicated.
     */
    Region post(const ComponentModel& model, const Region& source,
            const std::vector<VarName>& vars, const EdgeContext& edge = {});

    Region pre(const ComponentModel& model, const Region& source,
            const std::vector<VarName>& vars, const EdgeContext& edge = {});
};

} // namespace cnevo

#endif // CNEVO_TRANSFORMER_HPP

/**
 * \file evolution.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_EVOLUTION_HPP
#define CNEVO_EVOLUTION_HPP

#include "contract.hpp"
#include "network.hpp"
#include "recorder.hpp"
#include "solver.hpp"
#include "transformer.hpp"
#include "validation.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cnevo {

/**
 * How the forward contributions of several incoming edges of the same
 * consumer are combined in one iteration.
 */
enum class MergePolicy {
    /** Union each edge's contribution into the assumption, one edge at a time. */
    INCREMENTAL_UNION,

    /**
     * Intersect the contributions of all incoming edges with each other,
     * then union the result into the assumption once.
     */
    INTERSECT_ACROSS_EDGES,
};

std::ostream& operator<<(std::ostream& strm, MergePolicy p);
MergePolicy merge_policy_from_str(const std::string& s);

struct Config {

    /**
     * Stop with NON_CONVERGENCE when no fixpoint has been reached after this
     * many iterations.
     */
    int max_iterations = 100;

    /**
     * Composition of the contributions of multiple incoming edges.
     */
    MergePolicy merge_policy = MergePolicy::INCREMENTAL_UNION;

    /**
     * 0: silent, 1: one line per iteration and the outcome, 2: also every
     * contract update.
     */
    int verbosity = 0;

    /**
     * Check well-formedness of the baseline and the final contracts and
     * store the result in the EvolutionResult.
     */
    bool check_well_formedness = false;

    /**
     * Time limit per MILP for the solver created by `evolve(scenario)`.
     * 0 disables the limit.
     */
    unsigned solver_timeout_ms = 5000;
};

/**
 * The change injected into one component before the first iteration.
 * Regions that are given replace the baseline regions of the current
 * contract (the baseline itself is kept for deviation accounting).
 * Constraints are added to the component's model.
 */
struct ScenarioDeviation {
    std::string component;
    std::optional<Region> assumption;
    std::optional<Region> guarantee;
    std::vector<LinConstraint> constraints;

    inline bool changes_model() const { return !constraints.empty(); }
};

struct Scenario {
    std::string name;
    std::string description;
    ContractNetwork network;
    ScenarioDeviation deviation;
    Config config;

    /** Optional system-level guarantee checked against the final contracts. */
    std::optional<Region> system_guarantee;

    /** Informational: minimal number of iterations the scenario should take. */
    int min_iterations_expected = 0;
};

enum class EvolutionStatus {
    RUNNING,
    CONVERGED,
    NON_CONVERGENCE,
    FAILED,
    INFEASIBLE_CONTRACT,
};

std::ostream& operator<<(std::ostream& strm, EvolutionStatus s);

struct EvolutionResult {
    std::string scenario;
    EvolutionStatus status = EvolutionStatus::RUNNING;

    /** Committed iterations, the last one is the fixpoint when converged. */
    std::vector<IterationSnapshot> snapshots;

    /** Contracts when the run stopped, in component order. */
    std::vector<ComponentSnapshot> final_contracts;

    /** Set when status is FAILED. */
    std::optional<FailureReport> failure;

    /** Set when status is INFEASIBLE_CONTRACT. */
    std::string infeasible_component;
    int infeasible_iteration = -1;

    std::optional<ValidationResult> baseline_well_formedness;
    std::optional<ValidationResult> final_well_formedness;
    std::optional<SystemCheck> system_check;

    size_t num_solves = 0;
    double time = 0.0;

    inline bool is_converged() const { return status == EvolutionStatus::CONVERGED; }
    inline size_t num_iterations() const { return snapshots.size(); }
    const Contract& final_contract(const std::string& component) const;
};

std::ostream& operator<<(std::ostream& s, const EvolutionResult& r);

/**
 * Fixpoint iteration of the contracts of a network after a deviation.
 *
 * Each iteration first propagates forward: the producer's guarantee is
 * pushed through `post` onto each consumer's assumption (union), and
 * consumers with new assumption boxes widen their own guarantee through
 * `post` of their model. It then propagates backward: each consumer's
 * assumption is pulled through `pre` onto the interface, and a producer
 * guarantee that is not covered by it is narrowed (intersection), after
 * which the producer narrows its own assumption through `pre` of its model.
 *
 * Forward reads the contracts as they were at the start of the iteration;
 * every component is evolved at most once, at the end of the iteration.
 */
class Evolution {
public:
    using time_clock = std::chrono::steady_clock;
    using time_point = std::chrono::time_point<time_clock>;

    const Config config;

private:
    std::string scenario_name_;
    ContractNetwork network_;
    std::optional<Region> system_guarantee_;
    std::vector<ComponentState> states_;
    std::vector<size_t> edge_order_;
    Transformer transformer_;
    Recorder recorder_;
    RecorderSink *sink_;

    int iteration_ = 0;
    EvolutionStatus status_ = EvolutionStatus::RUNNING;
    size_t perturbed_;
    bool model_deviated_;
    std::string infeasible_component_;
    int infeasible_iteration_ = -1;
    time_point start_time_;

    using Contracts = std::vector<Contract>;

    void apply_deviation_(const ScenarioDeviation& dev);
    size_t forward_(const Contracts& start, Contracts& work);
    size_t backward_(Contracts& work);
    void set_infeasible_(size_t i);
    Region lift_(const Region& r, const Region& tmpl) const;
    ComponentSnapshot snapshot_(size_t i, int iteration) const;
    inline const ComponentModel& model_(size_t i) const {
        return network_.components()[i].model;
    }

public:
    /**
     * `sink` optionally receives a copy of every snapshot and the failure
     * report, next to the internal recorder.
     */
    Evolution(const Scenario& scenario, MilpSolver& solver,
            RecorderSink *sink = nullptr);
    Evolution(const Scenario& scenario, MilpSolver& solver,
            const Config& config, RecorderSink *sink = nullptr);

    /**
     * Run one iteration. A MilpFailure from a transformer propagates out of
     * this method; the iteration is then not committed.
     *
     * Stepping a converged evolution is allowed and reruns the iteration on
     * the fixpoint.
     */
    EvolutionStatus step();

    /**
     * Iterate until fixpoint, iteration cap, contract infeasibility or
     * failure. A MilpFailure stops the run with status FAILED and is
     * turned into the FailureReport.
     */
    EvolutionStatus run();

    inline EvolutionStatus status() const { return status_; }
    inline int iteration() const { return iteration_; }
    inline const ContractNetwork& network() const { return network_; }
    inline const std::vector<ComponentState>& states() const { return states_; }
    inline const Recorder& recorder() const { return recorder_; }
    inline size_t num_solves() const { return transformer_.num_solves(); }

    const ComponentState& state(const std::string& component) const;
    std::vector<Contract> current_contracts() const;
    double time_since_start() const;

    EvolutionResult result() const;
};

/** Run a scenario to completion with the given solver and configuration. */
EvolutionResult evolve(const Scenario& scenario, MilpSolver& solver,
        const Config& config);

/** Run a scenario with its own configuration. */
EvolutionResult evolve(const Scenario& scenario, MilpSolver& solver);

/** Run a scenario with the Z3 backend. */
EvolutionResult evolve(const Scenario& scenario);

} // namespace cnevo

#endif // CNEVO_EVOLUTION_HPP

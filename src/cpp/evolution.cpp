/**
 * \file evolution.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "evolution.hpp"
#include "deviation.hpp"
#include "z3_solver.hpp"

#include <iomanip>
#include <limits>
#include <stdexcept>

namespace cnevo {

static const size_t NO_COMPONENT = std::numeric_limits<size_t>::max();

std::ostream& operator<<(std::ostream& strm, MergePolicy p)
{
    switch (p) {
    case MergePolicy::INCREMENTAL_UNION: return strm << "INCREMENTAL_UNION";
    case MergePolicy::INTERSECT_ACROSS_EDGES: return strm << "INTERSECT_ACROSS_EDGES";
    }
    return strm;
}

MergePolicy merge_policy_from_str(const std::string& s)
{
    if (s == "INCREMENTAL_UNION") return MergePolicy::INCREMENTAL_UNION;
    if (s == "INTERSECT_ACROSS_EDGES") return MergePolicy::INTERSECT_ACROSS_EDGES;
    throw std::runtime_error("invalid merge policy: " + s);
}

std::ostream& operator<<(std::ostream& strm, EvolutionStatus s)
{
#define CNEVO_STATUS_CASE(name) case EvolutionStatus::name: \
    strm << #name; \
    break;

    switch (s) {
        CNEVO_STATUS_CASE(RUNNING)
        CNEVO_STATUS_CASE(CONVERGED)
        CNEVO_STATUS_CASE(NON_CONVERGENCE)
        CNEVO_STATUS_CASE(FAILED)
        CNEVO_STATUS_CASE(INFEASIBLE_CONTRACT)
    }

    return strm;
#undef CNEVO_STATUS_CASE
}

const Contract&
EvolutionResult::final_contract(const std::string& component) const
{
    for (const ComponentSnapshot& c : final_contracts)
        if (c.component == component)
            return c.contract;
    throw std::out_of_range("no final contract for " + component);
}

std::ostream& operator<<(std::ostream& s, const EvolutionResult& r)
{
    s << "EvolutionResult(" << r.scenario << ", " << r.status
        << ", iterations=" << r.num_iterations()
        << ", solves=" << r.num_solves
        << ", time=" << r.time;
    if (r.failure)
        s << ", " << *r.failure;
    if (!r.infeasible_component.empty())
        s << ", infeasible=" << r.infeasible_component;
    return s << ')';
}

Evolution::Evolution(const Scenario& scenario, MilpSolver& solver,
        RecorderSink *sink)
    : Evolution(scenario, solver, scenario.config, sink) {}

Evolution::Evolution(const Scenario& scenario, MilpSolver& solver,
        const Config& config, RecorderSink *sink)
    : config(config)
    , scenario_name_(scenario.name)
    , network_(scenario.network)
    , system_guarantee_(scenario.system_guarantee)
    , states_()
    , edge_order_(network_.edge_order())
    , transformer_(solver)
    , recorder_()
    , sink_(sink)
    , perturbed_(NO_COMPONENT)
    , model_deviated_(false)
    , start_time_(time_clock::now())
{
    if (config.max_iterations < 1)
        throw std::invalid_argument("max_iterations must be at least 1");

    for (const Component& c : network_.components())
        states_.emplace_back(c.name(), c.baseline);

    apply_deviation_(scenario.deviation);
}

void
Evolution::apply_deviation_(const ScenarioDeviation& dev)
{
    if (dev.component.empty())
    {
        if (dev.assumption || dev.guarantee || dev.changes_model())
            throw std::invalid_argument("deviation without component");
        return;
    }

    perturbed_ = network_.component_index(dev.component);
    Component& comp = network_.get_component(dev.component);

    for (const LinConstraint& c : dev.constraints)
        comp.model.add_constraint(c);
    model_deviated_ = dev.changes_model();

    auto check_region = [&comp](const Region& r, const char *what) {
        if (r.empty())
            throw std::invalid_argument(std::string("empty deviation ") + what);
        for (const VarName& var : r.vars())
            if (!comp.model.has_variable(var))
                throw std::invalid_argument(std::string("deviation ") + what
                        + " uses unknown variable " + var);
    };
    if (dev.assumption)
        check_region(*dev.assumption, "assumption");
    if (dev.guarantee)
        check_region(*dev.guarantee, "guarantee");

    ComponentState& state = states_[perturbed_];
    if (dev.assumption || dev.guarantee)
        state.evolve(dev.assumption ? *dev.assumption : state.assumption(),
                     dev.guarantee ? *dev.guarantee : state.guarantee());

    if (config.verbosity >= 1)
        std::cout << "deviation applied to " << dev.component << ": "
            << state.current() << std::endl;
}

Region
Evolution::lift_(const Region& r, const Region& tmpl) const
{
    // one box per pair: the other variables keep the intervals of each
    // template box, not of their hull
    Region lifted;
    for (const Box& b : r)
        for (const Box& t : tmpl)
            lifted.insert(b.lift(t));
    return lifted;
}

static EdgeContext
edge_context(const Edge *e)
{
    if (!e)
        return {};
    return { e->producer, e->consumer, e->vars };
}

size_t
Evolution::forward_(const Contracts& start, Contracts& work)
{
    size_t n = states_.size();
    size_t num_props = 0;
    std::vector<Region> added(n);
    std::vector<const Edge *> added_by(n, nullptr);

    auto merge = [&](size_t c, const Region& contribution, const Edge& e) {
        for (const Box& b : contribution)
        {
            if (!work[c].assumption.insert(b))
                continue;
            added[c].insert(b);
            if (!added_by[c])
                added_by[c] = &e;
            ++num_props;
            if (config.verbosity >= 2)
                std::cout << "  A(" << states_[c].name() << ") += " << b << std::endl;
        }
    };

    std::vector<std::optional<Region>> candidates(n);
    std::vector<const Edge *> candidate_edge(n, nullptr);
    for (size_t idx : edge_order_)
    {
        const Edge& e = network_.edges()[idx];
        size_t p = network_.component_index(e.producer);
        size_t c = network_.component_index(e.consumer);
        EdgeContext ctx { e.producer, e.consumer, e.vars };

        Region r = transformer_.post(model_(p), start[p].guarantee, e.vars, ctx);
        Region lifted = lift_(r, start[c].assumption);

        if (config.merge_policy == MergePolicy::INCREMENTAL_UNION)
        {
            merge(c, lifted, e);
        }
        else if (candidates[c])
        {
            candidates[c] = candidates[c]->intersect(lifted);
        }
        else
        {
            candidates[c] = std::move(lifted);
            candidate_edge[c] = &e;
        }
    }
    for (size_t c = 0; c < n; ++c)
        if (candidates[c])
            merge(c, *candidates[c], *candidate_edge[c]);

    // a changed model also changes what the unchanged assumption produces
    if (iteration_ == 0 && model_deviated_)
        for (const Box& b : work[perturbed_].assumption)
            added[perturbed_].insert(b);

    for (size_t c = 0; c < n; ++c)
    {
        std::vector<VarName> outputs = model_(c).outputs();
        if (added[c].empty() || outputs.empty())
            continue;

        // blamed on the first edge that added a box, none for a model deviation
        Region g = transformer_.post(model_(c), added[c], outputs,
                edge_context(added_by[c]));
        for (const Box& b : lift_(g, start[c].guarantee))
        {
            if (!work[c].guarantee.insert(b))
                continue;
            ++num_props;
            if (config.verbosity >= 2)
                std::cout << "  G(" << states_[c].name() << ") += " << b << std::endl;
        }
    }

    return num_props;
}

size_t
Evolution::backward_(Contracts& work)
{
    size_t n = states_.size();
    size_t num_props = 0;
    std::vector<const Edge *> narrowed_by(n, nullptr);

    for (size_t idx : edge_order_)
    {
        const Edge& e = network_.edges()[idx];
        size_t p = network_.component_index(e.producer);
        size_t c = network_.component_index(e.consumer);
        EdgeContext ctx { e.producer, e.consumer, e.vars };

        Region required = transformer_.pre(model_(c), work[c].assumption, e.vars, ctx);
        if (required.covers(work[p].guarantee.project(e.vars)))
            continue;

        work[p].guarantee = work[p].guarantee.intersect(required);
        ++num_props;
        if (config.verbosity >= 2)
            std::cout << "  G(" << states_[p].name() << ") narrowed to "
                << work[p].guarantee << std::endl;
        if (work[p].guarantee.empty())
        {
            set_infeasible_(p);
            return num_props;
        }
        if (!narrowed_by[p])
            narrowed_by[p] = &e;
    }

    for (size_t p = 0; p < n; ++p)
    {
        std::vector<VarName> inputs = model_(p).inputs();
        if (!narrowed_by[p] || inputs.empty())
            continue;

        Region required = transformer_.pre(model_(p), work[p].guarantee, inputs,
                edge_context(narrowed_by[p]));
        if (required.covers(work[p].assumption.project(inputs)))
            continue;

        work[p].assumption = work[p].assumption.intersect(required);
        ++num_props;
        if (config.verbosity >= 2)
            std::cout << "  A(" << states_[p].name() << ") narrowed to "
                << work[p].assumption << std::endl;
        if (work[p].assumption.empty())
        {
            set_infeasible_(p);
            return num_props;
        }
    }

    return num_props;
}

void
Evolution::set_infeasible_(size_t i)
{
    states_[i].declare_infeasible();
    status_ = EvolutionStatus::INFEASIBLE_CONTRACT;
    infeasible_component_ = states_[i].name();
    infeasible_iteration_ = iteration_;
    if (config.verbosity >= 1)
        std::cout << "contract of " << infeasible_component_
            << " became infeasible in iteration " << iteration_ << std::endl;
}

EvolutionStatus
Evolution::step()
{
    if (status_ != EvolutionStatus::RUNNING && status_ != EvolutionStatus::CONVERGED)
        throw std::runtime_error("evolution has stopped");

    time_point t0 = time_clock::now();
    size_t solves0 = transformer_.num_solves();
    transformer_.iteration = iteration_;

    Contracts start = current_contracts();
    Contracts work = start;

    size_t num_props = forward_(start, work);
    num_props += backward_(work);
    if (status_ == EvolutionStatus::INFEASIBLE_CONTRACT)
        return status_;

    bool changed = false;
    for (size_t i = 0; i < states_.size(); ++i)
    {
        if (work[i] == start[i])
            continue;
        states_[i].evolve(std::move(work[i].assumption), std::move(work[i].guarantee));
        changed = true;
    }

    IterationSnapshot snap;
    snap.iteration = iteration_;
    for (size_t i = 0; i < states_.size(); ++i)
        snap.components.push_back(snapshot_(i, iteration_));
    snap.num_propagations = num_props;
    snap.num_solves = transformer_.num_solves() - solves0;
    snap.time = std::chrono::duration_cast<std::chrono::microseconds>(
            time_clock::now() - t0).count() * 1e-6;
    snap.converged = !changed;

    recorder_.record_iteration(snap);
    if (sink_)
        sink_->record_iteration(snap);

    if (config.verbosity >= 1)
        std::cout << "iteration " << std::setw(3) << iteration_
            << ": " << num_props << " propagations, "
            << snap.num_solves << " MILPs, magnitude "
            << snap.total_magnitude() << ", " << snap.time << "s"
            << (snap.converged ? " (fixpoint)" : "") << std::endl;

    ++iteration_;
    if (!changed)
        status_ = EvolutionStatus::CONVERGED;
    else if (iteration_ >= config.max_iterations)
        status_ = EvolutionStatus::NON_CONVERGENCE;
    else
        status_ = EvolutionStatus::RUNNING;

    return status_;
}

EvolutionStatus
Evolution::run()
{
    try
    {
        while (status_ == EvolutionStatus::RUNNING)
            step();
    }
    catch (const MilpFailure& f)
    {
        status_ = EvolutionStatus::FAILED;
        FailureReport report = FailureReport::from_failure(f);
        recorder_.record_failure(report);
        if (sink_)
            sink_->record_failure(report);
        if (config.verbosity >= 1)
            std::cout << report.format_report();
    }

    if (config.verbosity >= 1)
        std::cout << scenario_name_ << ": " << status_ << " after "
            << iteration_ << " iteration(s), " << num_solves() << " MILPs, "
            << time_since_start() << "s" << std::endl;

    return status_;
}

const ComponentState&
Evolution::state(const std::string& component) const
{
    return states_.at(network_.component_index(component));
}

std::vector<Contract>
Evolution::current_contracts() const
{
    std::vector<Contract> cs;
    for (const ComponentState& s : states_)
        cs.push_back(s.current());
    return cs;
}

double
Evolution::time_since_start() const
{
    auto now = time_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(
            now - start_time_).count() * 1e-6;
}

ComponentSnapshot
Evolution::snapshot_(size_t i, int iteration) const
{
    return { states_[i].name(), states_[i].current(),
             deviation_record(states_[i], iteration) };
}

EvolutionResult
Evolution::result() const
{
    EvolutionResult r;
    r.scenario = scenario_name_;
    r.status = status_;
    r.snapshots = recorder_.snapshots();
    for (size_t i = 0; i < states_.size(); ++i)
        r.final_contracts.push_back(snapshot_(i, iteration_ - 1));
    r.failure = recorder_.failure();
    r.infeasible_component = infeasible_component_;
    r.infeasible_iteration = infeasible_iteration_;

    if (config.check_well_formedness)
    {
        r.baseline_well_formedness = check_well_formedness(network_);
        r.final_well_formedness = check_well_formedness(network_, current_contracts());
    }
    if (system_guarantee_)
        r.system_check = check_system_contract(network_, current_contracts(),
                *system_guarantee_);

    r.num_solves = num_solves();
    r.time = time_since_start();
    return r;
}

EvolutionResult
evolve(const Scenario& scenario, MilpSolver& solver, const Config& config)
{
    Evolution evolution(scenario, solver, config);
    evolution.run();
    return evolution.result();
}

EvolutionResult
evolve(const Scenario& scenario, MilpSolver& solver)
{
    return evolve(scenario, solver, scenario.config);
}

EvolutionResult
evolve(const Scenario& scenario)
{
    Z3MilpSolver solver(scenario.config.solver_timeout_ms);
    return evolve(scenario, solver, scenario.config);
}

} // namespace cnevo

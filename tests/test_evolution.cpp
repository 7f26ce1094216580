#include "bounds_solver.hpp"
#include "evolution.hpp"
#include <iostream>
#include <stdexcept>

using namespace cnevo;

/*
 * Producer -> Consumer over V, both baselines V in [0, 10], the deviation
 * widens the producer guarantee to [0, 15].
 */
static Scenario producer_consumer(FloatT consumer_hi = 100.0) {
    ComponentModel pm("Producer");
    pm.add_output("V", {0.0, 100.0});
    ComponentModel cm("Consumer");
    cm.add_input("V", {0.0, consumer_hi});

    Scenario s;
    s.name = "producer_consumer";
    s.network.add_component({std::move(pm),
            {Region{Box()}, Region{Box{{"V", {0.0, 10.0}}}}}});
    s.network.add_component({std::move(cm),
            {Region{Box{{"V", {0.0, 10.0}}}}, Region{Box()}}});
    s.network.add_edge({"Producer", "Consumer", {"V"}});
    s.deviation.component = "Producer";
    s.deviation.guarantee = Region{Box{{"V", {0.0, 15.0}}}};
    return s;
}

class CountingSink : public RecorderSink {
public:
    int num_iterations = 0;
    int num_failures = 0;

    void record_iteration(const IterationSnapshot&) override { ++num_iterations; }
    void record_failure(const FailureReport&) override { ++num_failures; }
};

int test_producer_consumer() {
    Scenario s = producer_consumer();
    BoundsSolver solver;
    CountingSink sink;
    Evolution evo(s, solver, &sink);

    EvolutionStatus status = evo.run();
    const auto& snaps = evo.recorder().snapshots();

    Region expected_a{Box{{"V", {0.0, 10.0}}}, Box{{"V", {0.0, 15.0}}}};

    bool result = true
        && status == EvolutionStatus::CONVERGED
        && snaps.size() == 2
        && !snaps[0].converged
        && snaps[1].converged
        && snaps[0].iteration == 0
        && snaps[1].iteration == 1
        // iteration 0 pushes [0, 15] through post onto the consumer
        && solver.solved.at(0) == "Producer_post_b0_V_min"
        && solver.solved.at(1) == "Producer_post_b0_V_max"
        && snaps[0].get("Consumer").contract.assumption == expected_a
        && snaps[0].num_propagations == 1
        && snaps[0].num_solves == 6
        && snaps[1].num_solves == 6
        && snaps[1].num_propagations == 0
        && snaps[0].get("Producer").deviation.g_rel.magnitude == 5.0
        && snaps[0].get("Consumer").deviation.a_rel.count == 1
        && snaps[0].get("Consumer").deviation.num_assumption_boxes == 2
        && evo.state("Consumer").assumption() == expected_a
        && evo.num_solves() == 12
        && sink.num_iterations == 2
        && sink.num_failures == 0;

    std::cout << "test_producer_consumer " << result << std::endl;
    return result;
}

int test_producer_consumer_failure() {
    Scenario s = producer_consumer();
    BoundsSolver solver;
    solver.fail_problem = "Producer_post_b0_V_max";
    CountingSink sink;
    Evolution evo(s, solver, &sink);

    EvolutionStatus status = evo.run();
    EvolutionResult r = evo.result();

    bool result = true
        && status == EvolutionStatus::FAILED
        && r.status == EvolutionStatus::FAILED
        && r.failure.has_value()
        && r.snapshots.empty()
        && sink.num_iterations == 0
        && sink.num_failures == 1;

    if (result) {
        const FailureReport& f = *r.failure;
        result = true
            && f.kind == FailureKind::INFEASIBLE_MODEL
            && f.component == "Producer"
            && f.transform == TransformKind::POST
            && f.var == "V"
            && f.direction == Direction::MAX
            && f.iteration == 0
            && f.status == SolveStatus::INFEASIBLE
            && f.solver_name == "bounds"
            && f.problem.name() == "Producer_post_b0_V_max"
            && f.edge.consumer == "Consumer";
        std::cout << f.format_report();
    }

    // nothing of the failed iteration is committed
    result = result
        && evo.state("Consumer").assumption().size() == 1
        && evo.state("Consumer").num_evolutions() == 0;

    try {
        evo.step();
        result = false;
    } catch (const std::runtime_error&) {}

    std::cout << "test_producer_consumer_failure " << result << std::endl;
    return result;
}

int test_step_failure_propagates() {
    Scenario s = producer_consumer();
    BoundsSolver solver;
    solver.fail_problem = "Consumer_pre_b1_V_min";
    Evolution evo(s, solver);

    bool result = false;
    try {
        evo.step();
    } catch (const MilpFailure& f) {
        result = f.transform == TransformKind::PRE
            && f.component == "Consumer"
            && f.direction == Direction::MIN;
    }
    result = result && evo.recorder().snapshots().empty();

    std::cout << "test_step_failure_propagates " << result << std::endl;
    return result;
}

int test_fixpoint_stability() {
    Scenario s = producer_consumer();
    BoundsSolver solver;
    Evolution evo(s, solver);

    evo.run();
    std::vector<Contract> fixpoint = evo.current_contracts();
    EvolutionStatus status = evo.step();

    bool result = true
        && status == EvolutionStatus::CONVERGED
        && evo.current_contracts() == fixpoint
        && evo.recorder().snapshots().size() == 3
        && evo.recorder().snapshots().back().converged
        && evo.iteration() == 3;

    std::cout << "test_fixpoint_stability " << result << std::endl;
    return result;
}

int test_dedup_and_monotonicity() {
    Scenario s = producer_consumer();
    BoundsSolver solver;
    Evolution evo(s, solver);

    FloatT prev_a = evo.state("Consumer").assumption().volume();
    FloatT prev_g = evo.state("Producer").guarantee().volume();
    bool result = true;
    std::vector<size_t> sizes;
    while (evo.step() == EvolutionStatus::RUNNING) {
        FloatT a = evo.state("Consumer").assumption().volume();
        FloatT g = evo.state("Producer").guarantee().volume();
        result = result && a >= prev_a && g >= prev_g;
        prev_a = a;
        prev_g = g;
        sizes.push_back(evo.state("Consumer").assumption().size());
    }

    // the same post result merged twice does not add a box
    result = result
        && sizes == std::vector<size_t>{2}
        && evo.state("Consumer").assumption().size() == 2
        && evo.state("Consumer").assumption().volume() == 15.0;

    std::cout << "test_dedup_and_monotonicity " << result << std::endl;
    return result;
}

int test_non_convergence() {
    Scenario s = producer_consumer();
    s.config.max_iterations = 1;
    BoundsSolver solver;
    Evolution evo(s, solver);

    EvolutionStatus status = evo.run();
    EvolutionResult r = evo.result();

    bool result = true
        && status == EvolutionStatus::NON_CONVERGENCE
        && r.num_iterations() == 1
        && !r.failure.has_value()
        && !r.is_converged();

    try {
        Config c;
        c.max_iterations = 0;
        Evolution bad(s, solver, c);
        result = false;
    } catch (const std::invalid_argument&) {}

    std::cout << "test_non_convergence " << result << std::endl;
    return result;
}

int test_backward_narrowing() {
    // baseline guarantee [0, 5], deviated to [0, 10], consumer only accepts [0, 8]
    Scenario s;
    s.name = "narrowing";
    ComponentModel pm("Producer");
    pm.add_input("X", {0.0, 20.0});
    pm.add_output("V", {0.0, 100.0});
    ComponentModel cm("Consumer");
    cm.add_input("V", {0.0, 8.0});
    s.network.add_component({std::move(pm),
            {Region{Box{{"X", {0.0, 10.0}}}}, Region{Box{{"V", {0.0, 5.0}}}}}});
    s.network.add_component({std::move(cm),
            {Region{Box{{"V", {0.0, 5.0}}}}, Region{Box()}}});
    s.network.add_edge({"Producer", "Consumer", {"V"}});
    s.deviation.component = "Producer";
    s.deviation.guarantee = Region{Box{{"V", {0.0, 10.0}}}};

    BoundsSolver solver;
    Evolution evo(s, solver);
    EvolutionStatus status = evo.run();
    const auto& snaps = evo.recorder().snapshots();

    Region narrowed{Box{{"V", {0.0, 5.0}}}, Box{{"V", {0.0, 8.0}}}};

    bool result = true
        && status == EvolutionStatus::CONVERGED
        && snaps.size() == 3
        && snaps[0].get("Producer").contract.guarantee == narrowed
        && snaps[0].get("Producer").contract.guarantee.volume() <= 10.0
        && evo.state("Producer").guarantee() == narrowed
        && evo.state("Producer").assumption() == Region{Box{{"X", {0.0, 10.0}}}}
        && evo.state("Consumer").assumption().size() == 3;

    std::cout << "test_backward_narrowing " << result << std::endl;
    return result;
}

int test_infeasible_contract() {
    // the producer's model can only work with X in [50, 60]
    Scenario s;
    s.name = "infeasible";
    ComponentModel pm("Producer");
    pm.add_input("X", {50.0, 60.0});
    pm.add_output("V", {0.0, 100.0});
    ComponentModel cm("Consumer");
    cm.add_input("V", {0.0, 8.0});
    s.network.add_component({std::move(pm),
            {Region{Box{{"X", {0.0, 10.0}}}}, Region{Box{{"V", {0.0, 10.0}}}}}});
    s.network.add_component({std::move(cm),
            {Region{Box{{"V", {0.0, 10.0}}}}, Region{Box()}}});
    s.network.add_edge({"Producer", "Consumer", {"V"}});

    BoundsSolver solver;
    Evolution evo(s, solver);
    EvolutionStatus status = evo.run();
    EvolutionResult r = evo.result();

    bool result = true
        && status == EvolutionStatus::INFEASIBLE_CONTRACT
        && r.infeasible_component == "Producer"
        && r.infeasible_iteration == 0
        && !r.failure.has_value()
        && r.snapshots.empty()
        && evo.state("Producer").is_infeasible();

    std::cout << "test_infeasible_contract " << result << std::endl;
    return result;
}

int test_model_deviation() {
    Scenario s = producer_consumer();
    s.deviation.guarantee.reset();
    Component& p = s.network.get_component("Producer");
    p.model.add_input("X", {0.0, 10.0});
    p.baseline.assumption = Region{Box{{"X", {0.0, 10.0}}}};
    s.deviation.constraints.push_back({"limit", {{1.0, "V"}}, Relation::LE, 3.0});

    BoundsSolver solver;
    Evolution evo(s, solver);
    EvolutionStatus status = evo.run();

    bool result = true
        && status == EvolutionStatus::CONVERGED
        && evo.recorder().snapshots().size() == 2
        && evo.state("Producer").guarantee().has_box(Box{{"V", {0.0, 3.0}}})
        && evo.state("Consumer").assumption().has_box(Box{{"V", {0.0, 3.0}}})
        && evo.network().get_component("Producer").model.constraints().size() == 1
        // the scenario itself is not modified
        && s.network.get_component("Producer").model.constraints().empty();

    std::cout << "test_model_deviation " << result << std::endl;
    return result;
}

static Scenario two_producers(MergePolicy policy) {
    Scenario s;
    s.name = "two_producers";
    s.config.merge_policy = policy;

    ComponentModel p1("P1");
    p1.add_output("a", {0.0, 100.0});
    ComponentModel p2("P2");
    p2.add_output("b", {0.0, 100.0});
    ComponentModel c("C");
    c.add_input("a", {0.0, 100.0});
    c.add_input("b", {0.0, 100.0});

    s.network.add_component({std::move(p1),
            {Region{Box()}, Region{Box{{"a", {0.0, 10.0}}}}}});
    s.network.add_component({std::move(p2),
            {Region{Box()}, Region{Box{{"b", {0.0, 10.0}}}}}});
    s.network.add_component({std::move(c),
            {Region{Box{{"a", {0.0, 10.0}}, {"b", {0.0, 10.0}}}}, Region{Box()}}});
    s.network.add_edge({"P1", "C", {"a"}});
    s.network.add_edge({"P2", "C", {"b"}});
    s.deviation.component = "P1";
    s.deviation.guarantee = Region{Box{{"a", {0.0, 15.0}}}};
    return s;
}

int test_merge_policy() {
    BoundsSolver solver;
    EvolutionResult r_union = evolve(two_producers(MergePolicy::INCREMENTAL_UNION), solver);
    EvolutionResult r_inter = evolve(two_producers(MergePolicy::INTERSECT_ACROSS_EDGES), solver);

    Region widened{
        Box{{"a", {0.0, 10.0}}, {"b", {0.0, 10.0}}},
        Box{{"a", {0.0, 15.0}}, {"b", {0.0, 10.0}}}};

    bool result = true
        && r_union.is_converged()
        && r_union.final_contract("C").assumption == widened
        && r_union.final_contract("P1").guarantee == Region{Box{{"a", {0.0, 15.0}}}}
        && r_inter.is_converged()
        && r_inter.final_contract("C").assumption.size() == 1
        // the consumer does not take the deviation, so it is narrowed away
        && r_inter.final_contract("P1").guarantee == Region{Box{{"a", {0.0, 10.0}}}}
        && merge_policy_from_str("INTERSECT_ACROSS_EDGES") == MergePolicy::INTERSECT_ACROSS_EDGES;

    std::cout << "test_merge_policy " << result << std::endl;
    return result;
}

int test_invalid_deviation() {
    BoundsSolver solver;
    bool result = true;

    try {
        Scenario s = producer_consumer();
        s.deviation.component = "Nobody";
        Evolution evo(s, solver);
        result = false;
    } catch (const std::runtime_error&) {}

    try {
        Scenario s = producer_consumer();
        s.deviation.guarantee = Region{Box{{"W", {0.0, 1.0}}}};
        Evolution evo(s, solver);
        result = false;
    } catch (const std::invalid_argument&) {}

    try {
        Scenario s = producer_consumer();
        s.deviation.assumption = Region();
        Evolution evo(s, solver);
        result = false;
    } catch (const std::invalid_argument&) {}

    std::cout << "test_invalid_deviation " << result << std::endl;
    return result;
}

int test_evolve_z3() {
    // same scenario, exact solver, the consumer scales V into W = V / 2
    Scenario s = producer_consumer();
    Component& c = s.network.get_component("Consumer");
    c.model.add_output("W", {0.0, 100.0});
    c.model.add_constraint({{2.0, "W"}, {-1.0, "V"}}, Relation::EQ, 0.0);
    c.baseline.guarantee = Region{Box{{"W", {0.0, 5.0}}}};
    s.config.check_well_formedness = true;

    EvolutionResult r = evolve(s);

    bool result = true
        && r.is_converged()
        && r.num_iterations() == 2
        && r.final_contract("Consumer").guarantee.has_box(Box{{"W", {0.0, 7.5}}})
        && r.final_well_formedness.has_value()
        && r.final_well_formedness->passed;

    std::cout << r << std::endl;
    std::cout << "test_evolve_z3 " << result << std::endl;
    return result;
}

int test_lift_keeps_other_vars() {
    // the consumer assumes a and b move together: two disjoint boxes
    Scenario s;
    s.name = "nonconvex";
    ComponentModel pm("P");
    pm.add_output("a", {0.0, 100.0});
    ComponentModel cm("C");
    cm.add_input("a", {0.0, 100.0});
    cm.add_input("b", {0.0, 100.0});

    Region base_a{
        Box{{"a", {0.0, 1.0}}, {"b", {0.0, 1.0}}},
        Box{{"a", {5.0, 6.0}}, {"b", {5.0, 6.0}}}};
    s.network.add_component({std::move(pm),
            {Region{Box()}, Region{Box{{"a", {0.0, 1.0}}}}}});
    s.network.add_component({std::move(cm), {base_a, Region{Box()}}});
    s.network.add_edge({"P", "C", {"a"}});
    s.deviation.component = "P";
    s.deviation.guarantee = Region{Box{{"a", {0.0, 2.0}}}};

    BoundsSolver solver;
    Evolution evo(s, solver);
    EvolutionStatus status = evo.run();

    const Region& a = evo.state("C").assumption();
    Region expected = base_a.unite(Region{
        Box{{"a", {0.0, 2.0}}, {"b", {0.0, 1.0}}},
        Box{{"a", {0.0, 2.0}}, {"b", {5.0, 6.0}}}});
    const DeviationRecord& dev = evo.recorder().snapshots().at(0).get("C").deviation;

    bool result = true
        && status == EvolutionStatus::CONVERGED
        && a == expected
        && a.contains(Box{{"a", {1.5, 1.5}}, {"b", {0.5, 0.5}}})
        && !a.contains(Box{{"a", {1.5, 1.5}}, {"b", {3.0, 3.0}}})
        // deviation is measured on hulls, the new boxes stay inside the baseline hull
        && dev.a_rel.is_zero()
        && dev.num_assumption_boxes == 4;

    std::cout << dev << std::endl;
    std::cout << "test_lift_keeps_other_vars " << result << std::endl;
    return result;
}

int test_own_model_failure_edge() {
    bool result = true;

    // forward: the consumer widens its guarantee for the box P added
    {
        Scenario s = producer_consumer();
        Component& c = s.network.get_component("Consumer");
        c.model.add_output("W", {0.0, 100.0});
        c.baseline.guarantee = Region{Box{{"W", {0.0, 5.0}}}};

        BoundsSolver solver;
        solver.fail_problem = "Consumer_post_b0_W_max";
        EvolutionResult r = evolve(s, solver);

        result = result
            && r.status == EvolutionStatus::FAILED
            && r.failure.has_value()
            && r.failure->component == "Consumer"
            && r.failure->transform == TransformKind::POST
            && r.failure->edge.producer == "Producer"
            && r.failure->edge.consumer == "Consumer"
            && r.failure->edge.vars == std::vector<VarName>{"V"};
    }

    // backward: the producer narrows its assumption for the consumer's requirement
    {
        Scenario s;
        s.name = "narrowing";
        ComponentModel pm("Producer");
        pm.add_input("X", {0.0, 20.0});
        pm.add_output("V", {0.0, 100.0});
        ComponentModel cm("Consumer");
        cm.add_input("V", {0.0, 8.0});
        s.network.add_component({std::move(pm),
                {Region{Box{{"X", {0.0, 10.0}}}}, Region{Box{{"V", {0.0, 5.0}}}}}});
        s.network.add_component({std::move(cm),
                {Region{Box{{"V", {0.0, 5.0}}}}, Region{Box()}}});
        s.network.add_edge({"Producer", "Consumer", {"V"}});
        s.deviation.component = "Producer";
        s.deviation.guarantee = Region{Box{{"V", {0.0, 10.0}}}};

        BoundsSolver solver;
        solver.fail_problem = "Producer_pre_b0_X_min";
        EvolutionResult r = evolve(s, solver);

        result = result
            && r.status == EvolutionStatus::FAILED
            && r.failure.has_value()
            && r.failure->component == "Producer"
            && r.failure->transform == TransformKind::PRE
            && r.failure->edge.producer == "Producer"
            && r.failure->edge.consumer == "Consumer";
    }

    std::cout << "test_own_model_failure_edge " << result << std::endl;
    return result;
}

int main_evolution() {
    int result = 1
        && test_producer_consumer()
        && test_producer_consumer_failure()
        && test_step_failure_propagates()
        && test_fixpoint_stability()
        && test_dedup_and_monotonicity()
        && test_non_convergence()
        && test_backward_narrowing()
        && test_infeasible_contract()
        && test_model_deviation()
        && test_merge_policy()
        && test_invalid_deviation()
        && test_evolve_z3()
        && test_lift_keeps_other_vars()
        && test_own_model_failure_edge()
        ;
    return !result;
}

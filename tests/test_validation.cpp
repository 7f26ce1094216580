#include "bounds_solver.hpp"
#include "evolution.hpp"
#include "recorder.hpp"
#include "validation.hpp"
#include <iostream>
#include <stdexcept>

using namespace cnevo;

static ContractNetwork make_network() {
    ComponentModel pm("Producer");
    pm.add_output("V", {0.0, 100.0});
    ComponentModel cm("Consumer");
    cm.add_input("V", {0.0, 100.0});

    ContractNetwork n;
    n.add_component({std::move(pm),
            {Region{Box()}, Region{Box{{"V", {0.0, 10.0}}}}}});
    n.add_component({std::move(cm),
            {Region{Box{{"V", {0.0, 10.0}}}}, Region{Box()}}});
    n.add_edge({"Producer", "Consumer", {"V"}});
    return n;
}

int test_well_formedness() {
    ContractNetwork n = make_network();

    ValidationResult base = check_well_formedness(n);

    std::vector<Contract> contracts{
        {Region{Box()}, Region{Box{{"V", {0.0, 15.0}}}}},
        {Region{Box{{"V", {0.0, 10.0}}}}, Region{Box()}}};
    ValidationResult deviated = check_well_formedness(n, contracts);

    contracts[1].assumption = contracts[1].assumption.unite(
            Region{Box{{"V", {0.0, 15.0}}}});
    ValidationResult repaired = check_well_formedness(n, contracts);

    bool result = true
        && base.passed
        && !deviated.passed
        && deviated.details.size() == 1
        && repaired.passed;

    std::cout << deviated << std::endl;

    try {
        check_well_formedness(n, {});
        result = false;
    } catch (const std::invalid_argument&) {}

    std::cout << "test_well_formedness " << result << std::endl;
    return result;
}

int test_system_contract() {
    ContractNetwork n = make_network();
    std::vector<Contract> contracts{
        {Region{Box()}, Region{Box{{"V", {0.0, 15.0}}}}},
        {Region{Box{{"V", {0.0, 15.0}}}}, Region{Box()}}};

    SystemCheck exact = check_system_contract(n, contracts,
            Region{Box{{"V", {0.0, 15.0}}}});
    SystemCheck narrow = check_system_contract(n, contracts,
            Region{Box{{"V", {0.0, 10.0}}}});
    SystemCheck wide = check_system_contract(n, contracts,
            Region{Box{{"V", {0.0, 20.0}}}});

    bool result = true
        && exact.result.passed
        && exact.gap.empty() && exact.violation.empty()
        && !narrow.result.passed
        && narrow.violation == Region{Box{{"V", {10.0, 15.0}}}}
        && narrow.gap.empty()
        && !wide.result.passed
        && wide.gap == Region{Box{{"V", {15.0, 20.0}}}}
        && wide.violation.empty();

    std::cout << "test_system_contract " << result << std::endl;
    return result;
}

int test_evolution_checks() {
    Scenario s;
    s.name = "checked";
    s.network = make_network();
    s.deviation.component = "Producer";
    s.deviation.guarantee = Region{Box{{"V", {0.0, 15.0}}}};
    s.config.check_well_formedness = true;
    s.system_guarantee = Region{Box{{"V", {0.0, 20.0}}}};

    BoundsSolver solver;
    EvolutionResult r = evolve(s, solver);

    bool result = true
        && r.is_converged()
        && r.baseline_well_formedness.has_value()
        && r.baseline_well_formedness->passed
        && r.final_well_formedness.has_value()
        && r.final_well_formedness->passed
        && r.system_check.has_value()
        && !r.system_check->result.passed
        && r.system_check->gap == Region{Box{{"V", {15.0, 20.0}}}};

    std::cout << "test_evolution_checks " << result << std::endl;
    return result;
}

int test_recorder() {
    Recorder rec;
    IterationSnapshot snap;
    snap.iteration = 0;
    rec.record_iteration(snap);

    ComponentModel m("Producer");
    m.add_output("V");
    Box src{{"V", {0.0, 15.0}}};
    MilpFailure f("Producer", TransformKind::POST, "V", Direction::MAX,
            SolveResult::failed(SolveStatus::INFEASIBLE), "bounds", src,
            build_problem(m, src, "V", Direction::MAX, "Producer_post_b0_V_max"),
            {"Producer", "Consumer", {"V"}}, 1);
    FailureReport report = FailureReport::from_failure(f);
    rec.record_failure(report);

    std::string text = report.format_report();

    bool result = true
        && rec.has_failed()
        && rec.snapshots().size() == 1
        && report.kind == FailureKind::INFEASIBLE_MODEL
        && text.find("InfeasibleModel") != std::string::npos
        && text.find("component:   Producer") != std::string::npos
        && text.find("transformer: post") != std::string::npos
        && text.find("direction:   max") != std::string::npos
        && text.find("Producer -> Consumer") != std::string::npos
        && text.find("box_V_hi: V <= 15") != std::string::npos;

    try {
        rec.record_iteration(snap);
        result = false;
    } catch (const std::runtime_error&) {}
    try {
        rec.record_failure(report);
        result = false;
    } catch (const std::runtime_error&) {}

    std::cout << "test_recorder " << result << std::endl;
    return result;
}

int main_validation() {
    int result = 1
        && test_well_formedness()
        && test_system_contract()
        && test_evolution_checks()
        && test_recorder()
        ;
    return !result;
}

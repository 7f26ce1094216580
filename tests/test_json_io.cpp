#include "bounds_solver.hpp"
#include "evolution.hpp"
#include "json_io.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace cnevo;

static Scenario load_scenario(const std::string& fname) {
    std::string path = "tests/scenarios/" + fname;
    std::ifstream f(path);
    if (!f.is_open())
        path = "../" + path;
    return scenario_from_file(path);
}

int test_region_json() {
    Region r{
        Box{{"V", {0.0, 10.0}}, {"W", Interval::from_lo(2.0)}},
        Box{{"V", Interval()}},
        Box()};

    std::stringstream s;
    region_to_json(s, r);
    std::string str = s.str();
    Region r2 = region_from_json(s);

    bool result = true
        && r == r2
        && str.find("null") != std::string::npos;

    std::stringstream bad("[{\"V\": [10, 0]}]");
    try {
        region_from_json(bad);
        result = false;
    } catch (const std::invalid_argument&) {}

    std::cout << "test_region_json " << result << std::endl;
    return result;
}

int test_load_producer_consumer() {
    Scenario s = load_scenario("producer_consumer.json");

    BoundsSolver solver;
    EvolutionResult r = evolve(s, solver);

    bool result = true
        && s.name == "producer_consumer"
        && s.network.num_components() == 2
        && s.network.edges().size() == 1
        && s.network.get_component("Producer").model.get_variable("V").unit == "V"
        && s.deviation.component == "Producer"
        && s.deviation.guarantee.has_value()
        && *s.deviation.guarantee == Region{Box{{"V", {0.0, 15.0}}}}
        && !s.deviation.assumption.has_value()
        && s.config.max_iterations == 20
        && s.config.verbosity == 1
        && s.config.merge_policy == MergePolicy::INCREMENTAL_UNION
        && s.min_iterations_expected == 2
        && r.is_converged()
        && (int)r.num_iterations() == s.min_iterations_expected
        && r.final_contract("Consumer").assumption.size() == 2;

    std::cout << "test_load_producer_consumer " << result << std::endl;
    return result;
}

int test_scenario_roundtrip() {
    Scenario s = load_scenario("drone_power_chain.json");

    std::stringstream ss;
    scenario_to_json(ss, s);
    Scenario s2 = scenario_from_json(ss);

    const ComponentModel& pm = s2.network.get_component("PowerManager").model;

    bool result = true
        && s2.name == s.name
        && s2.description == s.description
        && s2.network.num_components() == 3
        && s2.network.edges().size() == 2
        && s2.network.edges()[1].vars == std::vector<VarName>{"P_motor"}
        && pm.constraints().size() == 1
        && pm.constraints()[0].name == "efficiency"
        && pm.constraints()[0].terms.size() == 2
        && pm.constraints()[0].terms[1].coef == -0.9
        && pm.constraints()[0].rel == Relation::EQ
        && pm.is_input("P_bat") && pm.is_output("P_motor")
        && s2.network.get_component("Motor").baseline
            == s.network.get_component("Motor").baseline
        && *s2.deviation.guarantee == *s.deviation.guarantee
        && s2.system_guarantee.has_value()
        && s2.config.check_well_formedness
        && s2.config.solver_timeout_ms == 10000
        && s2.min_iterations_expected == 3;

    std::cout << "test_scenario_roundtrip " << result << std::endl;
    return result;
}

int test_drone_power_chain() {
    Scenario s = load_scenario("drone_power_chain.json");
    EvolutionResult r = evolve(s);

    std::stringstream js;
    result_to_json(js, r);
    std::string str = js.str();

    bool result = true
        && r.is_converged()
        && (int)r.num_iterations() == s.min_iterations_expected
        && r.final_contract("PowerManager").guarantee.has_box(Box{{"P_motor", {0.0, 315.0}}})
        && r.final_contract("Motor").guarantee.has_box(Box{{"thrust", {0.0, 63.0}}})
        && r.final_well_formedness.has_value()
        && r.final_well_formedness->passed
        && r.system_check.has_value()
        && r.system_check->result.passed
        && str.find("\"status\": \"CONVERGED\"") != std::string::npos
        && str.find("\"final_contracts\"") != std::string::npos;

    std::cout << r << std::endl;
    std::cout << "test_drone_power_chain " << result << std::endl;
    return result;
}

int test_motor_degradation() {
    Scenario s = load_scenario("motor_degradation.json");
    EvolutionResult r = evolve(s);

    bool result = true
        && s.network.has_cycle()
        && s.network.cycles().size() == 1
        && s.network.cycles()[0].size() == 2
        && s.network.edge_order() == std::vector<size_t>{0, 1, 2}
        && r.is_converged()
        && (int)r.num_iterations() == s.min_iterations_expected
        // the higher thrust reaches the controller, the higher current the power manager
        && r.final_contract("FlightController").assumption.has_box(Box{{"motor_thrust", {0.0, 90.0}}})
        && r.final_contract("PowerManager").assumption.has_box(Box{{"motor_current", {0.0, 45.0}}})
        // the widened command is cut back to what the motor accepts
        && r.final_contract("FlightController").guarantee
            == Region{Box{{"thrust_command", {0.0, 40.0}}}}
        && r.snapshots[0].num_propagations == 4
        && r.snapshots[1].num_propagations == 0
        && r.baseline_well_formedness.has_value()
        && r.baseline_well_formedness->passed
        && r.final_well_formedness.has_value()
        && r.final_well_formedness->passed;

    std::cout << r << std::endl;
    std::cout << "test_motor_degradation " << result << std::endl;
    return result;
}

int test_json_lines_sink() {
    Scenario s = load_scenario("producer_consumer.json");
    s.config.verbosity = 0;

    std::stringstream ok_lines;
    {
        BoundsSolver solver;
        JsonLinesSink sink(ok_lines);
        Evolution evo(s, solver, &sink);
        evo.run();
    }

    std::stringstream fail_lines;
    {
        BoundsSolver solver;
        solver.fail_problem = "Producer_post_b0_V_max";
        JsonLinesSink sink(fail_lines);
        Evolution evo(s, solver, &sink);
        evo.run();
    }

    int num_ok = 0;
    std::string line;
    while (std::getline(ok_lines, line))
        if (line.find("\"type\":\"iteration\"") != std::string::npos)
            ++num_ok;

    std::string fail = fail_lines.str();

    bool result = true
        && num_ok == 2
        && fail.find("\"type\":\"failure\"") != std::string::npos
        && fail.find("\"kind\":\"InfeasibleModel\"") != std::string::npos
        && fail.find("\"variable\":\"V\"") != std::string::npos
        && fail.find("\"direction\":\"max\"") != std::string::npos
        && fail.find("\"type\":\"iteration\"") == std::string::npos;

    std::cout << "test_json_lines_sink " << result << std::endl;
    return result;
}

int test_invalid_scenarios() {
    bool result = true;

    try {
        scenario_from_file("does/not/exist.json");
        result = false;
    } catch (const std::runtime_error&) {}

    std::stringstream bad_role(R"({
        "name": "bad",
        "components": [{"name": "A", "variables": [{"name": "x", "role": "sideways"}],
                        "assumption": [{}], "guarantee": [{}]}]
    })");
    try {
        scenario_from_json(bad_role);
        result = false;
    } catch (const std::runtime_error&) {}

    std::stringstream bad_deviation(R"({
        "name": "bad",
        "components": [{"name": "A", "variables": [{"name": "x", "role": "output"}],
                        "assumption": [{}], "guarantee": [{"x": [0, 1]}]}],
        "deviation": {"component": "B"}
    })");
    try {
        scenario_from_json(bad_deviation);
        result = false;
    } catch (const std::runtime_error&) {}

    std::stringstream bad_policy(R"({
        "name": "bad",
        "components": [],
        "config": {"merge_policy": "AVERAGE"}
    })");
    try {
        scenario_from_json(bad_policy);
        result = false;
    } catch (const std::runtime_error&) {}

    std::cout << "test_invalid_scenarios " << result << std::endl;
    return result;
}

int main_json_io() {
    int result = 1
        && test_region_json()
        && test_load_producer_consumer()
        && test_scenario_roundtrip()
        && test_drone_power_chain()
        && test_motor_degradation()
        && test_json_lines_sink()
        && test_invalid_scenarios()
        ;
    return !result;
}

/**
 * \file json_io_nlohmann.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "basics.hpp"
#include "interval.hpp"
#include "json_io.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <istream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace cnevo {

using json = nlohmann::json;

namespace json_detail {

static json bound_to_json(FloatT v) {
    if (std::isinf(v))
        return nullptr;
    return v;
}

static FloatT bound_from_json(const json& j, FloatT inf) {
    if (j.is_null())
        return inf;
    if (!j.is_number())
        throw std::runtime_error("invalid bound");
    return j.get<FloatT>();
}

static json interval_to_json(const Interval& ival) {
    return json::array({ bound_to_json(ival.lo), bound_to_json(ival.hi) });
}

static Interval interval_from_json(const json& j) {
    if (!j.is_array() || j.size() != 2)
        throw std::runtime_error("invalid interval");
    return { bound_from_json(j[0], Limits<FloatT>::min),
             bound_from_json(j[1], Limits<FloatT>::max) };
}

static json box_to_json(const Box& box) {
    json j = json::object();
    for (auto&& [var, ival] : box)
        j[var] = interval_to_json(ival);
    return j;
}

static Box box_from_json(const json& j) {
    if (!j.is_object())
        throw std::runtime_error("invalid box");
    Box::BufT buf;
    for (auto it = j.begin(); it != j.end(); ++it)
        buf.emplace_back(it.key(), interval_from_json(it.value()));
    return Box(std::move(buf));
}

static json region_to_json(const Region& r) {
    json j = json::array();
    for (const Box& b : r)
        j.push_back(box_to_json(b));
    return j;
}

static Region region_from_json(const json& j) {
    if (!j.is_array())
        throw std::runtime_error("invalid region");
    Region r;
    for (const json& b : j)
        r.insert(box_from_json(b));
    return r;
}

static std::string relation_to_str(Relation r) {
    std::stringstream s;
    s << r;
    return s.str();
}

static Relation relation_from_str(const std::string& s) {
    if (s == "<=") return Relation::LE;
    if (s == ">=") return Relation::GE;
    if (s == "=" || s == "==") return Relation::EQ;
    throw std::runtime_error("invalid relation: " + s);
}

template <typename T>
static std::string to_str(const T& o) {
    std::stringstream s;
    s << o;
    return s.str();
}

static json constraint_to_json(const LinConstraint& c) {
    json j;
    j["name"] = c.name;
    j["terms"] = json::array();
    for (const LinTerm& t : c.terms)
        j["terms"].push_back(json::array({ t.coef, t.var }));
    j["rel"] = relation_to_str(c.rel);
    j["rhs"] = c.rhs;
    return j;
}

static LinConstraint constraint_from_json(const json& j) {
    LinConstraint c;
    c.name = j.value("name", "");
    for (const json& t : j.at("terms"))
    {
        if (!t.is_array() || t.size() != 2)
            throw std::runtime_error("invalid constraint term");
        c.terms.push_back({ t[0].get<FloatT>(), t[1].get<std::string>() });
    }
    c.rel = relation_from_str(j.at("rel").get<std::string>());
    c.rhs = j.at("rhs").get<FloatT>();
    return c;
}

static json variable_to_json(const Variable& v) {
    json j;
    j["name"] = v.name;
    j["role"] = to_str(v.role);
    j["type"] = to_str(v.type);
    if (!v.unit.empty())
        j["unit"] = v.unit;
    j["lo"] = bound_to_json(v.bounds.lo);
    j["hi"] = bound_to_json(v.bounds.hi);
    return j;
}

static Variable variable_from_json(const json& j) {
    Variable v;
    v.name = j.at("name").get<std::string>();
    v.role = var_role_from_str(j.at("role").get<std::string>());
    v.type = var_type_from_str(j.value("type", "continuous"));
    v.unit = j.value("unit", "");
    v.bounds = {
        j.contains("lo") ? bound_from_json(j.at("lo"), Limits<FloatT>::min) : Limits<FloatT>::min,
        j.contains("hi") ? bound_from_json(j.at("hi"), Limits<FloatT>::max) : Limits<FloatT>::max,
    };
    return v;
}

static json config_to_json(const Config& c) {
    json j;
    j["max_iterations"] = c.max_iterations;
    j["merge_policy"] = to_str(c.merge_policy);
    j["verbosity"] = c.verbosity;
    j["check_well_formedness"] = c.check_well_formedness;
    j["solver_timeout_ms"] = c.solver_timeout_ms;
    return j;
}

static Config config_from_json(const json& j) {
    Config c;
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    if (j.contains("merge_policy"))
        c.merge_policy = merge_policy_from_str(j["merge_policy"].get<std::string>());
    c.verbosity = j.value("verbosity", c.verbosity);
    c.check_well_formedness = j.value("check_well_formedness", c.check_well_formedness);
    c.solver_timeout_ms = j.value("solver_timeout_ms", c.solver_timeout_ms);
    return c;
}

static json component_to_json(const Component& comp) {
    json j;
    j["name"] = comp.name();
    j["variables"] = json::array();
    for (const Variable& v : comp.model.variables())
        j["variables"].push_back(variable_to_json(v));
    j["constraints"] = json::array();
    for (const LinConstraint& c : comp.model.constraints())
        j["constraints"].push_back(constraint_to_json(c));
    j["assumption"] = region_to_json(comp.baseline.assumption);
    j["guarantee"] = region_to_json(comp.baseline.guarantee);
    return j;
}

static Component component_from_json(const json& j) {
    ComponentModel model(j.at("name").get<std::string>());
    for (const json& v : j.at("variables"))
        model.add_variable(variable_from_json(v));
    if (j.contains("constraints"))
        for (const json& c : j["constraints"])
            model.add_constraint(constraint_from_json(c));
    Contract baseline {
        region_from_json(j.at("assumption")),
        region_from_json(j.at("guarantee")),
    };
    return { std::move(model), std::move(baseline) };
}

static json contract_to_json(const Contract& c) {
    json j;
    j["assumption"] = region_to_json(c.assumption);
    j["guarantee"] = region_to_json(c.guarantee);
    return j;
}

static json measure_to_json(const DeltaMeasure& m) {
    json j;
    j["count"] = m.count;
    j["magnitude"] = bound_to_json(m.magnitude);
    return j;
}

static json deviation_record_to_json(const DeviationRecord& r) {
    json j;
    j["iteration"] = r.iteration;
    j["A_rel"] = measure_to_json(r.a_rel);
    j["A_str"] = measure_to_json(r.a_str);
    j["G_rel"] = measure_to_json(r.g_rel);
    j["G_str"] = measure_to_json(r.g_str);
    j["num_assumption_boxes"] = r.num_assumption_boxes;
    j["num_guarantee_boxes"] = r.num_guarantee_boxes;
    return j;
}

static json component_snapshot_to_json(const ComponentSnapshot& c) {
    json j;
    j["component"] = c.component;
    j["contract"] = contract_to_json(c.contract);
    j["deviation"] = deviation_record_to_json(c.deviation);
    return j;
}

static json snapshot_to_json(const IterationSnapshot& snap) {
    json j;
    j["iteration"] = snap.iteration;
    j["total_magnitude"] = bound_to_json(snap.total_magnitude());
    j["num_propagations"] = snap.num_propagations;
    j["num_solves"] = snap.num_solves;
    j["time"] = snap.time;
    j["converged"] = snap.converged;
    j["components"] = json::array();
    for (const ComponentSnapshot& c : snap.components)
        j["components"].push_back(component_snapshot_to_json(c));
    return j;
}

static json problem_to_json(const MilpProblem& p) {
    json j;
    j["name"] = p.name();
    j["objective"] = p.objective();
    j["direction"] = to_str(p.direction());
    j["variables"] = json::array();
    for (const MilpVariable& v : p.variables())
    {
        json jv;
        jv["name"] = v.name;
        jv["type"] = to_str(v.type);
        jv["lo"] = bound_to_json(v.bounds.lo);
        jv["hi"] = bound_to_json(v.bounds.hi);
        j["variables"].push_back(std::move(jv));
    }
    j["constraints"] = json::array();
    for (const LinConstraint& c : p.constraints())
        j["constraints"].push_back(constraint_to_json(c));
    return j;
}

static json failure_report_to_json(const FailureReport& r) {
    json j;
    j["kind"] = to_str(r.kind);
    j["component"] = r.component;
    j["transformer"] = to_str(r.transform);
    j["variable"] = r.var;
    j["direction"] = to_str(r.direction);
    j["solver"] = r.solver_name;
    j["status"] = to_str(r.status);
    j["reason"] = r.reason;
    j["iteration"] = r.iteration;
    j["source_box"] = box_to_json(r.source_box);
    if (!r.edge.empty())
    {
        j["edge"]["producer"] = r.edge.producer;
        j["edge"]["consumer"] = r.edge.consumer;
        j["edge"]["vars"] = r.edge.vars;
    }
    j["problem"] = problem_to_json(r.problem);
    return j;
}

static json validation_to_json(const ValidationResult& v) {
    json j;
    j["passed"] = v.passed;
    j["message"] = v.message;
    j["details"] = v.details;
    return j;
}

} // namespace json_detail

using namespace json_detail;

void region_to_json(std::ostream& s, const Region& r) {
    s << json_detail::region_to_json(r);
}

Region region_from_json(std::istream& s) {
    json j = json::parse(s);
    return json_detail::region_from_json(j);
}

void scenario_to_json(std::ostream& s, const Scenario& scenario) {
    json j;
    j["name"] = scenario.name;
    j["description"] = scenario.description;
    j["components"] = json::array();
    for (const Component& c : scenario.network.components())
        j["components"].push_back(component_to_json(c));
    j["edges"] = json::array();
    for (const Edge& e : scenario.network.edges())
    {
        json je;
        je["producer"] = e.producer;
        je["consumer"] = e.consumer;
        je["vars"] = e.vars;
        j["edges"].push_back(std::move(je));
    }

    const ScenarioDeviation& dev = scenario.deviation;
    if (!dev.component.empty())
    {
        json jd;
        jd["component"] = dev.component;
        if (dev.assumption)
            jd["assumption"] = json_detail::region_to_json(*dev.assumption);
        if (dev.guarantee)
            jd["guarantee"] = json_detail::region_to_json(*dev.guarantee);
        jd["constraints"] = json::array();
        for (const LinConstraint& c : dev.constraints)
            jd["constraints"].push_back(constraint_to_json(c));
        j["deviation"] = std::move(jd);
    }

    j["config"] = config_to_json(scenario.config);
    if (scenario.system_guarantee)
        j["system_guarantee"] = json_detail::region_to_json(*scenario.system_guarantee);
    j["min_iterations_expected"] = scenario.min_iterations_expected;

    s << j.dump(2);
}

Scenario scenario_from_json(std::istream& s) {
    json j = json::parse(s);

    Scenario scenario;
    scenario.name = j.at("name").get<std::string>();
    scenario.description = j.value("description", "");

    for (const json& c : j.at("components"))
        scenario.network.add_component(component_from_json(c));
    if (j.contains("edges"))
        for (const json& e : j["edges"])
            scenario.network.add_edge({
                e.at("producer").get<std::string>(),
                e.at("consumer").get<std::string>(),
                e.at("vars").get<std::vector<std::string>>(),
            });

    if (j.contains("deviation"))
    {
        const json& jd = j["deviation"];
        ScenarioDeviation& dev = scenario.deviation;
        dev.component = jd.at("component").get<std::string>();
        if (!scenario.network.has_component(dev.component))
            throw std::runtime_error("invalid deviation component: " + dev.component);
        if (jd.contains("assumption"))
            dev.assumption = json_detail::region_from_json(jd["assumption"]);
        if (jd.contains("guarantee"))
            dev.guarantee = json_detail::region_from_json(jd["guarantee"]);
        if (jd.contains("constraints"))
            for (const json& c : jd["constraints"])
                dev.constraints.push_back(constraint_from_json(c));
    }

    if (j.contains("config"))
        scenario.config = config_from_json(j["config"]);
    if (j.contains("system_guarantee"))
        scenario.system_guarantee = json_detail::region_from_json(j["system_guarantee"]);
    scenario.min_iterations_expected = j.value("min_iterations_expected", 0);

    return scenario;
}

Scenario scenario_from_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("cannot open scenario file " + path);
    return scenario_from_json(f);
}

void problem_to_json(std::ostream& s, const MilpProblem& p) {
    s << json_detail::problem_to_json(p);
}

void failure_report_to_json(std::ostream& s, const FailureReport& r) {
    s << json_detail::failure_report_to_json(r);
}

void snapshot_to_json(std::ostream& s, const IterationSnapshot& snap) {
    s << json_detail::snapshot_to_json(snap);
}

void result_to_json(std::ostream& s, const EvolutionResult& r) {
    json j;
    j["scenario"] = r.scenario;
    j["status"] = to_str(r.status);
    j["num_iterations"] = r.num_iterations();
    j["num_solves"] = r.num_solves;
    j["time"] = r.time;

    j["iterations"] = json::array();
    for (const IterationSnapshot& snap : r.snapshots)
        j["iterations"].push_back(json_detail::snapshot_to_json(snap));

    j["final_contracts"] = json::array();
    for (const ComponentSnapshot& c : r.final_contracts)
        j["final_contracts"].push_back(component_snapshot_to_json(c));

    if (r.failure)
        j["failure"] = json_detail::failure_report_to_json(*r.failure);
    if (!r.infeasible_component.empty())
    {
        j["infeasible"]["component"] = r.infeasible_component;
        j["infeasible"]["iteration"] = r.infeasible_iteration;
    }
    if (r.baseline_well_formedness)
        j["baseline_well_formedness"] = validation_to_json(*r.baseline_well_formedness);
    if (r.final_well_formedness)
        j["final_well_formedness"] = validation_to_json(*r.final_well_formedness);
    if (r.system_check)
    {
        j["system_check"] = validation_to_json(r.system_check->result);
        j["system_check"]["gap"] = json_detail::region_to_json(r.system_check->gap);
        j["system_check"]["violation"] = json_detail::region_to_json(r.system_check->violation);
    }

    s << j.dump(2);
}

void JsonLinesSink::record_iteration(const IterationSnapshot& snapshot) {
    json j;
    j["type"] = "iteration";
    j["data"] = json_detail::snapshot_to_json(snapshot);
    strm_ << j << std::endl;
}

void JsonLinesSink::record_failure(const FailureReport& report) {
    json j;
    j["type"] = "failure";
    j["data"] = json_detail::failure_report_to_json(report);
    strm_ << j << std::endl;
}

} // namespace cnevo

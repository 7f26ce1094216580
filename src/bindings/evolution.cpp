#include "bindings.h"
#include "evolution.hpp"
#include "json_io.hpp"
#include "z3_solver.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace cnevo;

void init_evolution(py::module &m) {
    py::enum_<MergePolicy>(m, "MergePolicy")
        .value("INCREMENTAL_UNION",      MergePolicy::INCREMENTAL_UNION)
        .value("INTERSECT_ACROSS_EDGES", MergePolicy::INTERSECT_ACROSS_EDGES)
        ; // MergePolicy

    py::enum_<EvolutionStatus>(m, "EvolutionStatus")
        .value("RUNNING", EvolutionStatus::RUNNING)
        .value("CONVERGED", EvolutionStatus::CONVERGED)
        .value("NON_CONVERGENCE", EvolutionStatus::NON_CONVERGENCE)
        .value("FAILED", EvolutionStatus::FAILED)
        .value("INFEASIBLE_CONTRACT", EvolutionStatus::INFEASIBLE_CONTRACT)
        ; // EvolutionStatus

    py::enum_<SolveStatus>(m, "SolveStatus")
        .value("OPTIMAL", SolveStatus::OPTIMAL)
        .value("INFEASIBLE", SolveStatus::INFEASIBLE)
        .value("UNBOUNDED", SolveStatus::UNBOUNDED)
        .value("TIMEOUT", SolveStatus::TIMEOUT)
        .value("ERROR", SolveStatus::ERROR)
        .value("OTHER", SolveStatus::OTHER)
        ; // SolveStatus

    py::enum_<FailureKind>(m, "FailureKind")
        .value("INFEASIBLE_MODEL",    FailureKind::INFEASIBLE_MODEL)
        .value("UNBOUNDED_OBJECTIVE", FailureKind::UNBOUNDED_OBJECTIVE)
        .value("SOLVER_ERROR",        FailureKind::SOLVER_ERROR)
        .value("SOLVER_TIMEOUT",      FailureKind::SOLVER_TIMEOUT)
        .value("NON_OPTIMAL_STATUS",  FailureKind::NON_OPTIMAL_STATUS)
        ; // FailureKind

    py::enum_<TransformKind>(m, "TransformKind")
        .value("PRE", TransformKind::PRE)
        .value("POST", TransformKind::POST)
        ; // TransformKind

    py::enum_<Direction>(m, "Direction")
        .value("MIN", Direction::MIN)
        .value("MAX", Direction::MAX)
        ; // Direction

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("max_iterations", &Config::max_iterations)
        .def_readwrite("merge_policy", &Config::merge_policy)
        .def_readwrite("verbosity", &Config::verbosity)
        .def_readwrite("check_well_formedness", &Config::check_well_formedness)
        .def_readwrite("solver_timeout_ms", &Config::solver_timeout_ms)
        ; // Config

    py::class_<Scenario>(m, "Scenario")
        .def_static("from_file", &scenario_from_file)
        .def_static("from_json", [](const std::string& json) {
            std::stringstream s(json);
            return scenario_from_json(s);
        })
        .def("to_json", [](const Scenario& s) {
            std::stringstream ss;
            scenario_to_json(ss, s);
            return ss.str();
        })
        .def_readwrite("name", &Scenario::name)
        .def_readwrite("description", &Scenario::description)
        .def_readwrite("config", &Scenario::config)
        .def_readwrite("min_iterations_expected", &Scenario::min_iterations_expected)
        .def_property_readonly("components", [](const Scenario& s) {
            std::vector<std::string> names;
            for (const Component& c : s.network.components())
                names.push_back(c.name());
            return names;
        })
        .def_property_readonly("deviated_component", [](const Scenario& s) {
            return s.deviation.component;
        })
        .def("__repr__", [](const Scenario& s) { return "Scenario(" + s.name + ")"; })
        ; // Scenario

    py::class_<MilpSolver>(m, "MilpSolver")
        .def("name", &MilpSolver::name)
        ; // MilpSolver

    py::class_<Z3MilpSolver, MilpSolver>(m, "Z3MilpSolver")
        .def(py::init<unsigned>(), py::arg("timeout_ms") = 5000)
        .def_property_readonly("timeout_ms", &Z3MilpSolver::timeout_ms)
        .def_property_readonly("num_solves", &Z3MilpSolver::num_solves)
        ; // Z3MilpSolver

    py::class_<DeltaMeasure>(m, "DeltaMeasure")
        .def_readonly("count", &DeltaMeasure::count)
        .def_readonly("magnitude", &DeltaMeasure::magnitude)
        .def("is_zero", &DeltaMeasure::is_zero)
        ; // DeltaMeasure

    py::class_<DeviationRecord>(m, "DeviationRecord")
        .def_readonly("component", &DeviationRecord::component)
        .def_readonly("iteration", &DeviationRecord::iteration)
        .def_readonly("assumption_relaxation", &DeviationRecord::a_rel)
        .def_readonly("assumption_strengthening", &DeviationRecord::a_str)
        .def_readonly("guarantee_relaxation", &DeviationRecord::g_rel)
        .def_readonly("guarantee_strengthening", &DeviationRecord::g_str)
        .def_readonly("num_assumption_boxes", &DeviationRecord::num_assumption_boxes)
        .def_readonly("num_guarantee_boxes", &DeviationRecord::num_guarantee_boxes)
        .def("total_magnitude", &DeviationRecord::total_magnitude)
        .def("is_zero", &DeviationRecord::is_zero)
        ; // DeviationRecord

    py::class_<ComponentSnapshot>(m, "ComponentSnapshot")
        .def_readonly("component", &ComponentSnapshot::component)
        .def_readonly("contract", &ComponentSnapshot::contract)
        .def_readonly("deviation", &ComponentSnapshot::deviation)
        ; // ComponentSnapshot

    py::class_<IterationSnapshot>(m, "IterationSnapshot")
        .def_readonly("iteration", &IterationSnapshot::iteration)
        .def_readonly("components", &IterationSnapshot::components)
        .def_readonly("num_propagations", &IterationSnapshot::num_propagations)
        .def_readonly("num_solves", &IterationSnapshot::num_solves)
        .def_readonly("time", &IterationSnapshot::time)
        .def_readonly("converged", &IterationSnapshot::converged)
        .def("total_magnitude", &IterationSnapshot::total_magnitude)
        .def("__getitem__", &IterationSnapshot::get)
        .def("to_json", [](const IterationSnapshot& snap) {
            std::stringstream s;
            snapshot_to_json(s, snap);
            return s.str();
        })
        ; // IterationSnapshot

    py::class_<FailureReport>(m, "FailureReport")
        .def_readonly("kind", &FailureReport::kind)
        .def_readonly("component", &FailureReport::component)
        .def_readonly("transform", &FailureReport::transform)
        .def_readonly("var", &FailureReport::var)
        .def_readonly("direction", &FailureReport::direction)
        .def_readonly("solver_name", &FailureReport::solver_name)
        .def_readonly("status", &FailureReport::status)
        .def_readonly("reason", &FailureReport::reason)
        .def_readonly("source_box", &FailureReport::source_box)
        .def_readonly("iteration", &FailureReport::iteration)
        .def_property_readonly("edge", [](const FailureReport& r) -> py::object {
            if (r.edge.empty())
                return py::none();
            return py::make_tuple(r.edge.producer, r.edge.consumer, r.edge.vars);
        })
        .def("format_report", &FailureReport::format_report)
        .def("to_json", [](const FailureReport& r) {
            std::stringstream s;
            failure_report_to_json(s, r);
            return s.str();
        })
        .def("__repr__", &FailureReport::format_report)
        ; // FailureReport

    py::class_<ValidationResult>(m, "ValidationResult")
        .def_readonly("passed", &ValidationResult::passed)
        .def_readonly("message", &ValidationResult::message)
        .def_readonly("details", &ValidationResult::details)
        .def("__repr__", [](const ValidationResult& v) { return tostr(v); })
        ; // ValidationResult

    py::class_<SystemCheck>(m, "SystemCheck")
        .def_readonly("result", &SystemCheck::result)
        .def_readonly("gap", &SystemCheck::gap)
        .def_readonly("violation", &SystemCheck::violation)
        ; // SystemCheck

    py::class_<EvolutionResult>(m, "EvolutionResult")
        .def_readonly("scenario", &EvolutionResult::scenario)
        .def_readonly("status", &EvolutionResult::status)
        .def_readonly("snapshots", &EvolutionResult::snapshots)
        .def_readonly("final_contracts", &EvolutionResult::final_contracts)
        .def_readonly("failure", &EvolutionResult::failure)
        .def_readonly("infeasible_component", &EvolutionResult::infeasible_component)
        .def_readonly("infeasible_iteration", &EvolutionResult::infeasible_iteration)
        .def_readonly("baseline_well_formedness", &EvolutionResult::baseline_well_formedness)
        .def_readonly("final_well_formedness", &EvolutionResult::final_well_formedness)
        .def_readonly("system_check", &EvolutionResult::system_check)
        .def_readonly("num_solves", &EvolutionResult::num_solves)
        .def_readonly("time", &EvolutionResult::time)
        .def("is_converged", &EvolutionResult::is_converged)
        .def("num_iterations", &EvolutionResult::num_iterations)
        .def("final_contract", &EvolutionResult::final_contract)
        .def("to_json", [](const EvolutionResult& r) {
            std::stringstream s;
            result_to_json(s, r);
            return s.str();
        })
        .def("__repr__", [](const EvolutionResult& r) { return tostr(r); })
        ; // EvolutionResult

    py::class_<RecorderSink>(m, "RecorderSink")
        ; // RecorderSink

    py::class_<Evolution>(m, "Evolution", R"pbdoc(
        Fixpoint iteration of the contracts of a network after a deviation.
        The solver must outlive the evolution.

        )pbdoc")
        .def(py::init<const Scenario&, MilpSolver&, RecorderSink *>(),
                py::arg("scenario"), py::arg("solver"), py::arg("sink") = nullptr,
                py::keep_alive<1, 3>())
        .def(py::init<const Scenario&, MilpSolver&, const Config&, RecorderSink *>(),
                py::arg("scenario"), py::arg("solver"), py::arg("config"),
                py::arg("sink") = nullptr,
                py::keep_alive<1, 3>())
        .def_readonly("config", &Evolution::config)
        .def("step", &Evolution::step)
        .def("run", &Evolution::run)
        .def_property_readonly("status", &Evolution::status)
        .def_property_readonly("iteration", &Evolution::iteration)
        .def_property_readonly("num_solves", &Evolution::num_solves)
        .def("current_contracts", &Evolution::current_contracts)
        .def("contract", [](const Evolution& e, const std::string& component) {
            return e.state(component).current();
        })
        .def("time_since_start", &Evolution::time_since_start)
        .def("result", &Evolution::result)
        ; // Evolution

    m.def("evolve", py::overload_cast<const Scenario&>(&evolve), py::arg("scenario"));
    m.def("evolve", py::overload_cast<const Scenario&, MilpSolver&>(&evolve),
            py::arg("scenario"), py::arg("solver"));
    m.def("evolve", py::overload_cast<const Scenario&, MilpSolver&, const Config&>(&evolve),
            py::arg("scenario"), py::arg("solver"), py::arg("config"));
}

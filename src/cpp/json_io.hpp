/**
 * \file json_io.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_JSONIO_HPP
#define CNEVO_JSONIO_HPP

#include "evolution.hpp"
#include "recorder.hpp"
#include "region.hpp"

#include <iostream>
#include <string>

namespace cnevo {

/*
 * Regions are arrays of boxes, a box is an object mapping variable names to
 * [lo, hi] pairs. Infinite bounds are written as null.
 */

void region_to_json(std::ostream& s, const Region& r);
Region region_from_json(std::istream& s);

void scenario_to_json(std::ostream& s, const Scenario& scenario);
Scenario scenario_from_json(std::istream& s);

/** Read a scenario file, throws when the file cannot be opened. */
Scenario scenario_from_file(const std::string& path);

void problem_to_json(std::ostream& s, const MilpProblem& p);
void failure_report_to_json(std::ostream& s, const FailureReport& r);
void snapshot_to_json(std::ostream& s, const IterationSnapshot& snap);
void result_to_json(std::ostream& s, const EvolutionResult& r);

/** Writes one JSON document per line: every snapshot, then the failure. */
class JsonLinesSink : public RecorderSink {
    std::ostream& strm_;

public:
    explicit JsonLinesSink(std::ostream& strm) : strm_(strm) {}

    void record_iteration(const IterationSnapshot& snapshot) override;
    void record_failure(const FailureReport& report) override;
};

} // namespace cnevo

#endif // CNEVO_JSONIO_HPP

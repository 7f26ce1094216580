/**
 * \file recorder.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_RECORDER_HPP
#define CNEVO_RECORDER_HPP

#include "contract.hpp"
#include "deviation.hpp"
#include "transformer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cnevo {

struct ComponentSnapshot {
    std::string component;
    Contract contract;
    DeviationRecord deviation;
};

/** State of the network after one committed iteration. */
struct IterationSnapshot {
    int iteration = -1;
    std::vector<ComponentSnapshot> components;

    /** Number of transformer results merged into a contract. */
    size_t num_propagations = 0;

    /** Number of MILPs solved in this iteration. */
    size_t num_solves = 0;

    /** Wall clock time of the iteration in seconds. */
    double time = 0.0;

    /** No contract changed in this iteration. */
    bool converged = false;

    FloatT total_magnitude() const;
    const ComponentSnapshot& get(const std::string& component) const;
};

std::ostream& operator<<(std::ostream& s, const IterationSnapshot& snap);

/**
 * Everything about the solve that aborted a run: which transformer, for
 * which component, edge and variable, what the solver said, and the exact
 * problem that was handed to it.
 */
struct FailureReport {
    FailureKind kind;
    std::string component;
    TransformKind transform;
    VarName var;
    Direction direction;
    std::string solver_name;
    SolveStatus status;
    std::string reason;
    Box source_box;
    MilpProblem problem;
    EdgeContext edge;
    int iteration;

    static FailureReport from_failure(const MilpFailure& f);

    /** Multi-line human readable report. */
    std::string format_report() const;
};

std::ostream& operator<<(std::ostream& s, const FailureReport& r);

/** Receives the per-iteration snapshots and the failure report of a run. */
class RecorderSink {
public:
    virtual ~RecorderSink() {}

    virtual void record_iteration(const IterationSnapshot& snapshot) = 0;
    virtual void record_failure(const FailureReport& report) = 0;
};

/** Keeps everything in memory. Refuses new iterations after a failure. */
class Recorder : public RecorderSink {
    std::vector<IterationSnapshot> snapshots_;
    std::optional<FailureReport> failure_;

public:
    void record_iteration(const IterationSnapshot& snapshot) override;
    void record_failure(const FailureReport& report) override;

    inline const std::vector<IterationSnapshot>& snapshots() const { return snapshots_; }
    inline const std::optional<FailureReport>& failure() const { return failure_; }
    inline bool has_failed() const { return failure_.has_value(); }
};

} // namespace cnevo

#endif // CNEVO_RECORDER_HPP

/**
 * \file recorder.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "recorder.hpp"

#include <sstream>
#include <stdexcept>

namespace cnevo {

FloatT
IterationSnapshot::total_magnitude() const
{
    FloatT m = 0.0;
    for (const ComponentSnapshot& c : components)
        m += c.deviation.total_magnitude();
    return m;
}

const ComponentSnapshot&
IterationSnapshot::get(const std::string& component) const
{
    for (const ComponentSnapshot& c : components)
        if (c.component == component)
            return c;
    throw std::out_of_range("no snapshot for component " + component);
}

std::ostream& operator<<(std::ostream& s, const IterationSnapshot& snap)
{
    s << "IterationSnapshot(it=" << snap.iteration
        << ", magnitude=" << snap.total_magnitude()
        << ", propagations=" << snap.num_propagations
        << ", solves=" << snap.num_solves
        << ", time=" << snap.time
        << (snap.converged ? ", converged" : "") << ')';
    return s;
}

FailureReport
FailureReport::from_failure(const MilpFailure& f)
{
    return {
        f.kind,
        f.component,
        f.transform,
        f.var,
        f.direction,
        f.solver_name,
        f.result.status,
        f.result.reason,
        f.source_box,
        f.problem,
        f.edge,
        f.iteration,
    };
}

std::string
FailureReport::format_report() const
{
    std::stringstream s;
    s << "MILP transformation failure: " << kind << std::endl
        << "  component:   " << component << std::endl
        << "  transformer: " << transform << std::endl
        << "  variable:    " << var << std::endl
        << "  direction:   " << direction << std::endl
        << "  solver:      " << solver_name << std::endl
        << "  status:      " << status << std::endl;
    if (!reason.empty())
        s << "  reason:      " << reason << std::endl;
    s << "  iteration:   " << iteration << std::endl
        << "  source box:  " << source_box << std::endl
        << "  edge:        " << edge << std::endl
        << "  problem:" << std::endl
        << problem << std::endl;
    return s.str();
}

std::ostream& operator<<(std::ostream& s, const FailureReport& r)
{
    return s << "FailureReport(" << r.kind << ", " << r.component << ' '
        << r.transform << ' ' << r.direction << ' ' << r.var
        << ", status=" << r.status << ", it=" << r.iteration << ')';
}

void
Recorder::record_iteration(const IterationSnapshot& snapshot)
{
    if (failure_)
        throw std::runtime_error("recording an iteration after a failure");
    snapshots_.push_back(snapshot);
}

void
Recorder::record_failure(const FailureReport& report)
{
    if (failure_)
        throw std::runtime_error("failure already recorded");
    failure_ = report;
}

} // namespace cnevo

/**
 * \file deviation.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "deviation.hpp"

namespace cnevo {

std::ostream& operator<<(std::ostream& s, const DeltaMeasure& m)
{
    return s << m.count << '/' << m.magnitude;
}

static void
add_delta(DeltaMeasure& m, FloatT delta)
{
    ++m.count;
    m.magnitude += delta;
}

void
measure_deviation(const Box& baseline, const Box& evolved,
        DeltaMeasure& relaxation, DeltaMeasure& strengthening)
{
    for (auto&& [var, base] : baseline)
    {
        if (!evolved.has(var))
            continue;
        const Interval& ival = evolved.at(var);

        if (ival.lo < base.lo)
            add_delta(relaxation, base.lo - ival.lo);
        else if (ival.lo > base.lo)
            add_delta(strengthening, ival.lo - base.lo);

        if (ival.hi > base.hi)
            add_delta(relaxation, ival.hi - base.hi);
        else if (ival.hi < base.hi)
            add_delta(strengthening, base.hi - ival.hi);
    }
}

FloatT
DeviationRecord::total_magnitude() const
{
    return a_rel.magnitude + a_str.magnitude + g_rel.magnitude + g_str.magnitude;
}

bool
DeviationRecord::is_zero() const
{
    return a_rel.is_zero() && a_str.is_zero() && g_rel.is_zero() && g_str.is_zero();
}

DeviationRecord
deviation_record(const ComponentState& state, int iteration)
{
    DeviationRecord r;
    r.component = state.name();
    r.iteration = iteration;
    r.num_assumption_boxes = state.assumption().size();
    r.num_guarantee_boxes = state.guarantee().size();

    const Contract& base = state.baseline();
    if (!state.assumption().empty() && !base.assumption.empty())
        measure_deviation(base.assumption.hull(), state.assumption().hull(),
                r.a_rel, r.a_str);
    if (!state.guarantee().empty() && !base.guarantee.empty())
        measure_deviation(base.guarantee.hull(), state.guarantee().hull(),
                r.g_rel, r.g_str);
    return r;
}

std::ostream& operator<<(std::ostream& s, const DeviationRecord& r)
{
    return s << "DeviationRecord(" << r.component
        << ", it=" << r.iteration
        << ", A_rel=" << r.a_rel
        << ", A_str=" << r.a_str
        << ", G_rel=" << r.g_rel
        << ", G_str=" << r.g_str
        << ", #A=" << r.num_assumption_boxes
        << ", #G=" << r.num_guarantee_boxes << ')';
}

} // namespace cnevo

/**
 * \file deviation.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_DEVIATION_HPP
#define CNEVO_DEVIATION_HPP

#include "box.hpp"
#include "contract.hpp"

#include <string>

namespace cnevo {

/** Number of moved bounds and the total distance they moved. */
struct DeltaMeasure {
    size_t count = 0;
    FloatT magnitude = 0.0;

    inline bool is_zero() const { return count == 0; }
    inline bool operator==(const DeltaMeasure& o) const {
        return count == o.count && magnitude == o.magnitude;
    }
};

std::ostream& operator<<(std::ostream& s, const DeltaMeasure& m);

/**
 * Signed bound deltas between a baseline box and an evolved box, for the
 * variables present in both. A lower bound that moved down or an upper
 * bound that moved up is a relaxation, the opposite a strengthening.
 */
void measure_deviation(const Box& baseline, const Box& evolved,
        DeltaMeasure& relaxation, DeltaMeasure& strengthening);

/**
 * How far the contract of one component has moved away from its baseline
 * after a given iteration.
 */
struct DeviationRecord {
    std::string component;
    int iteration = -1;

    DeltaMeasure a_rel; // assumption relaxation
    DeltaMeasure a_str; // assumption strengthening
    DeltaMeasure g_rel; // guarantee relaxation
    DeltaMeasure g_str; // guarantee strengthening

    size_t num_assumption_boxes = 0;
    size_t num_guarantee_boxes = 0;

    FloatT total_magnitude() const;
    bool is_zero() const;
};

/** Compare the hull of the current regions with the hull of the baseline. */
DeviationRecord deviation_record(const ComponentState& state, int iteration);

std::ostream& operator<<(std::ostream& s, const DeviationRecord& r);

} // namespace cnevo

#endif // CNEVO_DEVIATION_HPP

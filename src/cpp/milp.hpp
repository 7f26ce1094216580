/**
 * \file milp.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_MILP_HPP
#define CNEVO_MILP_HPP

#include "box.hpp"
#include "model.hpp"

#include <string>
#include <vector>

namespace cnevo {

enum class Direction { MIN, MAX };

std::ostream& operator<<(std::ostream& strm, Direction d);

struct MilpVariable {
    VarName name;
    VarType type;
    Interval bounds;
};

/**
 * Optimize a single variable subject to linear constraints. Immutable once
 * constructed; it is the unit of work handed to a MilpSolver and the
 * problem reported when a solve fails.
 */
class MilpProblem {
    std::string name_;
    std::vector<MilpVariable> vars_;
    std::vector<LinConstraint> constraints_;
    VarName objective_;
    Direction direction_;

public:
    MilpProblem(std::string name,
                std::vector<MilpVariable> vars,
                std::vector<LinConstraint> constraints,
                VarName objective,
                Direction direction);

    inline const std::string& name() const { return name_; }
    inline const std::vector<MilpVariable>& variables() const { return vars_; }
    inline const std::vector<LinConstraint>& constraints() const { return constraints_; }
    inline const VarName& objective() const { return objective_; }
    inline Direction direction() const { return direction_; }

    const MilpVariable& get_variable(const VarName& name) const;
    bool is_integral() const;
};

/**
 * The problem `direction objective` subject to the model constraints and the
 * bounds of `source_box`. Variables of the box that are not in the model are
 * ignored. Box bounds are added as constraints `box_<var>_lo` and
 * `box_<var>_hi`, the physical variable bounds as bounds.
 */
MilpProblem build_problem(const ComponentModel& model,
                          const Box& source_box,
                          const VarName& objective,
                          Direction direction,
                          std::string name);

/** LP-format like listing. */
std::ostream& operator<<(std::ostream& s, const MilpProblem& p);

} // namespace cnevo

#endif // CNEVO_MILP_HPP

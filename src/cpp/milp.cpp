/**
 * \file milp.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "milp.hpp"

#include <algorithm>
#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& strm, Direction d)
{
    switch (d) {
    case Direction::MIN: return strm << "min";
    case Direction::MAX: return strm << "max";
    }
    return strm;
}

MilpProblem::MilpProblem(std::string name,
                         std::vector<MilpVariable> vars,
                         std::vector<LinConstraint> constraints,
                         VarName objective,
                         Direction direction)
    : name_(std::move(name))
    , vars_(std::move(vars))
    , constraints_(std::move(constraints))
    , objective_(std::move(objective))
    , direction_(direction)
{
    get_variable(objective_); // throws if unknown
    for (const LinConstraint& c : constraints_)
        for (const LinTerm& t : c.terms)
            get_variable(t.var);
}

const MilpVariable&
MilpProblem::get_variable(const VarName& name) const
{
    for (const MilpVariable& v : vars_)
        if (v.name == name)
            return v;
    throw std::out_of_range("unknown variable " + name + " in problem " + name_);
}

bool
MilpProblem::is_integral() const
{
    return std::any_of(vars_.begin(), vars_.end(), [](const MilpVariable& v) {
        return v.type != VarType::CONTINUOUS;
    });
}

MilpProblem
build_problem(const ComponentModel& model,
              const Box& source_box,
              const VarName& objective,
              Direction direction,
              std::string name)
{
    if (!model.has_variable(objective))
        throw std::invalid_argument("objective " + objective
                + " is not a variable of " + model.name());

    std::vector<MilpVariable> vars;
    for (const Variable& v : model.variables())
        vars.push_back({v.name, v.type, v.bounds});

    std::vector<LinConstraint> constraints = model.constraints();
    for (auto&& [var, ival] : source_box)
    {
        if (!model.has_variable(var))
            continue;
        if (!ival.lo_is_unbound())
            constraints.push_back({"box_" + var + "_lo", {{1.0, var}}, Relation::GE, ival.lo});
        if (!ival.hi_is_unbound())
            constraints.push_back({"box_" + var + "_hi", {{1.0, var}}, Relation::LE, ival.hi});
    }

    return MilpProblem(std::move(name), std::move(vars), std::move(constraints),
            objective, direction);
}

std::ostream& operator<<(std::ostream& s, const MilpProblem& p)
{
    s << "\\ Problem: " << p.name() << std::endl;
    s << (p.direction() == Direction::MIN ? "Minimize" : "Maximize") << std::endl;
    s << "  obj: " << p.objective() << std::endl;
    s << "Subject To" << std::endl;
    for (const LinConstraint& c : p.constraints())
        s << "  " << c << std::endl;
    s << "Bounds" << std::endl;
    for (const MilpVariable& v : p.variables())
    {
        s << "  ";
        if (v.bounds.is_everything())
            s << v.name << " free";
        else if (v.bounds.lo_is_unbound())
            s << "-inf <= " << v.name << " <= " << v.bounds.hi;
        else if (v.bounds.hi_is_unbound())
            s << v.name << " >= " << v.bounds.lo;
        else
            s << v.bounds.lo << " <= " << v.name << " <= " << v.bounds.hi;
        s << std::endl;
    }
    bool header = false;
    for (const MilpVariable& v : p.variables())
    {
        if (v.type == VarType::CONTINUOUS)
            continue;
        if (!header)
            s << "Generals" << std::endl;
        header = true;
        s << "  " << v.name << std::endl;
    }
    return s << "End";
}

} // namespace cnevo

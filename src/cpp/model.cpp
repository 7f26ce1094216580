/**
 * \file model.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "model.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& strm, VarType t)
{
    switch (t) {
    case VarType::CONTINUOUS: return strm << "continuous";
    case VarType::INTEGER: return strm << "integer";
    case VarType::BINARY: return strm << "binary";
    }
    return strm;
}

VarType var_type_from_str(const std::string& s)
{
    if (s == "continuous") return VarType::CONTINUOUS;
    if (s == "integer") return VarType::INTEGER;
    if (s == "binary") return VarType::BINARY;
    throw std::runtime_error("invalid variable type: " + s);
}

std::ostream& operator<<(std::ostream& strm, VarRole r)
{
    switch (r) {
    case VarRole::INPUT: return strm << "input";
    case VarRole::OUTPUT: return strm << "output";
    case VarRole::INTERNAL: return strm << "internal";
    }
    return strm;
}

VarRole var_role_from_str(const std::string& s)
{
    if (s == "input") return VarRole::INPUT;
    if (s == "output") return VarRole::OUTPUT;
    if (s == "internal") return VarRole::INTERNAL;
    throw std::runtime_error("invalid variable role: " + s);
}

std::ostream& operator<<(std::ostream& s, const Variable& v)
{
    s << v.name << " (" << v.role << ", " << v.type;
    if (!v.unit.empty())
        s << ", " << v.unit;
    return s << ") " << v.bounds;
}

std::ostream& operator<<(std::ostream& strm, Relation r)
{
    switch (r) {
    case Relation::LE: return strm << "<=";
    case Relation::GE: return strm << ">=";
    case Relation::EQ: return strm << "=";
    }
    return strm;
}

std::ostream& operator<<(std::ostream& s, const LinConstraint& c)
{
    s << c.name << ": ";
    for (size_t i = 0; i < c.terms.size(); ++i)
    {
        const LinTerm& t = c.terms[i];
        if (i > 0)
            s << (t.coef < 0.0 ? " - " : " + ");
        else if (t.coef < 0.0)
            s << '-';
        FloatT abs_coef = t.coef < 0.0 ? -t.coef : t.coef;
        if (abs_coef != 1.0)
            s << abs_coef << ' ';
        s << t.var;
    }
    return s << ' ' << c.rel << ' ' << c.rhs;
}

ComponentModel::ComponentModel(std::string name) : name_(std::move(name)) {}

const Variable&
ComponentModel::add_variable(Variable v)
{
    if (v.name.empty())
        throw std::invalid_argument("empty variable name in model " + name_);
    if (has_variable(v.name))
        throw std::invalid_argument("duplicate variable " + v.name
                + " in model " + name_);
    if (v.type == VarType::BINARY)
        v.bounds = Interval(0.0, 1.0);
    vars_.push_back(std::move(v));
    return vars_.back();
}

const Variable&
ComponentModel::add_input(const VarName& name, Interval bounds, VarType type)
{
    return add_variable({name, type, VarRole::INPUT, "", bounds});
}

const Variable&
ComponentModel::add_output(const VarName& name, Interval bounds, VarType type)
{
    return add_variable({name, type, VarRole::OUTPUT, "", bounds});
}

const Variable&
ComponentModel::add_internal(const VarName& name, Interval bounds, VarType type)
{
    return add_variable({name, type, VarRole::INTERNAL, "", bounds});
}

void
ComponentModel::add_constraint(LinConstraint c)
{
    for (const LinTerm& t : c.terms)
        if (!has_variable(t.var))
            throw std::invalid_argument("unknown variable " + t.var
                    + " in constraint of model " + name_);
    if (c.name.empty())
    {
        std::stringstream s;
        s << 'c' << constraints_.size();
        c.name = s.str();
    }
    constraints_.push_back(std::move(c));
}

void
ComponentModel::add_constraint(std::vector<LinTerm> terms, Relation rel, FloatT rhs)
{
    add_constraint(LinConstraint{"", std::move(terms), rel, rhs});
}

bool
ComponentModel::has_variable(const VarName& name) const
{
    return std::any_of(vars_.begin(), vars_.end(),
            [&name](const Variable& v) { return v.name == name; });
}

const Variable&
ComponentModel::get_variable(const VarName& name) const
{
    for (const Variable& v : vars_)
        if (v.name == name)
            return v;
    throw std::out_of_range("unknown variable " + name + " in model " + name_);
}

bool
ComponentModel::is_input(const VarName& name) const
{
    return has_variable(name) && get_variable(name).role == VarRole::INPUT;
}

bool
ComponentModel::is_output(const VarName& name) const
{
    return has_variable(name) && get_variable(name).role == VarRole::OUTPUT;
}

static std::vector<VarName>
vars_with_role(const std::vector<Variable>& vars, VarRole role)
{
    std::vector<VarName> names;
    for (const Variable& v : vars)
        if (v.role == role)
            names.push_back(v.name);
    return names;
}

std::vector<VarName>
ComponentModel::inputs() const { return vars_with_role(vars_, VarRole::INPUT); }

std::vector<VarName>
ComponentModel::outputs() const { return vars_with_role(vars_, VarRole::OUTPUT); }

std::vector<VarName>
ComponentModel::internals() const { return vars_with_role(vars_, VarRole::INTERNAL); }

std::ostream& operator<<(std::ostream& s, const ComponentModel& m)
{
    s << "ComponentModel(" << m.name() << ")" << std::endl;
    for (const Variable& v : m.variables())
        s << "  var " << v << std::endl;
    for (const LinConstraint& c : m.constraints())
        s << "  " << c << std::endl;
    return s;
}

} // namespace cnevo

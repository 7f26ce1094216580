/**
 * \file model.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_MODEL_HPP
#define CNEVO_MODEL_HPP

#include "basics.hpp"
#include "interval.hpp"

#include <string>
#include <vector>

namespace cnevo {

enum class VarType { CONTINUOUS, INTEGER, BINARY };

std::ostream& operator<<(std::ostream& strm, VarType t);
VarType var_type_from_str(const std::string& s);

enum class VarRole { INPUT, OUTPUT, INTERNAL };

std::ostream& operator<<(std::ostream& strm, VarRole r);
VarRole var_role_from_str(const std::string& s);

struct Variable {
    VarName name;
    VarType type = VarType::CONTINUOUS;
    VarRole role = VarRole::INTERNAL;
    std::string unit;

    /** Physical bounds of the variable. Binary variables are always [0, 1]. */
    Interval bounds;
};

std::ostream& operator<<(std::ostream& s, const Variable& v);

enum class Relation { LE, GE, EQ };

std::ostream& operator<<(std::ostream& strm, Relation r);

struct LinTerm {
    FloatT coef;
    VarName var;
};

/** sum(coef * var) <rel> rhs */
struct LinConstraint {
    std::string name;
    std::vector<LinTerm> terms;
    Relation rel;
    FloatT rhs;
};

std::ostream& operator<<(std::ostream& s, const LinConstraint& c);

/**
 * Behavioral model of a component: its variables and the linear
 * constraints between them. Integer and binary variables make it a MILP
 * (e.g. big-M mode selection).
 */
class ComponentModel {
    std::string name_;
    std::vector<Variable> vars_;
    std::vector<LinConstraint> constraints_;

public:
    explicit ComponentModel(std::string name);

    inline const std::string& name() const { return name_; }
    inline const std::vector<Variable>& variables() const { return vars_; }
    inline const std::vector<LinConstraint>& constraints() const { return constraints_; }

    /** Add a variable. Throws on duplicate names. */
    const Variable& add_variable(Variable v);
    const Variable& add_input(const VarName& name, Interval bounds = {},
            VarType type = VarType::CONTINUOUS);
    const Variable& add_output(const VarName& name, Interval bounds = {},
            VarType type = VarType::CONTINUOUS);
    const Variable& add_internal(const VarName& name, Interval bounds = {},
            VarType type = VarType::CONTINUOUS);

    /**
     * Add a constraint. All variables must be known to the model. An empty
     * name is replaced by `c<index>`.
     */
    void add_constraint(LinConstraint c);
    void add_constraint(std::vector<LinTerm> terms, Relation rel, FloatT rhs);

    bool has_variable(const VarName& name) const;
    const Variable& get_variable(const VarName& name) const;

    bool is_input(const VarName& name) const;
    bool is_output(const VarName& name) const;

    std::vector<VarName> inputs() const;
    std::vector<VarName> outputs() const;
    std::vector<VarName> internals() const;
};

std::ostream& operator<<(std::ostream& s, const ComponentModel& m);

} // namespace cnevo

#endif // CNEVO_MODEL_HPP

/**
 * \file contract.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_CONTRACT_HPP
#define CNEVO_CONTRACT_HPP

#include "region.hpp"

#include <string>

namespace cnevo {

/** Assume-guarantee contract over the variables of one component. */
struct Contract {
    Region assumption;
    Region guarantee;

    inline bool operator==(const Contract& o) const {
        return assumption == o.assumption && guarantee == o.guarantee;
    }
    inline bool operator!=(const Contract& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& s, const Contract& c);

/**
 * The contract of a component during one evolution run, together with the
 * baseline it started from.
 */
class ComponentState {
    std::string name_;
    Contract baseline_;
    Contract current_;
    bool infeasible_ = false;
    int num_evolutions_ = 0;

public:
    ComponentState(std::string name, Contract baseline);

    inline const std::string& name() const { return name_; }
    inline const Contract& baseline() const { return baseline_; }
    inline const Contract& current() const { return current_; }
    inline const Region& assumption() const { return current_.assumption; }
    inline const Region& guarantee() const { return current_.guarantee; }
    inline bool is_infeasible() const { return infeasible_; }
    inline int num_evolutions() const { return num_evolutions_; }

    /** Replace the current contract. */
    void evolve(Region new_assumption, Region new_guarantee);

    /** Mark the contract as unsatisfiable: one of its regions became empty. */
    void declare_infeasible();
};

} // namespace cnevo

#endif // CNEVO_CONTRACT_HPP

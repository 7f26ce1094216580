/**
 * \file contract.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "contract.hpp"

#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& s, const Contract& c)
{
    return s << "Contract(A=" << c.assumption << ", G=" << c.guarantee << ')';
}

ComponentState::ComponentState(std::string name, Contract baseline)
    : name_(std::move(name))
    , baseline_(std::move(baseline))
    , current_(baseline_)
{}

void
ComponentState::evolve(Region new_assumption, Region new_guarantee)
{
    if (infeasible_)
        throw std::runtime_error("evolving infeasible component " + name_);
    current_.assumption = std::move(new_assumption);
    current_.guarantee = std::move(new_guarantee);
    ++num_evolutions_;
}

void
ComponentState::declare_infeasible()
{
    infeasible_ = true;
}

} // namespace cnevo

/**
 * \file bindings.h
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef BINDINGS_H
#define BINDINGS_H

#include "basics.hpp"
#include "box.hpp"
#include "region.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/cast.h>
#include <pybind11/stl.h>

#include <sstream>
#include <string>

// Utility
template <typename T>
std::string tostr(const T& o) {
    std::stringstream s;
    s << o;
    return s.str();
}

/**
 * Convert a Python dict {name: Interval | (lo, hi)} to the buffer of a
 * cnevo box.
 */
cnevo::Box::BufT tobox(pybind11::object pybox);

/** Convert a Python list of boxes (dicts or Box objects) to a region. */
cnevo::Region toregion(pybind11::object pyregion);




///////////////////////////////////////////////////////////////////////////////
// Module elements
///////////////////////////////////////////////////////////////////////////////

void init_interval(pybind11::module& m);    /* bindings/interval.cpp */
void init_box(pybind11::module& m);         /* bindings/box.cpp */
void init_evolution(pybind11::module& m);   /* bindings/evolution.cpp */

#endif

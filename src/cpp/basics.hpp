/**
 * \file basics.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_BASICS_HPP
#define CNEVO_BASICS_HPP

#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace cnevo {

using FloatT = double;

/** Variables are identified by name within a component model. */
using VarName = std::string;

template <typename T> struct Limits {
};
template <> struct Limits<FloatT> {
    static constexpr FloatT min = -std::numeric_limits<FloatT>::infinity();
    static constexpr FloatT max = +std::numeric_limits<FloatT>::infinity();
};

constexpr inline bool check_sanity() {
#ifndef CNEVO_SANITY_CHECKS
    return false;
#elif CNEVO_SANITY_CHECKS == 1
    return true;
#else
    return false;
#endif // !CNEVO_SANITY_CHECKS
}

template <typename T>
inline
std::ostream&
operator<<(std::ostream& strm, const std::vector<T>& v)
{
    strm << '[';
    for (size_t i = 0; i < v.size(); ++i)
        strm << (i > 0 ? ", " : "") << v[i];
    return strm << ']';
}

} // namespace cnevo


#endif // CNEVO_BASICS_HPP

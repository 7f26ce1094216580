/**
 * \file interval.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_INTERVAL_HPP
#define CNEVO_INTERVAL_HPP

#include "basics.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cnevo {

/**
 * Closed interval [lo, hi].
 *
 * lo == hi is a valid, degenerate interval. Infinite ends mean the variable
 * is unbounded in that direction.
 */
struct Interval {
    FloatT lo; // inclusive
    FloatT hi; // inclusive

    Interval() : lo{Limits<FloatT>::min}, hi{Limits<FloatT>::max} {}
    Interval(FloatT lo, FloatT hi) : lo{lo}, hi{hi} {
        Interval::check_or_throw(lo, hi);
    }

    static inline void check_or_throw(FloatT lo, FloatT hi) {
        if (std::isnan(lo) || std::isnan(hi) || lo > hi) {
            std::stringstream s;
            s << "Interval error: lo > hi: [" << lo << ", " << hi << "]";
            throw std::invalid_argument(s.str());
        }
    }

    static inline Interval from_lo(FloatT lo) { return {lo, Limits<FloatT>::max}; }
    static inline Interval from_hi(FloatT hi) { return {Limits<FloatT>::min, hi}; }
    static inline Interval constant(FloatT x) { return {x, x}; }

    inline bool lo_is_unbound() const { return lo == Limits<FloatT>::min; }
    inline bool hi_is_unbound() const { return hi == Limits<FloatT>::max; }
    inline bool is_point() const { return lo == hi; }
    inline bool operator==(const Interval& o) const { return o.lo == lo && o.hi == hi; }
    inline bool operator!=(const Interval& o) const { return !(*this == o); }
    inline bool is_everything() const { return lo_is_unbound() && hi_is_unbound(); }
    inline bool contains(FloatT v) const { return lo <= v && v <= hi; }
    inline bool contains(const Interval& o) const { return lo <= o.lo && o.hi <= hi; }

    /** Closed intervals that only touch in one point overlap. */
    inline bool overlaps(const Interval& o) const {
        return lo <= o.hi && hi >= o.lo;
    }

    /** Only valid when `overlaps(o)`. */
    inline Interval intersect(const Interval& o) const {
        return { std::max(lo, o.lo), std::min(hi, o.hi) };
    }

    inline Interval hull(const Interval& o) const {
        return { std::min(lo, o.lo), std::max(hi, o.hi) };
    }

    inline FloatT width() const { return hi - lo; }
};

inline std::ostream &operator<<(std::ostream &s, const Interval &d) {
    if (d.is_everything())
        return s << "Interval()";
    if (d.hi_is_unbound())
        return s << "Interval(>=" << d.lo << ')';
    if (d.lo_is_unbound())
        return s << "Interval(<=" << d.hi << ')';
    return s << "Interval(" << d.lo << ',' << d.hi << ')';
}

} // namespace cnevo
#endif // CNEVO_INTERVAL_HPP

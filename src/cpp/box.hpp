/**
 * \file box.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_BOX_HPP
#define CNEVO_BOX_HPP

#include "basics.hpp"
#include "interval.hpp"
#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace cnevo {

/** An interval annotated with a variable name */
struct IntervalPair {
    VarName var;
    Interval interval;

    IntervalPair(VarName v, Interval i) : var{std::move(v)}, interval{i} {}

    bool operator==(const IntervalPair& o) const {
        return o.var == var && o.interval == interval;
    }
    bool operator!=(const IntervalPair& o) const { return !(*this == o); }
};

/**
 * Axis-aligned box over named variables.
 *
 * The intervals are kept sorted by variable name. A variable that is not
 * present in the box is unconstrained.
 */
class Box {
public:
    using BufT = std::vector<IntervalPair>;
    using const_iterator = BufT::const_iterator;

private:
    BufT buf_;

    inline BufT::iterator find_(const VarName& var) {
        return std::lower_bound(buf_.begin(), buf_.end(), var,
                [](const IntervalPair& p, const VarName& v) { return p.var < v; });
    }

    inline const_iterator find_(const VarName& var) const {
        return std::lower_bound(buf_.begin(), buf_.end(), var,
                [](const IntervalPair& p, const VarName& v) { return p.var < v; });
    }

public:
    Box() {}
    Box(std::initializer_list<IntervalPair> ivals) : Box(BufT(ivals)) {}
    explicit Box(BufT buf);

    inline const_iterator begin() const { return buf_.begin(); }
    inline const_iterator end() const { return buf_.end(); }
    inline size_t size() const { return buf_.size(); }
    inline bool empty() const { return buf_.empty(); }
    inline const BufT& buf() const { return buf_; }

    inline bool has(const VarName& var) const {
        auto it = find_(var);
        return it != buf_.end() && it->var == var;
    }

    /** Interval for `var`, or the unbounded interval if `var` is absent. */
    inline Interval get(const VarName& var) const {
        auto it = find_(var);
        if (it != buf_.end() && it->var == var)
            return it->interval;
        return {};
    }

    inline const Interval& at(const VarName& var) const {
        auto it = find_(var);
        if (it == buf_.end() || it->var != var)
            throw std::out_of_range("variable not in box: " + var);
        return it->interval;
    }

    inline Interval& get_or_insert(const VarName& var) {
        auto it = find_(var);
        if (it == buf_.end() || it->var != var)
            it = buf_.insert(it, IntervalPair(var, Interval()));
        return it->interval;
    }

    inline void set(const VarName& var, const Interval& ival) {
        get_or_insert(var) = ival;
    }

    std::vector<VarName> vars() const;

    /** Do the intervals for the shared variables overlap? */
    bool overlaps(const Box& other) const;

    /**
     * Intersection over the union of both variable sets. Variables present
     * in only one of the boxes keep their interval. Only valid when
     * `overlaps(other)`.
     */
    Box intersect(const Box& other) const;

    /** Does this box (as a set) contain `other`? */
    bool contains(const Box& other) const;

    /** Bounding box, a variable missing from either box is unconstrained. */
    Box hull(const Box& other) const;

    /** Restrict to the given variables, skipping those not in the box. */
    Box project(const std::vector<VarName>& vars) const;

    /**
     * Extend this box with the intervals of `tmpl` for all variables of
     * `tmpl` that are not in this box.
     */
    Box lift(const Box& tmpl) const;

    /**
     * Parts of this box not in `other`, as boxes that are disjoint up to
     * shared boundaries. When the boxes only touch (their intersection has
     * zero width on an axis where this box has positive width), the result
     * is this box unchanged.
     */
    std::vector<Box> subtract(const Box& other) const;

    /** Product of the widths along `axes`. */
    FloatT volume(const std::vector<VarName>& axes) const;
    FloatT volume() const { return volume(vars()); }

    inline bool operator==(const Box& o) const { return buf_ == o.buf_; }
    inline bool operator!=(const Box& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& s, const Box& box);

} // namespace cnevo

#endif // CNEVO_BOX_HPP

/**
 * \file region.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_REGION_HPP
#define CNEVO_REGION_HPP

#include "basics.hpp"
#include "box.hpp"

#include <vector>

namespace cnevo {

/**
 * A union of boxes.
 *
 * No two boxes in a region are bound-for-bound identical over the same
 * variable set. A region without boxes is the empty set: it means the
 * contract is infeasible, not that it is unconstrained.
 *
 * Regions are values; all set operations return a new region.
 */
class Region {
public:
    using BoxesT = std::vector<Box>;
    using const_iterator = BoxesT::const_iterator;

private:
    BoxesT boxes_;

public:
    Region() {}
    Region(std::initializer_list<Box> boxes);
    explicit Region(const BoxesT& boxes);

    static Region single(Box box);

    inline const_iterator begin() const { return boxes_.begin(); }
    inline const_iterator end() const { return boxes_.end(); }
    inline size_t size() const { return boxes_.size(); }
    inline bool empty() const { return boxes_.empty(); }
    inline const Box& operator[](size_t i) const { return boxes_.at(i); }
    inline const BoxesT& boxes() const { return boxes_; }

    /** Is a bound-for-bound identical box in this region? */
    bool has_box(const Box& box) const;

    /** Variables used by at least one box, sorted. */
    std::vector<VarName> vars() const;

    /**
     * Add `box` unless an identical one is present. Returns true when the
     * box was added.
     */
    bool insert(Box box);

    /** Set-union, dropping exact duplicates. */
    Region unite(const Region& other) const;

    /**
     * Narrowing: all pairwise intersections of overlapping boxes.
     * Variables constrained by only one of both boxes keep their interval.
     */
    Region intersect(const Region& other) const;

    /** Does some box of this region overlap with some box of `other`? */
    bool overlaps(const Region& other) const;

    /** Does the union of the boxes cover `box`, up to zero-measure gaps? */
    bool contains(const Box& box) const;

    /** Does this region cover every box of `other`? */
    bool covers(const Region& other) const;

    /**
     * Split the region into boxes that overlap only on their boundaries.
     * The result covers exactly the same set.
     */
    std::vector<Box> disjoint_boxes() const;

    /** The parts of this region not covered by `other`. */
    Region subtract(const Region& other) const;

    /**
     * Measure of the union of the boxes, over the variables that have a
     * positive width in at least one box. Zero for the empty region.
     */
    FloatT volume() const;

    /** Bounding box of all boxes. Throws on the empty region. */
    Box hull() const;

    Region project(const std::vector<VarName>& vars) const;

    /** Box-set equality, independent of the box order. */
    bool operator==(const Region& other) const;
    inline bool operator!=(const Region& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& s, const Region& r);

} // namespace cnevo

#endif // CNEVO_REGION_HPP

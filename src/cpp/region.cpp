/**
 * \file region.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "region.hpp"

#include <algorithm>
#include <stdexcept>

namespace cnevo {

Region::Region(std::initializer_list<Box> boxes) {
    for (const Box& b : boxes)
        insert(b);
}

Region::Region(const BoxesT& boxes) {
    for (const Box& b : boxes)
        insert(b);
}

Region
Region::single(Box box) {
    Region r;
    r.boxes_.push_back(std::move(box));
    return r;
}

bool
Region::has_box(const Box& box) const {
    // Box equality compares variable sets and bounds
    return std::find(boxes_.begin(), boxes_.end(), box) != boxes_.end();
}

std::vector<VarName>
Region::vars() const {
    std::vector<VarName> vs;
    for (const Box& b : boxes_)
        for (auto&& [var, ival] : b)
            vs.push_back(var);
    std::sort(vs.begin(), vs.end());
    vs.erase(std::unique(vs.begin(), vs.end()), vs.end());
    return vs;
}

bool
Region::insert(Box box) {
    if (has_box(box))
        return false;
    boxes_.push_back(std::move(box));
    return true;
}

Region
Region::unite(const Region& other) const {
    Region r = *this;
    for (const Box& b : other.boxes_)
        r.insert(b);
    return r;
}

Region
Region::intersect(const Region& other) const {
    Region r;
    for (const Box& b0 : boxes_)
        for (const Box& b1 : other.boxes_)
            if (b0.overlaps(b1))
                r.insert(b0.intersect(b1));
    return r;
}

bool
Region::overlaps(const Region& other) const {
    for (const Box& b0 : boxes_)
        for (const Box& b1 : other.boxes_)
            if (b0.overlaps(b1))
                return true;
    return false;
}

bool
Region::contains(const Box& box) const {
    std::vector<Box> remaining { box };
    for (const Box& b : boxes_)
    {
        std::vector<Box> next;
        for (const Box& piece : remaining)
            for (Box& p : piece.subtract(b))
                next.push_back(std::move(p));
        remaining = std::move(next);
        if (remaining.empty())
            return true;
    }
    return remaining.empty();
}

bool
Region::covers(const Region& other) const {
    for (const Box& b : other.boxes_)
        if (!contains(b))
            return false;
    return true;
}

std::vector<Box>
Region::disjoint_boxes() const {
    std::vector<Box> accepted;
    for (const Box& b : boxes_)
    {
        std::vector<Box> pieces { b };
        for (const Box& a : accepted)
        {
            std::vector<Box> next;
            for (const Box& piece : pieces)
                for (Box& p : piece.subtract(a))
                    next.push_back(std::move(p));
            pieces = std::move(next);
            if (pieces.empty())
                break;
        }
        for (Box& p : pieces)
            accepted.push_back(std::move(p));
    }
    return accepted;
}

Region
Region::subtract(const Region& other) const {
    Region r;
    for (const Box& b : boxes_)
    {
        std::vector<Box> pieces { b };
        for (const Box& o : other.boxes_)
        {
            std::vector<Box> next;
            for (const Box& piece : pieces)
                for (Box& p : piece.subtract(o))
                    next.push_back(std::move(p));
            pieces = std::move(next);
        }
        for (Box& p : pieces)
            r.insert(std::move(p));
    }
    return r;
}

FloatT
Region::volume() const {
    std::vector<VarName> axes;
    for (const VarName& var : vars())
    {
        bool degenerate = std::all_of(boxes_.begin(), boxes_.end(),
                [&var](const Box& b) { return b.get(var).is_point(); });
        if (!degenerate)
            axes.push_back(var);
    }

    FloatT v = 0.0;
    for (const Box& b : disjoint_boxes())
        v += b.volume(axes);
    return v;
}

Box
Region::hull() const {
    if (boxes_.empty())
        throw std::runtime_error("hull of empty region");
    Box h = boxes_.front();
    for (size_t i = 1; i < boxes_.size(); ++i)
        h = h.hull(boxes_[i]);
    return h;
}

Region
Region::project(const std::vector<VarName>& vars) const {
    Region r;
    for (const Box& b : boxes_)
        r.insert(b.project(vars));
    return r;
}

bool
Region::operator==(const Region& other) const {
    if (size() != other.size())
        return false;
    for (const Box& b : boxes_)
        if (!other.has_box(b))
            return false;
    return true;
}

std::ostream&
operator<<(std::ostream& s, const Region& r)
{
    s << "Region(" << r.size() << ") { ";
    for (const Box& b : r)
        s << b << ' ';
    return s << '}';
}

} // namespace cnevo

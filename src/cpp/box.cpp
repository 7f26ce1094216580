/**
 * \file box.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "box.hpp"

namespace cnevo {

Box::Box(BufT buf) : buf_(std::move(buf)) {
    std::sort(buf_.begin(), buf_.end(),
            [](const IntervalPair& a, const IntervalPair& b) { return a.var < b.var; });
    for (size_t i = 1; i < buf_.size(); ++i)
        if (buf_[i-1].var == buf_[i].var)
            throw std::invalid_argument("duplicate variable in box: " + buf_[i].var);
}

std::vector<VarName>
Box::vars() const {
    std::vector<VarName> vs;
    vs.reserve(buf_.size());
    for (auto&& [var, ival] : buf_)
        vs.push_back(var);
    return vs;
}

bool
Box::overlaps(const Box& other) const {
    auto it0 = begin();
    auto it1 = other.begin();

    // both sorted
    while (it0 != end() && it1 != other.end())
    {
        if (it0->var == it1->var)
        {
            if (!it0->interval.overlaps(it1->interval))
                return false;
            ++it0; ++it1;
        }
        else if (it0->var < it1->var) ++it0;
        else ++it1;
    }

    return true;
}

Box
Box::intersect(const Box& other) const {
    if constexpr (check_sanity())
        if (!overlaps(other))
            throw std::invalid_argument("cannot intersect non-overlapping boxes");

    BufT buf;
    auto it0 = begin();
    auto it1 = other.begin();

    while (it0 != end() && it1 != other.end())
    {
        if (it0->var == it1->var)
        {
            buf.emplace_back(it0->var, it0->interval.intersect(it1->interval));
            ++it0; ++it1;
        }
        else if (it0->var < it1->var)
            buf.push_back(*it0++);
        else
            buf.push_back(*it1++);
    }

    // one of both is at the end, copy the rest of the other
    for (; it0 != end(); ++it0)
        buf.push_back(*it0);
    for (; it1 != other.end(); ++it1)
        buf.push_back(*it1);

    Box result;
    result.buf_ = std::move(buf);
    return result;
}

bool
Box::contains(const Box& other) const {
    for (auto&& [var, ival] : buf_)
        if (!ival.contains(other.get(var)))
            return false;
    return true;
}

Box
Box::hull(const Box& other) const {
    Box result;
    for (auto&& [var, ival] : buf_)
        if (other.has(var))
            result.buf_.emplace_back(var, ival.hull(other.at(var)));
    return result;
}

Box
Box::project(const std::vector<VarName>& vars) const {
    BufT buf;
    for (const VarName& var : vars)
    {
        auto it = find_(var);
        if (it != buf_.end() && it->var == var)
            buf.push_back(*it);
    }
    return Box(std::move(buf));
}

Box
Box::lift(const Box& tmpl) const {
    Box result = *this;
    for (auto&& [var, ival] : tmpl)
        if (!has(var))
            result.set(var, ival);
    return result;
}

std::vector<Box>
Box::subtract(const Box& other) const {
    if (!overlaps(other))
        return { *this };

    // touching boxes: nothing of positive width is removed
    for (auto&& [var, oival] : other)
    {
        Interval ival = get(var);
        if (!ival.is_point() && ival.intersect(oival).is_point())
            return { *this };
    }

    std::vector<Box> pieces;
    Box cur = *this;
    for (auto&& [var, oival] : other)
    {
        Interval ival = cur.get(var);
        if (ival.lo < oival.lo)
        {
            Box piece = cur;
            piece.set(var, {ival.lo, oival.lo});
            pieces.push_back(std::move(piece));
        }
        if (ival.hi > oival.hi)
        {
            Box piece = cur;
            piece.set(var, {oival.hi, ival.hi});
            pieces.push_back(std::move(piece));
        }
        cur.set(var, ival.intersect(oival));
    }
    // what remains in `cur` lies inside `other`
    return pieces;
}

FloatT
Box::volume(const std::vector<VarName>& axes) const {
    FloatT v = 1.0;
    for (const VarName& var : axes)
    {
        FloatT w = get(var).width();
        if (w == 0.0)
            return 0.0;
        v *= w;
    }
    return v;
}

std::ostream&
operator<<(std::ostream& s, const Box& box)
{
    s << "Box { ";
    for (auto&& [var, ival] : box)
        s << var << ":" << ival << " ";
    s << '}';
    return s;
}

} // namespace cnevo

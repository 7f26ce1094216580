#include "bindings.h"
#include "interval.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace cnevo;

void init_interval(py::module& m) {
    py::class_<Interval>(m, "Interval", R"pbdoc(
        Closed interval [lo, hi], infinite bounds are unbounded.

        )pbdoc")
        .def(py::init<>())
        .def(py::init<FloatT, FloatT>())
        .def_static("from_lo", &Interval::from_lo)
        .def_static("from_hi", &Interval::from_hi)
        .def_static("constant", &Interval::constant)
        .def_readonly("lo", &Interval::lo)
        .def_readonly("hi", &Interval::hi)
        .def("lo_is_unbound", &Interval::lo_is_unbound)
        .def("hi_is_unbound", &Interval::hi_is_unbound)
        .def("is_point", &Interval::is_point)
        .def("contains", py::overload_cast<FloatT>(&Interval::contains, py::const_))
        .def("contains", py::overload_cast<const Interval&>(&Interval::contains, py::const_))
        .def("overlaps", &Interval::overlaps)
        .def("intersect", &Interval::intersect)
        .def("hull", &Interval::hull)
        .def("width", &Interval::width)
        .def("is_everything", &Interval::is_everything)
        .def("__eq__", [](const Interval& s, const Interval& t) { return s == t; })
        .def("__repr__", [](const Interval& d) { return tostr(d); })
        .def("__iter__", [](const Interval& d) { return py::iter(py::make_tuple(d.lo, d.hi)); })
        .def(py::pickle(
            [](const Interval& d) { return py::make_tuple(d.lo, d.hi); }, // __getstate__
            [](py::tuple t) { // __setstate__
                if (t.size() != 2) throw std::runtime_error("invalid pickle state");
                return Interval(t[0].cast<FloatT>(), t[1].cast<FloatT>());
            }))
        ; // Interval
}

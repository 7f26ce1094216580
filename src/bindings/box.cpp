#include "bindings.h"
#include "box.hpp"
#include "contract.hpp"
#include "json_io.hpp"
#include "region.hpp"

#include <pybind11/pybind11.h>

namespace py = pybind11;
using namespace cnevo;

Box::BufT tobox(py::object pybox) {
    if (py::isinstance<Box>(pybox))
        return pybox.cast<Box>().buf();

    Box::BufT buf;
    for (auto&& [key, value] : pybox.cast<py::dict>()) {
        VarName var = key.cast<VarName>();
        if (py::isinstance<Interval>(value)) {
            buf.emplace_back(var, value.cast<Interval>());
        } else {
            py::tuple t = value.cast<py::tuple>();
            if (t.size() != 2)
                throw std::runtime_error("interval for " + var + " needs (lo, hi)");
            buf.emplace_back(var, Interval(t[0].cast<FloatT>(), t[1].cast<FloatT>()));
        }
    }
    return buf;
}

Region toregion(py::object pyregion) {
    if (py::isinstance<Region>(pyregion))
        return pyregion.cast<Region>();

    Region r;
    for (py::handle b : pyregion)
        r.insert(Box(tobox(py::reinterpret_borrow<py::object>(b))));
    return r;
}

void init_box(py::module &m) {
    py::class_<IntervalPair>(m, "IntervalPair")
        .def_readonly("var", &IntervalPair::var)
        .def_readonly("interval", &IntervalPair::interval)
        .def("__repr__", [](const IntervalPair& p) { return p.var + ":" + tostr(p.interval); })
        ; // IntervalPair

    py::class_<Box>(m, "Box", R"pbdoc(
        Named-variable box. Variables that are not in the box are unconstrained.

        )pbdoc")
        .def(py::init<>())
        .def(py::init([](py::object o) { return Box(tobox(o)); }))
        .def("__len__", &Box::size)
        .def("__iter__", [](const Box& b) { return py::make_iterator(b.begin(), b.end()); },
                py::keep_alive<0, 1>())
        .def("__getitem__", [](const Box& b, const VarName& var) { return b.at(var); })
        .def("__contains__", &Box::has)
        .def("get", &Box::get)
        .def("vars", &Box::vars)
        .def("overlaps", &Box::overlaps)
        .def("intersect", &Box::intersect)
        .def("contains", &Box::contains)
        .def("hull", &Box::hull)
        .def("project", &Box::project)
        .def("lift", &Box::lift)
        .def("subtract", &Box::subtract)
        .def("volume", [](const Box& b) { return b.volume(); })
        .def("__eq__", [](const Box& a, const Box& b) { return a == b; })
        .def("__repr__", [](const Box& b) { return tostr(b); })
        ; // Box

    py::class_<Region>(m, "Region", R"pbdoc(
        Union of boxes, exact duplicates are dropped.

        )pbdoc")
        .def(py::init<>())
        .def(py::init([](py::object o) { return toregion(o); }))
        .def("__len__", &Region::size)
        .def("__getitem__", [](const Region& r, size_t i) { return r[i]; })
        .def("__iter__", [](const Region& r) { return py::make_iterator(r.begin(), r.end()); },
                py::keep_alive<0, 1>())
        .def("insert", [](Region& r, py::object b) { return r.insert(Box(tobox(b))); })
        .def("has_box", &Region::has_box)
        .def("vars", &Region::vars)
        .def("unite", &Region::unite)
        .def("intersect", &Region::intersect)
        .def("overlaps", &Region::overlaps)
        .def("contains", &Region::contains)
        .def("covers", &Region::covers)
        .def("subtract", &Region::subtract)
        .def("volume", &Region::volume)
        .def("hull", &Region::hull)
        .def("project", &Region::project)
        .def("to_json", [](const Region& r) {
            std::stringstream s;
            region_to_json(s, r);
            return s.str();
        })
        .def_static("from_json", [](const std::string& json) {
            std::stringstream s(json);
            return region_from_json(s);
        })
        .def("__eq__", [](const Region& a, const Region& b) { return a == b; })
        .def("__repr__", [](const Region& r) { return tostr(r); })
        ; // Region

    py::class_<Contract>(m, "Contract")
        .def(py::init([](py::object a, py::object g) {
            return Contract{toregion(a), toregion(g)};
        }))
        .def_readonly("assumption", &Contract::assumption)
        .def_readonly("guarantee", &Contract::guarantee)
        .def("__eq__", [](const Contract& a, const Contract& b) { return a == b; })
        .def("__repr__", [](const Contract& c) { return tostr(c); })
        ; // Contract
}

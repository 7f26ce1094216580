/**
 * \file network.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "network.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& s, const Edge& e)
{
    return s << e.producer << " -> " << e.consumer << " " << e.vars;
}

static void
check_region_vars(const ComponentModel& m, const Region& r, const char *what)
{
    if (r.empty())
        throw std::invalid_argument(std::string("empty baseline ") + what
                + " for component " + m.name());
    for (const VarName& var : r.vars())
        if (!m.has_variable(var))
            throw std::invalid_argument(std::string("baseline ") + what
                    + " of " + m.name() + " uses unknown variable " + var);
}

void
ContractNetwork::add_component(Component c)
{
    if (has_component(c.name()))
        throw std::invalid_argument("duplicate component " + c.name());
    check_region_vars(c.model, c.baseline.assumption, "assumption");
    check_region_vars(c.model, c.baseline.guarantee, "guarantee");
    components_.push_back(std::move(c));
}

void
ContractNetwork::add_edge(Edge e)
{
    const Component& p = get_component(e.producer);
    const Component& c = get_component(e.consumer);
    if (e.vars.empty())
        throw std::invalid_argument("empty interface " + e.producer + " -> " + e.consumer);
    for (const VarName& var : e.vars)
    {
        if (!p.model.is_output(var))
            throw std::invalid_argument(var + " is not an output of " + e.producer);
        if (!c.model.is_input(var))
            throw std::invalid_argument(var + " is not an input of " + e.consumer);
    }
    for (const Edge& other : edges_)
        if (other.producer == e.producer && other.consumer == e.consumer)
            throw std::invalid_argument("duplicate edge " + e.producer + " -> " + e.consumer);
    std::sort(e.vars.begin(), e.vars.end());
    edges_.push_back(std::move(e));
}

bool
ContractNetwork::has_component(const std::string& name) const
{
    return std::any_of(components_.begin(), components_.end(),
            [&name](const Component& c) { return c.name() == name; });
}

size_t
ContractNetwork::component_index(const std::string& name) const
{
    for (size_t i = 0; i < components_.size(); ++i)
        if (components_[i].name() == name)
            return i;
    throw std::runtime_error("unknown component " + name);
}

const Component&
ContractNetwork::get_component(const std::string& name) const
{
    return components_[component_index(name)];
}

Component&
ContractNetwork::get_component(const std::string& name)
{
    return components_[component_index(name)];
}

std::vector<std::string>
ContractNetwork::suppliers(const std::string& name) const
{
    std::vector<std::string> res;
    for (const Edge& e : edges_)
        if (e.consumer == name)
            res.push_back(e.producer);
    return res;
}

std::vector<std::string>
ContractNetwork::consumers(const std::string& name) const
{
    std::vector<std::string> res;
    for (const Edge& e : edges_)
        if (e.producer == name)
            res.push_back(e.consumer);
    return res;
}

std::vector<const Edge *>
ContractNetwork::incoming(const std::string& name) const
{
    std::vector<const Edge *> res;
    for (const Edge& e : edges_)
        if (e.consumer == name)
            res.push_back(&e);
    return res;
}

std::vector<const Edge *>
ContractNetwork::outgoing(const std::string& name) const
{
    std::vector<const Edge *> res;
    for (const Edge& e : edges_)
        if (e.producer == name)
            res.push_back(&e);
    return res;
}

std::vector<std::vector<std::string>>
ContractNetwork::strongly_connected_components() const
{
    size_t n = components_.size();
    std::vector<int> index(n, -1), lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> stack;
    std::vector<std::vector<std::string>> sccs;
    int counter = 0;

    std::function<void(size_t)> strongconnect = [&](size_t v) {
        index[v] = lowlink[v] = counter++;
        stack.push_back(v);
        on_stack[v] = true;

        for (const Edge& e : edges_)
        {
            if (e.producer != components_[v].name())
                continue;
            size_t w = component_index(e.consumer);
            if (index[w] == -1)
            {
                strongconnect(w);
                lowlink[v] = std::min(lowlink[v], lowlink[w]);
            }
            else if (on_stack[w])
            {
                lowlink[v] = std::min(lowlink[v], index[w]);
            }
        }

        if (lowlink[v] == index[v])
        {
            std::vector<std::string> scc;
            size_t w;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack[w] = false;
                scc.push_back(components_[w].name());
            } while (w != v);
            sccs.push_back(std::move(scc));
        }
    };

    for (size_t v = 0; v < n; ++v)
        if (index[v] == -1)
            strongconnect(v);

    return sccs;
}

std::vector<std::vector<std::string>>
ContractNetwork::cycles() const
{
    std::vector<std::vector<std::string>> res;
    for (auto& scc : strongly_connected_components())
    {
        bool self_loop = scc.size() == 1 && std::any_of(edges_.begin(), edges_.end(),
                [&scc](const Edge& e) {
                    return e.producer == scc[0] && e.consumer == scc[0];
                });
        if (scc.size() > 1 || self_loop)
            res.push_back(std::move(scc));
    }
    return res;
}

bool
ContractNetwork::has_cycle() const
{
    return !cycles().empty();
}

std::vector<size_t>
ContractNetwork::edge_order() const
{
    auto sccs = strongly_connected_components();
    std::vector<size_t> scc_of(components_.size());
    for (size_t i = 0; i < sccs.size(); ++i)
        for (const std::string& name : sccs[i])
            scc_of[component_index(name)] = i;

    // Tarjan emits sinks first: walking backwards, all suppliers of an SCC
    // have their level fixed before it is visited
    std::vector<size_t> level(sccs.size(), 0);
    for (size_t i = sccs.size(); i-- > 0; )
    {
        for (const Edge& e : edges_)
        {
            size_t p = scc_of[component_index(e.producer)];
            size_t c = scc_of[component_index(e.consumer)];
            if (p == i && c != i)
                level[c] = std::max(level[c], level[i] + 1);
        }
    }

    std::vector<size_t> order(edges_.size());
    for (size_t i = 0; i < order.size(); ++i)
        order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return level[scc_of[component_index(edges_[a].producer)]]
             < level[scc_of[component_index(edges_[b].producer)]];
    });
    return order;
}

std::ostream& operator<<(std::ostream& s, const ContractNetwork& n)
{
    s << "ContractNetwork(" << n.components().size() << " components, "
        << n.edges().size() << " edges)" << std::endl;
    for (const Component& c : n.components())
        s << "  " << c.name() << ": " << c.baseline << std::endl;
    for (const Edge& e : n.edges())
        s << "  " << e << std::endl;
    return s;
}

} // namespace cnevo

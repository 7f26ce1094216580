/**
 * \file network.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_NETWORK_HPP
#define CNEVO_NETWORK_HPP

#include "contract.hpp"
#include "model.hpp"

#include <string>
#include <vector>

namespace cnevo {

/** A component: its behavioral model and its baseline contract. */
struct Component {
    ComponentModel model;
    Contract baseline;

    inline const std::string& name() const { return model.name(); }
};

/**
 * Directed interface between two components. The producer writes the
 * variables as outputs, the consumer reads them as inputs.
 */
struct Edge {
    std::string producer;
    std::string consumer;
    std::vector<VarName> vars;
};

std::ostream& operator<<(std::ostream& s, const Edge& e);

class ContractNetwork {
    std::vector<Component> components_;
    std::vector<Edge> edges_;

public:
    /** Throws on duplicate names or baseline regions over unknown variables. */
    void add_component(Component c);

    /**
     * Throws when the components are unknown, when the interface is empty,
     * when a variable is not an output of the producer or an input of the
     * consumer, or when an edge between the same two components exists.
     */
    void add_edge(Edge e);

    inline const std::vector<Component>& components() const { return components_; }
    inline const std::vector<Edge>& edges() const { return edges_; }
    inline size_t num_components() const { return components_.size(); }

    bool has_component(const std::string& name) const;
    const Component& get_component(const std::string& name) const;
    Component& get_component(const std::string& name);
    size_t component_index(const std::string& name) const;

    std::vector<std::string> suppliers(const std::string& name) const;
    std::vector<std::string> consumers(const std::string& name) const;
    std::vector<const Edge *> incoming(const std::string& name) const;
    std::vector<const Edge *> outgoing(const std::string& name) const;

    /**
     * Tarjan's algorithm. Components are returned in reverse topological
     * order: an SCC comes before the SCCs that feed into it.
     */
    std::vector<std::vector<std::string>> strongly_connected_components() const;

    /** SCCs with more than one component, or with a self-loop. */
    std::vector<std::vector<std::string>> cycles() const;
    bool has_cycle() const;

    /**
     * Indices of the edges in the order the evolution engine visits them:
     * topological level of the producer's SCC (sources first), ties broken
     * by the order in which the edges were added.
     */
    std::vector<size_t> edge_order() const;
};

std::ostream& operator<<(std::ostream& s, const ContractNetwork& n);

} // namespace cnevo

#endif // CNEVO_NETWORK_HPP

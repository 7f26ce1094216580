/**
 * \file validation.cpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#include "validation.hpp"

#include <sstream>
#include <stdexcept>

namespace cnevo {

std::ostream& operator<<(std::ostream& s, const ValidationResult& r)
{
    s << (r.passed ? "PASSED" : "FAILED") << ": " << r.message;
    for (const std::string& d : r.details)
        s << std::endl << "  - " << d;
    return s;
}

ValidationResult
check_well_formedness(const ContractNetwork& network,
        const std::vector<Contract>& contracts)
{
    if (contracts.size() != network.num_components())
        throw std::invalid_argument("one contract per component expected");

    ValidationResult res;
    for (const Edge& e : network.edges())
    {
        const Contract& p = contracts[network.component_index(e.producer)];
        const Contract& c = contracts[network.component_index(e.consumer)];
        Region g = p.guarantee.project(e.vars);
        Region a = c.assumption.project(e.vars);
        if (!a.covers(g))
        {
            std::stringstream s;
            s << "G(" << e.producer << ") not contained in A(" << e.consumer
                << ") on " << e.vars;
            res.details.push_back(s.str());
        }
    }

    res.passed = res.details.empty();
    res.message = res.passed
        ? "all interfaces are well-formed"
        : "well-formedness violated";
    return res;
}

ValidationResult
check_well_formedness(const ContractNetwork& network)
{
    std::vector<Contract> contracts;
    for (const Component& c : network.components())
        contracts.push_back(c.baseline);
    return check_well_formedness(network, contracts);
}

SystemCheck
check_system_contract(const ContractNetwork& network,
        const std::vector<Contract>& contracts,
        const Region& system_guarantee)
{
    if (contracts.size() != network.num_components())
        throw std::invalid_argument("one contract per component expected");

    std::vector<VarName> vars = system_guarantee.vars();
    Region achieved;
    for (const Contract& c : contracts)
        for (const Box& b : c.guarantee)
        {
            Box p = b.project(vars);
            if (!p.empty())
                achieved.insert(std::move(p));
        }

    SystemCheck check {
        {},
        system_guarantee.subtract(achieved),
        achieved.subtract(system_guarantee),
    };

    if (!check.gap.empty())
    {
        std::stringstream s;
        s << "gap: " << check.gap.size() << " box(es) required but not achieved";
        check.result.details.push_back(s.str());
    }
    if (!check.violation.empty())
    {
        std::stringstream s;
        s << "violation: " << check.violation.size()
            << " box(es) achieved but not required";
        check.result.details.push_back(s.str());
    }

    check.result.passed = check.result.details.empty();
    check.result.message = check.result.passed
        ? "system contract satisfied"
        : "system contract not satisfied";
    return check;
}

} // namespace cnevo

/**
 * \file validation.hpp
 *
 * Copyright 2024 DTAI Research Group - KU Leuven.
 * License: Apache License 2.0
 * Author: Laurens Devos
*/

#ifndef CNEVO_VALIDATION_HPP
#define CNEVO_VALIDATION_HPP

#include "network.hpp"

#include <string>
#include <vector>

namespace cnevo {

struct ValidationResult {
    bool passed = true;
    std::string message;
    std::vector<std::string> details;
};

std::ostream& operator<<(std::ostream& s, const ValidationResult& r);

/**
 * For every edge P -> C, the guarantee of P restricted to the interface
 * must be covered by the assumption of C restricted to the interface.
 *
 * `contracts` is indexed like `network.components()`.
 */
ValidationResult check_well_formedness(const ContractNetwork& network,
        const std::vector<Contract>& contracts);

/** Well-formedness of the baseline contracts. */
ValidationResult check_well_formedness(const ContractNetwork& network);

struct SystemCheck {
    ValidationResult result;
    Region gap;       // required but not achieved
    Region violation; // achieved but not required
};

/**
 * Compare the union of the component guarantees, restricted to the
 * variables of `system_guarantee`, with `system_guarantee`.
 */
SystemCheck check_system_contract(const ContractNetwork& network,
        const std::vector<Contract>& contracts,
        const Region& system_guarantee);

} // namespace cnevo

#endif // CNEVO_VALIDATION_HPP

#pragma once

#include "swath_sampler/core/types.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace swath_sampler::sampling {

struct CompletenessReport {
    size_t total_elements = 0;
    size_t valid_elements = 0;

    bool has_missing() const { return valid_elements < total_elements; }
    // Fraction of non-missing elements in [0, 1]; 1 for an empty swath.
    double ratio() const {
        return total_elements == 0
                   ? 1.0
                   : static_cast<double>(valid_elements) / static_cast<double>(total_elements);
    }
};

// Counts NaN (and `fill_value`, when given) over every band. Observability
// only: never throws on contaminated data and never modifies the swath.
CompletenessReport check_completeness(const Swath& swath,
                                      std::optional<float> fill_value = std::nullopt);

// Writes the "[COMPLETENESS]" diagnostic for a contaminated swath; silent otherwise.
void report_completeness(const CompletenessReport& report, const std::string& swath_name,
                         std::ostream& out);

} // namespace swath_sampler::sampling

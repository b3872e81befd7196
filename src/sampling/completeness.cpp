#include "swath_sampler/sampling/completeness.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace swath_sampler::sampling {

CompletenessReport check_completeness(const Swath& swath, std::optional<float> fill_value) {
    CompletenessReport report;
    report.total_elements = swath.element_count();

    size_t missing = 0;
    for (const auto& band : swath.bands) {
        const float* p = band.data();
        const Eigen::Index n = band.size();
        for (Eigen::Index i = 0; i < n; ++i) {
            const float v = p[i];
            if (std::isnan(v) || (fill_value && v == *fill_value)) {
                ++missing;
            }
        }
    }
    report.valid_elements = report.total_elements - missing;
    return report;
}

void report_completeness(const CompletenessReport& report, const std::string& swath_name,
                         std::ostream& out) {
    if (!report.has_missing()) return;
    std::ostringstream oss;
    oss << "[COMPLETENESS] WARNING: " << swath_name << " missing-value check failed\n";
    oss << "[COMPLETENESS] " << swath_name << " is " << std::fixed << std::setprecision(3)
        << report.ratio() * 100.0 << "% complete ("
        << report.total_elements - report.valid_elements << " of " << report.total_elements
        << " elements missing)\n";
    out << oss.str();
    out.flush();
}

} // namespace swath_sampler::sampling

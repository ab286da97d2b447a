#include "steelcheck/deflection.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/units.hpp"
#include "steelcheck/verification_result.hpp"

#include <cmath>
#include <sstream>

namespace steelcheck {

const std::vector<double>& default_deflection_denominators() {
    static const std::vector<double> denominators = {180.0, 240.0, 360.0};
    return denominators;
}

std::string deflection_limit_name(double denominator) {
    std::ostringstream oss;
    oss << "L/" << denominator;
    return oss.str();
}

std::map<std::string, DeflectionCheck> verify_deflection(
    double actual_mm, double span_m,
    const std::vector<double>& denominators,
    const DesignConfig& config) {
    require_finite_demand("deflection", actual_mm);
    require_positive_length("span", span_m);

    std::map<std::string, DeflectionCheck> checks;
    for (double n : denominators) {
        if (!std::isfinite(n) || n <= 0.0) {
            throw CheckException(CheckError::invalid_property("denominator", n,
                "deflection limit denominator must be positive"));
        }
        DeflectionCheck check;
        check.denominator = n;
        check.limit = units::to_mm(span_m) / n;
        check.actual = std::abs(actual_mm);
        check.ratio = check.actual / check.limit;
        check.ok = within_capacity(check.ratio, config.tolerance);
        checks[deflection_limit_name(n)] = check;
    }
    return checks;
}

} // namespace steelcheck

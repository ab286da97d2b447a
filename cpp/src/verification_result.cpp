#include "steelcheck/verification_result.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace steelcheck {

std::string design_method_to_string(DesignMethod method) {
    return method == DesignMethod::LRFD ? "LRFD" : "ASD";
}

DesignMethod parse_design_method(const std::string& method) {
    if (method == "LRFD") return DesignMethod::LRFD;
    if (method == "ASD") return DesignMethod::ASD;
    throw CheckException(CheckError::unsupported("design_method", method,
        "design method must be LRFD or ASD"));
}

double VerificationResult::display_utilization() const {
    if (std::isnan(utilization)) return 999.9;
    return std::clamp(utilization, 0.0, 999.9);
}

std::string VerificationResult::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << check << " [" << design_method_to_string(method) << "] "
        << (ok ? "OK" : "NOT OK") << "\n";
    oss << "  demand = " << demand << ", capacity = " << capacity
        << " (Rn = " << nominal << ")\n";
    oss << "  ratio = " << ratio << ", utilization = "
        << std::setprecision(1) << display_utilization() << " %";
    oss << std::setprecision(3);
    for (const auto& kv : details) {
        oss << "\n  " << kv.first << " = " << kv.second;
    }
    if (warnings.has_warnings()) {
        oss << "\n  " << warnings.summary();
    }
    return oss.str();
}

double demand_ratio(double demand, double capacity) {
    double magnitude = std::abs(demand);
    if (magnitude == 0.0) return 0.0;
    if (!(capacity > 0.0)) return std::numeric_limits<double>::infinity();
    return magnitude / capacity;
}

bool within_capacity(double ratio, double tolerance) {
    return ratio <= 1.0 + tolerance;
}

void apply_strength(VerificationResult& result, double demand, double Rn,
                    const ResistanceFactor& factor, const DesignConfig& config) {
    result.method = config.method;
    result.phi = factor.phi;
    result.omega = factor.omega;
    result.demand = std::abs(demand);
    result.nominal = Rn;
    result.capacity = factor.available(Rn, config.method);
    apply_ratio(result, demand_ratio(demand, result.capacity), config);
}

void apply_ratio(VerificationResult& result, double ratio, const DesignConfig& config) {
    result.ratio = ratio;
    result.utilization = ratio * 100.0;
    result.ok = within_capacity(ratio, config.tolerance);
}

void require_finite_demand(const std::string& field, double value) {
    if (!std::isfinite(value)) {
        throw CheckException(CheckError::invalid_demand(field, value, "must be a finite number"));
    }
}

void require_positive_length(const std::string& field, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw CheckException(CheckError::invalid_geometry(field, value, "must be positive"));
    }
}

void require_non_negative_length(const std::string& field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw CheckException(CheckError::invalid_geometry(field, value, "cannot be negative"));
    }
}

} // namespace steelcheck

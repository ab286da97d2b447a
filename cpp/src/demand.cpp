#include "steelcheck/demand.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>

namespace steelcheck {

namespace {

ActionExtreme abs_extreme(const Eigen::VectorXd& x, const Eigen::VectorXd& values) {
    Eigen::Index idx = 0;
    values.cwiseAbs().maxCoeff(&idx);
    return ActionExtreme(x(idx), values(idx));
}

} // namespace

void ForceStations::validate() const {
    if (x.size() == 0) {
        throw CheckException(CheckError::invalid_demand("stations", 0.0,
            "at least one station is required"));
    }
    if (N.size() != x.size() || V.size() != x.size() || M.size() != x.size()) {
        throw CheckException(CheckError::invalid_demand("stations",
            static_cast<double>(x.size()), "N, V and M must have one value per station"));
    }
    if (!x.allFinite() || !N.allFinite() || !V.allFinite() || !M.allFinite()) {
        throw CheckException(CheckError::invalid_demand("stations", 0.0,
            "station values must be finite"));
    }
}

Demand DemandEnvelope::to_demand() const {
    return Demand(max_compression, std::abs(shear.value), std::abs(moment.value));
}

DemandEnvelope envelope(const ForceStations& stations) {
    stations.validate();

    DemandEnvelope env;
    env.axial = abs_extreme(stations.x, stations.N);
    env.shear = abs_extreme(stations.x, stations.V);
    env.moment = abs_extreme(stations.x, stations.M);
    env.max_compression = std::max(0.0, -stations.N.minCoeff());
    return env;
}

double ElementEndForces::max_axial() const {
    return std::max(std::abs(N_i), std::abs(N_j));
}

double ElementEndForces::max_shear() const {
    return std::max(std::abs(V_i), std::abs(V_j));
}

double ElementEndForces::max_moment() const {
    return std::max(std::abs(M_i), std::abs(M_j));
}

} // namespace steelcheck

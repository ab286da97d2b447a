#pragma once

#include <Eigen/Dense>

#include <optional>

namespace steelcheck {

/**
 * @brief Factored internal forces at a check location
 *
 * Axial force is positive in compression. Shear and moments are used by
 * magnitude.
 */
struct Demand {
    double Pu = 0.0;                ///< Axial force [kN] (positive = compression)
    double Vu = 0.0;                ///< Shear force [kN]
    double Mux = 0.0;               ///< Major-axis moment [kN·m]
    std::optional<double> Muy;      ///< Minor-axis moment [kN·m]
    std::optional<double> Lb;       ///< Unbraced length [m]
    double Cb = 1.0;                ///< Moment gradient factor

    Demand() = default;

    Demand(double pu, double vu, double mux) : Pu(pu), Vu(vu), Mux(mux) {}
};

/**
 * @brief Extremum location and value
 *
 * Used to report force and moment extrema along a member.
 */
struct ActionExtreme {
    double x = 0.0;      ///< Position along member [m]
    double value = 0.0;  ///< Signed value at extremum

    ActionExtreme() = default;
    ActionExtreme(double pos, double val) : x(pos), value(val) {}
};

/**
 * @brief Internal forces sampled by the analysis at stations along a member
 *
 * Sign convention of the solver: axial tension positive.
 */
struct ForceStations {
    Eigen::VectorXd x;  ///< Station positions [m]
    Eigen::VectorXd N;  ///< Axial force [kN] (positive = tension)
    Eigen::VectorXd V;  ///< Shear force [kN]
    Eigen::VectorXd M;  ///< Bending moment [kN·m]

    Eigen::Index size() const { return x.size(); }

    /**
     * @brief Check the vectors are non-empty, equally sized and finite
     *
     * @throws CheckException (INVALID_DEMAND)
     */
    void validate() const;
};

/**
 * @brief Extrema of a ForceStations set
 *
 * Extrema are taken by magnitude; ties keep the first station.
 */
struct DemandEnvelope {
    ActionExtreme axial;                ///< Largest |N|
    ActionExtreme shear;                ///< Largest |V|
    ActionExtreme moment;               ///< Largest |M|
    double max_compression = 0.0;       ///< max(−N, 0) over all stations [kN]

    /**
     * @brief Demand with Pu = max_compression, Vu = |V|max, Mux = |M|max
     */
    Demand to_demand() const;
};

/**
 * @brief Reduce station output to its envelope
 *
 * @throws CheckException (INVALID_DEMAND) if the stations are invalid
 */
DemandEnvelope envelope(const ForceStations& stations);

/**
 * @brief End forces of a 2D frame element in local coordinates
 *
 * Axial tension positive.
 */
struct ElementEndForces {
    double N_i = 0.0;   ///< Axial force at node i [kN]
    double V_i = 0.0;   ///< Shear at node i [kN]
    double M_i = 0.0;   ///< Moment at node i [kN·m]
    double N_j = 0.0;   ///< Axial force at node j [kN]
    double V_j = 0.0;   ///< Shear at node j [kN]
    double M_j = 0.0;   ///< Moment at node j [kN·m]

    ElementEndForces() = default;

    ElementEndForces(double ni, double vi, double mi, double nj, double vj, double mj)
        : N_i(ni), V_i(vi), M_i(mi), N_j(nj), V_j(vj), M_j(mj) {}

    /**
     * @brief Construct from the local force vector [N_i, V_i, M_i, N_j, V_j, M_j]
     */
    static ElementEndForces from_local_vector(const Eigen::Vector<double, 6>& f) {
        return ElementEndForces(f(0), f(1), f(2), f(3), f(4), f(5));
    }

    Eigen::Vector<double, 6> to_vector() const {
        return Eigen::Vector<double, 6>{N_i, V_i, M_i, N_j, V_j, M_j};
    }

    /// max(|N_i|, |N_j|)
    double max_axial() const;

    /// max(|V_i|, |V_j|)
    double max_shear() const;

    /// max(|M_i|, |M_j|)
    double max_moment() const;
};

} // namespace steelcheck

#pragma once

/**
 * @file units.hpp
 * @brief Unit conventions of the design checks
 *
 * Inputs and outputs:
 * - Forces [kN], moments [kN·m]
 * - Member lengths and spans [m]
 * - Deflections, plate and bolt dimensions [mm]
 * - Stresses [MPa]
 *
 * Internally the formulas run in N, mm and MPa (N/mm²) and results are
 * converted back with the factors below.
 */

namespace steelcheck {
namespace units {

constexpr double kMmPerM = 1000.0;          ///< mm in one m
constexpr double kNPerKN = 1000.0;          ///< N in one kN
constexpr double kNmmPerKNm = 1.0e6;        ///< N·mm in one kN·m

/// N·mm -> kN·m
constexpr double to_kNm(double Nmm) { return Nmm / kNmmPerKNm; }

/// N -> kN
constexpr double to_kN(double N) { return N / kNPerKN; }

/// m -> mm
constexpr double to_mm(double m) { return m * kMmPerM; }

/// mm -> m
constexpr double to_m(double mm) { return mm / kMmPerM; }

} // namespace units
} // namespace steelcheck

// atmos_coeffs.hpp
#ifndef ATMOS_COEFFS_HPP
#define ATMOS_COEFFS_HPP

/**
 * @file atmos_coeffs.hpp
 * @brief Structure coefficients at the outer boundary of a stellar model.
 *
 * @details
 * The atmosphere boundary conditions of the oscillation equations depend on four
 * dimensionless quantities evaluated at the surface point:
 * - V: \f$-d\ln P/d\ln r\f$
 * - A_s: the buoyancy coefficient \f$A^*\f$
 * - c_1: \f$(r/R)^3 / (m/M)\f$
 * - Gamma_1: the adiabatic exponent
 *
 * Two formulations are supported:
 * @li UNNO: all four are taken from the model (Unno et al. 1989, §18.1).
 * @li ISOTHERMAL: A_s is replaced by \f$V(1 - 1/\Gamma_1)\f$, the value implied by an
 *     isothermal, massless outer layer.
 *
 * Errors raised by the model (unsupported coordinates, missing data) propagate unchanged.
 */

#include "stellar_model.hpp"

#include <string>

enum class AtmosFormulation {
  UNNO,      ///< Coefficients taken from the model
  ISOTHERMAL ///< Isothermal, massless atmosphere
};

struct AtmosCoeffs {
  double V;
  double As;
  double c_1;
  double Gamma_1;
};

/**
 * @brief Evaluate the atmosphere coefficients in the Unno formulation
 *
 * V is rebuilt from the model's regular V_2 coefficient as \f$V = V_2 x^2\f$.
 *
 * @param[in] model Stellar model supplying the coefficients
 * @param[in] pt Grid point (normally the outermost point)
 * @return V, A_s, c_1 and Gamma_1 at pt
 */
[[nodiscard]] AtmosCoeffs eval_atmos_coeffs_unno(const StellarModel &model, const GridPoint &pt);

/**
 * @brief Evaluate the atmosphere coefficients for an isothermal atmosphere
 *
 * As eval_atmos_coeffs_unno(), except \f$A_s = V (1 - 1/\Gamma_1)\f$.
 */
[[nodiscard]] AtmosCoeffs eval_atmos_coeffs_isothrm(const StellarModel &model,
                                                    const GridPoint &pt);

[[nodiscard]] AtmosCoeffs eval_atmos_coeffs(const StellarModel &model, const GridPoint &pt,
                                            AtmosFormulation formulation);

std::string atmosFormulationToString(AtmosFormulation formulation);

/**
 * @brief Convert string to formulation
 * @throw std::invalid_argument if the string is not "UNNO" or "ISOTHERMAL"
 */
AtmosFormulation stringToAtmosFormulation(const std::string &str);

#endif // ATMOS_COEFFS_HPP

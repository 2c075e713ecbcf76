// atmos_cutoff.hpp
#ifndef ATMOS_CUTOFF_HPP
#define ATMOS_CUTOFF_HPP

/**
 * @file atmos_cutoff.hpp
 * @brief Atmospheric cutoff frequencies.
 *
 * @details
 * The cutoff frequencies bound the band in which waves are evanescent in the atmosphere.
 * They are the roots of a quadratic in \f$\omega^2\f$:
 * \f{eqnarray*}{
 * a &=& -4 (V/\Gamma_1) c_1^2 \\
 * b &=& \left[(A_s - V/\Gamma_1 - 4)^2 + 4 (V/\Gamma_1) A_s + 4\lambda\right] c_1 \\
 * c &=& -4 \lambda A_s
 * \f}
 * with \f$\omega_{lo}^2 = (-b + \sqrt{b^2 - 4ac})/2a\f$ and
 * \f$\omega_{hi}^2 = (-b - \sqrt{b^2 - 4ac})/2a\f$.
 *
 * @note Stable stratification (A_s > 0, V/Gamma_1 > 0) gives a valid ordered pair.
 *       Other inputs can produce a negative \f$\omega^2\f$ or the wrong ordering, which is
 *       reported as an error.
 */

#include "atmos_coeffs.hpp"

struct CutoffFrequencies {
  double omega_lo;
  double omega_hi;
};

/**
 * @brief Low and high cutoff frequencies of the atmosphere
 *
 * @param[in] V, As, c_1, Gamma_1 Atmosphere structure coefficients
 * @param[in] lambda Angular eigenvalue
 * @return (omega_lo, omega_hi) with omega_hi >= omega_lo
 *
 * @throw AtmosError with code CUTOFF_ORDERING if omega_hi >= omega_lo does not hold
 *        (including NaN results)
 */
[[nodiscard]] CutoffFrequencies eval_atmos_cutoff_freqs(double V, double As, double c_1,
                                                        double Gamma_1, double lambda);

[[nodiscard]] CutoffFrequencies eval_atmos_cutoff_freqs(const AtmosCoeffs &coeffs,
                                                        double lambda);

#endif // ATMOS_CUTOFF_HPP

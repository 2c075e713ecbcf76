// atmos_wavenumber.hpp
#ifndef ATMOS_WAVENUMBER_HPP
#define ATMOS_WAVENUMBER_HPP

/**
 * @file atmos_wavenumber.hpp
 * @brief Radial wavenumber of the oscillation solution at the stellar surface.
 *
 * @details
 * In the atmosphere the adiabatic oscillation equations reduce to a constant-coefficient
 * 2x2 system \f$dy/d\ln x = A y\f$ with
 * \f{eqnarray*}{
 * a_{11} &=& V/\Gamma_1 - 3 \\
 * a_{12} &=& \lambda/(c_1 \omega^2) - V/\Gamma_1 \\
 * a_{21} &=& c_1 \omega^2 - A_s \\
 * a_{22} &=& A_s + 1
 * \f}
 * Solutions vary as \f$x^\chi\f$ where \f$\chi\f$ is an eigenvalue of A, i.e. a root of
 * \f$\chi^2 + b\chi + c = 0\f$ with \f$b = -(a_{11} + a_{22})\f$ and
 * \f$c = a_{11}a_{22} - a_{12}a_{21}\f$.
 *
 * Both roots are evaluated in the cancellation-free form: whichever of
 * \f$(-b \pm \psi)/2\f$ would subtract nearly equal numbers is replaced by \f$2c/(-b \mp \psi)\f$.
 *
 * @section real Real frequencies
 * eval_atmos_chi_real() picks the decaying real root. When the discriminant
 * \f$\psi^2 = b^2 - 4c\f$ is negative the wave propagates into the atmosphere; the imaginary
 * part is discarded (\f$\chi = -b/2\f$) and a notice is issued once per diagnostics channel.
 *
 * @section complex Complex frequencies
 * eval_atmos_chi_complex() chooses between \f$\pm\psi\f$ with one of six physical criteria
 * (see AtmosBranch).
 */

#include "atmos_coeffs.hpp"
#include "atmos_diagnostics.hpp"

#include <complex>
#include <string>

/**
 * @brief Physical criteria for choosing the sign of the complex root psi
 */
enum class AtmosBranch {
  OUTWARD_GROWING_ENERGY,  ///< Keep Re(psi) >= 0
  OUTWARD_DECAYING_ENERGY, ///< Keep Re(psi) <= 0
  OUTWARD_FLUX,            ///< Keep Im((psi - a11) conj(omega)) >= 0
  INWARD_FLUX,             ///< Keep Im((psi - a11) conj(omega)) <= 0
  OUTWARD_PHASE_VELOCITY,  ///< Keep Im(psi)/Re(omega) >= 0
  INWARD_PHASE_VELOCITY    ///< Keep Im(psi)/Re(omega) <= 0
};

inline constexpr AtmosBranch kDefaultAtmosBranch = AtmosBranch::OUTWARD_DECAYING_ENERGY;

/**
 * @brief Entries of the characteristic matrix and the coefficients of its quadratic
 *
 * T is double for real frequencies and std::complex<double> otherwise.
 */
template <typename T> struct AtmosQuadratic {
  T a11;
  T a12;
  T a21;
  T a22;
  T b;
  T c;

  [[nodiscard]] T discriminant() const { return b * b - 4.0 * c; }
};

template <typename T>
[[nodiscard]] AtmosQuadratic<T> atmos_quadratic(double V, double As, double c_1, double Gamma_1,
                                                T omega, T lambda) {
  AtmosQuadratic<T> q;

  q.a11 = V / Gamma_1 - 3.0;
  q.a12 = lambda / (c_1 * omega * omega) - V / Gamma_1;
  q.a21 = c_1 * omega * omega - As;
  q.a22 = As + 1.0;

  q.b = -(q.a11 + q.a22);
  q.c = q.a11 * q.a22 - q.a12 * q.a21;

  return q;
}

/**
 * @brief Radial wavenumber for a real frequency
 *
 * @param[in] V, As, c_1, Gamma_1 Atmosphere structure coefficients
 * @param[in] omega Dimensionless frequency
 * @param[in] lambda Angular eigenvalue, \f$\ell(\ell+1)\f$ for non-rotating stars
 * @param[in,out] diag Channel for the propagating-wave notice
 * @return \f$\chi\f$; \f$-b/2\f$ when \f$\psi^2 < 0\f$
 */
[[nodiscard]] double eval_atmos_chi_real(double V, double As, double c_1, double Gamma_1,
                                         double omega, double lambda,
                                         AtmosDiagnostics &diag = AtmosDiagnostics::global());

[[nodiscard]] double eval_atmos_chi_real(const AtmosCoeffs &coeffs, double omega, double lambda,
                                         AtmosDiagnostics &diag = AtmosDiagnostics::global());

/**
 * @brief Apply a branch criterion to the principal square root psi
 *
 * Returns psi when the criterion holds and -psi otherwise.
 *
 * @throw AtmosError with code INVALID_BRANCH if branch is not an AtmosBranch enumerator
 */
[[nodiscard]] std::complex<double> select_atmos_psi(std::complex<double> psi,
                                                    std::complex<double> a11,
                                                    std::complex<double> omega,
                                                    AtmosBranch branch);

/**
 * @brief Radial wavenumber for a complex frequency
 *
 * @details
 * \f$\psi\f$ is the principal square root of \f$b^2 - 4c\f$, adjusted by
 * select_atmos_psi(). The root is then
 * \f$-2c/(b + \psi)\f$ if \f$\mathrm{Re}\,\psi\f$ and \f$\mathrm{Re}\,b\f$ share a sign,
 * \f$(-b + \psi)/2\f$ otherwise.
 *
 * For real omega and lambda the default branch gives the same root as
 * eval_atmos_chi_real() whenever \f$\psi^2 > 0\f$.
 *
 * @throw AtmosError with code INVALID_BRANCH for an unknown branch
 */
[[nodiscard]] std::complex<double> eval_atmos_chi_complex(double V, double As, double c_1,
                                                          double Gamma_1,
                                                          std::complex<double> omega,
                                                          std::complex<double> lambda,
                                                          AtmosBranch branch = kDefaultAtmosBranch);

[[nodiscard]] std::complex<double> eval_atmos_chi_complex(const AtmosCoeffs &coeffs,
                                                          std::complex<double> omega,
                                                          std::complex<double> lambda,
                                                          AtmosBranch branch = kDefaultAtmosBranch);

/**
 * @brief Check that branch is one of the six supported criteria
 * @throw AtmosError with code INVALID_BRANCH otherwise
 */
void validateAtmosBranch(AtmosBranch branch);

std::string atmosBranchToString(AtmosBranch branch);

/**
 * @brief Convert string to branch selector
 * @throw AtmosError with code INVALID_BRANCH if the string is not recognized
 */
AtmosBranch stringToAtmosBranch(const std::string &str);

#endif // ATMOS_WAVENUMBER_HPP

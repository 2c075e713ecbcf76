/**
 * @file main_atmos_boundary.cpp
 * @brief Example usage of the atmosphere boundary evaluators
 *
 * Evaluates the surface coefficients of a homogeneous model in both formulations,
 * tabulates the cutoff frequencies for the first few harmonic degrees, and compares the
 * radial wavenumber obtained with each branch criterion for a slightly damped mode.
 */

#include "atmos_coeffs.hpp"
#include "atmos_cutoff.hpp"
#include "atmos_error.hpp"
#include "atmos_wavenumber.hpp"
#include "homogeneous_model.hpp"

#include <complex>
#include <iomanip>
#include <iostream>

void demonstrateCoefficients(const StellarModel &model, const GridPoint &pt) {
  std::cout << "\n=== Surface Coefficients (x = " << pt.x << ") ===" << std::endl;

  for (AtmosFormulation f : {AtmosFormulation::UNNO, AtmosFormulation::ISOTHERMAL}) {
    const AtmosCoeffs coeffs = eval_atmos_coeffs(model, pt, f);
    std::cout << std::left << std::setw(12) << atmosFormulationToString(f) << std::right
              << std::fixed << std::setprecision(4) << "V = " << coeffs.V
              << ", As = " << coeffs.As << ", c_1 = " << coeffs.c_1
              << ", Gamma_1 = " << coeffs.Gamma_1 << std::endl;
  }
}

void tabulateCutoffs(const AtmosCoeffs &coeffs) {
  std::cout << "\n=== Cutoff Frequencies (isothermal atmosphere) ===" << std::endl;
  std::cout << std::setw(4) << "l" << std::setw(14) << "omega_lo" << std::setw(14) << "omega_hi"
            << std::endl;

  for (int l = 1; l <= 5; ++l) {
    const double lambda = l * (l + 1.0);
    try {
      const CutoffFrequencies freqs = eval_atmos_cutoff_freqs(coeffs, lambda);
      std::cout << std::setw(4) << l << std::setw(14) << freqs.omega_lo << std::setw(14)
                << freqs.omega_hi << std::endl;
    } catch (const AtmosError &e) {
      std::cout << std::setw(4) << l << "  " << e.what() << std::endl;
    }
  }
}

void compareBranches(const AtmosCoeffs &coeffs) {
  std::cout << "\n=== Wavenumber by Branch (l = 2) ===" << std::endl;

  const std::complex<double> omega(5.0, -0.01);
  const std::complex<double> lambda(6.0, 0.0);

  const AtmosBranch branches[] = {
      AtmosBranch::OUTWARD_GROWING_ENERGY, AtmosBranch::OUTWARD_DECAYING_ENERGY,
      AtmosBranch::OUTWARD_FLUX,           AtmosBranch::INWARD_FLUX,
      AtmosBranch::OUTWARD_PHASE_VELOCITY, AtmosBranch::INWARD_PHASE_VELOCITY};

  for (AtmosBranch b : branches) {
    const std::complex<double> chi = eval_atmos_chi_complex(coeffs, omega, lambda, b);
    std::cout << std::left << std::setw(26) << atmosBranchToString(b) << std::right
              << std::scientific << std::setprecision(6) << "chi = (" << chi.real() << ", "
              << chi.imag() << ")" << std::endl;
  }

  std::cout << "\nReal-frequency solver at omega = 5: chi = "
            << eval_atmos_chi_real(coeffs, 5.0, 6.0) << std::endl;
}

int main() {
  HomogeneousModel model(5.0 / 3.0);
  GridPoint pt{1, 0.95};

  demonstrateCoefficients(model, pt);

  const AtmosCoeffs coeffs = eval_atmos_coeffs(model, pt, AtmosFormulation::ISOTHERMAL);
  tabulateCutoffs(coeffs);
  compareBranches(coeffs);

  return 0;
}

#include "atmos_cutoff.hpp"

#include "atmos_error.hpp"

#include <cmath>
#include <sstream>

CutoffFrequencies eval_atmos_cutoff_freqs(double V, double As, double c_1, double Gamma_1,
                                          double lambda) {
  const double V_g = V / Gamma_1;

  const double a = -4.0 * V_g * c_1 * c_1;
  const double b = ((As - V_g - 4.0) * (As - V_g - 4.0) + 4.0 * V_g * As + 4.0 * lambda) * c_1;
  const double c = -4.0 * lambda * As;

  const double sqrt_disc = std::sqrt(b * b - 4.0 * a * c);

  CutoffFrequencies freqs;
  // + 0.0 turns the -0.0 produced when lambda = 0 into +0.0
  freqs.omega_lo = std::sqrt((-b + sqrt_disc) / (2.0 * a)) + 0.0;
  freqs.omega_hi = std::sqrt((-b - sqrt_disc) / (2.0 * a));

  if (!(freqs.omega_hi >= freqs.omega_lo)) {
    std::ostringstream oss;
    oss << "Atmospheric cutoff frequencies out of order: omega_lo = " << freqs.omega_lo
        << ", omega_hi = " << freqs.omega_hi << " (V = " << V << ", As = " << As
        << ", c_1 = " << c_1 << ", Gamma_1 = " << Gamma_1 << ", lambda = " << lambda << ")";
    throw AtmosError(AtmosErrorCode::CUTOFF_ORDERING, oss.str());
  }

  return freqs;
}

CutoffFrequencies eval_atmos_cutoff_freqs(const AtmosCoeffs &coeffs, double lambda) {
  return eval_atmos_cutoff_freqs(coeffs.V, coeffs.As, coeffs.c_1, coeffs.Gamma_1, lambda);
}

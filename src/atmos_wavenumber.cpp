#include "atmos_wavenumber.hpp"

#include "atmos_error.hpp"

#include <cmath>
#include <sstream>

namespace {
// Sign convention of the root selection: zero counts as positive
inline double sign_of(double x) { return (x >= 0.0) ? 1.0 : -1.0; }
} // namespace

double eval_atmos_chi_real(double V, double As, double c_1, double Gamma_1, double omega,
                           double lambda, AtmosDiagnostics &diag) {
  const auto q = atmos_quadratic<double>(V, As, c_1, Gamma_1, omega, lambda);
  const double psi2 = q.discriminant();

  if (psi2 < 0.0) {
    // Propagating wave: chi is complex, keep only its real part
    diag.warn_once_with([omega, psi2]() {
      std::ostringstream oss;
      oss << "Discarding imaginary part of atmospheric radial wavenumber (omega = " << omega
          << ", psi2 = " << psi2 << ")";
      return oss.str();
    });

    return -0.5 * q.b;
  }

  const double psi = std::sqrt(psi2);

  if (q.b >= 0.0) {
    return 0.5 * (-q.b - psi);
  } else {
    return 2.0 * q.c / (-q.b + psi);
  }
}

double eval_atmos_chi_real(const AtmosCoeffs &coeffs, double omega, double lambda,
                           AtmosDiagnostics &diag) {
  return eval_atmos_chi_real(coeffs.V, coeffs.As, coeffs.c_1, coeffs.Gamma_1, omega, lambda,
                             diag);
}

std::complex<double> select_atmos_psi(std::complex<double> psi, std::complex<double> a11,
                                      std::complex<double> omega, AtmosBranch branch) {
  bool keep = true;

  switch (branch) {
  case AtmosBranch::OUTWARD_GROWING_ENERGY:
    keep = psi.real() >= 0.0;
    break;
  case AtmosBranch::OUTWARD_DECAYING_ENERGY:
    keep = psi.real() <= 0.0;
    break;
  case AtmosBranch::OUTWARD_FLUX:
    keep = ((psi - a11) * std::conj(omega)).imag() >= 0.0;
    break;
  case AtmosBranch::INWARD_FLUX:
    keep = ((psi - a11) * std::conj(omega)).imag() <= 0.0;
    break;
  case AtmosBranch::OUTWARD_PHASE_VELOCITY:
    keep = psi.imag() / omega.real() >= 0.0;
    break;
  case AtmosBranch::INWARD_PHASE_VELOCITY:
    keep = psi.imag() / omega.real() <= 0.0;
    break;
  default:
    throw AtmosError(AtmosErrorCode::INVALID_BRANCH,
                     "Invalid atmospheric branch selector: " +
                         std::to_string(static_cast<int>(branch)));
  }

  return keep ? psi : -psi;
}

std::complex<double> eval_atmos_chi_complex(double V, double As, double c_1, double Gamma_1,
                                            std::complex<double> omega,
                                            std::complex<double> lambda, AtmosBranch branch) {
  const auto q = atmos_quadratic<std::complex<double>>(V, As, c_1, Gamma_1, omega, lambda);

  const std::complex<double> psi = select_atmos_psi(std::sqrt(q.discriminant()), q.a11, omega,
                                                    branch);

  if (sign_of(psi.real()) == sign_of(q.b.real())) {
    return -2.0 * q.c / (q.b + psi);
  } else {
    return 0.5 * (-q.b + psi);
  }
}

std::complex<double> eval_atmos_chi_complex(const AtmosCoeffs &coeffs,
                                            std::complex<double> omega,
                                            std::complex<double> lambda, AtmosBranch branch) {
  return eval_atmos_chi_complex(coeffs.V, coeffs.As, coeffs.c_1, coeffs.Gamma_1, omega, lambda,
                                branch);
}

void validateAtmosBranch(AtmosBranch branch) {
  switch (branch) {
  case AtmosBranch::OUTWARD_GROWING_ENERGY:
  case AtmosBranch::OUTWARD_DECAYING_ENERGY:
  case AtmosBranch::OUTWARD_FLUX:
  case AtmosBranch::INWARD_FLUX:
  case AtmosBranch::OUTWARD_PHASE_VELOCITY:
  case AtmosBranch::INWARD_PHASE_VELOCITY:
    return;
  default:
    throw AtmosError(AtmosErrorCode::INVALID_BRANCH,
                     "Invalid atmospheric branch selector: " +
                         std::to_string(static_cast<int>(branch)));
  }
}

std::string atmosBranchToString(AtmosBranch branch) {
  switch (branch) {
  case AtmosBranch::OUTWARD_GROWING_ENERGY:
    return "OUTWARD_GROWING_ENERGY";
  case AtmosBranch::OUTWARD_DECAYING_ENERGY:
    return "OUTWARD_DECAYING_ENERGY";
  case AtmosBranch::OUTWARD_FLUX:
    return "OUTWARD_FLUX";
  case AtmosBranch::INWARD_FLUX:
    return "INWARD_FLUX";
  case AtmosBranch::OUTWARD_PHASE_VELOCITY:
    return "OUTWARD_PHASE_VELOCITY";
  case AtmosBranch::INWARD_PHASE_VELOCITY:
    return "INWARD_PHASE_VELOCITY";
  default:
    throw AtmosError(AtmosErrorCode::INVALID_BRANCH, "Unknown atmospheric branch selector");
  }
}

AtmosBranch stringToAtmosBranch(const std::string &str) {
  if (str == "OUTWARD_GROWING_ENERGY") {
    return AtmosBranch::OUTWARD_GROWING_ENERGY;
  } else if (str == "OUTWARD_DECAYING_ENERGY") {
    return AtmosBranch::OUTWARD_DECAYING_ENERGY;
  } else if (str == "OUTWARD_FLUX") {
    return AtmosBranch::OUTWARD_FLUX;
  } else if (str == "INWARD_FLUX") {
    return AtmosBranch::INWARD_FLUX;
  } else if (str == "OUTWARD_PHASE_VELOCITY") {
    return AtmosBranch::OUTWARD_PHASE_VELOCITY;
  } else if (str == "INWARD_PHASE_VELOCITY") {
    return AtmosBranch::INWARD_PHASE_VELOCITY;
  } else {
    throw AtmosError(AtmosErrorCode::INVALID_BRANCH,
                     "Unknown atmospheric branch selector string: " + str);
  }
}

#include "atmos_calculator.hpp"

#include "atmos_error.hpp"
#include "homogeneous_model.hpp"
#include "tabulated_model.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

std::unique_ptr<StellarModel> StellarModelFactory::createModel(const AtmosParameters &params) {
  if (params.model_file.empty()) {
    return std::make_unique<HomogeneousModel>(params.Gamma_1);
  }

  ModelTable table;
  if (!readModelData(params.model_file, table)) {
    throw std::runtime_error("Could not read model table from " + params.model_file);
  }
  return std::make_unique<TabulatedStellarModel>(table);
}

std::vector<double> createFrequencyGrid(double omega_min, double omega_max, int num_points,
                                        bool use_log_spacing) {
  if (num_points < 1) {
    throw std::invalid_argument("num_points must be at least 1");
  }
  if (num_points > 1 && !(omega_min < omega_max)) {
    throw std::invalid_argument("omega_min must be less than omega_max");
  }
  if (use_log_spacing && !(omega_min > 0.0)) {
    throw std::invalid_argument("omega_min must be positive for logarithmic spacing");
  }

  std::vector<double> omegas;
  omegas.reserve(num_points);

  if (num_points == 1) {
    omegas.push_back(omega_min);
    return omegas;
  }

  if (use_log_spacing) {
    const double log_min = std::log10(omega_min);
    const double log_step = (std::log10(omega_max) - log_min) / (num_points - 1);
    for (int i = 0; i < num_points; ++i) {
      omegas.push_back(std::pow(10.0, log_min + i * log_step));
    }
  } else {
    const double step = (omega_max - omega_min) / (num_points - 1);
    for (int i = 0; i < num_points; ++i) {
      omegas.push_back(omega_min + i * step);
    }
  }

  return omegas;
}

AtmosScanResult runAtmosScan(const StellarModel &model, const AtmosParameters &params,
                             AtmosDiagnostics &diag) {
  if (params.l < 0) {
    throw std::invalid_argument("Harmonic degree l must be non-negative");
  }
  if (params.use_complex) {
    // Nothing may throw inside the parallel loop
    validateAtmosBranch(params.branch);
  }

  const std::vector<double> omegas = createFrequencyGrid(
      params.omega_min, params.omega_max, params.num_points, params.use_log_spacing);

  AtmosScanResult result;
  result.lambda = static_cast<double>(params.l) * (params.l + 1);
  result.coeffs = eval_atmos_coeffs(model, GridPoint{1, params.x_surface}, params.formulation);

  try {
    result.cutoffs = eval_atmos_cutoff_freqs(result.coeffs, result.lambda);
    result.have_cutoffs = true;
  } catch (const AtmosError &e) {
    std::cerr << "[scan] Warning: " << e.what() << '\n';
    result.cutoffs.omega_lo = std::numeric_limits<double>::quiet_NaN();
    result.cutoffs.omega_hi = std::numeric_limits<double>::quiet_NaN();
    result.have_cutoffs = false;
  }

  const AtmosCoeffs coeffs = result.coeffs;
  const double lambda = result.lambda;
  const int num_points = static_cast<int>(omegas.size());
  result.points.resize(num_points);

#ifdef _OPENMP
  double t0 = omp_get_wtime();
#else
  auto t0 = std::chrono::high_resolution_clock::now();
#endif

#pragma omp parallel for schedule(static)
  for (int i = 0; i < num_points; ++i) {
    AtmosScanPoint &p = result.points[i];

    const auto q = atmos_quadratic<double>(coeffs.V, coeffs.As, coeffs.c_1, coeffs.Gamma_1,
                                           omegas[i], lambda);
    p.psi2 = q.discriminant();
    p.evanescent = p.psi2 >= 0.0;

    if (params.use_complex) {
      p.omega = std::complex<double>(omegas[i], params.omega_imag);
      p.chi = eval_atmos_chi_complex(coeffs, p.omega, std::complex<double>(lambda, 0.0),
                                     params.branch);
    } else {
      p.omega = std::complex<double>(omegas[i], 0.0);
      p.chi = eval_atmos_chi_real(coeffs, omegas[i], lambda, diag);
    }
  }

#ifdef _OPENMP
  const double elapsed = omp_get_wtime() - t0;
  std::cout << "[timing] runAtmosScan took " << elapsed << " s with " << omp_get_max_threads()
            << " threads\n";
#else
  const double elapsed =
      std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t0).count();
  std::cout << "[timing] runAtmosScan took " << elapsed << " s\n";
#endif

  return result;
}

bool writeAtmosScan(const std::string &filename, const AtmosScanResult &result,
                    const AtmosParameters &params) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error: Could not open file " << filename << " for writing" << '\n';
    return false;
  }

  outfile << "# Atmosphere scan: "
          << (params.model_file.empty() ? "homogeneous model" : params.model_file) << '\n';
  outfile << "# formulation = " << atmosFormulationToString(params.formulation)
          << ", x = " << params.x_surface << ", l = " << params.l << '\n';
  outfile << std::scientific << std::setprecision(10);
  outfile << "# V = " << result.coeffs.V << ", As = " << result.coeffs.As
          << ", c_1 = " << result.coeffs.c_1 << ", Gamma_1 = " << result.coeffs.Gamma_1 << '\n';
  if (result.have_cutoffs) {
    outfile << "# omega_lo = " << result.cutoffs.omega_lo
            << ", omega_hi = " << result.cutoffs.omega_hi << '\n';
  } else {
    outfile << "# cutoff frequencies unavailable" << '\n';
  }
  if (params.use_complex) {
    outfile << "# branch = " << atmosBranchToString(params.branch) << '\n';
  }
  outfile << "#" << '\n';
  outfile << "omega_re,omega_im,chi_re,chi_im,psi2,evanescent" << '\n';

  for (const auto &p : result.points) {
    outfile << p.omega.real() << "," << p.omega.imag() << "," << p.chi.real() << ","
            << p.chi.imag() << "," << p.psi2 << "," << (p.evanescent ? 1 : 0) << '\n';
  }

  outfile.close();
  return true;
}

bool calculateAtmos(const AtmosParameters &params) {
  // Validate parameters
  if (params.num_points < 1) {
    std::cerr << "Error: num_points must be at least 1." << '\n';
    return false;
  }
  if (params.num_points > 1 && params.omega_min >= params.omega_max) {
    std::cerr << "Error: omega_min must be less than omega_max." << '\n';
    return false;
  }
  if (params.l < 0) {
    std::cerr << "Error: l must be non-negative." << '\n';
    return false;
  }

  try {
    auto model = StellarModelFactory::createModel(params);

    AtmosParameters scan_params = params;
    if (auto *table = dynamic_cast<TabulatedStellarModel *>(model.get())) {
      const double x_clamped = std::clamp(scan_params.x_surface, table->x_min(), table->x_max());
      if (x_clamped != scan_params.x_surface) {
        std::cout << "[scan] x = " << scan_params.x_surface << " outside model table; using x = "
                  << x_clamped << '\n';
        scan_params.x_surface = x_clamped;
      }
    }

    std::cout << "Calculating atmosphere scan..." << '\n';
    std::cout << "Parameters:" << '\n';
    std::cout << "  Model: "
              << (scan_params.model_file.empty() ? "homogeneous" : scan_params.model_file)
              << '\n';
    std::cout << "  Formulation: " << atmosFormulationToString(scan_params.formulation) << '\n';
    std::cout << "  x: " << scan_params.x_surface << ", l: " << scan_params.l << '\n';
    std::cout << "  omega range: " << scan_params.omega_min << " to " << scan_params.omega_max
              << " (" << scan_params.num_points << " points)" << '\n';
    if (scan_params.use_complex) {
      std::cout << "  Im(omega): " << scan_params.omega_imag
                << ", branch: " << atmosBranchToString(scan_params.branch) << '\n';
    }
    std::cout << "  Output file: " << scan_params.output_file << '\n';

    const AtmosScanResult result =
        runAtmosScan(*model, scan_params, AtmosDiagnostics::global());

    std::cout << "  V = " << result.coeffs.V << ", As = " << result.coeffs.As
              << ", c_1 = " << result.coeffs.c_1 << ", Gamma_1 = " << result.coeffs.Gamma_1
              << '\n';
    if (result.have_cutoffs) {
      std::cout << "  Cutoff frequencies: " << result.cutoffs.omega_lo << ", "
                << result.cutoffs.omega_hi << '\n';
    }

    if (!writeAtmosScan(scan_params.output_file, result, scan_params)) {
      std::cerr << "Failed to write atmosphere scan" << '\n';
      return false;
    }

    std::cout << "Results written to: " << scan_params.output_file << '\n';
    return true;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

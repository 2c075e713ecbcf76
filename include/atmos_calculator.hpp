/**
 * @file atmos_calculator.hpp
 * @brief Driver for atmosphere boundary quantities over a frequency range
 *
 * Builds a stellar model (analytic homogeneous model or a tabulated CSV model), evaluates
 * the atmosphere coefficients at the surface point, the cutoff frequencies, and the radial
 * wavenumber over a grid of frequencies, and writes the results to CSV.
 *
 * @example Basic Usage
 * ```cpp
 * AtmosParameters params;
 * params.l = 2;
 * params.omega_min = 0.5;
 * params.omega_max = 20.0;
 * params.output_file = "atmos_l2.csv";
 *
 * bool success = calculateAtmos(params);
 * ```
 *
 * @example Tabulated model, complex frequencies
 * ```cpp
 * AtmosParameters params;
 * params.model_file = "data/model.csv";
 * params.formulation = AtmosFormulation::UNNO;
 * params.use_complex = true;
 * params.omega_imag = -1e-3;
 * params.branch = AtmosBranch::OUTWARD_FLUX;
 *
 * bool success = calculateAtmos(params);
 * ```
 *
 * @example Command Line Usage
 * ```bash
 * ./atmos_calculator --l 2 --omega-min 0.5 --omega-max 20 --output atmos_l2.csv
 * ./atmos_calculator --model data/model.csv --formulation UNNO --omega-imag -1e-3 --branch INWARD_FLUX
 * ```
 */

#ifndef ATMOS_CALCULATOR_HPP
#define ATMOS_CALCULATOR_HPP

#include "atmos_coeffs.hpp"
#include "atmos_cutoff.hpp"
#include "atmos_diagnostics.hpp"
#include "atmos_wavenumber.hpp"
#include "stellar_model.hpp"

#include <complex>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Parameters controlling an atmosphere scan
 */
struct AtmosParameters {
  // Model
  std::string model_file;       ///< Tabulated model CSV; empty selects the homogeneous model
  double Gamma_1;               ///< Adiabatic exponent of the homogeneous model
  double x_surface;             ///< Fractional radius of the boundary point
  AtmosFormulation formulation; ///< Coefficient formulation

  // Mode
  int l; ///< Harmonic degree; lambda = l(l+1)

  // Frequency grid
  double omega_min;     ///< Lowest real part of omega
  double omega_max;     ///< Highest real part of omega
  int num_points;       ///< Number of frequencies
  bool use_log_spacing; ///< Logarithmic spacing of the real part

  // Complex frequencies
  bool use_complex;   ///< Use the complex-frequency solver
  double omega_imag;  ///< Imaginary part of omega (complex solver only)
  AtmosBranch branch; ///< Branch criterion (complex solver only)

  std::string output_file; ///< Output CSV path

  /**
   * @brief Constructor with default values
   *
   * - homogeneous model with Gamma_1 = 5/3, boundary at x = 0.99, isothermal atmosphere
   * - l = 1
   * - 200 log-spaced frequencies in [0.1, 10]
   * - real-frequency solver
   * - output file atmos_scan.csv
   */
  AtmosParameters()
      : model_file(""), Gamma_1(5.0 / 3.0), x_surface(0.99),
        formulation(AtmosFormulation::ISOTHERMAL), l(1), omega_min(0.1), omega_max(10.0),
        num_points(200), use_log_spacing(true), use_complex(false), omega_imag(0.0),
        branch(kDefaultAtmosBranch), output_file("atmos_scan.csv") {}
};

struct AtmosScanPoint {
  std::complex<double> omega;
  std::complex<double> chi;
  double psi2;     ///< Real-frequency discriminant at Re(omega)
  bool evanescent; ///< psi2 >= 0
};

struct AtmosScanResult {
  AtmosCoeffs coeffs;
  double lambda;
  bool have_cutoffs; ///< false if the cutoff frequencies could not be ordered
  CutoffFrequencies cutoffs;
  std::vector<AtmosScanPoint> points;
};

/**
 * @brief Factory for the stellar model named by the parameters
 */
class StellarModelFactory {
public:
  /**
   * @brief Create the model selected by params
   *
   * @return HomogeneousModel if params.model_file is empty, TabulatedStellarModel otherwise
   * @throw std::runtime_error if the model file cannot be read
   * @throw std::invalid_argument for invalid model parameters
   */
  static std::unique_ptr<StellarModel> createModel(const AtmosParameters &params);
};

/**
 * @brief Frequencies of the scan grid (real parts)
 * @throw std::invalid_argument for an empty or invalid range
 */
std::vector<double> createFrequencyGrid(double omega_min, double omega_max, int num_points,
                                        bool use_log_spacing);

/**
 * @brief Evaluate atmosphere quantities over the frequency grid
 *
 * The coefficients and cutoff frequencies are evaluated once; the wavenumbers are computed
 * in parallel when OpenMP is available. A cutoff ordering failure is reported on
 * std::cerr and flagged in the result rather than aborting the scan.
 *
 * @param model Stellar model
 * @param params Scan parameters
 * @param diag Channel for the real-frequency fallback notice
 * @throw std::invalid_argument for invalid parameters
 * @throw AtmosError for an invalid branch selector
 */
AtmosScanResult runAtmosScan(const StellarModel &model, const AtmosParameters &params,
                             AtmosDiagnostics &diag);

/**
 * @brief Write a scan to CSV
 * @return true if successful, false otherwise
 */
bool writeAtmosScan(const std::string &filename, const AtmosScanResult &result,
                    const AtmosParameters &params);

/**
 * @brief Main entry point: validate, build the model, scan, write
 *
 * @param params Scan parameters
 * @return true if the scan was written, false otherwise (reason on std::cerr)
 */
bool calculateAtmos(const AtmosParameters &params);

#endif // ATMOS_CALCULATOR_HPP

#include "atmos_calculator.hpp"
#include "atmos_error.hpp"

#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
void printUsage(const char *prog) {
  std::cout << "Usage: " << prog << " [options]" << '\n';
  std::cout << '\n';
  std::cout << "Model:" << '\n';
  std::cout << "  --model <file>          Tabulated model CSV (default: homogeneous model)" << '\n';
  std::cout << "  --gamma1 <value>        Gamma_1 of the homogeneous model (default 5/3)" << '\n';
  std::cout << "  --x <value>             Fractional radius of the boundary point" << '\n';
  std::cout << "  --formulation <name>    UNNO or ISOTHERMAL" << '\n';
  std::cout << '\n';
  std::cout << "Frequencies:" << '\n';
  std::cout << "  --l <value>             Harmonic degree" << '\n';
  std::cout << "  --omega-min <value>     Lowest Re(omega)" << '\n';
  std::cout << "  --omega-max <value>     Highest Re(omega)" << '\n';
  std::cout << "  --num-points <value>    Number of frequencies" << '\n';
  std::cout << "  --linear-spacing        Use linear instead of log spacing" << '\n';
  std::cout << "  --complex               Use the complex-frequency solver" << '\n';
  std::cout << "  --omega-imag <value>    Im(omega); implies --complex" << '\n';
  std::cout << "  --branch <name>         Branch criterion for complex frequencies" << '\n';
  std::cout << '\n';
  std::cout << "  --output <file>         Output file" << '\n';
  std::cout << "  --list-branches         List branch criteria" << '\n';
  std::cout << "  --help                  Show this message" << '\n';
}

void listBranches() {
  const AtmosBranch branches[] = {
      AtmosBranch::OUTWARD_GROWING_ENERGY, AtmosBranch::OUTWARD_DECAYING_ENERGY,
      AtmosBranch::OUTWARD_FLUX,           AtmosBranch::INWARD_FLUX,
      AtmosBranch::OUTWARD_PHASE_VELOCITY, AtmosBranch::INWARD_PHASE_VELOCITY};

  std::cout << "Available branch criteria:" << '\n';
  std::cout << std::string(40, '-') << '\n';
  for (AtmosBranch b : branches) {
    std::cout << std::left << std::setw(30) << atmosBranchToString(b)
              << (b == kDefaultAtmosBranch ? "(default)" : "") << '\n';
  }
}
} // namespace

int main(int argc, char *argv[]) {
  gsl_set_error_handler_off();

  try {
    AtmosParameters params;

    for (int i = 1; i < argc; i++) {
      std::string arg = argv[i];

      if (arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "--list-branches") {
        listBranches();
        return 0;
      } else if (arg == "--model" && i + 1 < argc) {
        params.model_file = argv[++i];
      } else if (arg == "--gamma1" && i + 1 < argc) {
        params.Gamma_1 = std::stod(argv[++i]);
      } else if (arg == "--x" && i + 1 < argc) {
        params.x_surface = std::stod(argv[++i]);
      } else if (arg == "--formulation" && i + 1 < argc) {
        params.formulation = stringToAtmosFormulation(argv[++i]);
      } else if (arg == "--l" && i + 1 < argc) {
        params.l = std::stoi(argv[++i]);
      } else if (arg == "--omega-min" && i + 1 < argc) {
        params.omega_min = std::stod(argv[++i]);
      } else if (arg == "--omega-max" && i + 1 < argc) {
        params.omega_max = std::stod(argv[++i]);
      } else if (arg == "--num-points" && i + 1 < argc) {
        params.num_points = std::stoi(argv[++i]);
      } else if (arg == "--linear-spacing") {
        params.use_log_spacing = false;
      } else if (arg == "--complex") {
        params.use_complex = true;
      } else if (arg == "--omega-imag" && i + 1 < argc) {
        params.omega_imag = std::stod(argv[++i]);
        params.use_complex = true;
      } else if (arg == "--branch" && i + 1 < argc) {
        params.branch = stringToAtmosBranch(argv[++i]);
      } else if (arg == "--output" && i + 1 < argc) {
        params.output_file = argv[++i];
      } else {
        std::cerr << "Unknown option: " << arg << '\n';
        printUsage(argv[0]);
        return 1;
      }
    }

    return calculateAtmos(params) ? 0 : 1;

  } catch (const AtmosError &e) {
    std::cerr << "Configuration error: " << e.what() << '\n';
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

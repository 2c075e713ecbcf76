#include "atmos_calculator.hpp"
#include "atmos_error.hpp"
#include "homogeneous_model.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

// Test fixture for atmosphere scan driver tests
class AtmosCalculatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Use /tmp directory for test outputs
    test_output_dir = "/tmp/atmos_test_outputs";
    std::filesystem::create_directories(test_output_dir);
  }

  void TearDown() override {
    // Cleanup after each test
    try {
      std::filesystem::remove_all(test_output_dir);
    } catch (const std::filesystem::filesystem_error &e) {
      std::cerr << "Warning: Could not remove test directory: " << e.what() << std::endl;
    }
  }

  std::string test_output_dir;
  AtmosParameters getDefaultParams() {
    AtmosParameters params;
    params.x_surface = 0.95;
    params.l = 2;
    params.omega_min = 0.1;
    params.omega_max = 20.0;
    params.num_points = 50;
    return params;
  }

  static std::vector<std::string> readDataLines(const std::string &filename) {
    std::vector<std::string> lines;
    std::ifstream file(filename);
    std::string line;
    while (std::getline(file, line)) {
      if (!line.empty() && line[0] != '#') {
        lines.push_back(line);
      }
    }
    return lines;
  }
};

TEST_F(AtmosCalculatorTest, FrequencyGrid) {
  const auto lin = createFrequencyGrid(1.0, 5.0, 5, false);
  ASSERT_EQ(lin.size(), 5u);
  EXPECT_DOUBLE_EQ(lin.front(), 1.0);
  EXPECT_DOUBLE_EQ(lin[2], 3.0);
  EXPECT_DOUBLE_EQ(lin.back(), 5.0);

  const auto log = createFrequencyGrid(0.1, 10.0, 3, true);
  ASSERT_EQ(log.size(), 3u);
  EXPECT_NEAR(log[0], 0.1, 1e-14);
  EXPECT_NEAR(log[1], 1.0, 1e-14);
  EXPECT_NEAR(log[2], 10.0, 1e-12);

  const auto single = createFrequencyGrid(2.0, 1.0, 1, false);
  ASSERT_EQ(single.size(), 1u);
  EXPECT_DOUBLE_EQ(single[0], 2.0);

  EXPECT_THROW(createFrequencyGrid(1.0, 5.0, 0, false), std::invalid_argument);
  EXPECT_THROW(createFrequencyGrid(5.0, 1.0, 10, false), std::invalid_argument);
  EXPECT_THROW(createFrequencyGrid(0.0, 1.0, 10, true), std::invalid_argument);
}

TEST_F(AtmosCalculatorTest, ModelFactory) {
  AtmosParameters params = getDefaultParams();
  auto model = StellarModelFactory::createModel(params);
  ASSERT_NE(model, nullptr);
  EXPECT_NE(dynamic_cast<HomogeneousModel *>(model.get()), nullptr);

  params.model_file = test_output_dir + "/no_such_model.csv";
  EXPECT_THROW(StellarModelFactory::createModel(params), std::runtime_error);
}

// Real scan over the homogeneous model: each point matches the direct solver
TEST_F(AtmosCalculatorTest, RealScanMatchesSolver) {
  std::ostringstream sink;
  AtmosDiagnostics diag(sink);
  AtmosParameters params = getDefaultParams();
  HomogeneousModel model(params.Gamma_1);

  const AtmosScanResult result = runAtmosScan(model, params, diag);

  EXPECT_DOUBLE_EQ(result.lambda, 6.0);
  EXPECT_TRUE(result.have_cutoffs);
  EXPECT_LE(result.cutoffs.omega_lo, result.cutoffs.omega_hi);
  ASSERT_EQ(result.points.size(), 50u);

  AtmosDiagnostics check_diag(sink);
  bool any_propagating = false;
  bool any_evanescent = false;
  for (const auto &p : result.points) {
    EXPECT_DOUBLE_EQ(p.omega.imag(), 0.0);
    EXPECT_DOUBLE_EQ(p.chi.imag(), 0.0);
    EXPECT_DOUBLE_EQ(p.chi.real(),
                     eval_atmos_chi_real(result.coeffs, p.omega.real(), result.lambda, check_diag));
    EXPECT_EQ(p.evanescent, p.psi2 >= 0.0);
    any_propagating = any_propagating || !p.evanescent;
    any_evanescent = any_evanescent || p.evanescent;
  }

  // The range spans both regimes, so the fallback notice fired once
  EXPECT_TRUE(any_propagating);
  EXPECT_TRUE(any_evanescent);
  EXPECT_TRUE(diag.has_warned());
}

TEST_F(AtmosCalculatorTest, ComplexScanUsesBranch) {
  std::ostringstream sink;
  AtmosDiagnostics diag(sink);
  AtmosParameters params = getDefaultParams();
  params.use_complex = true;
  params.omega_imag = -0.02;
  params.branch = AtmosBranch::INWARD_FLUX;
  HomogeneousModel model(params.Gamma_1);

  const AtmosScanResult result = runAtmosScan(model, params, diag);

  for (const auto &p : result.points) {
    EXPECT_DOUBLE_EQ(p.omega.imag(), -0.02);
    const std::complex<double> expected = eval_atmos_chi_complex(
        result.coeffs, p.omega, std::complex<double>(result.lambda, 0.0), AtmosBranch::INWARD_FLUX);
    EXPECT_EQ(p.chi, expected);
  }
  EXPECT_FALSE(diag.has_warned());
}

// A scan whose cutoffs cannot be ordered still runs
TEST_F(AtmosCalculatorTest, ScanWithoutCutoffs) {
  std::ostringstream sink;
  AtmosDiagnostics diag(sink);
  AtmosParameters params = getDefaultParams();
  params.x_surface = 0.5;
  params.formulation = AtmosFormulation::UNNO;
  HomogeneousModel model(params.Gamma_1);

  const AtmosScanResult result = runAtmosScan(model, params, diag);

  EXPECT_FALSE(result.have_cutoffs);
  EXPECT_TRUE(std::isnan(result.cutoffs.omega_lo));
  EXPECT_TRUE(std::isnan(result.cutoffs.omega_hi));
  EXPECT_EQ(result.points.size(), 50u);
}

TEST_F(AtmosCalculatorTest, InvalidBranchRejectedBeforeScan) {
  std::ostringstream sink;
  AtmosDiagnostics diag(sink);
  AtmosParameters params = getDefaultParams();
  params.use_complex = true;
  params.branch = static_cast<AtmosBranch>(17);
  HomogeneousModel model(params.Gamma_1);

  EXPECT_THROW(runAtmosScan(model, params, diag), AtmosError);
}

// End to end with the default homogeneous model
TEST_F(AtmosCalculatorTest, CalculateAtmosWritesOutput) {
  AtmosParameters params = getDefaultParams();
  params.output_file = test_output_dir + "/atmos_scan_test.csv";

  EXPECT_TRUE(calculateAtmos(params));
  EXPECT_TRUE(std::filesystem::exists(params.output_file));

  std::ifstream file(params.output_file);
  ASSERT_TRUE(file.is_open());
  std::string first_line;
  std::getline(file, first_line);
  EXPECT_EQ(first_line.rfind("# Atmosphere scan", 0), 0u);

  const auto lines = readDataLines(params.output_file);
  ASSERT_EQ(lines.size(), 51u);
  EXPECT_EQ(lines[0], "omega_re,omega_im,chi_re,chi_im,psi2,evanescent");
}

// Tabulated model with a boundary point above the table is clamped to the last row
TEST_F(AtmosCalculatorTest, CalculateAtmosFromTable) {
  const std::string model_file = test_output_dir + "/model.csv";
  {
    std::ofstream out(model_file);
    out << "x,V_2,As,c_1,Gamma_1\n";
    for (int i = 0; i <= 10; ++i) {
      const double x = 0.9 + 0.008 * i;
      const double V_2 = 2.0 / (1.0 - x * x);
      out << x << "," << V_2 << "," << 0.4 * V_2 * x * x << ",1.0,1.6667\n";
    }
  }

  AtmosParameters params = getDefaultParams();
  params.model_file = model_file;
  params.x_surface = 0.999;
  params.formulation = AtmosFormulation::UNNO;
  params.use_complex = true;
  params.omega_imag = 0.01;
  params.output_file = test_output_dir + "/atmos_table_scan.csv";

  EXPECT_TRUE(calculateAtmos(params));

  const auto lines = readDataLines(params.output_file);
  EXPECT_EQ(lines.size(), 51u);
}

// A boundary point below the table is clamped to the first row, not the last
TEST_F(AtmosCalculatorTest, CalculateAtmosClampsToTableStart) {
  const std::string model_file = test_output_dir + "/model_from_08.csv";
  {
    std::ofstream out(model_file);
    out << "x,V_2,As,c_1,Gamma_1\n";
    for (int i = 0; i <= 10; ++i) {
      const double x = 0.8 + 0.02 * i;
      out << x << "," << 10.0 + 20.0 * x << "," << 1.0 + 2.0 * x << ",1.0,1.6667\n";
    }
  }

  AtmosParameters params = getDefaultParams();
  params.model_file = model_file;
  params.x_surface = 0.5;
  params.formulation = AtmosFormulation::UNNO;
  params.output_file = test_output_dir + "/atmos_clamped_scan.csv";

  ASSERT_TRUE(calculateAtmos(params));

  std::ifstream file(params.output_file);
  ASSERT_TRUE(file.is_open());
  std::string line;
  bool found_x = false;
  bool found_V = false;
  while (std::getline(file, line)) {
    if (line.rfind("# formulation", 0) == 0) {
      EXPECT_NE(line.find("x = 0.8,"), std::string::npos) << line;
      found_x = true;
    }
    if (line.rfind("# V = ", 0) == 0) {
      const double V = std::stod(line.substr(6));
      // V = V_2 x^2 at the first row x = 0.8
      EXPECT_NEAR(V, (10.0 + 20.0 * 0.8) * 0.64, 1e-8);
      EXPECT_NE(line.find("As = 2.6"), std::string::npos) << line;
      found_V = true;
    }
  }
  EXPECT_TRUE(found_x);
  EXPECT_TRUE(found_V);
}

TEST_F(AtmosCalculatorTest, CalculateAtmosFailures) {
  AtmosParameters params = getDefaultParams();
  params.output_file = test_output_dir + "/unused.csv";

  AtmosParameters bad_points = params;
  bad_points.num_points = 0;
  EXPECT_FALSE(calculateAtmos(bad_points));

  AtmosParameters bad_range = params;
  bad_range.omega_min = 5.0;
  bad_range.omega_max = 1.0;
  EXPECT_FALSE(calculateAtmos(bad_range));

  AtmosParameters bad_model = params;
  bad_model.model_file = test_output_dir + "/missing.csv";
  EXPECT_FALSE(calculateAtmos(bad_model));

  AtmosParameters bad_output = params;
  bad_output.output_file = test_output_dir + "/no_dir/out.csv";
  EXPECT_FALSE(calculateAtmos(bad_output));
}

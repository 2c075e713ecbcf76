#include "atmos_coeffs.hpp"
#include "homogeneous_model.hpp"

#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

// Model returning fixed coefficient values regardless of position
struct FixedModel : public StellarModel {
  std::map<StructureCoeff, double> values;

  double coeff(StructureCoeff idx, const GridPoint &) const override {
    auto it = values.find(idx);
    if (it == values.end()) {
      throw std::out_of_range("coefficient not tabulated");
    }
    return it->second;
  }
};

// Test fixture for atmosphere coefficient evaluation
class AtmosCoeffsTest : public ::testing::Test {
protected:
  void SetUp() override {
    model.values[StructureCoeff::V_2] = 4.0;
    model.values[StructureCoeff::AS] = 0.7;
    model.values[StructureCoeff::C_1] = 1.25;
    model.values[StructureCoeff::GAMMA_1] = 1.6667;
    pt.segment = 1;
    pt.x = 0.5;
  }

  FixedModel model;
  GridPoint pt;
  const double tolerance = 1e-12;
};

// Unno formulation takes all coefficients from the model, rescaling V_2 by x^2
TEST_F(AtmosCoeffsTest, UnnoFormulation) {
  AtmosCoeffs coeffs = eval_atmos_coeffs_unno(model, pt);

  EXPECT_NEAR(coeffs.V, 1.0, tolerance);
  EXPECT_NEAR(coeffs.As, 0.7, tolerance);
  EXPECT_NEAR(coeffs.c_1, 1.25, tolerance);
  EXPECT_NEAR(coeffs.Gamma_1, 1.6667, tolerance);
}

// Isothermal atmosphere: A_s = V (1 - 1/Gamma_1)
TEST_F(AtmosCoeffsTest, IsothermalFormulation) {
  AtmosCoeffs coeffs = eval_atmos_coeffs_isothrm(model, pt);

  EXPECT_NEAR(coeffs.V, 1.0, tolerance);
  EXPECT_NEAR(coeffs.As, 1.0 * (1.0 - 1.0 / 1.6667), tolerance);
  EXPECT_NEAR(coeffs.As, 0.4, 1e-4);
  EXPECT_NEAR(coeffs.c_1, 1.25, tolerance);
  EXPECT_NEAR(coeffs.Gamma_1, 1.6667, tolerance);
}

TEST_F(AtmosCoeffsTest, IsothermalIgnoresModelBuoyancy) {
  model.values.erase(StructureCoeff::AS);

  EXPECT_NO_THROW((void)eval_atmos_coeffs_isothrm(model, pt));
  EXPECT_THROW((void)eval_atmos_coeffs_unno(model, pt), std::out_of_range);
}

TEST_F(AtmosCoeffsTest, DispatchMatchesFormulation) {
  AtmosCoeffs unno = eval_atmos_coeffs(model, pt, AtmosFormulation::UNNO);
  AtmosCoeffs iso = eval_atmos_coeffs(model, pt, AtmosFormulation::ISOTHERMAL);

  EXPECT_DOUBLE_EQ(unno.As, eval_atmos_coeffs_unno(model, pt).As);
  EXPECT_DOUBLE_EQ(iso.As, eval_atmos_coeffs_isothrm(model, pt).As);
}

// Model errors reach the caller unchanged
TEST_F(AtmosCoeffsTest, ModelErrorsPropagate) {
  model.values.erase(StructureCoeff::GAMMA_1);

  EXPECT_THROW((void)eval_atmos_coeffs(model, pt, AtmosFormulation::UNNO), std::out_of_range);
  EXPECT_THROW((void)eval_atmos_coeffs(model, pt, AtmosFormulation::ISOTHERMAL),
               std::out_of_range);
}

TEST_F(AtmosCoeffsTest, FormulationStrings) {
  EXPECT_EQ(atmosFormulationToString(AtmosFormulation::UNNO), "UNNO");
  EXPECT_EQ(atmosFormulationToString(AtmosFormulation::ISOTHERMAL), "ISOTHERMAL");
  EXPECT_EQ(stringToAtmosFormulation("UNNO"), AtmosFormulation::UNNO);
  EXPECT_EQ(stringToAtmosFormulation("ISOTHERMAL"), AtmosFormulation::ISOTHERMAL);
  EXPECT_THROW(stringToAtmosFormulation("EDDINGTON"), std::invalid_argument);
}

// Homogeneous model: V = 2x^2/(1-x^2), A* = -V/Gamma_1, c_1 = 1
TEST(HomogeneousModelTest, SurfaceCoefficients) {
  HomogeneousModel model(5.0 / 3.0);
  GridPoint pt{1, 0.5};

  AtmosCoeffs unno = eval_atmos_coeffs_unno(model, pt);
  EXPECT_NEAR(unno.V, 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(unno.As, -0.4, 1e-12);
  EXPECT_DOUBLE_EQ(unno.c_1, 1.0);
  EXPECT_DOUBLE_EQ(unno.Gamma_1, 5.0 / 3.0);

  AtmosCoeffs iso = eval_atmos_coeffs_isothrm(model, pt);
  EXPECT_NEAR(iso.V, 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(iso.As, 0.4 * 2.0 / 3.0, 1e-12);

  EXPECT_DOUBLE_EQ(model.coeff(StructureCoeff::U, pt), 3.0);
}

TEST(HomogeneousModelTest, InvalidInput) {
  EXPECT_THROW(HomogeneousModel(0.0), std::invalid_argument);

  HomogeneousModel model(5.0 / 3.0);
  EXPECT_THROW(model.coeff(StructureCoeff::V_2, GridPoint{1, 1.0}), std::invalid_argument);
  EXPECT_THROW(model.coeff(StructureCoeff::V_2, GridPoint{1, -0.1}), std::invalid_argument);
}

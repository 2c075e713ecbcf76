#pragma once

// Dimensionless structure coefficients a stellar model can supply at a grid point.
enum class StructureCoeff {
  V_2,     ///< V/x^2, regular at the centre
  AS,      ///< A*, the buoyancy coefficient
  U,       ///< dln(m)/dln(r)
  C_1,     ///< (r/R)^3 / (m/M)
  GAMMA_1  ///< adiabatic exponent
};

struct GridPoint {
  int segment = 1;
  double x = 0.0; // fractional radius r/R
};

struct StellarModel {
  // Value of the coefficient idx at pt. Implementations throw on unsupported input.
  virtual double coeff(StructureCoeff idx, const GridPoint &pt) const = 0;

  virtual ~StellarModel() = default;
};

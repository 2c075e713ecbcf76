#pragma once
#include "stellar_model.hpp"

#include <stdexcept>

// Constant-density sphere: P = P_c (1 - x^2), m ∝ r^3.
struct HomogeneousModel : public StellarModel {
  double Gamma_1_;

  explicit HomogeneousModel(double Gamma_1) : Gamma_1_(Gamma_1) {
    if (Gamma_1 <= 0.0) {
      throw std::invalid_argument("Gamma_1 must be positive");
    }
  }

  double coeff(StructureCoeff idx, const GridPoint &pt) const override {
    const double x = pt.x;
    if (x < 0.0 || x >= 1.0) {
      throw std::invalid_argument("Homogeneous model requires 0 <= x < 1");
    }

    const double V_2 = 2.0 / (1.0 - x * x);

    switch (idx) {
    case StructureCoeff::V_2:
      return V_2;
    case StructureCoeff::AS:
      // dln(rho)/dln(r) = 0, so A* = -V/Gamma_1
      return -V_2 * x * x / Gamma_1_;
    case StructureCoeff::U:
      return 3.0;
    case StructureCoeff::C_1:
      return 1.0;
    case StructureCoeff::GAMMA_1:
      return Gamma_1_;
    default:
      throw std::invalid_argument("Unknown structure coefficient");
    }
  }
};

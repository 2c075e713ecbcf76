#include "atmos_coeffs.hpp"

#include <stdexcept>

AtmosCoeffs eval_atmos_coeffs_unno(const StellarModel &model, const GridPoint &pt) {
  AtmosCoeffs coeffs;

  coeffs.V = model.coeff(StructureCoeff::V_2, pt) * pt.x * pt.x;
  coeffs.As = model.coeff(StructureCoeff::AS, pt);
  coeffs.c_1 = model.coeff(StructureCoeff::C_1, pt);
  coeffs.Gamma_1 = model.coeff(StructureCoeff::GAMMA_1, pt);

  return coeffs;
}

AtmosCoeffs eval_atmos_coeffs_isothrm(const StellarModel &model, const GridPoint &pt) {
  AtmosCoeffs coeffs;

  coeffs.V = model.coeff(StructureCoeff::V_2, pt) * pt.x * pt.x;
  coeffs.c_1 = model.coeff(StructureCoeff::C_1, pt);
  coeffs.Gamma_1 = model.coeff(StructureCoeff::GAMMA_1, pt);
  coeffs.As = coeffs.V * (1.0 - 1.0 / coeffs.Gamma_1);

  return coeffs;
}

AtmosCoeffs eval_atmos_coeffs(const StellarModel &model, const GridPoint &pt,
                              AtmosFormulation formulation) {
  switch (formulation) {
  case AtmosFormulation::UNNO:
    return eval_atmos_coeffs_unno(model, pt);
  case AtmosFormulation::ISOTHERMAL:
    return eval_atmos_coeffs_isothrm(model, pt);
  default:
    throw std::invalid_argument("Unknown atmosphere formulation");
  }
}

std::string atmosFormulationToString(AtmosFormulation formulation) {
  switch (formulation) {
  case AtmosFormulation::UNNO:
    return "UNNO";
  case AtmosFormulation::ISOTHERMAL:
    return "ISOTHERMAL";
  default:
    throw std::invalid_argument("Unknown atmosphere formulation");
  }
}

AtmosFormulation stringToAtmosFormulation(const std::string &str) {
  if (str == "UNNO") {
    return AtmosFormulation::UNNO;
  } else if (str == "ISOTHERMAL") {
    return AtmosFormulation::ISOTHERMAL;
  } else {
    throw std::invalid_argument("Unknown atmosphere formulation string: " + str);
  }
}

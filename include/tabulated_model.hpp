// tabulated_model.hpp
#ifndef TABULATED_MODEL_HPP
#define TABULATED_MODEL_HPP

/**
 * @file tabulated_model.hpp
 * @brief Stellar model built from tabulated structure coefficients.
 *
 * @details
 * Coefficients are tabulated against the fractional radius x and interpolated with GSL
 * Steffen splines (monotonicity-preserving, so no overshoot near steep surface gradients).
 * Queries outside the table are clamped to its end points.
 *
 * Tables are read from CSV by readModelData(). The header names the columns; accepted
 * aliases (case and quotes ignored):
 * - x
 * - v_2, v2 (or v, converted to V_2 = V/x^2)
 * - as, a_s, astar
 * - u (optional)
 * - c_1, c1
 * - gamma_1, gamma1
 *
 * @code{.cpp}
 * ModelTable table;
 * if (readModelData("data/model.csv", table)) {
 *   TabulatedStellarModel model(table);
 *   GridPoint pt{1, table.x.back()};
 *   double V_2 = model.coeff(StructureCoeff::V_2, pt);
 * }
 * @endcode
 */

#include "stellar_model.hpp"

#include <gsl/gsl_errno.h>
#include <gsl/gsl_spline.h>
#include <string>
#include <vector>

struct ModelTable {
  std::vector<double> x;
  std::vector<double> V_2;
  std::vector<double> As;
  std::vector<double> U;
  std::vector<double> c_1;
  std::vector<double> Gamma_1;
};

class TabulatedStellarModel : public StellarModel {
public:
  /**
   * @brief Build splines over the table
   *
   * @param table Columns of equal length; x strictly increasing, with at least
   *              gsl_interp_type_min_size(gsl_interp_steffen) rows.
   *              A U column that is empty or holds non-finite values is not interpolated.
   * @throw std::invalid_argument for inconsistent or too short columns
   * @throw std::runtime_error if GSL fails to initialise a spline
   */
  explicit TabulatedStellarModel(const ModelTable &table);
  ~TabulatedStellarModel() override;

  TabulatedStellarModel(const TabulatedStellarModel &) = delete;
  TabulatedStellarModel &operator=(const TabulatedStellarModel &) = delete;

  /**
   * @brief Interpolated coefficient at pt.x (clamped to the table range)
   * @throw std::invalid_argument if U is requested and the table has none
   * @warning Not safe for concurrent calls: the GSL accelerators are shared.
   */
  double coeff(StructureCoeff idx, const GridPoint &pt) const override;

  [[nodiscard]] double x_min() const { return x_min_; }
  [[nodiscard]] double x_max() const { return x_max_; }
  [[nodiscard]] std::size_t size() const { return n_; }

private:
  struct Column {
    gsl_spline *spline = nullptr;
    gsl_interp_accel *acc = nullptr;
  };

  static Column makeColumn(const std::vector<double> &x, const std::vector<double> &y,
                           const char *name);
  static void freeColumn(Column &col);

  const Column &column(StructureCoeff idx) const;

  std::size_t n_;
  double x_min_;
  double x_max_;
  Column V_2_;
  Column As_;
  Column U_;
  Column c_1_;
  Column Gamma_1_;
};

/**
 * @brief Read tabulated structure coefficients from a CSV file
 *
 * Rows are sorted by x and duplicates in x dropped. Malformed rows are skipped.
 *
 * @param[in] filename CSV file with a header line
 * @param[out] table Parsed columns (cleared first)
 * @return true on success; false (with a message on std::cerr) otherwise
 */
bool readModelData(const std::string &filename, ModelTable &table);

#endif // TABULATED_MODEL_HPP

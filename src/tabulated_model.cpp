#include "tabulated_model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

TabulatedStellarModel::TabulatedStellarModel(const ModelTable &table) : n_(table.x.size()) {
  if (n_ < gsl_interp_type_min_size(gsl_interp_steffen)) {
    throw std::invalid_argument("Model table has too few rows for spline interpolation");
  }
  if (table.V_2.size() != n_ || table.As.size() != n_ || table.c_1.size() != n_ ||
      table.Gamma_1.size() != n_) {
    throw std::invalid_argument("Model table columns must have the same length as x");
  }
  for (std::size_t i = 1; i < n_; ++i) {
    if (!(table.x[i] > table.x[i - 1])) {
      throw std::invalid_argument("Model table x must be strictly increasing");
    }
  }

  x_min_ = table.x.front();
  x_max_ = table.x.back();

  const bool have_U =
      table.U.size() == n_ &&
      std::all_of(table.U.begin(), table.U.end(), [](double u) { return std::isfinite(u); });

  try {
    V_2_ = makeColumn(table.x, table.V_2, "V_2");
    As_ = makeColumn(table.x, table.As, "As");
    c_1_ = makeColumn(table.x, table.c_1, "c_1");
    Gamma_1_ = makeColumn(table.x, table.Gamma_1, "Gamma_1");
    if (have_U) {
      U_ = makeColumn(table.x, table.U, "U");
    }
  } catch (...) {
    freeColumn(V_2_);
    freeColumn(As_);
    freeColumn(U_);
    freeColumn(c_1_);
    freeColumn(Gamma_1_);
    throw;
  }
}

TabulatedStellarModel::~TabulatedStellarModel() {
  freeColumn(V_2_);
  freeColumn(As_);
  freeColumn(U_);
  freeColumn(c_1_);
  freeColumn(Gamma_1_);
}

TabulatedStellarModel::Column TabulatedStellarModel::makeColumn(const std::vector<double> &x,
                                                                const std::vector<double> &y,
                                                                const char *name) {
  Column col;
  col.acc = gsl_interp_accel_alloc();
  col.spline = gsl_spline_alloc(gsl_interp_steffen, x.size());

  if (!col.acc || !col.spline) {
    freeColumn(col);
    throw std::runtime_error(std::string("Failed to allocate spline for ") + name);
  }

  const int status = gsl_spline_init(col.spline, x.data(), y.data(), x.size());
  if (status != GSL_SUCCESS) {
    freeColumn(col);
    throw std::runtime_error(std::string("Failed to init spline for ") + name + ": " +
                             gsl_strerror(status));
  }

  return col;
}

void TabulatedStellarModel::freeColumn(Column &col) {
  if (col.spline) {
    gsl_spline_free(col.spline);
    col.spline = nullptr;
  }
  if (col.acc) {
    gsl_interp_accel_free(col.acc);
    col.acc = nullptr;
  }
}

const TabulatedStellarModel::Column &TabulatedStellarModel::column(StructureCoeff idx) const {
  switch (idx) {
  case StructureCoeff::V_2:
    return V_2_;
  case StructureCoeff::AS:
    return As_;
  case StructureCoeff::U:
    if (!U_.spline) {
      throw std::invalid_argument("Model table has no U column");
    }
    return U_;
  case StructureCoeff::C_1:
    return c_1_;
  case StructureCoeff::GAMMA_1:
    return Gamma_1_;
  default:
    throw std::invalid_argument("Unknown structure coefficient");
  }
}

double TabulatedStellarModel::coeff(StructureCoeff idx, const GridPoint &pt) const {
  const Column &col = column(idx);
  return gsl_spline_eval(col.spline, std::clamp(pt.x, x_min_, x_max_), col.acc);
}

bool readModelData(const std::string &filename, ModelTable &table) {
  table = ModelTable{};

  std::ifstream file(filename);
  if (!file.is_open()) {
    std::cerr << "[model] Error: Could not open file " << filename << "\n";
    return false;
  }

  std::string header;
  if (!std::getline(file, header)) {
    std::cerr << "[model] Error: Empty file " << filename << "\n";
    return false;
  }

  auto norm = [](std::string s) {
    s.erase(std::remove_if(
                s.begin(), s.end(),
                [](unsigned char ch) { return std::isspace(ch) || ch == '\"' || ch == '\''; }),
            s.end());
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    return s;
  };

  std::vector<std::string> cols;
  {
    std::stringstream sh(header);
    std::string tok;
    while (std::getline(sh, tok, ','))
      cols.push_back(norm(tok));
  }
  auto find_any = [&](std::initializer_list<const char *> names) -> int {
    for (size_t i = 0; i < cols.size(); ++i)
      for (auto *n : names)
        if (cols[i] == n)
          return (int)i;
    return -1;
  };

  const int i_x = find_any({"x"});
  const int i_V_2 = find_any({"v_2", "v2"});
  const int i_V = find_any({"v"});
  const int i_As = find_any({"as", "a_s", "astar"});
  const int i_U = find_any({"u"});
  const int i_c_1 = find_any({"c_1", "c1"});
  const int i_Gamma_1 = find_any({"gamma_1", "gamma1"});

  if (i_x < 0 || (i_V_2 < 0 && i_V < 0) || i_As < 0 || i_c_1 < 0 || i_Gamma_1 < 0) {
    std::cerr << "[model] Unrecognized header in " << filename
              << " (need x, V_2 or V, As, c_1, Gamma_1).\n";
    return false;
  }

  struct Row {
    double x, V_2, As, U, c_1, Gamma_1;
  };
  std::vector<Row> rows;
  rows.reserve(2048);

  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#')
      continue;

    std::vector<std::string> toks;
    {
      std::stringstream ss(line);
      std::string t;
      while (std::getline(ss, t, ','))
        toks.push_back(norm(t));
    }
    if (toks.size() < cols.size())
      continue;

    try {
      Row r;
      r.x = std::stod(toks[(size_t)i_x]);
      if (i_V_2 >= 0) {
        r.V_2 = std::stod(toks[(size_t)i_V_2]);
      } else {
        // V/x^2 is undefined at the centre
        if (!(r.x > 0.0))
          continue;
        r.V_2 = std::stod(toks[(size_t)i_V]) / (r.x * r.x);
      }
      r.As = std::stod(toks[(size_t)i_As]);
      r.U = (i_U >= 0) ? std::stod(toks[(size_t)i_U]) : std::numeric_limits<double>::quiet_NaN();
      r.c_1 = std::stod(toks[(size_t)i_c_1]);
      r.Gamma_1 = std::stod(toks[(size_t)i_Gamma_1]);

      if (!std::isfinite(r.x) || !std::isfinite(r.V_2) || !std::isfinite(r.As) ||
          !std::isfinite(r.c_1) || !std::isfinite(r.Gamma_1))
        continue;

      rows.push_back(r);
    } catch (const std::exception &) {
      continue; // skip malformed row
    }
  }
  file.close();

  if (rows.empty()) {
    std::cerr << "[model] No usable rows read from " << filename << "\n";
    return false;
  }

  // Sort by x and deduplicate (strictly increasing for Steffen)
  std::sort(rows.begin(), rows.end(), [](const Row &a, const Row &b) { return a.x < b.x; });

  for (const auto &r : rows) {
    if (!table.x.empty() && !(r.x > table.x.back()))
      continue;
    table.x.push_back(r.x);
    table.V_2.push_back(r.V_2);
    table.As.push_back(r.As);
    table.U.push_back(r.U);
    table.c_1.push_back(r.c_1);
    table.Gamma_1.push_back(r.Gamma_1);
  }

  if (table.x.size() < gsl_interp_type_min_size(gsl_interp_steffen)) {
    std::cerr << "[model] Only " << table.x.size() << " unique x rows after cleaning; need "
              << gsl_interp_type_min_size(gsl_interp_steffen) << ".\n";
    return false;
  }

  return true;
}

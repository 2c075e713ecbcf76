#ifndef ATMOS_ERROR_HPP
#define ATMOS_ERROR_HPP

/**
 * @file atmos_error.hpp
 * @brief Typed error raised by the atmosphere boundary evaluators.
 *
 * The evaluators never terminate the process. Conditions that leave no meaningful result
 * (an unknown branch selector, mis-ordered cutoff frequencies) are thrown as AtmosError so
 * the caller decides whether they are fatal.
 */

#include <stdexcept>
#include <string>

/**
 * @brief Kinds of atmosphere evaluation failure
 */
enum class AtmosErrorCode {
  INVALID_BRANCH, ///< Branch selector outside the supported set
  CUTOFF_ORDERING ///< Cutoff frequencies came out with omega_hi < omega_lo (or NaN)
};

class AtmosError : public std::runtime_error {
public:
  AtmosError(AtmosErrorCode code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  [[nodiscard]] AtmosErrorCode code() const noexcept { return code_; }

private:
  AtmosErrorCode code_;
};

#endif // ATMOS_ERROR_HPP

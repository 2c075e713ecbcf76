#ifndef ATMOS_DIAGNOSTICS_HPP
#define ATMOS_DIAGNOSTICS_HPP

/**
 * @file atmos_diagnostics.hpp
 * @brief At-most-once warning channel for the atmosphere evaluators.
 *
 * @details
 * The real-frequency wavenumber solver falls back to an approximation when the
 * characteristic discriminant is negative and reports this once. The "already warned"
 * state lives in an AtmosDiagnostics instance rather than in a hidden global, so callers
 * (and tests) can inject their own channel. AtmosDiagnostics::global() is the process-wide
 * instance used when none is supplied.
 *
 * The latch is an std::atomic<bool> updated with exchange(): when several threads hit the
 * fallback concurrently exactly one of them writes the notice.
 */

#include <atomic>
#include <iostream>
#include <string>

class AtmosDiagnostics {
public:
  /**
   * @brief Create a diagnostics channel writing to sink
   * @param sink Output stream for notices (default std::cerr); must outlive this object
   */
  explicit AtmosDiagnostics(std::ostream &sink = std::cerr);

  AtmosDiagnostics(const AtmosDiagnostics &) = delete;
  AtmosDiagnostics &operator=(const AtmosDiagnostics &) = delete;

  /**
   * @brief Emit message unless a notice was already emitted through this channel
   * @return true if this call wrote the notice
   */
  bool warn_once(const std::string &message);

  /**
   * @brief As warn_once(), but build() is only called by the thread that wins the latch
   * @param build Callable returning the message text
   * @return true if this call wrote the notice
   */
  template <typename MessageBuilder> bool warn_once_with(MessageBuilder &&build) {
    if (warned_.load(std::memory_order_acquire) ||
        warned_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    *sink_ << "[atmos] Warning: " << build() << '\n';
    return true;
  }

  [[nodiscard]] bool has_warned() const;

  /// Re-arm the latch.
  void reset();

  /// Process-wide channel writing to std::cerr.
  static AtmosDiagnostics &global();

private:
  std::atomic<bool> warned_;
  std::ostream *sink_;
};

#endif // ATMOS_DIAGNOSTICS_HPP

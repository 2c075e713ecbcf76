#include "atmos_diagnostics.hpp"

AtmosDiagnostics::AtmosDiagnostics(std::ostream &sink) : warned_(false), sink_(&sink) {}

bool AtmosDiagnostics::warn_once(const std::string &message) {
  if (warned_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  *sink_ << "[atmos] Warning: " << message << '\n';
  return true;
}

bool AtmosDiagnostics::has_warned() const { return warned_.load(std::memory_order_acquire); }

void AtmosDiagnostics::reset() { warned_.store(false, std::memory_order_release); }

AtmosDiagnostics &AtmosDiagnostics::global() {
  static AtmosDiagnostics instance(std::cerr);
  return instance;
}

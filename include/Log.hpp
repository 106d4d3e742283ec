#ifndef REDACT_LOG_HPP
#define REDACT_LOG_HPP

#include <atomic>
#include <iostream>

namespace redact {

namespace detail {
inline std::atomic<bool> &debugFlag() {
  static std::atomic<bool> enabled{false};
  return enabled;
}
} // namespace detail

/// Turn the DEBUG diagnostics on or off for the whole process
inline void setDebugLogging(bool enabled) { detail::debugFlag() = enabled; }

inline bool debugLoggingEnabled() { return detail::debugFlag(); }

/**
 * @brief Stream for DEBUG diagnostics: std::cerr when enabled, otherwise a
 * stream without a buffer that discards everything
 */
inline std::ostream &debugLog() {
  static std::ostream discard(nullptr);
  return debugLoggingEnabled() ? std::cerr : discard;
}

} // namespace redact

#endif // REDACT_LOG_HPP

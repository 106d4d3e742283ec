#ifndef REDACT_CANCELLATION_HPP
#define REDACT_CANCELLATION_HPP

#include <atomic>

#include "Errors.hpp"

namespace redact {

/**
 * @brief Cooperative cancellation flag shared between a caller and a run
 *
 * The run checks the flag between pages and the OCR engine polls it while
 * recognising a page.
 */
class CancellationToken {
public:
  void cancel() { m_cancelled.store(true); }
  bool isCancelled() const { return m_cancelled.load(); }

private:
  std::atomic<bool> m_cancelled{false};
};

/// Throw OperationCancelled when `token` is set and has been cancelled
inline void throwIfCancelled(const CancellationToken *token) {
  if (token != nullptr && token->isCancelled()) {
    throw OperationCancelled();
  }
}

} // namespace redact

#endif // REDACT_CANCELLATION_HPP

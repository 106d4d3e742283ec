#ifndef REDACT_ERRORS_HPP
#define REDACT_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace redact {

/**
 * @brief Base class of every error raised by the redaction core
 */
class RedactError : public std::runtime_error {
public:
  explicit RedactError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief The input document cannot be read (missing, corrupt, locked)
 */
class InputError : public RedactError {
public:
  explicit InputError(const std::string &message) : RedactError(message) {}
};

/**
 * @brief A search pattern failed to compile
 */
class PatternError : public RedactError {
public:
  PatternError(std::string pattern, std::optional<std::size_t> position,
               const std::string &detail)
      : RedactError(formatMessage(pattern, position, detail)),
        m_pattern(std::move(pattern)), m_position(position) {}

  const std::string &pattern() const { return m_pattern; }
  std::optional<std::size_t> position() const { return m_position; }

private:
  static std::string formatMessage(const std::string &pattern,
                                   std::optional<std::size_t> position,
                                   const std::string &detail) {
    std::string message = "Invalid pattern '" + pattern + "'";
    if (position) {
      message += " at position " + std::to_string(*position);
    }
    return message + ": " + detail;
  }

  std::string m_pattern;
  std::optional<std::size_t> m_position;
};

/**
 * @brief A caller-supplied rectangle file failed validation
 *
 * `page()` is the page key as written in the file (1-based), or 0 when the
 * error is not tied to a page.
 */
class ValidationError : public RedactError {
public:
  ValidationError(int page, std::string field, const std::string &message)
      : RedactError(formatMessage(page, field, message)), m_page(page),
        m_field(std::move(field)) {}

  int page() const { return m_page; }
  const std::string &field() const { return m_field; }

private:
  static std::string formatMessage(int page, const std::string &field,
                                   const std::string &message) {
    std::string text = "Invalid rectangle";
    if (page > 0) {
      text += " on page " + std::to_string(page);
    }
    if (!field.empty()) {
      text += " (field '" + field + "')";
    }
    return text + ": " + message;
  }

  int m_page;
  std::string m_field;
};

/**
 * @brief An optional collaborator (OCR engine, language data) is missing
 */
class CapabilityUnavailable : public RedactError {
public:
  CapabilityUnavailable(std::string capability, const std::string &reason)
      : RedactError(capability + " unavailable: " + reason),
        m_capability(std::move(capability)) {}

  const std::string &capability() const { return m_capability; }

private:
  std::string m_capability;
};

/**
 * @brief A single page could not be processed
 */
class PageProcessingError : public RedactError {
public:
  PageProcessingError(int pageIndex, const std::string &message)
      : RedactError("Page " + std::to_string(pageIndex + 1) + ": " + message),
        m_pageIndex(pageIndex) {}

  int pageIndex() const { return m_pageIndex; }

private:
  int m_pageIndex;
};

/**
 * @brief The run was cancelled through its CancellationToken
 */
class OperationCancelled : public RedactError {
public:
  OperationCancelled() : RedactError("Operation cancelled") {}
};

} // namespace redact

#endif // REDACT_ERRORS_HPP

#ifndef REDACT_DOCUMENT_HPP
#define REDACT_DOCUMENT_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace redact {

/**
 * @brief Immutable PDF byte buffer plus the password needed to open it
 *
 * Copies share the same bytes. Every pipeline stage takes a Document and
 * returns a new one; nothing mutates a Document in place.
 */
class Document {
public:
  Document();

  /**
   * @brief Read a PDF from disk
   * @throws InputError if the file cannot be read or is not a PDF
   */
  static Document fromFile(const std::string &path,
                           const std::string &password = "");

  /**
   * @brief Wrap bytes already in memory
   * @throws InputError if the bytes do not start like a PDF
   */
  static Document fromBytes(std::string bytes,
                            const std::string &password = "");

  const std::string &bytes() const { return *m_bytes; }
  const std::string &password() const { return m_password; }
  std::size_t size() const { return m_bytes->size(); }
  bool empty() const { return m_bytes->empty(); }

  /**
   * @brief Write the bytes to `path` through a temporary sibling file
   *
   * The destination only appears once the write has fully succeeded.
   * @throws InputError on I/O failure
   */
  void save(const std::string &path) const;

private:
  Document(std::shared_ptr<const std::string> bytes, std::string password);

  std::shared_ptr<const std::string> m_bytes;
  std::string m_password;
};

} // namespace redact

#endif // REDACT_DOCUMENT_HPP

#ifndef REDACT_SANITIZER_HPP
#define REDACT_SANITIZER_HPP

#include "Document.hpp"

#include <set>
#include <string>
#include <vector>

namespace redact {

struct SanitizeConfig {
  bool keepAnnotations = false; ///< Keep annotations that are not links,
                                ///< attachments or form widgets
  bool metadataOnly = false;    ///< Strip metadata, leave everything else
};

/**
 * @brief What a sanitization pass removed
 *
 * All zero / empty means the document had nothing to remove.
 */
struct SanitizationReport {
  std::set<std::string> metadataRemoved; ///< Info keys, plus "XMP"
  int javascriptRemoved = 0;
  int embeddedFilesRemoved = 0;
  int linksRemoved = 0;
  int formsFlattened = 0; ///< Terminal form fields
  int thumbnailsRemoved = 0;
  int annotationsRemoved = 0;

  bool isEmpty() const;
};

struct SanitizeResult {
  Document document;
  SanitizationReport report;
};

/**
 * @brief Read-only inventory of the channels the sanitizer strips
 */
struct SecurityAnalysis {
  int pageCount = 0;
  bool encrypted = false;
  std::vector<std::string> metadataFound;
  int javascriptCount = 0;
  int embeddedFilesCount = 0;
  int linksCount = 0;
  int formFieldCount = 0;
  int annotationsCount = 0;
  int thumbnailsCount = 0;
  std::vector<std::string> warnings;
};

/**
 * @brief Removes metadata, scripts, attachments, links, forms and
 * thumbnails from a document
 */
class Sanitizer {
public:
  explicit Sanitizer(const SanitizeConfig &config = SanitizeConfig());

  /**
   * @brief Strip every auxiliary channel and rewrite the document
   * @throws InputError if the document cannot be opened
   */
  SanitizeResult sanitize(const Document &document) const;

  /**
   * @brief Report what sanitize() would find, without changing anything
   * @throws InputError if the document cannot be opened
   */
  SecurityAnalysis analyze(const Document &document) const;

private:
  SanitizeConfig m_config;
};

} // namespace redact

#endif // REDACT_SANITIZER_HPP

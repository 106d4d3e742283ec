#ifndef REDACT_REPORT_HPP
#define REDACT_REPORT_HPP

#include "Redactor.hpp"
#include "Sanitizer.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace redact {

/**
 * @brief JSON form of a run report
 *
 * Page numbers are 1-based everywhere in the output.
 */
nlohmann::json reportToJson(const RedactionReport &report);

nlohmann::json sanitizationToJson(const SanitizationReport &report);

nlohmann::json analysisToJson(const SecurityAnalysis &analysis);

/**
 * @brief Write the report, pretty-printed, through a temporary sibling file
 * @throws InputError on I/O failure
 */
void writeReport(const RedactionReport &report, const std::string &path);

} // namespace redact

#endif // REDACT_REPORT_HPP

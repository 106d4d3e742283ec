#include "Report.hpp"

#include "Errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace redact {

namespace {

json boxToJson(const RedactionBox &box) {
  json entry = {{"x0", box.rect.x0},
                {"y0", box.rect.y0},
                {"x1", box.rect.x1},
                {"y1", box.rect.y1},
                {"source", toString(box.source)}};
  if (box.matchedText) {
    entry["text"] = *box.matchedText;
  }
  if (box.confidence) {
    entry["confidence"] = *box.confidence;
  }
  return entry;
}

json verificationToJson(const VerificationResult &verification) {
  json residuals = json::array();
  for (const auto &residual : verification.residualMatches) {
    json entry = {{"term_or_pattern", residual.termOrPattern},
                  {"context", residual.contextSnippet},
                  {"layer", toString(residual.layer)}};
    if (residual.pageIndex) {
      entry["page"] = *residual.pageIndex + 1;
    }
    residuals.push_back(entry);
  }
  return {{"passed", verification.passed}, {"residual_matches", residuals}};
}

json oneBased(const std::vector<int> &pages) {
  json result = json::array();
  for (int page : pages) {
    result.push_back(page + 1);
  }
  return result;
}

} // anonymous namespace

json sanitizationToJson(const SanitizationReport &report) {
  return {{"metadata_removed", report.metadataRemoved},
          {"javascript_removed", report.javascriptRemoved},
          {"embedded_files_removed", report.embeddedFilesRemoved},
          {"links_removed", report.linksRemoved},
          {"forms_flattened", report.formsFlattened},
          {"thumbnails_removed", report.thumbnailsRemoved},
          {"annotations_removed", report.annotationsRemoved}};
}

json analysisToJson(const SecurityAnalysis &analysis) {
  return {{"page_count", analysis.pageCount},
          {"encrypted", analysis.encrypted},
          {"metadata_found", analysis.metadataFound},
          {"javascript_count", analysis.javascriptCount},
          {"embedded_files_count", analysis.embeddedFilesCount},
          {"links_count", analysis.linksCount},
          {"form_field_count", analysis.formFieldCount},
          {"annotations_count", analysis.annotationsCount},
          {"thumbnails_count", analysis.thumbnailsCount},
          {"warnings", analysis.warnings}};
}

json reportToJson(const RedactionReport &report) {
  json classification = json::array();
  for (const auto &page : report.classification) {
    classification.push_back({{"page", page.pageIndex + 1},
                              {"kind", toString(page.kind)},
                              {"text_coverage", page.textCoverageRatio},
                              {"image_coverage", page.imageCoverageRatio}});
  }

  json redactions = json::object();
  for (const auto &entry : report.redactions) {
    json boxes = json::array();
    for (const auto &box : entry.second) {
      boxes.push_back(boxToJson(box));
    }
    redactions[std::to_string(entry.first + 1)] = boxes;
  }

  json issues = json::array();
  for (const auto &issue : report.issues) {
    json entry = {{"kind", toString(issue.kind)}, {"message", issue.message}};
    if (issue.pageIndex) {
      entry["page"] = *issue.pageIndex + 1;
    }
    issues.push_back(entry);
  }

  json result = {{"input_file", report.inputFile},
                 {"output_file", report.outputFile},
                 {"timestamp", report.timestamp},
                 {"terms_found", report.termsFound},
                 {"pages_affected", oneBased(report.pagesAffected)},
                 {"total_matches", report.totalMatches},
                 {"classification", classification},
                 {"redactions", redactions},
                 {"issues", issues},
                 {"incomplete_pages", oneBased(report.incompletePages)}};
  result["sanitization"] = report.sanitization
                               ? sanitizationToJson(*report.sanitization)
                               : json(nullptr);
  result["verification"] = report.verification
                               ? verificationToJson(*report.verification)
                               : json(nullptr);
  return result;
}

void writeReport(const RedactionReport &report, const std::string &path) {
  std::string tempPath = path + ".partial";
  {
    std::ofstream out(tempPath, std::ios::trunc);
    if (!out) {
      throw InputError("Cannot create report file: " + tempPath);
    }
    out << reportToJson(report).dump(2) << "\n";
    if (!out) {
      out.close();
      std::remove(tempPath.c_str());
      throw InputError("Failed to write report file: " + tempPath);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    std::remove(tempPath.c_str());
    throw InputError("Cannot move report into place: " + path + ": " +
                     ec.message());
  }
}

} // namespace redact

#include "Document.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "OcrDetector.hpp"
#include "RectFile.hpp"
#include "Redactor.hpp"
#include "Report.hpp"
#include "Sanitizer.hpp"
#include "TesseractOcr.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitVerificationFailed = 3;

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string &message)
      : std::runtime_error(message) {}
};

struct CliOptions {
  std::string command;
  std::vector<std::string> positional;
  redact::RedactConfig config;
  std::string rectsPath;
  std::string password;
  std::string reportPath;
  bool verbose = false;
  bool help = false;
};

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <command> [options]\n"
      << "\nCommands:\n"
      << "  redact <in.pdf> <out.pdf>   Find, remove and verify sensitive content\n"
      << "  sanitize <in.pdf> <out.pdf> Strip metadata, scripts, attachments, links\n"
      << "  analyze <in.pdf>            List what sanitize would remove\n"
      << "  preview <in.pdf>            Show matches without changing anything\n"
      << "  patterns                    List built-in patterns for --pii\n"
      << "\nSearch options:\n"
      << "  --term <text>           Exact term (repeatable)\n"
      << "  --regex <pattern>       Regular expression (repeatable)\n"
      << "  --pii <name[,name]>     Built-in pattern(s), see 'patterns'\n"
      << "  --rects <file>          JSON rectangles keyed by 1-based page\n"
      << "\nRedaction options:\n"
      << "  --fill <color>          Box colour: name or #rrggbb (default: black)\n"
      << "  --remove-images         Drop images that intersect a box\n"
      << "  --raster-policy <p>     'scanned' or 'ocr' (default: ocr)\n"
      << "  --no-sanitize           Skip sanitization after redacting\n"
      << "  --keep-annotations      Keep ordinary annotations when sanitizing\n"
      << "  --no-binary-check       Verify the text layer only\n"
      << "  --ocr-recheck           Re-OCR rasterized pages when verifying\n"
      << "  --report <file>         Write a JSON report\n"
      << "\nOCR options:\n"
      << "  --no-ocr                Do not OCR scanned pages\n"
      << "  -l, --language <lang>   OCR language (default: eng)\n"
      << "  --tessdata <dir>        Tesseract data directory\n"
      << "  --dpi <n>               OCR resolution, at least 150 (default: 300)\n"
      << "  -c, --confidence <n>    Minimum word confidence 0-100 (default: 50)\n"
      << "  --ocr-timeout <ms>      Per-page OCR deadline (default: 60000)\n"
      << "\nGeneral options:\n"
      << "  --password <pw>         Password of the input document\n"
      << "  -v, --verbose           Print diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExit codes: 0 success, 1 error, 2 usage error, 3 verification "
         "failed\n"
      << "\nExamples:\n"
      << "  " << programName << " redact in.pdf out.pdf --term \"John Smith\"\n"
      << "  " << programName << " redact in.pdf out.pdf --pii ssn,email "
      << "--report report.json\n"
      << "  " << programName << " sanitize in.pdf clean.pdf\n";
}

std::string requireValue(int argc, char *argv[], int &i,
                         const std::string &arg) {
  if (i + 1 >= argc) {
    throw UsageError(arg + " requires an argument");
  }
  return argv[++i];
}

int requireInt(int argc, char *argv[], int &i, const std::string &arg) {
  std::string value = requireValue(argc, argv, i, arg);
  try {
    std::size_t used = 0;
    int number = std::stoi(value, &used);
    if (used != value.size()) {
      throw UsageError(arg + " expects a number, got '" + value + "'");
    }
    return number;
  } catch (const std::logic_error &) {
    throw UsageError(arg + " expects a number, got '" + value + "'");
  }
}

void checkOcrSetting(const redact::OcrConfig &ocr) {
  try {
    redact::validateOcrConfig(ocr);
  } catch (const std::invalid_argument &e) {
    throw UsageError(e.what());
  }
}

void addPiiPatterns(const std::string &names, redact::MatchCriteria &criteria) {
  std::stringstream stream(names);
  std::string name;
  while (std::getline(stream, name, ',')) {
    if (!name.empty()) {
      criteria.patterns.push_back(redact::piiPattern(name).pattern);
    }
  }
}

CliOptions parseArguments(int argc, char *argv[]) {
  CliOptions options;
  options.command = argv[1];
  redact::RedactConfig &config = options.config;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--term") {
      config.criteria.terms.push_back(requireValue(argc, argv, i, arg));
    } else if (arg == "--regex") {
      config.criteria.patterns.push_back(requireValue(argc, argv, i, arg));
    } else if (arg == "--pii") {
      addPiiPatterns(requireValue(argc, argv, i, arg), config.criteria);
    } else if (arg == "--rects") {
      options.rectsPath = requireValue(argc, argv, i, arg);
    } else if (arg == "--fill") {
      config.apply.fill =
          redact::FillColor::parse(requireValue(argc, argv, i, arg));
    } else if (arg == "--password") {
      options.password = requireValue(argc, argv, i, arg);
    } else if (arg == "--dpi") {
      config.ocr.dpi = requireInt(argc, argv, i, arg);
      if (config.ocr.dpi < redact::kMinimumOcrDpi) {
        throw UsageError("--dpi must be at least 150");
      }
    } else if (arg == "-c" || arg == "--confidence") {
      config.ocr.confidenceThreshold = requireInt(argc, argv, i, arg);
      checkOcrSetting(config.ocr);
    } else if (arg == "--ocr-timeout") {
      config.ocr.pageTimeoutMs = requireInt(argc, argv, i, arg);
      checkOcrSetting(config.ocr);
    } else if (arg == "-l" || arg == "--language") {
      config.ocr.language = requireValue(argc, argv, i, arg);
    } else if (arg == "--tessdata") {
      config.ocr.tessDataPath = requireValue(argc, argv, i, arg);
    } else if (arg == "--no-ocr") {
      config.useOcr = false;
    } else if (arg == "--raster-policy") {
      std::string policy = requireValue(argc, argv, i, arg);
      if (policy == "scanned") {
        config.apply.rasterPolicy = redact::RasterPolicy::ScannedOnly;
      } else if (policy == "ocr") {
        config.apply.rasterPolicy = redact::RasterPolicy::OcrPages;
      } else {
        throw UsageError("--raster-policy must be 'scanned' or 'ocr'");
      }
    } else if (arg == "--remove-images") {
      config.apply.removeIntersectingImages = true;
    } else if (arg == "--no-sanitize") {
      config.sanitize = false;
    } else if (arg == "--keep-annotations") {
      config.sanitizer.keepAnnotations = true;
    } else if (arg == "--no-binary-check") {
      config.verifier.binaryScan = false;
    } else if (arg == "--ocr-recheck") {
      config.ocrRecheck = true;
    } else if (arg == "--report") {
      options.reportPath = requireValue(argc, argv, i, arg);
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (!arg.empty() && arg[0] != '-') {
      options.positional.push_back(arg);
    } else {
      throw UsageError("Unknown option: " + arg);
    }
  }
  config.ocr.dpi = std::max(config.ocr.dpi, redact::kMinimumOcrDpi);
  config.apply.rasterDpi = config.ocr.dpi;
  return options;
}

void expectPositional(const CliOptions &options, std::size_t count) {
  if (options.positional.size() != count) {
    throw UsageError("'" + options.command + "' expects " +
                     std::to_string(count) + " file argument(s)");
  }
}

void printSanitization(const redact::SanitizationReport &report) {
  std::cout << "\n[Sanitization]\n";
  std::cout << "  Metadata removed:       ";
  if (report.metadataRemoved.empty()) {
    std::cout << "none";
  }
  for (const auto &key : report.metadataRemoved) {
    std::cout << key << " ";
  }
  std::cout << "\n"
            << "  JavaScript removed:     " << report.javascriptRemoved << "\n"
            << "  Embedded files removed: " << report.embeddedFilesRemoved
            << "\n"
            << "  Links removed:          " << report.linksRemoved << "\n"
            << "  Form fields flattened:  " << report.formsFlattened << "\n"
            << "  Thumbnails removed:     " << report.thumbnailsRemoved << "\n"
            << "  Annotations removed:    " << report.annotationsRemoved
            << "\n";
}

void printBoxes(const redact::PageBoxMap &boxes) {
  std::cout << std::setw(6) << "Page" << std::setw(8) << "Source"
            << std::setw(36) << "Box (x0,y0,x1,y1)"
            << "  Text\n";
  std::cout << std::string(80, '-') << "\n";
  for (const auto &entry : boxes) {
    for (const auto &box : entry.second) {
      std::ostringstream rect;
      rect << std::fixed << std::setprecision(1) << "(" << box.rect.x0 << ","
           << box.rect.y0 << "," << box.rect.x1 << "," << box.rect.y1 << ")";
      std::cout << std::setw(6) << (entry.first + 1) << std::setw(8)
                << redact::toString(box.source) << std::setw(36) << rect.str()
                << "  " << box.matchedText.value_or("") << "\n";
    }
  }
}

void printIssues(const std::vector<redact::PageIssue> &issues) {
  if (issues.empty()) {
    return;
  }
  std::cout << "\n[Issues]\n";
  for (const auto &issue : issues) {
    std::cout << "  ";
    if (issue.pageIndex) {
      std::cout << "page " << (*issue.pageIndex + 1) << ": ";
    }
    std::cout << redact::toString(issue.kind) << ": " << issue.message << "\n";
  }
}

int runRedact(CliOptions &options) {
  expectPositional(options, 2);
  const std::string &input = options.positional[0];
  const std::string &output = options.positional[1];

  if (!options.rectsPath.empty()) {
    options.config.manualBoxes = redact::loadRectFile(options.rectsPath);
  }
  if (options.config.criteria.empty() && options.config.manualBoxes.empty()) {
    throw UsageError("redact needs --term, --regex, --pii or --rects");
  }

  redact::Document document =
      redact::Document::fromFile(input, options.password);
  redact::Redactor redactor(options.config);
  redact::RedactOutcome outcome = redactor.run(document);
  outcome.report.inputFile = input;
  outcome.report.outputFile = output;

  outcome.document.save(output);
  if (!options.reportPath.empty()) {
    redact::writeReport(outcome.report, options.reportPath);
  }

  const redact::RedactionReport &report = outcome.report;
  std::cout << "=== PDF Redaction ===\n"
            << "Input:  " << input << "\n"
            << "Output: " << output << "\n"
            << "Matches: " << report.totalMatches << "\n"
            << "Boxes applied: " << redact::countBoxes(report.redactions)
            << " on " << report.pagesAffected.size() << " page(s)\n";
  if (report.sanitization) {
    printSanitization(*report.sanitization);
  }
  printIssues(report.issues);

  if (report.verification) {
    std::cout << "\nVerification: "
              << (report.verification->passed ? "passed" : "FAILED") << "\n";
    for (const auto &residual : report.verification->residualMatches) {
      std::cout << "  [" << redact::toString(residual.layer) << "] ";
      if (residual.pageIndex) {
        std::cout << "page " << (*residual.pageIndex + 1) << " ";
      }
      std::cout << "'" << residual.termOrPattern << "': "
                << residual.contextSnippet << "\n";
    }
    if (!report.verification->passed) {
      return kExitVerificationFailed;
    }
  }
  return kExitSuccess;
}

int runSanitize(const CliOptions &options) {
  expectPositional(options, 2);
  redact::Document document =
      redact::Document::fromFile(options.positional[0], options.password);
  redact::Sanitizer sanitizer(options.config.sanitizer);
  redact::SanitizeResult result = sanitizer.sanitize(document);
  result.document.save(options.positional[1]);

  std::cout << "Sanitized " << options.positional[0] << " -> "
            << options.positional[1] << "\n";
  if (result.report.isEmpty()) {
    std::cout << "Nothing to remove.\n";
  } else {
    printSanitization(result.report);
  }
  return kExitSuccess;
}

int runAnalyze(const CliOptions &options) {
  expectPositional(options, 1);
  redact::Document document =
      redact::Document::fromFile(options.positional[0], options.password);
  redact::SecurityAnalysis analysis = redact::Sanitizer().analyze(document);
  std::cout << redact::analysisToJson(analysis).dump(2) << "\n";
  return kExitSuccess;
}

int runPreview(CliOptions &options) {
  expectPositional(options, 1);
  if (options.config.criteria.empty()) {
    throw UsageError("preview needs --term, --regex or --pii");
  }
  redact::Document document =
      redact::Document::fromFile(options.positional[0], options.password);
  redact::Redactor redactor(options.config);
  redact::DetectionResult detection = redactor.detect(document);

  std::cout << "\n[Page Classification]\n";
  for (const auto &page : detection.classifications) {
    std::cout << "  page " << (page.pageIndex + 1) << ": "
              << redact::toString(page.kind) << std::fixed
              << std::setprecision(3) << " (text " << page.textCoverageRatio
              << ", image " << page.imageCoverageRatio << ")\n";
  }

  std::cout << "\n[Matches]\n";
  printBoxes(detection.boxes);
  std::cout << "\nTotal matches: " << detection.matchCount << "\n";
  printIssues(detection.issues);
  return kExitSuccess;
}

int runPatterns() {
  std::cout << std::left;
  for (const auto &pattern : redact::piiPatterns()) {
    std::cout << "  " << std::setw(14) << pattern.name << pattern.description
              << "\n      " << pattern.pattern << "\n";
  }
  std::cout << "\nTesseract version: " << redact::TesseractOcr::getTesseractVersion()
            << "\n";
  return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return kExitUsage;
  }

  try {
    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
      printUsage(argv[0]);
      return kExitSuccess;
    }

    CliOptions options = parseArguments(argc, argv);
    if (options.help) {
      printUsage(argv[0]);
      return kExitSuccess;
    }
    if (options.verbose) {
      redact::setDebugLogging(true);
    }

    if (command == "redact") {
      return runRedact(options);
    } else if (command == "sanitize") {
      return runSanitize(options);
    } else if (command == "analyze") {
      return runAnalyze(options);
    } else if (command == "preview") {
      return runPreview(options);
    } else if (command == "patterns") {
      return runPatterns();
    }
    throw UsageError("Unknown command: " + command);
  } catch (const UsageError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    printUsage(argv[0]);
    return kExitUsage;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitFailure;
  }
}

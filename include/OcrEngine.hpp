#ifndef REDACT_OCR_ENGINE_HPP
#define REDACT_OCR_ENGINE_HPP

#include "BoxModel.hpp"
#include "Cancellation.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Configuration options for OCR processing
 */
struct OcrConfig {
  std::string language = "eng"; ///< Tesseract language code (e.g. "eng+deu")
  std::string tessDataPath = ""; ///< tessdata directory (empty: environment)
  double dpi = 300.0;            ///< Render resolution; at least 150
  double confidenceThreshold = 50.0; ///< Words below this are discarded
  bool preprocessImage = true;       ///< Grayscale + adaptive threshold
  int pageTimeoutMs = 60000;         ///< Per-page recognition deadline
};

/// Lowest render resolution the OCR detector accepts
constexpr double kMinimumOcrDpi = 150.0;

/**
 * @brief One recognised word in pixel coordinates
 */
struct OcrWord {
  std::string text;       ///< UTF-8 text
  float confidence = 0.f; ///< Confidence score (0-100)
  PixelRect box;          ///< Bounds in the recognised image
};

/**
 * @brief Result of recognising one image
 */
struct OcrResult {
  std::vector<OcrWord> words;     ///< Words in reading order
  double processingTimeMs = 0.0;  ///< Processing time in milliseconds
  bool success = false;           ///< Whether recognition completed
  bool timedOut = false;          ///< The deadline expired
  bool cancelled = false;         ///< The cancellation token fired
  std::string errorMessage;       ///< Error message if failed
};

/**
 * @brief OCR collaborator used by the detector and the verifier
 */
class OcrEngine {
public:
  virtual ~OcrEngine() = default;

  /// Initialise if needed; false when the engine or its data is missing
  virtual bool isAvailable() = 0;

  /// Why isAvailable() returned false
  virtual std::string unavailableReason() const = 0;

  /**
   * @brief Recognise words in a BGR or grayscale image
   * @param image Image to recognise
   * @param timeoutMs Deadline for this call, 0 for none
   * @param cancel Optional token polled during recognition
   */
  virtual OcrResult recognize(const cv::Mat &image, int timeoutMs,
                              const CancellationToken *cancel) = 0;
};

} // namespace redact

#endif // REDACT_OCR_ENGINE_HPP

#ifndef REDACT_TESSERACT_OCR_HPP
#define REDACT_TESSERACT_OCR_HPP

#include "OcrEngine.hpp"

#include <tesseract/baseapi.h>

#include <memory>
#include <string>

namespace redact {

/**
 * @brief OcrEngine backed by Tesseract
 *
 * The engine is initialised lazily on the first isAvailable() or
 * recognize() call. The tessdata directory is taken from the configuration,
 * then from TESSDATA_PREFIX, then Tesseract's compiled-in default.
 *
 * Example usage:
 * @code
 * redact::TesseractOcr engine(config);
 * if (engine.isAvailable()) {
 *     auto result = engine.recognize(image, 60000, nullptr);
 * }
 * @endcode
 */
class TesseractOcr : public OcrEngine {
public:
  TesseractOcr();
  explicit TesseractOcr(const OcrConfig &config);
  ~TesseractOcr() override;

  // Tesseract API is not copyable
  TesseractOcr(const TesseractOcr &) = delete;
  TesseractOcr &operator=(const TesseractOcr &) = delete;

  bool isAvailable() override;
  std::string unavailableReason() const override;
  OcrResult recognize(const cv::Mat &image, int timeoutMs,
                      const CancellationToken *cancel) override;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  const OcrConfig &getConfig() const { return m_config; }

  static std::string getTesseractVersion();

private:
  /**
   * @brief Preprocess image for better OCR results
   * @param image Input image
   * @return Preprocessed image
   */
  cv::Mat preprocessImage(const cv::Mat &image) const;

  /**
   * @brief Set image data to Tesseract
   * @param image OpenCV Mat image
   */
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  OcrConfig m_config;
  bool m_initialized;
  bool m_initAttempted;
  std::string m_unavailableReason;
};

} // namespace redact

#endif // REDACT_TESSERACT_OCR_HPP

#include "TesseractOcr.hpp"

#include "Log.hpp"

#include <opencv2/imgproc.hpp>

#include <tesseract/ocrclass.h>
#include <tesseract/resultiterator.h>

#include <chrono>
#include <cstdlib>

namespace redact {

namespace {

// Tesseract polls this between words; returning true aborts recognition
bool cancelRequested(void *cancelThis, int /*words*/) {
  auto *token = static_cast<const CancellationToken *>(cancelThis);
  return token != nullptr && token->isCancelled();
}

} // anonymous namespace

TesseractOcr::TesseractOcr()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false), m_initAttempted(false) {}

TesseractOcr::TesseractOcr(const OcrConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false), m_initAttempted(false) {}

TesseractOcr::~TesseractOcr() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractOcr::initialize() {
  if (m_initialized) {
    return true;
  }
  if (m_initAttempted) {
    return false;
  }
  m_initAttempted = true;

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    }
    // Priority 3: Tesseract's compiled-in default (nullptr)
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    m_unavailableReason = "failed to initialize Tesseract with language '" +
                          m_config.language + "'";
    if (tessDataPath != nullptr) {
      m_unavailableReason += " (tessdata: " + std::string(tessDataPath) + ")";
    }
    debugLog() << "DEBUG: " << m_unavailableReason << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(tesseract::PSM_AUTO);
  m_initialized = true;
  return true;
}

bool TesseractOcr::isAvailable() { return initialize(); }

std::string TesseractOcr::unavailableReason() const {
  return m_unavailableReason.empty() ? "Tesseract not initialized"
                                     : m_unavailableReason;
}

std::string TesseractOcr::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

OcrResult TesseractOcr::recognize(const cv::Mat &image, int timeoutMs,
                                  const CancellationToken *cancel) {
  OcrResult result;
  result.success = false;

  if (!initialize()) {
    result.errorMessage = unavailableReason();
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    cv::Mat processedImage =
        m_config.preprocessImage ? preprocessImage(image) : image;
    setImage(processedImage);
    m_tesseract->SetSourceResolution(static_cast<int>(m_config.dpi));

    tesseract::ETEXT_DESC monitor;
    monitor.cancel = &cancelRequested;
    monitor.cancel_this =
        const_cast<void *>(static_cast<const void *>(cancel));
    if (timeoutMs > 0) {
      monitor.set_deadline_msecs(timeoutMs);
    }

    int status = m_tesseract->Recognize(&monitor);

    if (cancel != nullptr && cancel->isCancelled()) {
      result.cancelled = true;
      result.errorMessage = "Recognition cancelled";
    } else if (timeoutMs > 0 && monitor.deadline_exceeded()) {
      result.timedOut = true;
      result.errorMessage =
          "Recognition exceeded " + std::to_string(timeoutMs) + " ms";
    } else if (status != 0) {
      result.errorMessage = "Tesseract recognition failed";
    } else {
      std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
      tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

      if (ri != nullptr) {
        do {
          std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
          if (word == nullptr || word[0] == '\0') {
            continue;
          }

          OcrWord ocrWord;
          ocrWord.text = word.get();
          ocrWord.confidence = ri->Confidence(level);

          int x1, y1, x2, y2;
          if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
            continue;
          }
          ocrWord.box.x = x1;
          ocrWord.box.y = y1;
          ocrWord.box.width = x2 - x1;
          ocrWord.box.height = y2 - y1;

          result.words.push_back(std::move(ocrWord));
        } while (ri->Next(level));
      }
      result.success = true;
    }

    m_tesseract->Clear();
  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR analysis failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

cv::Mat TesseractOcr::preprocessImage(const cv::Mat &image) const {
  cv::Mat processed;

  // Convert to grayscale if color
  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  // Apply Gaussian blur to reduce noise
  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);

  // Apply adaptive thresholding for better text recognition
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);

  return processed;
}

void TesseractOcr::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace redact

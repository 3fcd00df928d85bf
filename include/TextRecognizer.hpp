#ifndef DOCINTEL_TEXT_RECOGNIZER_HPP
#define DOCINTEL_TEXT_RECOGNIZER_HPP

#include "PipelineConfig.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Text read from one image region
 */
struct RecognitionResult {
  bool success = false;
  std::string text;
  double confidence = 0.0; ///< 0.0 - 1.0
  std::string errorMessage;
};

/**
 * @brief Pluggable text-recognition capability
 *
 * Any engine that returns text plus a confidence for an image region can
 * back the FieldExtractor. Implementations must be safe to call from
 * several worker threads.
 */
class TextRecognizer {
public:
  virtual ~TextRecognizer() = default;

  /**
   * @brief Recognize the text of an image region
   * @param region Cropped region, binary or grayscale
   */
  virtual RecognitionResult recognize(const cv::Mat &region) = 0;
};

/**
 * @brief TextRecognizer backed by Tesseract
 *
 * Example usage:
 * @code
 * docintel::TesseractRecognizer recognizer(config.ocr);
 * if (recognizer.initialize()) {
 *     auto result = recognizer.recognize(region);
 * }
 * @endcode
 */
class TesseractRecognizer : public TextRecognizer {
public:
  explicit TesseractRecognizer(const RecognizerConfig &config =
                                   RecognizerConfig());
  ~TesseractRecognizer() override;

  // Tesseract API is not copyable
  TesseractRecognizer(const TesseractRecognizer &) = delete;
  TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

  /**
   * @brief Initialize the OCR engine
   *
   * tessdata is looked up in the configured path, then TESSDATA_PREFIX,
   * then the engine's compiled-in default.
   *
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  RecognitionResult recognize(const cv::Mat &region) override;

  static std::string getTesseractVersion();

private:
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  RecognizerConfig m_config;
  bool m_initialized;
  std::mutex m_mutex; ///< TessBaseAPI holds per-image state
};

} // namespace docintel

#endif // DOCINTEL_TEXT_RECOGNIZER_HPP

#include "TextRecognizer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace docintel {

TesseractRecognizer::TesseractRecognizer(const RecognizerConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractRecognizer::~TesseractRecognizer() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractRecognizer::initialize() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_initialized) {
    return true;
  }

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
    } else {
      // Priority 3: Let Tesseract use its compiled-in default
      std::cerr << "[TesseractRecognizer] TESSDATA_PREFIX not set, using the "
                   "engine default"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "[TesseractRecognizer] Error: failed to initialize Tesseract "
                 "with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(
      static_cast<tesseract::PageSegMode>(m_config.pageSegMode));
  m_initialized = true;
  return true;
}

RecognitionResult TesseractRecognizer::recognize(const cv::Mat &region) {
  RecognitionResult result;

  std::lock_guard<std::mutex> lock(m_mutex);

  if (!m_initialized) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (region.empty()) {
    result.errorMessage = "Input region is empty";
    return result;
  }

  setImage(region);

  char *outText = m_tesseract->GetUTF8Text();
  if (outText) {
    result.text = outText;
    delete[] outText;
  }

  // MeanTextConf is 0-100
  int confidence = m_tesseract->MeanTextConf();
  result.confidence = std::max(0, std::min(100, confidence)) / 100.0;
  result.success = true;

  m_tesseract->Clear();
  return result;
}

std::string TesseractRecognizer::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

void TesseractRecognizer::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
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

} // namespace docintel

#include "ImageNormalizer.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace docintel {

ImageNormalizer::ImageNormalizer(const NormalizerConfig &config, bool verbose)
    : m_config(config), m_verbose(verbose) {}

const NormalizerConfig &ImageNormalizer::getConfig() const { return m_config; }

NormalizedImage ImageNormalizer::normalize(const cv::Mat &raw,
                                           double knownDpi) const {
  if (raw.empty()) {
    throw std::invalid_argument("Cannot normalize an empty image");
  }

  NormalizedImage result;
  NormalizationParams &params = result.params;
  params.thresholdMethod = m_config.binarization;

  cv::Mat working = toGray(raw);
  working = deskew(working, params);
  working = denoise(working, params);
  working = binarize(working, params);
  working = scaleToTarget(working, knownDpi, params);
  working = removeBorders(working, params);

  result.image = working;

  if (m_verbose) {
    std::cerr << "[ImageNormalizer] DEBUG: " << raw.cols << "x" << raw.rows
              << " -> " << working.cols << "x" << working.rows
              << ", skew=" << params.skewAngleDegrees
              << ", scale=" << params.scaleFactor
              << ", warnings=" << params.warnings.size() << std::endl;
  }

  return result;
}

cv::Mat ImageNormalizer::toGray(const cv::Mat &image) const {
  cv::Mat gray;

  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  if (gray.depth() != CV_8U) {
    cv::Mat converted;
    cv::normalize(gray, converted, 0, 255, cv::NORM_MINMAX, CV_8U);
    gray = converted;
  }

  return gray;
}

std::optional<double>
ImageNormalizer::detectSkewAngle(const cv::Mat &gray) const {
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150, 3);

  // Shorter segments are mostly glyph strokes
  const int minLineLength = std::max(50, gray.cols / 10);

  std::vector<cv::Vec4i> lines;
  cv::HoughLinesP(edges, lines, 1, CV_PI / 180, 100, minLineLength, 10);

  if (lines.empty()) {
    return std::nullopt;
  }

  std::vector<double> angles;
  angles.reserve(lines.size());

  for (const auto &line : lines) {
    double angle =
        std::atan2(line[3] - line[1], line[2] - line[0]) * 180.0 / M_PI;
    // Fold into [-45, 45] so vertical rules vote like horizontal ones
    while (angle > 45.0) {
      angle -= 90.0;
    }
    while (angle < -45.0) {
      angle += 90.0;
    }
    angles.push_back(angle);
  }

  std::sort(angles.begin(), angles.end());
  size_t mid = angles.size() / 2;
  if (angles.size() % 2 == 0) {
    return (angles[mid - 1] + angles[mid]) / 2.0;
  }
  return angles[mid];
}

cv::Mat ImageNormalizer::deskew(const cv::Mat &gray,
                                NormalizationParams &params) const {
  if (!m_config.deskewEnabled) {
    return gray;
  }

  try {
    std::optional<double> angle = detectSkewAngle(gray);
    if (!angle) {
      warn(params, "deskew: no line segments detected");
      return gray;
    }

    params.skewAngleDegrees = *angle;

    if (std::abs(*angle) > m_config.maxSkewDegrees) {
      warn(params, "deskew: angle " + std::to_string(*angle) +
                       " exceeds the correctable range");
      return gray;
    }

    if (std::abs(*angle) <= m_config.minSkewDegrees) {
      return gray;
    }

    cv::Point2f center(gray.cols / 2.0f, gray.rows / 2.0f);
    cv::Mat rotation = cv::getRotationMatrix2D(center, *angle, 1.0);
    cv::Mat rotated;
    cv::warpAffine(gray, rotated, rotation, gray.size(), cv::INTER_CUBIC,
                   cv::BORDER_REPLICATE);

    params.deskewApplied = true;
    return rotated;
  } catch (const cv::Exception &e) {
    warn(params, std::string("deskew: ") + e.what());
    return gray;
  }
}

cv::Mat ImageNormalizer::denoise(const cv::Mat &gray,
                                 NormalizationParams &params) const {
  float strength = 5.0f;
  if (m_config.denoiseLevel == "low") {
    strength = 3.0f;
  } else if (m_config.denoiseLevel == "high") {
    strength = 7.0f;
  } else if (m_config.denoiseLevel != "medium") {
    std::cerr << "[ImageNormalizer] Warning: unknown denoise level '"
              << m_config.denoiseLevel << "', using medium" << std::endl;
  }

  try {
    cv::Mat denoised;
    cv::fastNlMeansDenoising(gray, denoised, strength, 7, 21);
    return denoised;
  } catch (const cv::Exception &e) {
    warn(params, std::string("denoise: ") + e.what());
    return gray;
  }
}

cv::Mat ImageNormalizer::binarize(const cv::Mat &gray,
                                  NormalizationParams &params) const {
  try {
    cv::Mat binary;
    if (m_config.binarization == BinarizationMethod::Gaussian) {
      cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                            cv::THRESH_BINARY, m_config.gaussianBlockSize,
                            m_config.gaussianC);
    } else {
      cv::threshold(gray, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    }
    params.thresholdMethod = m_config.binarization;
    return binary;
  } catch (const cv::Exception &e) {
    warn(params, std::string("binarize: ") + e.what());
    return gray;
  }
}

cv::Mat ImageNormalizer::scaleToTarget(const cv::Mat &image, double knownDpi,
                                       NormalizationParams &params) const {
  double inputDpi = knownDpi > 0.0 ? knownDpi : m_config.assumedSourceDpi;
  params.estimatedInputDpi = inputDpi;

  double factor = m_config.targetDpi / inputDpi;
  if (std::abs(factor - 1.0) < 1e-3) {
    params.scaleFactor = 1.0;
    return image;
  }

  int width = static_cast<int>(std::lround(image.cols * factor));
  int height = static_cast<int>(std::lround(image.rows * factor));
  if (width < 1 || height < 1) {
    warn(params, "scale: target size collapses the image");
    return image;
  }

  try {
    cv::Mat scaled;
    cv::resize(image, scaled, cv::Size(width, height), 0, 0, cv::INTER_CUBIC);
    // Cubic resampling leaves grey ramps on stroke edges
    cv::threshold(scaled, scaled, 127, 255, cv::THRESH_BINARY);
    params.scaleFactor = factor;
    return scaled;
  } catch (const cv::Exception &e) {
    warn(params, std::string("scale: ") + e.what());
    return image;
  }
}

cv::Mat ImageNormalizer::removeBorders(const cv::Mat &image,
                                       NormalizationParams &params) const {
  params.borderCrop = cv::Rect(0, 0, image.cols, image.rows);
  if (!m_config.borderRemovalEnabled) {
    return image;
  }

  try {
    cv::Mat mask;
    cv::threshold(image, mask, 240, 255, cv::THRESH_BINARY_INV);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL,
                     cv::CHAIN_APPROX_SIMPLE);

    if (contours.empty()) {
      warn(params, "border removal: no content found");
      return image;
    }

    cv::Rect content = cv::boundingRect(contours[0]);
    for (size_t i = 1; i < contours.size(); ++i) {
      content |= cv::boundingRect(contours[i]);
    }

    int padX = std::max(m_config.borderMinPaddingPx,
                        static_cast<int>(content.width *
                                         m_config.borderPaddingRatio));
    int padY = std::max(m_config.borderMinPaddingPx,
                        static_cast<int>(content.height *
                                         m_config.borderPaddingRatio));

    cv::Rect padded(content.x - padX, content.y - padY,
                    content.width + 2 * padX, content.height + 2 * padY);
    padded &= cv::Rect(0, 0, image.cols, image.rows);

    params.borderCrop = padded;
    return image(padded).clone();
  } catch (const cv::Exception &e) {
    warn(params, std::string("border removal: ") + e.what());
    return image;
  }
}

void ImageNormalizer::warn(NormalizationParams &params,
                           const std::string &message) const {
  std::cerr << "[ImageNormalizer] Warning: " << message
            << "; step passed through" << std::endl;
  params.warnings.push_back(message);
}

} // namespace docintel

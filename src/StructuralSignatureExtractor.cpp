#include "StructuralSignatureExtractor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace docintel {

namespace {

double clampRatio(double value) { return std::min(1.0, std::max(0.0, value)); }

} // namespace

StructuralSignatureExtractor::StructuralSignatureExtractor(
    const SignatureConfig &config, bool verbose)
    : m_config(config), m_verbose(verbose) {}

StructuralSignature
StructuralSignatureExtractor::extract(const NormalizedImage &normalized) const {
  return extract(normalized.image);
}

StructuralSignature
StructuralSignatureExtractor::extract(const cv::Mat &image) const {
  if (image.empty()) {
    throw std::invalid_argument("Cannot extract a signature from an empty "
                                "image");
  }

  StructuralSignature signature;
  const double width = image.cols;
  const double height = image.rows;
  const double imageArea = width * height;

  cv::Mat ink = inkMask(image);

  // Merge glyphs and text lines into layout blocks
  int kernelWidth = std::max(
      1, static_cast<int>(std::lround(width * m_config.mergeKernelWidthRatio)));
  int kernelHeight = std::max(
      1,
      static_cast<int>(std::lround(height * m_config.mergeKernelHeightRatio)));
  cv::Mat kernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(kernelWidth, kernelHeight));
  cv::Mat blocks;
  cv::morphologyEx(ink, blocks, cv::MORPH_CLOSE, kernel);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(blocks, contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);

  cv::Mat coverage = cv::Mat::zeros(image.size(), CV_8UC1);

  for (const auto &contour : contours) {
    cv::Rect box = cv::boundingRect(contour);
    double areaRatio = (static_cast<double>(box.width) * box.height) /
                       imageArea;

    // Noise
    if (areaRatio < m_config.minZoneAreaRatio) {
      continue;
    }

    Zone zone;
    zone.kind = classify(ink, box, contour);
    zone.xRatio = clampRatio(box.x / width);
    zone.yRatio = clampRatio(box.y / height);
    zone.widthRatio = clampRatio(box.width / width);
    zone.heightRatio = clampRatio(box.height / height);
    zone.areaRatio = clampRatio(zone.widthRatio * zone.heightRatio);
    signature.zones.push_back(zone);

    coverage(box).setTo(cv::Scalar(255));
  }

  sortZones(signature.zones);

  signature.totalContentRatio =
      clampRatio(cv::countNonZero(coverage) / imageArea);

  if (m_verbose) {
    std::cerr << "[StructuralSignatureExtractor] DEBUG: "
              << signature.zones.size() << " zones from " << contours.size()
              << " blocks, content ratio " << signature.totalContentRatio
              << std::endl;
    for (const auto &zone : signature.zones) {
      std::cerr << "[StructuralSignatureExtractor] DEBUG:   "
                << toString(zone.kind) << " x=" << zone.xRatio
                << " y=" << zone.yRatio << " w=" << zone.widthRatio
                << " h=" << zone.heightRatio << std::endl;
    }
  }

  return signature;
}

cv::Mat StructuralSignatureExtractor::inkMask(const cv::Mat &image) const {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image;
  }

  // Normalized input is already binary; anything else gets Otsu
  cv::Mat midtones;
  cv::inRange(gray, cv::Scalar(1), cv::Scalar(254), midtones);

  cv::Mat ink;
  if (cv::countNonZero(midtones) == 0) {
    cv::threshold(gray, ink, 127, 255, cv::THRESH_BINARY_INV);
  } else {
    cv::threshold(gray, ink, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
  }
  return ink;
}

ZoneKind
StructuralSignatureExtractor::classify(const cv::Mat &ink, const cv::Rect &box,
                                       const std::vector<cv::Point> &contour)
    const {
  const double y = static_cast<double>(box.y) / ink.rows;
  const double w = static_cast<double>(box.width) / ink.cols;
  const double h = static_cast<double>(box.height) / ink.rows;
  const double area = w * h;

  // Header and footer: wide, short blocks at the page extremes
  if (y < 0.2 && w > 0.5 && h < 0.3) {
    return ZoneKind::Header;
  }
  if (y > 0.7 && w > 0.5 && h < 0.3) {
    return ZoneKind::Footer;
  }

  cv::Mat roi = ink(box);

  if (w >= 0.4 && hasPeriodicBanding(roi, m_config.minTableBands,
                                     m_config.maxBandPitchVariation)) {
    return ZoneKind::Table;
  }
  if (y >= 0.2 && y <= 0.7 && w > 0.6 && h > 0.3 && area > 0.1) {
    return ZoneKind::Table;
  }

  if (y < 0.3 && area < 0.05) {
    std::vector<cv::Point> local;
    local.reserve(contour.size());
    for (const auto &p : contour) {
      local.emplace_back(p.x - box.x, p.y - box.y);
    }
    if (isLikelyGraphic(roi, local)) {
      return ZoneKind::Logo;
    }
  }

  return ZoneKind::Other;
}

bool StructuralSignatureExtractor::hasPeriodicBanding(
    const cv::Mat &inkRoi, int minBands, double maxPitchVariation) {
  if (inkRoi.empty() || inkRoi.rows < minBands * 2) {
    return false;
  }

  // Vertical rules at the edges would make every row look inked
  int margin = std::max(1, inkRoi.cols / 33);
  if (inkRoi.cols <= margin * 2) {
    return false;
  }
  cv::Mat inner = inkRoi(cv::Rect(margin, 0, inkRoi.cols - 2 * margin,
                                  inkRoi.rows));

  cv::Mat rowSums;
  cv::reduce(inner, rowSums, 1, cv::REDUCE_SUM, CV_64F);

  const double rowFull = 255.0 * inner.cols;
  std::vector<int> bandStarts;
  bool inBand = false;

  for (int r = 0; r < rowSums.rows; ++r) {
    bool inked = rowSums.at<double>(r, 0) / rowFull > 0.05;
    if (inked && !inBand) {
      bandStarts.push_back(r);
    }
    inBand = inked;
  }

  if (static_cast<int>(bandStarts.size()) < minBands) {
    return false;
  }

  std::vector<double> pitches;
  for (size_t i = 1; i < bandStarts.size(); ++i) {
    pitches.push_back(bandStarts[i] - bandStarts[i - 1]);
  }

  double mean = 0.0;
  for (double p : pitches) {
    mean += p;
  }
  mean /= pitches.size();
  if (mean <= 0.0) {
    return false;
  }

  double variance = 0.0;
  for (double p : pitches) {
    variance += (p - mean) * (p - mean);
  }
  variance /= pitches.size();

  return std::sqrt(variance) / mean <= maxPitchVariation;
}

bool StructuralSignatureExtractor::isLikelyGraphic(
    const cv::Mat &inkRoi, const std::vector<cv::Point> &contour) {
  if (inkRoi.empty() || inkRoi.cols < 10 || inkRoi.rows < 10) {
    return false;
  }

  const double roiArea = static_cast<double>(inkRoi.cols) * inkRoi.rows;

  // 1. Logos are squarish, text lines are wide
  double aspectRatio = static_cast<double>(inkRoi.cols) / inkRoi.rows;
  bool isSquarish = (aspectRatio >= 0.5 && aspectRatio <= 2.0);

  // 2. Contour solidity
  double contourArea = cv::contourArea(contour);
  std::vector<cv::Point> hull;
  cv::convexHull(contour, hull);
  double hullArea = cv::contourArea(hull);
  double solidity = (hullArea > 0) ? (contourArea / hullArea) : 0;
  bool hasComplexShape = (solidity < 0.7);

  // 3. Edge density
  cv::Mat edges;
  cv::Canny(inkRoi, edges, 50, 150);
  double edgeDensity = cv::countNonZero(edges) / roiArea;
  bool hasHighEdgeDensity = (edgeDensity > 0.15);

  // 4. Fill ratio; glyph runs rarely cover half of their box
  double fillRatio = cv::countNonZero(inkRoi) / roiArea;
  bool isDense = (fillRatio > 0.5);
  bool hasSignificantFill = (fillRatio > 0.2 && fillRatio < 0.8);

  int graphicScore = 0;
  if (isSquarish)
    graphicScore += 2;
  if (hasComplexShape)
    graphicScore += 2;
  if (hasHighEdgeDensity)
    graphicScore += 1;
  if (isDense)
    graphicScore += 3;
  if (hasSignificantFill && isSquarish)
    graphicScore += 2;

  return isDense && graphicScore >= 5;
}

} // namespace docintel

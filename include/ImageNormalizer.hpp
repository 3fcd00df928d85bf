#ifndef DOCINTEL_IMAGE_NORMALIZER_HPP
#define DOCINTEL_IMAGE_NORMALIZER_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"

#include <opencv2/core.hpp>

#include <optional>

namespace docintel {

/**
 * @brief Deterministic geometric and tonal correction of raw scans
 *
 * Steps run in a fixed order: deskew, denoise, binarize, scale-normalize,
 * border removal. A step that cannot converge logs a warning, records it in
 * NormalizationParams::warnings and passes its input through unchanged.
 *
 * Example usage:
 * @code
 * docintel::ImageNormalizer normalizer;
 * docintel::NormalizedImage normalized = normalizer.normalize(raw);
 * @endcode
 */
class ImageNormalizer {
public:
  explicit ImageNormalizer(const NormalizerConfig &config = NormalizerConfig(),
                           bool verbose = false);

  /**
   * @brief Normalize a raw raster
   * @param raw BGR, BGRA or grayscale 8-bit image
   * @param knownDpi Input resolution when known; 0 uses assumedSourceDpi
   * @return Binary single-channel image plus the recorded parameters
   * @throws std::invalid_argument if @p raw is empty
   */
  NormalizedImage normalize(const cv::Mat &raw, double knownDpi = 0.0) const;

  /**
   * @brief Detect the dominant text-line angle with HoughLinesP
   * @param gray Grayscale image
   * @return Median angle in degrees within [-45, 45], or nullopt when no
   *         line segments were found
   */
  std::optional<double> detectSkewAngle(const cv::Mat &gray) const;

  const NormalizerConfig &getConfig() const;

private:
  cv::Mat toGray(const cv::Mat &image) const;
  cv::Mat deskew(const cv::Mat &gray, NormalizationParams &params) const;
  cv::Mat denoise(const cv::Mat &gray, NormalizationParams &params) const;
  cv::Mat binarize(const cv::Mat &gray, NormalizationParams &params) const;
  cv::Mat scaleToTarget(const cv::Mat &image, double knownDpi,
                        NormalizationParams &params) const;
  cv::Mat removeBorders(const cv::Mat &image,
                        NormalizationParams &params) const;

  void warn(NormalizationParams &params, const std::string &message) const;

  NormalizerConfig m_config;
  bool m_verbose;
};

} // namespace docintel

#endif // DOCINTEL_IMAGE_NORMALIZER_HPP

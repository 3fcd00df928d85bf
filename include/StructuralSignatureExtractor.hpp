#ifndef DOCINTEL_STRUCTURAL_SIGNATURE_EXTRACTOR_HPP
#define DOCINTEL_STRUCTURAL_SIGNATURE_EXTRACTOR_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace docintel {

/**
 * @brief Builds the ratio-based layout descriptor of a normalized image
 *
 * Ink is merged into blocks with a closing kernel sized relative to the
 * image, so the same layout at a different resolution yields the same
 * blocks. Each block is classified into a ZoneKind and converted to
 * ratios of the full image; pixel values never leave this class.
 */
class StructuralSignatureExtractor {
public:
  explicit StructuralSignatureExtractor(
      const SignatureConfig &config = SignatureConfig(), bool verbose = false);

  /**
   * @brief Extract the signature of a normalized image
   */
  StructuralSignature extract(const NormalizedImage &normalized) const;

  /**
   * @brief Extract the signature of a raster (black ink on white)
   * @throws std::invalid_argument if @p image is empty
   */
  StructuralSignature extract(const cv::Mat &image) const;

  /**
   * @brief Check a block for evenly spaced horizontal bands
   * @param inkRoi Ink mask of the block (ink = 255)
   * @param minBands Minimum number of bands
   * @param maxPitchVariation Largest accepted coefficient of variation of the
   *        band pitch
   */
  static bool hasPeriodicBanding(const cv::Mat &inkRoi, int minBands,
                                 double maxPitchVariation);

  /**
   * @brief Determine whether a block looks like a dense graphic (logo)
   * @param inkRoi Ink mask of the block (ink = 255)
   * @param contour Outer contour of the block, in ROI coordinates
   */
  static bool isLikelyGraphic(const cv::Mat &inkRoi,
                              const std::vector<cv::Point> &contour);

private:
  cv::Mat inkMask(const cv::Mat &image) const;
  ZoneKind classify(const cv::Mat &ink, const cv::Rect &box,
                    const std::vector<cv::Point> &contour) const;

  SignatureConfig m_config;
  bool m_verbose;
};

} // namespace docintel

#endif // DOCINTEL_STRUCTURAL_SIGNATURE_EXTRACTOR_HPP

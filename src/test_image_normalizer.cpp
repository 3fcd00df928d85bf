#include "ImageNormalizer.hpp"
#include "TestSupport.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <iostream>

using namespace docintel;
using docintel::testing::TestReport;

namespace {

cv::Mat rotate(const cv::Mat &image, double degrees) {
  cv::Point2f center(image.cols / 2.0f, image.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, degrees, 1.0);
  cv::Mat rotated;
  cv::warpAffine(image, rotated, rotation, image.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar(255));
  return rotated;
}

bool isBinary(const cv::Mat &image) {
  cv::Mat midtones;
  cv::inRange(image, cv::Scalar(1), cv::Scalar(254), midtones);
  return cv::countNonZero(midtones) == 0;
}

} // namespace

int main() {
  std::cout << "=== Test ImageNormalizer ===" << std::endl;
  TestReport report;

  cv::Mat page = docintel::testing::drawReceiptLayout(600, 800);

  report.section("Deskew");
  {
    NormalizerConfig config;
    config.borderRemovalEnabled = false;
    ImageNormalizer normalizer(config);

    cv::Mat skewed = rotate(page, 5.0);
    NormalizedImage result = normalizer.normalize(skewed, 300.0);
    std::cout << "    detected angle " << result.params.skewAngleDegrees
              << std::endl;
    report.check(std::abs(std::abs(result.params.skewAngleDegrees) - 5.0) <
                     1.0,
                 "5 degree skew is detected");
    report.check(result.params.deskewApplied, "rotation was applied");

    std::optional<double> residual =
        normalizer.detectSkewAngle(result.image);
    report.check(residual && std::abs(*residual) < 1.0,
                 "corrected page is level");

    NormalizedImage level = normalizer.normalize(page, 300.0);
    report.check(!level.params.deskewApplied,
                 "level page is not rotated");
  }

  report.section("Output format");
  {
    ImageNormalizer normalizer;
    NormalizedImage result = normalizer.normalize(page);
    report.check(result.image.type() == CV_8UC1, "single-channel 8-bit");
    report.check(isBinary(result.image), "binary black-on-white");
    report.check(result.params.estimatedInputDpi == 200.0,
                 "unknown resolution assumes 200 DPI");
    report.check(docintel::testing::near(result.params.scaleFactor, 1.5, 1e-9),
                 "scaled to 300 DPI");

    cv::Mat margins(800, 600, CV_8UC1, cv::Scalar(255));
    cv::rectangle(margins, cv::Point(200, 300), cv::Point(400, 500),
                  cv::Scalar(0), cv::FILLED);
    NormalizedImage cropped = normalizer.normalize(margins, 300.0);
    std::cout << "    border crop " << cropped.params.borderCrop << std::endl;
    report.check(cropped.params.borderCrop.width > 200 &&
                     cropped.params.borderCrop.width < 260,
                 "border crop keeps content plus padding");
    report.check(cropped.image.cols == cropped.params.borderCrop.width &&
                     cropped.image.rows == cropped.params.borderCrop.height,
                 "output is the cropped region");

    cv::Mat color;
    cv::cvtColor(page, color, cv::COLOR_GRAY2BGR);
    NormalizedImage fromColor = normalizer.normalize(color, 300.0);
    report.check(fromColor.image.channels() == 1, "colour input is reduced");
    report.check(fromColor.params.scaleFactor == 1.0,
                 "known 300 DPI input is not resampled");
  }

  report.section("Gaussian binarization");
  {
    NormalizerConfig config;
    config.binarization = BinarizationMethod::Gaussian;
    ImageNormalizer normalizer(config);
    NormalizedImage result = normalizer.normalize(page, 300.0);
    report.check(result.params.thresholdMethod == BinarizationMethod::Gaussian,
                 "method is recorded");
    report.check(isBinary(result.image), "output is binary");
  }

  report.section("Graceful degradation");
  {
    ImageNormalizer normalizer;
    cv::Mat blank(400, 300, CV_8UC1, cv::Scalar(255));
    bool threw = false;
    NormalizedImage result;
    try {
      result = normalizer.normalize(blank, 300.0);
    } catch (const std::exception &) {
      threw = true;
    }
    for (const auto &warning : result.params.warnings) {
      std::cout << "    warning: " << warning << std::endl;
    }
    report.check(!threw, "blank page does not throw");
    report.check(result.params.warnings.size() >= 2,
                 "deskew and border removal passed through");
    report.check(result.image.size() == blank.size(),
                 "blank page keeps its size");
  }

  report.section("Contract violations");
  {
    ImageNormalizer normalizer;
    bool threw = false;
    try {
      normalizer.normalize(cv::Mat());
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    report.check(threw, "empty input is rejected");
  }

  return report.finish();
}

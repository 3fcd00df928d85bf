#ifndef DOCINTEL_PIPELINE_CONFIG_HPP
#define DOCINTEL_PIPELINE_CONFIG_HPP

#include "DocumentTypes.hpp"

#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Options for the raster normalization pipeline
 */
struct NormalizerConfig {
  bool deskewEnabled = true;
  double minSkewDegrees = 0.5;  ///< Smaller angles are left alone
  double maxSkewDegrees = 45.0; ///< Larger angles are treated as no-converge
  std::string denoiseLevel = "medium"; ///< "low", "medium" or "high"
  BinarizationMethod binarization = BinarizationMethod::Otsu;
  int gaussianBlockSize = 11; ///< Must be odd
  double gaussianC = 2.0;
  double targetDpi = 300.0;
  double assumedSourceDpi = 200.0; ///< Used when the input DPI is unknown
  bool borderRemovalEnabled = true;
  double borderPaddingRatio = 0.05;
  int borderMinPaddingPx = 10;
  double pdfRenderDpi = 200.0;
};

/**
 * @brief Options for structural signature extraction
 */
struct SignatureConfig {
  double minZoneAreaRatio = 0.001;
  double mergeKernelWidthRatio = 0.025;  ///< Closing kernel / image width
  double mergeKernelHeightRatio = 0.008; ///< Closing kernel / image height
  int minTableBands = 3;
  double maxBandPitchVariation = 0.35; ///< Coefficient of variation
};

/**
 * @brief Template matching thresholds and scoring weights
 */
struct MatcherConfig {
  double autoMatchThreshold = 0.85;
  double partialMatchThreshold = 0.60;
  int suggestionCount = 5;
  double zoneCountWeight = 0.3;
  double contentRatioWeight = 0.2;
  double zoneGeometryWeight = 0.5;
  double zoneDistanceDecay = 2.0;
};

struct ExtractorConfig {
  double minZoneOverlap = 0.6;       ///< IoU below this discounts confidence
  double driftConfidenceFloor = 0.5; ///< Smallest drift discount factor
};

/**
 * @brief Validation floors and business-rule bindings
 */
struct ValidatorConfig {
  std::vector<std::string> highStakesFields = {"total_amount"};
  double highStakesConfidence = 0.99;
  double fieldConfidenceFloor = 0.70;
  int warningThreshold = 3;
  double subtotalTolerance = 0.01; ///< Relative to the computed sum
  double minimumTolerance = 0.01;  ///< Absolute floor of the tolerance
  double maxTaxRate = 0.15;
  std::string totalField = "total_amount";
  std::string subtotalField = "subtotal";
  std::string taxField = "tax_amount";
  std::string taxableField = "amount_taxable";
  std::string lineTotalPrefix = "line_total";
};

struct LibraryConfig {
  long cacheTtlSeconds = 86400;
  long refreshLockTimeoutMs = 2000;
};

/**
 * @brief Lifecycle and worker pool options; timeouts of 0 mean unlimited
 */
struct LifecycleConfig {
  long preprocessingTimeoutMs = 0;
  long matchingTimeoutMs = 0;
  long extractingTimeoutMs = 0;
  int workerCount = 0; ///< 0 = hardware concurrency
  std::string stateDirectory = "docintel_state";
};

struct RecognizerConfig {
  std::string language = "eng";
  std::string tessDataPath = ""; ///< Empty = TESSDATA_PREFIX or default
  int pageSegMode = 6;           ///< tesseract::PSM_SINGLE_BLOCK
};

/**
 * @brief Complete pipeline configuration; members default to production values
 */
struct PipelineConfig {
  NormalizerConfig normalizer;
  SignatureConfig signature;
  MatcherConfig matcher;
  ExtractorConfig extractor;
  ValidatorConfig validator;
  LibraryConfig library;
  LifecycleConfig lifecycle;
  RecognizerConfig ocr;
  bool verbose = false;
};

/**
 * @brief Result of loading a configuration file
 */
struct ConfigLoadResult {
  bool success = false;
  std::string errorMessage;
  PipelineConfig config;
};

/**
 * @brief Loads PipelineConfig from JSON with environment overrides
 *
 * Top-level JSON keys are the section names (normalizer, signature, matcher,
 * extractor, validator, library, lifecycle, ocr); keys inside a section are
 * snake_case. After the file is applied, variables named
 * DOCINTEL_<SECTION>_<KEY> override scalar keys.
 */
class ConfigLoader {
public:
  /**
   * @brief Load configuration from a JSON file
   * @param path Path to the JSON file
   * @return ConfigLoadResult; config holds defaults when loading failed
   */
  static ConfigLoadResult load(const std::string &path);

  /**
   * @brief Parse configuration from JSON text
   */
  static ConfigLoadResult parse(const std::string &jsonText);

  /**
   * @brief Apply DOCINTEL_<SECTION>_<KEY> environment overrides in place
   * @return Number of overrides applied
   */
  static int applyEnvironmentOverrides(PipelineConfig &config);
};

} // namespace docintel

#endif // DOCINTEL_PIPELINE_CONFIG_HPP

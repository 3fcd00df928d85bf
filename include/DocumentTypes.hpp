#ifndef DOCINTEL_DOCUMENT_TYPES_HPP
#define DOCINTEL_DOCUMENT_TYPES_HPP

#include <opencv2/core.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docintel {

using Clock = std::chrono::system_clock;
using Metadata = std::map<std::string, std::string>;

/**
 * @brief Classified kind of a layout region
 */
enum class ZoneKind { Header, Table, Footer, Logo, Other };

/**
 * @brief A classified region of a document, expressed purely as ratios
 *
 * All values are relative to the full image width/height and lie in
 * [0.0, 1.0]. Absolute pixel values never appear in a zone.
 */
struct Zone {
  ZoneKind kind = ZoneKind::Other;
  double xRatio = 0.0;      ///< Left edge / image width
  double yRatio = 0.0;      ///< Top edge / image height
  double widthRatio = 0.0;  ///< Width / image width
  double heightRatio = 0.0; ///< Height / image height
  double areaRatio = 0.0;   ///< widthRatio * heightRatio
};

/**
 * @brief Scale/DPI-invariant descriptor of a document layout
 */
struct StructuralSignature {
  std::vector<Zone> zones;        ///< Ordered top-to-bottom, then left-to-right
  double totalContentRatio = 0.0; ///< Fraction of image area covered by zones
};

/**
 * @brief Order zones top-to-bottom, then left-to-right
 */
void sortZones(std::vector<Zone> &zones);

/**
 * @brief Zones of one kind in top-to-bottom order, whatever the stored order
 */
std::vector<const Zone *> zonesOfKind(const StructuralSignature &signature,
                                      ZoneKind kind);

/**
 * @brief Thresholding method applied during normalization
 */
enum class BinarizationMethod { Otsu, Gaussian };

/**
 * @brief Parameters recorded while normalizing a raw image
 */
struct NormalizationParams {
  double skewAngleDegrees = 0.0; ///< Detected dominant text-line angle
  bool deskewApplied = false;    ///< Whether a rotation was applied
  double estimatedInputDpi = 0.0;
  double scaleFactor = 1.0;
  BinarizationMethod thresholdMethod = BinarizationMethod::Otsu;
  cv::Rect borderCrop;               ///< Crop applied by border removal
  std::vector<std::string> warnings; ///< Steps that passed through unmodified
};

/**
 * @brief Canonical raster produced by ImageNormalizer
 *
 * Single-channel 8-bit binary image, black ink on white background.
 */
struct NormalizedImage {
  cv::Mat image;
  NormalizationParams params;
};

/**
 * @brief Value type of a template field; selects the extraction strategy
 */
enum class FieldType { Text, Currency, Date, Integer, Identifier };

/**
 * @brief Sub-region of a zone, as ratios of the zone's own box
 */
struct RegionRatio {
  double x = 0.0;
  double y = 0.0;
  double width = 1.0;
  double height = 1.0;
};

/**
 * @brief Declarative definition of one expected field
 */
struct FieldDefinition {
  std::string name;
  ZoneKind zoneKind = ZoneKind::Other; ///< Zone of the template to look in
  int zoneIndex = 0;                   ///< nth zone of that kind
  RegionRatio region;                  ///< Sub-region inside the zone
  FieldType type = FieldType::Text;
  bool required = false;
  std::optional<double> minConfidence; ///< Overrides the default floor
};

/**
 * @brief A named, versioned reference layout
 */
struct Template {
  std::string id;
  std::string appId;
  std::string documentType;
  std::string vendor;
  std::string formatName;
  int version = 1;
  std::optional<StructuralSignature> signature; ///< Absent until computed
  std::vector<FieldDefinition> fieldMap;

  std::string label() const;
};

/**
 * @brief Filter used when pulling or listing templates
 */
struct TemplateQuery {
  std::string appId;
  std::optional<std::string> documentType;
  std::optional<std::string> vendor;
};

/**
 * @brief A suspected format drift of an existing template
 *
 * Proposals are submitted for human approval; they never become
 * authoritative templates on their own.
 */
struct VariantProposal {
  std::string id;
  std::string baseTemplateId;
  std::string appId;
  std::string documentType;
  std::string vendor;
  StructuralSignature observedSignature;
  double similarity = 0.0;
  Clock::time_point createdAt;
  bool submitted = false; ///< Accepted by the template source
};

/**
 * @brief Decision taken by the matcher for a document
 */
enum class MatchOutcome {
  AutoMatch,             ///< score >= auto threshold
  VariantMatch,          ///< partial <= score < auto
  NoMatch,               ///< score < partial threshold
  NoTemplatesAvailable   ///< Candidate set was empty
};

/**
 * @brief One scored candidate in a ranked match list
 */
struct MatchCandidate {
  std::string templateId;
  std::string label;
  double score = 0.0;
};

/**
 * @brief Result of matching a signature against the template library
 */
struct MatchResult {
  MatchOutcome outcome = MatchOutcome::NoTemplatesAvailable;
  std::optional<Template> bestTemplate;
  double score = 0.0;
  std::vector<MatchCandidate> ranked;      ///< Every candidate, best first
  std::vector<MatchCandidate> suggestions; ///< Top-N of ranked

  bool proceedsToExtraction() const;
};

/**
 * @brief A value extracted from one template field
 */
struct ExtractedField {
  std::string name;
  std::string rawValue;   ///< Text as returned by the recognizer
  std::string value;      ///< Normalized by the field-type strategy
  double confidence = 0.0;
  Zone sourceZone;        ///< Where the value was read, as ratios
};

/**
 * @brief Routing decision for a validated document
 */
enum class RoutingDecision { AutoCommit, Review, Fail };

/**
 * @brief Aggregate validation outcome
 */
struct ValidationResult {
  bool isValid = true;
  std::vector<std::string> missingFields;
  std::vector<std::string> lowConfidenceFields;
  std::vector<std::string> highStakesIssues;
  std::vector<std::string> warnings;
  bool mandatoryReview = false; ///< Set for variant matches
  double overallConfidence = 0.0;
  RoutingDecision routing = RoutingDecision::Review;
  std::vector<std::string> reviewReasons;
};

/**
 * @brief Lifecycle state of a document
 */
enum class DocumentState {
  Pending,
  Preprocessing,
  Matching,
  Extracting,
  Review,
  Completed,
  Failed
};

bool isTerminal(DocumentState state);

/**
 * @brief Why a document ended up in the failed state
 */
enum class ErrorKind { Exception, Timeout, Cancelled };

struct ErrorDetail {
  std::string stage;
  ErrorKind kind = ErrorKind::Exception;
  std::string message;
};

struct StateTransition {
  DocumentState state = DocumentState::Pending;
  Clock::time_point at;
};

/**
 * @brief One ingested file instance and its audit trail
 */
struct Document {
  std::string id;
  std::string sourcePath; ///< Always absolute
  std::string appId;
  Metadata metadata;
  DocumentState state = DocumentState::Pending;
  std::vector<StateTransition> transitions;
  std::optional<ErrorDetail> error;

  std::optional<NormalizationParams> normalization;
  std::optional<StructuralSignature> signature;
  std::optional<MatchOutcome> matchOutcome;
  std::string matchedTemplateId;
  double matchScore = 0.0;
  std::vector<MatchCandidate> suggestions;
  std::string variantProposalId;
  std::vector<ExtractedField> fields;
  std::optional<ValidationResult> validation;
  bool reviewRequired = false;
  std::vector<std::string> reviewReasons;
};

// String conversions used for logging and persistence.
std::string toString(ZoneKind kind);
std::string toString(FieldType type);
std::string toString(MatchOutcome outcome);
std::string toString(RoutingDecision decision);
std::string toString(DocumentState state);
std::string toString(ErrorKind kind);
std::string toString(BinarizationMethod method);

ZoneKind zoneKindFromString(const std::string &name);
FieldType fieldTypeFromString(const std::string &name);
MatchOutcome matchOutcomeFromString(const std::string &name);
RoutingDecision routingDecisionFromString(const std::string &name);
DocumentState documentStateFromString(const std::string &name);
ErrorKind errorKindFromString(const std::string &name);
BinarizationMethod binarizationMethodFromString(const std::string &name);

std::string formatTimestamp(Clock::time_point tp);
Clock::time_point parseTimestamp(const std::string &text);

} // namespace docintel

#endif // DOCINTEL_DOCUMENT_TYPES_HPP

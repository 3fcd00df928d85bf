#ifndef DOCINTEL_FIELD_EXTRACTOR_HPP
#define DOCINTEL_FIELD_EXTRACTOR_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"
#include "TextRecognizer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Normalize recognized text with the strategy of a field type
 *
 * currency -> "1234.50", date -> "YYYY-MM-DD", integer -> digits,
 * identifier -> receipt/invoice number token, text -> collapsed whitespace.
 *
 * @return Normalized value, or an empty string when the text cannot be
 *         parsed as @p type
 */
std::string normalizeFieldValue(FieldType type, const std::string &raw);

/**
 * @brief Extracts template fields from a normalized image
 *
 * Field regions come from the template's reference signature. The
 * recognizer's confidence is discounted when the template zone overlaps
 * poorly with the zones observed on the document.
 */
class FieldExtractor {
public:
  explicit FieldExtractor(std::shared_ptr<TextRecognizer> recognizer,
                          const ExtractorConfig &config = ExtractorConfig(),
                          bool verbose = false);

  /**
   * @brief Extract every field of the template's field map
   * @param normalized Normalized document image
   * @param tmpl Matched template; must carry a signature
   * @param observed Signature of the document, for the drift discount
   * @throws std::invalid_argument if the template has no signature
   */
  std::vector<ExtractedField>
  extract(const NormalizedImage &normalized, const Template &tmpl,
          const std::optional<StructuralSignature> &observed =
              std::nullopt) const;

  /**
   * @brief Region of a field as ratios of the full image
   * @return nullopt if the template has no zone for the field
   */
  static std::optional<Zone> locateField(const FieldDefinition &field,
                                         const StructuralSignature &reference);

  /**
   * @brief Intersection over union of two zones
   */
  static double zoneOverlap(const Zone &a, const Zone &b);

  /**
   * @brief Confidence factor for the drift of a template zone
   * @return 1.0 when a same-kind observed zone overlaps by at least
   *         minZoneOverlap, down to driftConfidenceFloor otherwise
   */
  double driftFactor(const Zone &templateZone,
                     const StructuralSignature &observed) const;

private:
  std::shared_ptr<TextRecognizer> m_recognizer;
  ExtractorConfig m_config;
  bool m_verbose;
};

} // namespace docintel

#endif // DOCINTEL_FIELD_EXTRACTOR_HPP

#ifndef DOCINTEL_CONFIDENCE_VALIDATOR_HPP
#define DOCINTEL_CONFIDENCE_VALIDATOR_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"

#include <functional>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Match facts that feed into validation
 */
struct ValidationContext {
  double matchScore = 1.0;
  bool variantMatch = false; ///< Score fell in the partial band
};

/**
 * @brief Aggregates field confidence and business rules into a routing
 *
 * Validation problems are data-quality outcomes: they route to review and
 * never produce RoutingDecision::Fail.
 */
class ConfidenceValidator {
public:
  /// Returns today's date as YYYY-MM-DD
  using TodaySource = std::function<std::string()>;

  explicit ConfidenceValidator(const ValidatorConfig &config =
                                   ValidatorConfig(),
                               bool verbose = false);

  /**
   * @brief Validate extracted fields against their template
   * @param fields Fields produced by the FieldExtractor
   * @param tmpl Template whose field map defines required fields
   * @param context Match score and variant flag of the document
   */
  ValidationResult validate(const std::vector<ExtractedField> &fields,
                            const Template &tmpl,
                            const ValidationContext &context =
                                ValidationContext()) const;

  /**
   * @brief Replace the source of "today" used by the future-date rule
   */
  void setTodaySource(TodaySource today);

  const ValidatorConfig &getConfig() const;

private:
  bool isHighStakes(const std::string &fieldName) const;
  void applyBusinessRules(const std::vector<ExtractedField> &fields,
                          const Template &tmpl,
                          ValidationResult &result) const;

  ValidatorConfig m_config;
  bool m_verbose;
  TodaySource m_today;
};

} // namespace docintel

#endif // DOCINTEL_CONFIDENCE_VALIDATOR_HPP

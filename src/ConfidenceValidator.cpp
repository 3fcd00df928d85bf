#include "ConfidenceValidator.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>

namespace docintel {

namespace {

std::string todayUtc() {
  std::time_t now = Clock::to_time_t(Clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%d");
  return out.str();
}

std::optional<double> numericValue(const ExtractedField *field) {
  if (field == nullptr || field->value.empty()) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    double value = std::stod(field->value, &consumed);
    if (consumed != field->value.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::string formatAmount(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

double tolerance(const ValidatorConfig &config, double magnitude) {
  return std::max(config.minimumTolerance,
                  config.subtotalTolerance * std::abs(magnitude));
}

} // namespace

ConfidenceValidator::ConfidenceValidator(const ValidatorConfig &config,
                                         bool verbose)
    : m_config(config), m_verbose(verbose), m_today(todayUtc) {}

const ValidatorConfig &ConfidenceValidator::getConfig() const {
  return m_config;
}

void ConfidenceValidator::setTodaySource(TodaySource today) {
  m_today = std::move(today);
}

bool ConfidenceValidator::isHighStakes(const std::string &fieldName) const {
  return std::find(m_config.highStakesFields.begin(),
                   m_config.highStakesFields.end(),
                   fieldName) != m_config.highStakesFields.end();
}

ValidationResult
ConfidenceValidator::validate(const std::vector<ExtractedField> &fields,
                              const Template &tmpl,
                              const ValidationContext &context) const {
  ValidationResult result;

  std::map<std::string, const ExtractedField *> byName;
  for (const auto &field : fields) {
    byName.emplace(field.name, &field);
  }

  auto lookup = [&byName](const std::string &name) -> const ExtractedField * {
    auto it = byName.find(name);
    return it == byName.end() ? nullptr : it->second;
  };

  // 1. Required fields
  int requiredCount = 0;
  int requiredFound = 0;
  for (const auto &definition : tmpl.fieldMap) {
    if (!definition.required) {
      continue;
    }
    requiredCount++;
    const ExtractedField *field = lookup(definition.name);
    if (field == nullptr || field->value.empty()) {
      result.missingFields.push_back(definition.name);
      result.reviewReasons.push_back("missing required field: " +
                                     definition.name);
      result.isValid = false;
    } else {
      requiredFound++;
    }
  }

  // 2. Confidence floors
  for (const auto &definition : tmpl.fieldMap) {
    const ExtractedField *field = lookup(definition.name);

    if (isHighStakes(definition.name)) {
      double confidence =
          (field == nullptr || field->value.empty()) ? 0.0 : field->confidence;
      if (confidence < m_config.highStakesConfidence) {
        std::ostringstream issue;
        issue << definition.name << " confidence " << std::fixed
              << std::setprecision(3) << confidence << " below "
              << m_config.highStakesConfidence;
        result.highStakesIssues.push_back(issue.str());
        result.reviewReasons.push_back("high-stakes field below floor: " +
                                       definition.name);
      }
      continue;
    }

    if (field == nullptr || field->value.empty()) {
      continue;
    }

    double floor =
        definition.minConfidence.value_or(m_config.fieldConfidenceFloor);
    if (field->confidence < floor) {
      result.lowConfidenceFields.push_back(definition.name);
      result.reviewReasons.push_back("low confidence field: " +
                                     definition.name);
    }
  }

  // 3. Cross-field business rules
  applyBusinessRules(fields, tmpl, result);

  if (static_cast<int>(result.warnings.size()) >= m_config.warningThreshold) {
    result.reviewReasons.push_back(std::to_string(result.warnings.size()) +
                                   " business-rule warnings");
  }

  if (context.variantMatch) {
    result.mandatoryReview = true;
    result.reviewReasons.push_back("variant match requires review");
  }

  // Overall confidence
  double meanConfidence = 0.0;
  if (!fields.empty()) {
    for (const auto &field : fields) {
      meanConfidence += field.confidence;
    }
    meanConfidence /= fields.size();
  }
  double extractionRate =
      requiredCount > 0 ? static_cast<double>(requiredFound) / requiredCount
                        : 1.0;
  double dataValidation =
      std::max(0.0, 1.0 - 0.1 * static_cast<double>(result.warnings.size()));
  double overall = 0.30 * meanConfidence + 0.40 * extractionRate +
                   0.20 * context.matchScore + 0.10 * dataValidation;
  result.overallConfidence = std::min(1.0, std::max(0.0, overall));

  bool needsReview =
      !result.isValid || !result.highStakesIssues.empty() ||
      !result.lowConfidenceFields.empty() ||
      static_cast<int>(result.warnings.size()) >= m_config.warningThreshold ||
      result.mandatoryReview;
  result.routing =
      needsReview ? RoutingDecision::Review : RoutingDecision::AutoCommit;

  if (m_verbose) {
    std::cerr << "[ConfidenceValidator] DEBUG: template '" << tmpl.id
              << "' valid=" << result.isValid
              << " missing=" << result.missingFields.size()
              << " lowConfidence=" << result.lowConfidenceFields.size()
              << " highStakes=" << result.highStakesIssues.size()
              << " warnings=" << result.warnings.size()
              << " overall=" << result.overallConfidence
              << " routing=" << toString(result.routing) << std::endl;
  }

  return result;
}

void ConfidenceValidator::applyBusinessRules(
    const std::vector<ExtractedField> &fields, const Template &tmpl,
    ValidationResult &result) const {
  const ExtractedField *totalField = nullptr;
  const ExtractedField *subtotalField = nullptr;
  const ExtractedField *taxField = nullptr;
  const ExtractedField *taxableField = nullptr;

  double lineSum = 0.0;
  int lineCount = 0;

  for (const auto &field : fields) {
    if (field.name == m_config.totalField && totalField == nullptr) {
      totalField = &field;
    } else if (field.name == m_config.subtotalField &&
               subtotalField == nullptr) {
      subtotalField = &field;
    } else if (field.name == m_config.taxField && taxField == nullptr) {
      taxField = &field;
    } else if (field.name == m_config.taxableField &&
               taxableField == nullptr) {
      taxableField = &field;
    } else if (!m_config.lineTotalPrefix.empty() &&
               field.name.rfind(m_config.lineTotalPrefix, 0) == 0) {
      std::optional<double> amount = numericValue(&field);
      if (amount) {
        lineSum += *amount;
        lineCount++;
      }
    }
  }

  std::optional<double> total = numericValue(totalField);
  std::optional<double> subtotal = numericValue(subtotalField);
  std::optional<double> tax = numericValue(taxField);
  std::optional<double> taxable = numericValue(taxableField);

  if (lineCount > 0 && subtotal &&
      std::abs(lineSum - *subtotal) > tolerance(m_config, lineSum)) {
    result.warnings.push_back("line totals sum to " + formatAmount(lineSum) +
                              " but subtotal is " + formatAmount(*subtotal));
  }

  if (tax) {
    std::optional<double> base = taxable ? taxable : subtotal;
    if (base && *base > 0.0) {
      double rate = *tax / *base;
      if (rate < 0.0 || rate > m_config.maxTaxRate) {
        std::ostringstream warning;
        warning << "implied tax rate " << std::fixed << std::setprecision(3)
                << rate << " outside [0, " << m_config.maxTaxRate << "]";
        result.warnings.push_back(warning.str());
      }
    }
  }

  if (total && subtotal && tax) {
    double expected = *subtotal + *tax;
    if (std::abs(*total - expected) > tolerance(m_config, expected)) {
      result.warnings.push_back("total " + formatAmount(*total) +
                                " does not equal subtotal plus tax " +
                                formatAmount(expected));
    }
  }

  if (total && *total <= 0.0 && lineCount > 0) {
    result.warnings.push_back("total is not positive but line items exist");
  }

  std::string today = m_today();
  for (const auto &definition : tmpl.fieldMap) {
    if (definition.type != FieldType::Date) {
      continue;
    }
    for (const auto &field : fields) {
      // ISO dates compare correctly as strings
      if (field.name == definition.name && !field.value.empty() &&
          field.value > today) {
        result.warnings.push_back("date field " + field.name + " (" +
                                  field.value + ") is in the future");
      }
    }
  }
}

} // namespace docintel

#include "ConfidenceValidator.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <iostream>

using namespace docintel;
using docintel::testing::TestReport;

namespace {

ExtractedField field(const std::string &name, const std::string &value,
                     double confidence) {
  ExtractedField f;
  f.name = name;
  f.rawValue = value;
  f.value = value;
  f.confidence = confidence;
  return f;
}

FieldDefinition definition(const std::string &name, FieldType type,
                           bool required) {
  FieldDefinition d;
  d.name = name;
  d.zoneKind = ZoneKind::Table;
  d.type = type;
  d.required = required;
  return d;
}

bool hasReason(const ValidationResult &result, const std::string &reason) {
  return std::find(result.reviewReasons.begin(), result.reviewReasons.end(),
                   reason) != result.reviewReasons.end();
}

void printResult(const ValidationResult &result) {
  std::cout << "    valid=" << (result.isValid ? "yes" : "no")
            << " routing=" << toString(result.routing)
            << " overall=" << result.overallConfidence << std::endl;
  for (const auto &reason : result.reviewReasons) {
    std::cout << "    reason: " << reason << std::endl;
  }
  for (const auto &warning : result.warnings) {
    std::cout << "    warning: " << warning << std::endl;
  }
}

} // namespace

int main() {
  std::cout << "=== Test ConfidenceValidator ===" << std::endl;
  TestReport report;
  ConfidenceValidator validator;
  Template receipt = docintel::testing::receiptTemplate();

  report.section("High-stakes total at 0.995");
  std::vector<ExtractedField> confident = {
      field("vendor_name", "ACME STORE", 0.95),
      field("total_amount", "162.00", 0.995)};
  ValidationResult passed = validator.validate(confident, receipt);
  printResult(passed);
  report.check(passed.isValid, "record is valid");
  report.check(passed.routing == RoutingDecision::AutoCommit,
               "routing is auto_commit");
  report.check(passed.reviewReasons.empty(), "no review reasons");

  report.section("High-stakes total at 0.80");
  std::vector<ExtractedField> doubtful = confident;
  doubtful[1].confidence = 0.80;
  ValidationResult flagged = validator.validate(doubtful, receipt);
  printResult(flagged);
  report.check(flagged.isValid, "value is present so the record is valid");
  report.check(flagged.routing == RoutingDecision::Review,
               "routing flips to review");
  report.check(flagged.highStakesIssues.size() == 1,
               "one high-stakes issue recorded");
  report.check(hasReason(flagged, "high-stakes field below floor: total_amount"),
               "reason names the field");
  report.check(flagged.lowConfidenceFields.empty(),
               "vendor_name is not affected");

  report.section("Required-field gating");
  std::vector<ExtractedField> missing = {
      field("vendor_name", "ACME STORE", 1.0),
      field("total_amount", "", 1.0)};
  ValidationResult gated = validator.validate(missing, receipt);
  printResult(gated);
  report.check(!gated.isValid, "missing required field invalidates");
  report.check(gated.routing == RoutingDecision::Review,
               "missing required field never auto-commits");
  report.check(gated.missingFields.size() == 1 &&
                   gated.missingFields[0] == "total_amount",
               "missing field is listed");
  report.check(hasReason(gated, "missing required field: total_amount"),
               "reason is human readable");

  std::vector<ExtractedField> absent = {field("vendor_name", "ACME", 1.0)};
  report.check(validator.validate(absent, receipt).routing ==
                   RoutingDecision::Review,
               "field absent from the result also gates");

  report.section("Per-field floor");
  Template withFloor = receipt;
  withFloor.fieldMap[0].minConfidence = 0.9;
  std::vector<ExtractedField> lowVendor = confident;
  lowVendor[0].confidence = 0.85;
  ValidationResult floorResult = validator.validate(lowVendor, withFloor);
  report.check(floorResult.lowConfidenceFields.size() == 1,
               "field below its own minimum is flagged");
  report.check(validator.validate(lowVendor, receipt).routing ==
                   RoutingDecision::AutoCommit,
               "same field passes the default floor");

  report.section("Business-rule warnings");
  Template invoice = receipt;
  invoice.fieldMap.push_back(definition("subtotal", FieldType::Currency, false));
  invoice.fieldMap.push_back(
      definition("tax_amount", FieldType::Currency, false));
  invoice.fieldMap.push_back(
      definition("line_total_1", FieldType::Currency, false));
  invoice.fieldMap.push_back(
      definition("line_total_2", FieldType::Currency, false));
  invoice.fieldMap.push_back(
      definition("invoice_date", FieldType::Date, false));

  validator.setTodaySource([]() { return std::string("2024-06-01"); });

  std::vector<ExtractedField> consistent = {
      field("vendor_name", "ACME STORE", 0.95),
      field("total_amount", "162.00", 0.995),
      field("subtotal", "150.00", 0.95),
      field("tax_amount", "12.00", 0.95),
      field("line_total_1", "100.00", 0.95),
      field("line_total_2", "50.00", 0.95),
      field("invoice_date", "2024-05-30", 0.95)};
  ValidationResult clean = validator.validate(consistent, invoice);
  printResult(clean);
  report.check(clean.warnings.empty(), "consistent invoice has no warnings");
  report.check(clean.routing == RoutingDecision::AutoCommit,
               "consistent invoice auto-commits");

  std::vector<ExtractedField> inconsistent = consistent;
  inconsistent[2].value = "140.00";      // line totals no longer add up
  inconsistent[3].value = "40.00";       // tax rate above 15%
  inconsistent[6].value = "2024-07-15";  // future date
  ValidationResult warned = validator.validate(inconsistent, invoice);
  printResult(warned);
  report.check(warned.warnings.size() >= 3, "three or more warnings");
  report.check(warned.isValid, "warnings do not invalidate the record");
  report.check(warned.routing == RoutingDecision::Review,
               "warnings at the threshold route to review");
  report.check(warned.overallConfidence < clean.overallConfidence,
               "warnings lower the overall confidence");

  std::vector<ExtractedField> futureOnly = consistent;
  futureOnly[6].value = "2031-01-01";
  ValidationResult oneWarning = validator.validate(futureOnly, invoice);
  report.check(oneWarning.warnings.size() == 1,
               "future date alone is one warning");
  report.check(oneWarning.routing == RoutingDecision::AutoCommit,
               "a single warning stays below the threshold");

  report.section("Variant match");
  ValidationContext variant;
  variant.matchScore = 0.7;
  variant.variantMatch = true;
  ValidationResult forced = validator.validate(confident, receipt, variant);
  printResult(forced);
  report.check(forced.mandatoryReview, "variant match forces review");
  report.check(forced.routing == RoutingDecision::Review,
               "perfect fields still go to review");
  report.check(hasReason(forced, "variant match requires review"),
               "reason names the variant match");

  report.section("Overall confidence");
  ValidationContext perfect;
  perfect.matchScore = 1.0;
  std::vector<ExtractedField> certain = {field("vendor_name", "ACME", 1.0),
                                         field("total_amount", "1.00", 1.0)};
  report.check(docintel::testing::near(
                   validator.validate(certain, receipt, perfect)
                       .overallConfidence,
                   1.0, 1e-9),
               "perfect record scores 1.0");

  return report.finish();
}

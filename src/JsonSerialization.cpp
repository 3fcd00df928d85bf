#include "JsonSerialization.hpp"

namespace docintel {

using json = nlohmann::json;

void to_json(json &j, const Zone &zone) {
  j = json{{"kind", toString(zone.kind)},
           {"x", zone.xRatio},
           {"y", zone.yRatio},
           {"w", zone.widthRatio},
           {"h", zone.heightRatio},
           {"area", zone.areaRatio}};
}

void from_json(const json &j, Zone &zone) {
  zone.kind = zoneKindFromString(j.at("kind").get<std::string>());
  zone.xRatio = j.value("x", 0.0);
  zone.yRatio = j.value("y", 0.0);
  zone.widthRatio = j.value("w", 0.0);
  zone.heightRatio = j.value("h", 0.0);
  // Template files written by hand usually omit the area
  zone.areaRatio = j.value("area", zone.widthRatio * zone.heightRatio);
}

void to_json(json &j, const StructuralSignature &signature) {
  j = json{{"zones", signature.zones},
           {"total_content_ratio", signature.totalContentRatio}};
}

void from_json(const json &j, StructuralSignature &signature) {
  signature.zones = j.value("zones", std::vector<Zone>());
  sortZones(signature.zones);
  signature.totalContentRatio = j.value("total_content_ratio", 0.0);
}

void to_json(json &j, const RegionRatio &region) {
  j = json{{"x", region.x},
           {"y", region.y},
           {"w", region.width},
           {"h", region.height}};
}

void from_json(const json &j, RegionRatio &region) {
  region.x = j.value("x", 0.0);
  region.y = j.value("y", 0.0);
  region.width = j.value("w", 1.0);
  region.height = j.value("h", 1.0);
}

void to_json(json &j, const FieldDefinition &field) {
  j = json{{"name", field.name},
           {"zone", toString(field.zoneKind)},
           {"zone_index", field.zoneIndex},
           {"region", field.region},
           {"type", toString(field.type)},
           {"required", field.required}};
  if (field.minConfidence) {
    j["min_confidence"] = *field.minConfidence;
  }
}

void from_json(const json &j, FieldDefinition &field) {
  field.name = j.at("name").get<std::string>();
  field.zoneKind = zoneKindFromString(j.value("zone", std::string("other")));
  field.zoneIndex = j.value("zone_index", 0);
  field.region = j.value("region", RegionRatio());
  field.type = fieldTypeFromString(j.value("type", std::string("text")));
  field.required = j.value("required", false);
  if (j.contains("min_confidence") && !j["min_confidence"].is_null()) {
    field.minConfidence = j["min_confidence"].get<double>();
  } else {
    field.minConfidence.reset();
  }
}

void to_json(json &j, const Template &tmpl) {
  j = json{{"id", tmpl.id},
           {"app_id", tmpl.appId},
           {"document_type", tmpl.documentType},
           {"vendor", tmpl.vendor},
           {"format_name", tmpl.formatName},
           {"version", tmpl.version},
           {"field_map", tmpl.fieldMap}};
  if (tmpl.signature) {
    j["signature"] = *tmpl.signature;
  } else {
    j["signature"] = nullptr;
  }
}

void from_json(const json &j, Template &tmpl) {
  tmpl.id = j.at("id").get<std::string>();
  tmpl.appId = j.value("app_id", std::string());
  tmpl.documentType = j.value("document_type", std::string());
  tmpl.vendor = j.value("vendor", std::string());
  tmpl.formatName = j.value("format_name", std::string());
  tmpl.version = j.value("version", 1);
  tmpl.fieldMap = j.value("field_map", std::vector<FieldDefinition>());
  if (j.contains("signature") && !j["signature"].is_null()) {
    tmpl.signature = j["signature"].get<StructuralSignature>();
  } else {
    tmpl.signature.reset();
  }
}

void to_json(json &j, const VariantProposal &proposal) {
  j = json{{"id", proposal.id},
           {"base_template_id", proposal.baseTemplateId},
           {"app_id", proposal.appId},
           {"document_type", proposal.documentType},
           {"vendor", proposal.vendor},
           {"observed_signature", proposal.observedSignature},
           {"similarity", proposal.similarity},
           {"created_at", formatTimestamp(proposal.createdAt)},
           {"submitted", proposal.submitted}};
}

void from_json(const json &j, VariantProposal &proposal) {
  proposal.id = j.at("id").get<std::string>();
  proposal.baseTemplateId = j.value("base_template_id", std::string());
  proposal.appId = j.value("app_id", std::string());
  proposal.documentType = j.value("document_type", std::string());
  proposal.vendor = j.value("vendor", std::string());
  proposal.observedSignature =
      j.value("observed_signature", StructuralSignature());
  proposal.similarity = j.value("similarity", 0.0);
  proposal.createdAt = parseTimestamp(j.at("created_at").get<std::string>());
  proposal.submitted = j.value("submitted", false);
}

void to_json(json &j, const MatchCandidate &candidate) {
  j = json{{"template_id", candidate.templateId},
           {"label", candidate.label},
           {"score", candidate.score}};
}

void from_json(const json &j, MatchCandidate &candidate) {
  candidate.templateId = j.at("template_id").get<std::string>();
  candidate.label = j.value("label", std::string());
  candidate.score = j.value("score", 0.0);
}

void to_json(json &j, const ExtractedField &field) {
  j = json{{"name", field.name},
           {"raw_value", field.rawValue},
           {"value", field.value},
           {"confidence", field.confidence},
           {"source_zone", field.sourceZone}};
}

void from_json(const json &j, ExtractedField &field) {
  field.name = j.at("name").get<std::string>();
  field.rawValue = j.value("raw_value", std::string());
  field.value = j.value("value", std::string());
  field.confidence = j.value("confidence", 0.0);
  field.sourceZone = j.value("source_zone", Zone());
}

void to_json(json &j, const ValidationResult &validation) {
  j = json{{"is_valid", validation.isValid},
           {"missing_fields", validation.missingFields},
           {"low_confidence_fields", validation.lowConfidenceFields},
           {"high_stakes_issues", validation.highStakesIssues},
           {"warnings", validation.warnings},
           {"mandatory_review", validation.mandatoryReview},
           {"overall_confidence", validation.overallConfidence},
           {"routing", toString(validation.routing)},
           {"review_reasons", validation.reviewReasons}};
}

void from_json(const json &j, ValidationResult &validation) {
  using Strings = std::vector<std::string>;
  validation.isValid = j.value("is_valid", false);
  validation.missingFields = j.value("missing_fields", Strings());
  validation.lowConfidenceFields = j.value("low_confidence_fields", Strings());
  validation.highStakesIssues = j.value("high_stakes_issues", Strings());
  validation.warnings = j.value("warnings", Strings());
  validation.mandatoryReview = j.value("mandatory_review", false);
  validation.overallConfidence = j.value("overall_confidence", 0.0);
  validation.routing =
      routingDecisionFromString(j.value("routing", std::string("review")));
  validation.reviewReasons = j.value("review_reasons", Strings());
}

void to_json(json &j, const NormalizationParams &params) {
  j = json{{"skew_angle_degrees", params.skewAngleDegrees},
           {"deskew_applied", params.deskewApplied},
           {"estimated_input_dpi", params.estimatedInputDpi},
           {"scale_factor", params.scaleFactor},
           {"threshold_method", toString(params.thresholdMethod)},
           {"border_crop",
            {params.borderCrop.x, params.borderCrop.y, params.borderCrop.width,
             params.borderCrop.height}},
           {"warnings", params.warnings}};
}

void from_json(const json &j, NormalizationParams &params) {
  params.skewAngleDegrees = j.value("skew_angle_degrees", 0.0);
  params.deskewApplied = j.value("deskew_applied", false);
  params.estimatedInputDpi = j.value("estimated_input_dpi", 0.0);
  params.scaleFactor = j.value("scale_factor", 1.0);
  params.thresholdMethod = binarizationMethodFromString(
      j.value("threshold_method", std::string("otsu")));
  if (j.contains("border_crop") && j["border_crop"].size() == 4) {
    const json &crop = j["border_crop"];
    params.borderCrop = cv::Rect(crop[0].get<int>(), crop[1].get<int>(),
                                 crop[2].get<int>(), crop[3].get<int>());
  }
  params.warnings = j.value("warnings", std::vector<std::string>());
}

void to_json(json &j, const ErrorDetail &error) {
  j = json{{"stage", error.stage},
           {"kind", toString(error.kind)},
           {"message", error.message}};
}

void from_json(const json &j, ErrorDetail &error) {
  error.stage = j.value("stage", std::string());
  error.kind = errorKindFromString(j.value("kind", std::string("exception")));
  error.message = j.value("message", std::string());
}

void to_json(json &j, const StateTransition &transition) {
  j = json{{"state", toString(transition.state)},
           {"at", formatTimestamp(transition.at)}};
}

void from_json(const json &j, StateTransition &transition) {
  transition.state = documentStateFromString(j.at("state").get<std::string>());
  transition.at = parseTimestamp(j.at("at").get<std::string>());
}

void to_json(json &j, const Document &doc) {
  j = json{{"id", doc.id},
           {"source_path", doc.sourcePath},
           {"app_id", doc.appId},
           {"metadata", doc.metadata},
           {"state", toString(doc.state)},
           {"transitions", doc.transitions},
           {"matched_template_id", doc.matchedTemplateId},
           {"match_score", doc.matchScore},
           {"suggestions", doc.suggestions},
           {"variant_proposal_id", doc.variantProposalId},
           {"fields", doc.fields},
           {"review_required", doc.reviewRequired},
           {"review_reasons", doc.reviewReasons}};

  j["error"] = doc.error ? json(*doc.error) : json(nullptr);
  j["normalization"] =
      doc.normalization ? json(*doc.normalization) : json(nullptr);
  j["signature"] = doc.signature ? json(*doc.signature) : json(nullptr);
  j["match_outcome"] =
      doc.matchOutcome ? json(toString(*doc.matchOutcome)) : json(nullptr);
  j["validation"] = doc.validation ? json(*doc.validation) : json(nullptr);
}

void from_json(const json &j, Document &doc) {
  doc.id = j.at("id").get<std::string>();
  doc.sourcePath = j.at("source_path").get<std::string>();
  doc.appId = j.at("app_id").get<std::string>();
  doc.metadata = j.value("metadata", Metadata());
  doc.state = documentStateFromString(j.at("state").get<std::string>());
  doc.transitions = j.value("transitions", std::vector<StateTransition>());
  doc.matchedTemplateId = j.value("matched_template_id", std::string());
  doc.matchScore = j.value("match_score", 0.0);
  doc.suggestions = j.value("suggestions", std::vector<MatchCandidate>());
  doc.variantProposalId = j.value("variant_proposal_id", std::string());
  doc.fields = j.value("fields", std::vector<ExtractedField>());
  doc.reviewRequired = j.value("review_required", false);
  doc.reviewReasons = j.value("review_reasons", std::vector<std::string>());

  auto present = [&j](const char *key) {
    return j.contains(key) && !j[key].is_null();
  };

  doc.error.reset();
  if (present("error")) {
    doc.error = j["error"].get<ErrorDetail>();
  }
  doc.normalization.reset();
  if (present("normalization")) {
    doc.normalization = j["normalization"].get<NormalizationParams>();
  }
  doc.signature.reset();
  if (present("signature")) {
    doc.signature = j["signature"].get<StructuralSignature>();
  }
  doc.matchOutcome.reset();
  if (present("match_outcome")) {
    doc.matchOutcome =
        matchOutcomeFromString(j["match_outcome"].get<std::string>());
  }
  doc.validation.reset();
  if (present("validation")) {
    doc.validation = j["validation"].get<ValidationResult>();
  }
}

} // namespace docintel

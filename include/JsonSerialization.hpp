#ifndef DOCINTEL_JSON_SERIALIZATION_HPP
#define DOCINTEL_JSON_SERIALIZATION_HPP

#include "DocumentTypes.hpp"

#include <nlohmann/json.hpp>

namespace docintel {

// nlohmann::json adapters for the persisted data model. Enums are written
// with their toString() names and timestamps as ISO-8601 UTC strings.

void to_json(nlohmann::json &j, const Zone &zone);
void from_json(const nlohmann::json &j, Zone &zone);

void to_json(nlohmann::json &j, const StructuralSignature &signature);
void from_json(const nlohmann::json &j, StructuralSignature &signature);

void to_json(nlohmann::json &j, const RegionRatio &region);
void from_json(const nlohmann::json &j, RegionRatio &region);

void to_json(nlohmann::json &j, const FieldDefinition &field);
void from_json(const nlohmann::json &j, FieldDefinition &field);

void to_json(nlohmann::json &j, const Template &tmpl);
void from_json(const nlohmann::json &j, Template &tmpl);

void to_json(nlohmann::json &j, const VariantProposal &proposal);
void from_json(const nlohmann::json &j, VariantProposal &proposal);

void to_json(nlohmann::json &j, const MatchCandidate &candidate);
void from_json(const nlohmann::json &j, MatchCandidate &candidate);

void to_json(nlohmann::json &j, const ExtractedField &field);
void from_json(const nlohmann::json &j, ExtractedField &field);

void to_json(nlohmann::json &j, const ValidationResult &validation);
void from_json(const nlohmann::json &j, ValidationResult &validation);

void to_json(nlohmann::json &j, const NormalizationParams &params);
void from_json(const nlohmann::json &j, NormalizationParams &params);

void to_json(nlohmann::json &j, const ErrorDetail &error);
void from_json(const nlohmann::json &j, ErrorDetail &error);

void to_json(nlohmann::json &j, const StateTransition &transition);
void from_json(const nlohmann::json &j, StateTransition &transition);

void to_json(nlohmann::json &j, const Document &doc);
void from_json(const nlohmann::json &j, Document &doc);

} // namespace docintel

#endif // DOCINTEL_JSON_SERIALIZATION_HPP

#include "FieldExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace docintel {

namespace {

double clampRatio(double value) { return std::min(1.0, std::max(0.0, value)); }

std::string collapseWhitespace(const std::string &text) {
  std::string result;
  bool pendingSpace = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pendingSpace = !result.empty();
      continue;
    }
    if (pendingSpace) {
      result += ' ';
      pendingSpace = false;
    }
    result += c;
  }
  return result;
}

std::string parseCurrency(const std::string &raw) {
  std::string text = raw;
  text.erase(std::remove(text.begin(), text.end(), ','), text.end());

  static const std::regex amount(R"(\$?\s*(\d+(?:\.\d+)?))");
  std::smatch match;
  if (!std::regex_search(text, match, amount)) {
    return "";
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << std::stod(match[1].str());
  return out.str();
}

std::string formatDate(int year, int month, int day) {
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return "";
  }
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2)
      << month << '-' << std::setw(2) << day;
  return out.str();
}

std::string parseDate(const std::string &raw) {
  static const std::regex isoDate(R"((\d{4})[/-](\d{1,2})[/-](\d{1,2}))");
  static const std::regex usDate(R"((\d{1,2})[/-](\d{1,2})[/-](\d{2,4}))");

  std::smatch match;
  if (std::regex_search(raw, match, isoDate)) {
    return formatDate(std::stoi(match[1].str()), std::stoi(match[2].str()),
                      std::stoi(match[3].str()));
  }
  if (std::regex_search(raw, match, usDate)) {
    int year = std::stoi(match[3].str());
    if (match[3].length() == 2) {
      year += year < 50 ? 2000 : 1900;
    }
    return formatDate(year, std::stoi(match[1].str()),
                      std::stoi(match[2].str()));
  }
  return "";
}

std::string parseInteger(const std::string &raw) {
  std::string digits;
  for (char c : raw) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits += c;
    }
  }
  return digits;
}

std::string parseIdentifier(const std::string &raw) {
  static const std::regex labelled(
      R"((?:receipt|invoice|inv|number|no|#)[\s#:.]*([A-Za-z0-9-]*[0-9][A-Za-z0-9-]*))",
      std::regex::icase);
  static const std::regex token(R"([A-Za-z0-9][A-Za-z0-9-]*)");

  std::smatch match;
  if (std::regex_search(raw, match, labelled)) {
    return match[1].str();
  }
  if (std::regex_search(raw, match, token)) {
    return match[0].str();
  }
  return "";
}

} // namespace

std::string normalizeFieldValue(FieldType type, const std::string &raw) {
  try {
    switch (type) {
    case FieldType::Currency:
      return parseCurrency(raw);
    case FieldType::Date:
      return parseDate(raw);
    case FieldType::Integer:
      return parseInteger(raw);
    case FieldType::Identifier:
      return parseIdentifier(raw);
    case FieldType::Text:
    default:
      return collapseWhitespace(raw);
    }
  } catch (const std::out_of_range &) {
    // Digit runs too long for stoi/stod
    return "";
  }
}

FieldExtractor::FieldExtractor(std::shared_ptr<TextRecognizer> recognizer,
                               const ExtractorConfig &config, bool verbose)
    : m_recognizer(std::move(recognizer)), m_config(config),
      m_verbose(verbose) {
  if (!m_recognizer) {
    throw std::invalid_argument("FieldExtractor requires a text recognizer");
  }
}

std::optional<Zone>
FieldExtractor::locateField(const FieldDefinition &field,
                            const StructuralSignature &reference) {
  std::vector<const Zone *> zones = zonesOfKind(reference, field.zoneKind);
  if (field.zoneIndex >= 0 &&
      static_cast<size_t>(field.zoneIndex) < zones.size()) {
    const Zone &zone = *zones[field.zoneIndex];

    Zone located;
    located.kind = zone.kind;
    located.xRatio = clampRatio(zone.xRatio + field.region.x * zone.widthRatio);
    located.yRatio =
        clampRatio(zone.yRatio + field.region.y * zone.heightRatio);
    located.widthRatio = clampRatio(
        std::min(field.region.width * zone.widthRatio, 1.0 - located.xRatio));
    located.heightRatio = clampRatio(std::min(
        field.region.height * zone.heightRatio, 1.0 - located.yRatio));
    located.areaRatio = located.widthRatio * located.heightRatio;
    return located;
  }
  return std::nullopt;
}

double FieldExtractor::zoneOverlap(const Zone &a, const Zone &b) {
  double left = std::max(a.xRatio, b.xRatio);
  double top = std::max(a.yRatio, b.yRatio);
  double right = std::min(a.xRatio + a.widthRatio, b.xRatio + b.widthRatio);
  double bottom = std::min(a.yRatio + a.heightRatio, b.yRatio + b.heightRatio);

  double intersection =
      std::max(0.0, right - left) * std::max(0.0, bottom - top);
  double unionArea = a.widthRatio * a.heightRatio +
                     b.widthRatio * b.heightRatio - intersection;
  return unionArea > 0.0 ? intersection / unionArea : 0.0;
}

double FieldExtractor::driftFactor(const Zone &templateZone,
                                   const StructuralSignature &observed) const {
  double best = 0.0;
  for (const auto &zone : observed.zones) {
    if (zone.kind == templateZone.kind) {
      best = std::max(best, zoneOverlap(templateZone, zone));
    }
  }

  if (best >= m_config.minZoneOverlap) {
    return 1.0;
  }
  double scaled =
      m_config.minZoneOverlap > 0.0 ? best / m_config.minZoneOverlap : 0.0;
  return std::max(m_config.driftConfidenceFloor, scaled);
}

std::vector<ExtractedField>
FieldExtractor::extract(const NormalizedImage &normalized, const Template &tmpl,
                        const std::optional<StructuralSignature> &observed)
    const {
  if (!tmpl.signature) {
    throw std::invalid_argument("Template '" + tmpl.id +
                                "' has no reference signature");
  }

  const cv::Mat &image = normalized.image;
  std::vector<ExtractedField> fields;

  for (const auto &definition : tmpl.fieldMap) {
    ExtractedField field;
    field.name = definition.name;

    std::optional<Zone> region = locateField(definition, *tmpl.signature);
    if (!region) {
      std::cerr << "[FieldExtractor] Warning: template '" << tmpl.id
                << "' has no " << toString(definition.zoneKind) << " zone #"
                << definition.zoneIndex << " for field '" << definition.name
                << "'" << std::endl;
      fields.push_back(field);
      continue;
    }
    field.sourceZone = *region;

    cv::Rect pixels(
        static_cast<int>(std::floor(region->xRatio * image.cols)),
        static_cast<int>(std::floor(region->yRatio * image.rows)),
        static_cast<int>(std::ceil(region->widthRatio * image.cols)),
        static_cast<int>(std::ceil(region->heightRatio * image.rows)));
    pixels &= cv::Rect(0, 0, image.cols, image.rows);

    if (pixels.empty()) {
      fields.push_back(field);
      continue;
    }

    RecognitionResult recognized = m_recognizer->recognize(image(pixels));
    if (!recognized.success) {
      std::cerr << "[FieldExtractor] Warning: recognition failed for field '"
                << definition.name << "': " << recognized.errorMessage
                << std::endl;
      fields.push_back(field);
      continue;
    }

    field.rawValue = recognized.text;
    field.value = normalizeFieldValue(definition.type, recognized.text);
    field.confidence = std::min(1.0, std::max(0.0, recognized.confidence));

    if (field.value.empty()) {
      field.confidence *= 0.5;
    }

    if (observed) {
      // Drift is judged on the whole template zone, not the sub-region
      std::vector<const Zone *> zones =
          zonesOfKind(*tmpl.signature, definition.zoneKind);
      if (definition.zoneIndex >= 0 &&
          static_cast<size_t>(definition.zoneIndex) < zones.size()) {
        field.confidence *=
            driftFactor(*zones[definition.zoneIndex], *observed);
      }
    }

    if (m_verbose) {
      std::cerr << "[FieldExtractor] DEBUG: " << definition.name << " = '"
                << field.value << "' (" << field.confidence << ")"
                << std::endl;
    }

    fields.push_back(field);
  }

  return fields;
}

} // namespace docintel

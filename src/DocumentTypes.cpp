#include "DocumentTypes.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docintel {

namespace {

bool zoneReadsBefore(const Zone &a, const Zone &b) {
  if (a.yRatio != b.yRatio) {
    return a.yRatio < b.yRatio;
  }
  return a.xRatio < b.xRatio;
}

} // namespace

void sortZones(std::vector<Zone> &zones) {
  std::stable_sort(zones.begin(), zones.end(), zoneReadsBefore);
}

std::vector<const Zone *> zonesOfKind(const StructuralSignature &signature,
                                      ZoneKind kind) {
  std::vector<const Zone *> matching;
  for (const auto &zone : signature.zones) {
    if (zone.kind == kind) {
      matching.push_back(&zone);
    }
  }
  std::stable_sort(matching.begin(), matching.end(),
                   [](const Zone *a, const Zone *b) {
                     return zoneReadsBefore(*a, *b);
                   });
  return matching;
}

std::string Template::label() const {
  std::string text = vendor.empty() ? id : vendor;
  if (!formatName.empty()) {
    text += " / " + formatName;
  }
  return text;
}

bool MatchResult::proceedsToExtraction() const {
  return bestTemplate.has_value() && (outcome == MatchOutcome::AutoMatch ||
                                      outcome == MatchOutcome::VariantMatch);
}

bool isTerminal(DocumentState state) {
  return state == DocumentState::Review || state == DocumentState::Completed ||
         state == DocumentState::Failed;
}

std::string toString(ZoneKind kind) {
  switch (kind) {
  case ZoneKind::Header:
    return "header";
  case ZoneKind::Table:
    return "table";
  case ZoneKind::Footer:
    return "footer";
  case ZoneKind::Logo:
    return "logo";
  case ZoneKind::Other:
  default:
    return "other";
  }
}

std::string toString(FieldType type) {
  switch (type) {
  case FieldType::Currency:
    return "currency";
  case FieldType::Date:
    return "date";
  case FieldType::Integer:
    return "integer";
  case FieldType::Identifier:
    return "identifier";
  case FieldType::Text:
  default:
    return "text";
  }
}

std::string toString(MatchOutcome outcome) {
  switch (outcome) {
  case MatchOutcome::AutoMatch:
    return "auto_match";
  case MatchOutcome::VariantMatch:
    return "variant_match";
  case MatchOutcome::NoMatch:
    return "no_match";
  case MatchOutcome::NoTemplatesAvailable:
  default:
    return "no_templates_available";
  }
}

std::string toString(RoutingDecision decision) {
  switch (decision) {
  case RoutingDecision::AutoCommit:
    return "auto_commit";
  case RoutingDecision::Fail:
    return "fail";
  case RoutingDecision::Review:
  default:
    return "review";
  }
}

std::string toString(DocumentState state) {
  switch (state) {
  case DocumentState::Pending:
    return "pending";
  case DocumentState::Preprocessing:
    return "preprocessing";
  case DocumentState::Matching:
    return "matching";
  case DocumentState::Extracting:
    return "extracting";
  case DocumentState::Review:
    return "review";
  case DocumentState::Completed:
    return "completed";
  case DocumentState::Failed:
  default:
    return "failed";
  }
}

std::string toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Exception:
  default:
    return "exception";
  }
}

std::string toString(BinarizationMethod method) {
  return method == BinarizationMethod::Gaussian ? "gaussian" : "otsu";
}

ZoneKind zoneKindFromString(const std::string &name) {
  if (name == "header")
    return ZoneKind::Header;
  if (name == "table")
    return ZoneKind::Table;
  if (name == "footer")
    return ZoneKind::Footer;
  if (name == "logo")
    return ZoneKind::Logo;
  if (name == "other")
    return ZoneKind::Other;
  throw std::invalid_argument("Unknown zone kind: " + name);
}

FieldType fieldTypeFromString(const std::string &name) {
  if (name == "text")
    return FieldType::Text;
  if (name == "currency")
    return FieldType::Currency;
  if (name == "date")
    return FieldType::Date;
  if (name == "integer")
    return FieldType::Integer;
  if (name == "identifier")
    return FieldType::Identifier;
  throw std::invalid_argument("Unknown field type: " + name);
}

MatchOutcome matchOutcomeFromString(const std::string &name) {
  if (name == "auto_match")
    return MatchOutcome::AutoMatch;
  if (name == "variant_match")
    return MatchOutcome::VariantMatch;
  if (name == "no_match")
    return MatchOutcome::NoMatch;
  if (name == "no_templates_available")
    return MatchOutcome::NoTemplatesAvailable;
  throw std::invalid_argument("Unknown match outcome: " + name);
}

RoutingDecision routingDecisionFromString(const std::string &name) {
  if (name == "auto_commit")
    return RoutingDecision::AutoCommit;
  if (name == "review")
    return RoutingDecision::Review;
  if (name == "fail")
    return RoutingDecision::Fail;
  throw std::invalid_argument("Unknown routing decision: " + name);
}

DocumentState documentStateFromString(const std::string &name) {
  if (name == "pending")
    return DocumentState::Pending;
  if (name == "preprocessing")
    return DocumentState::Preprocessing;
  if (name == "matching")
    return DocumentState::Matching;
  if (name == "extracting")
    return DocumentState::Extracting;
  if (name == "review")
    return DocumentState::Review;
  if (name == "completed")
    return DocumentState::Completed;
  if (name == "failed")
    return DocumentState::Failed;
  throw std::invalid_argument("Unknown document state: " + name);
}

ErrorKind errorKindFromString(const std::string &name) {
  if (name == "exception")
    return ErrorKind::Exception;
  if (name == "timeout")
    return ErrorKind::Timeout;
  if (name == "cancelled")
    return ErrorKind::Cancelled;
  throw std::invalid_argument("Unknown error kind: " + name);
}

BinarizationMethod binarizationMethodFromString(const std::string &name) {
  if (name == "otsu")
    return BinarizationMethod::Otsu;
  if (name == "gaussian")
    return BinarizationMethod::Gaussian;
  throw std::invalid_argument("Unknown binarization method: " + name);
}

std::string formatTimestamp(Clock::time_point tp) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    tp.time_since_epoch())
                    .count();
  std::time_t seconds = static_cast<std::time_t>(millis / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (millis % 1000) << 'Z';
  return out.str();
}

Clock::time_point parseTimestamp(const std::string &text) {
  std::tm utc{};
  std::istringstream in(text);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    throw std::invalid_argument("Invalid timestamp: " + text);
  }

  int millis = 0;
  if (in.peek() == '.') {
    in.get();
    in >> millis;
  }

  std::time_t seconds = timegm(&utc);
  return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

} // namespace docintel

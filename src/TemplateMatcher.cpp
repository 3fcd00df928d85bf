#include "TemplateMatcher.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace docintel {

TemplateMatcher::TemplateMatcher(const MatcherConfig &config)
    : m_config(config) {}

const MatcherConfig &TemplateMatcher::getConfig() const { return m_config; }

MatchOutcome TemplateMatcher::classifyScore(double score) const {
  if (score >= m_config.autoMatchThreshold) {
    return MatchOutcome::AutoMatch;
  }
  if (score >= m_config.partialMatchThreshold) {
    return MatchOutcome::VariantMatch;
  }
  return MatchOutcome::NoMatch;
}

MatchResult TemplateMatcher::match(const StructuralSignature &signature,
                                   const std::vector<Template> &candidates) const {
  MatchResult result;

  if (candidates.empty()) {
    result.outcome = MatchOutcome::NoTemplatesAvailable;
    return result;
  }

  std::vector<double> scores;
  scores.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    scores.push_back(candidate.signature
                         ? compareSignatures(signature, *candidate.signature)
                         : 0.0);
  }

  std::vector<size_t> order(candidates.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&scores](size_t a, size_t b) {
    return scores[a] > scores[b];
  });

  for (size_t index : order) {
    MatchCandidate entry;
    entry.templateId = candidates[index].id;
    entry.label = candidates[index].label();
    entry.score = scores[index];
    result.ranked.push_back(entry);
  }

  size_t suggestionCount = std::min(
      result.ranked.size(),
      static_cast<size_t>(std::max(0, m_config.suggestionCount)));
  result.suggestions.assign(result.ranked.begin(),
                            result.ranked.begin() + suggestionCount);

  const size_t best = order.front();
  result.score = scores[best];
  result.outcome = classifyScore(result.score);
  if (result.outcome != MatchOutcome::NoMatch) {
    result.bestTemplate = candidates[best];
  }

  return result;
}

double TemplateMatcher::compareSignatures(
    const StructuralSignature &observed,
    const StructuralSignature &reference) const {
  const auto &zones1 = observed.zones;
  const auto &zones2 = reference.zones;

  if (zones1.empty() && zones2.empty()) {
    return 1.0;
  }
  if (zones1.empty() || zones2.empty()) {
    return 0.0;
  }

  double maxZones = static_cast<double>(std::max(zones1.size(), zones2.size()));
  double countDiff = std::abs(static_cast<double>(zones1.size()) -
                              static_cast<double>(zones2.size()));
  double countScore = 1.0 - countDiff / maxZones;

  double areaDiff =
      std::abs(observed.totalContentRatio - reference.totalContentRatio);
  double areaScore = 1.0 - std::min(areaDiff, 1.0);

  std::vector<double> zoneScores;
  for (ZoneKind kind : {ZoneKind::Header, ZoneKind::Table, ZoneKind::Footer,
                        ZoneKind::Logo, ZoneKind::Other}) {
    // Paired top to bottom within each kind
    std::vector<const Zone *> list1 = zonesOfKind(observed, kind);
    std::vector<const Zone *> list2 = zonesOfKind(reference, kind);
    size_t paired = std::min(list1.size(), list2.size());

    for (size_t i = 0; i < paired; ++i) {
      zoneScores.push_back(zoneSimilarity(*list1[i], *list2[i]));
    }

    // Unpaired "other" blocks are usually noise
    if (kind != ZoneKind::Other) {
      size_t unpaired = std::max(list1.size(), list2.size()) - paired;
      zoneScores.insert(zoneScores.end(), unpaired, 0.0);
    }
  }

  double geometryScore = 0.0;
  if (!zoneScores.empty()) {
    geometryScore =
        std::accumulate(zoneScores.begin(), zoneScores.end(), 0.0) /
        zoneScores.size();
  }

  double weightSum = m_config.zoneCountWeight + m_config.contentRatioWeight +
                     m_config.zoneGeometryWeight;
  if (weightSum <= 0.0) {
    return 0.0;
  }

  double score = (m_config.zoneCountWeight * countScore +
                  m_config.contentRatioWeight * areaScore +
                  m_config.zoneGeometryWeight * geometryScore) /
                 weightSum;
  return std::min(1.0, std::max(0.0, score));
}

double TemplateMatcher::zoneSimilarity(const Zone &a, const Zone &b) const {
  double dx = a.xRatio - b.xRatio;
  double dy = a.yRatio - b.yRatio;
  double dw = a.widthRatio - b.widthRatio;
  double dh = a.heightRatio - b.heightRatio;
  double da = a.areaRatio - b.areaRatio;
  double distance = std::sqrt(dx * dx + dy * dy + dw * dw + dh * dh + da * da);
  return std::exp(-distance * m_config.zoneDistanceDecay);
}

} // namespace docintel

#ifndef DOCINTEL_TEMPLATE_MATCHER_HPP
#define DOCINTEL_TEMPLATE_MATCHER_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"

#include <vector>

namespace docintel {

/**
 * @brief Scores a document signature against candidate templates
 *
 * match() is a pure function of its inputs. Every candidate is scored;
 * the ranking is a stable sort by descending score, so the first-seen
 * candidate wins an exact tie.
 */
class TemplateMatcher {
public:
  explicit TemplateMatcher(const MatcherConfig &config = MatcherConfig());

  /**
   * @brief Match a signature against a candidate list
   * @param signature Signature of the document
   * @param candidates Templates to consider; ones without a signature score 0
   * @return MatchResult; outcome is NoTemplatesAvailable for an empty list
   */
  MatchResult match(const StructuralSignature &signature,
                    const std::vector<Template> &candidates) const;

  /**
   * @brief Composite similarity of two signatures in [0, 1]
   *
   * Weighted blend of zone-count similarity, total-content-ratio similarity
   * and per-zone geometry similarity. Zones are paired per kind in
   * top-to-bottom order.
   */
  double compareSignatures(const StructuralSignature &observed,
                           const StructuralSignature &reference) const;

  /**
   * @brief Outcome implied by a score under the configured thresholds
   */
  MatchOutcome classifyScore(double score) const;

  const MatcherConfig &getConfig() const;

private:
  double zoneSimilarity(const Zone &a, const Zone &b) const;

  MatcherConfig m_config;
};

} // namespace docintel

#endif // DOCINTEL_TEMPLATE_MATCHER_HPP

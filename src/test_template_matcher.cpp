#include "TemplateMatcher.hpp"
#include "TestSupport.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <utility>

using namespace docintel;
using docintel::testing::TestReport;
using docintel::testing::makeZone;
using docintel::testing::receiptSignature;

namespace {

Template templateWith(const std::string &id,
                      const std::optional<StructuralSignature> &signature) {
  Template tmpl;
  tmpl.id = id;
  tmpl.appId = "hq";
  tmpl.documentType = "receipt";
  tmpl.vendor = id;
  tmpl.signature = signature;
  return tmpl;
}

StructuralSignature invoiceSignature() {
  StructuralSignature signature;
  signature.zones.push_back(makeZone(ZoneKind::Logo, 0.05, 0.02, 0.1, 0.08));
  signature.zones.push_back(makeZone(ZoneKind::Other, 0.6, 0.05, 0.35, 0.1));
  signature.zones.push_back(makeZone(ZoneKind::Table, 0.05, 0.3, 0.9, 0.4));
  signature.totalContentRatio = 0.4;
  return signature;
}

} // namespace

int main() {
  std::cout << "=== Test TemplateMatcher ===" << std::endl;
  TestReport report;
  TemplateMatcher matcher;

  StructuralSignature observed = receiptSignature();
  observed.zones[1].heightRatio = 0.68;
  observed.zones[1].areaRatio = 0.68;

  std::vector<Template> candidates = {
      templateWith("invoice", invoiceSignature()),
      templateWith("receipt", receiptSignature()),
      templateWith("unsigned", std::nullopt)};

  report.section("Ranking");
  MatchResult first = matcher.match(observed, candidates);
  for (const auto &entry : first.ranked) {
    std::cout << "    " << std::setw(10) << std::left << entry.templateId
              << std::right << std::fixed << std::setprecision(4)
              << entry.score << std::endl;
  }
  report.check(first.outcome == MatchOutcome::AutoMatch,
               "near-identical layout auto-matches");
  report.check(first.bestTemplate && first.bestTemplate->id == "receipt",
               "best template is the receipt");
  report.check(first.ranked.size() == 3, "every candidate is ranked");
  report.check(!first.ranked.empty() && first.ranked.back().score == 0.0,
               "template without a signature scores zero");
  report.check(first.proceedsToExtraction(), "auto match proceeds");

  report.section("Determinism");
  bool identical = true;
  for (int i = 0; i < 20 && identical; ++i) {
    MatchResult again = matcher.match(observed, candidates);
    identical = again.score == first.score &&
                again.bestTemplate->id == first.bestTemplate->id &&
                again.ranked.size() == first.ranked.size();
    for (size_t k = 0; identical && k < again.ranked.size(); ++k) {
      identical = again.ranked[k].templateId == first.ranked[k].templateId &&
                  again.ranked[k].score == first.ranked[k].score;
    }
  }
  report.check(identical, "repeated matching yields identical results");

  report.section("Tie-break");
  std::vector<Template> twins = {templateWith("first", receiptSignature()),
                                 templateWith("second", receiptSignature())};
  MatchResult tie = matcher.match(receiptSignature(), twins);
  report.check(tie.score == 1.0, "identical signature scores 1.0");
  report.check(tie.bestTemplate && tie.bestTemplate->id == "first",
               "equal scores keep candidate order");

  report.section("Threshold boundaries");
  const double autoThreshold = matcher.getConfig().autoMatchThreshold;
  const double partialThreshold = matcher.getConfig().partialMatchThreshold;
  report.check(matcher.classifyScore(autoThreshold) == MatchOutcome::AutoMatch,
               "score exactly at auto threshold auto-matches");
  report.check(matcher.classifyScore(std::nextafter(autoThreshold, 0.0)) ==
                   MatchOutcome::VariantMatch,
               "one unit below auto threshold is a variant");
  report.check(matcher.classifyScore(partialThreshold) ==
                   MatchOutcome::VariantMatch,
               "score exactly at partial threshold is a variant");
  report.check(matcher.classifyScore(std::nextafter(partialThreshold, 0.0)) ==
                   MatchOutcome::NoMatch,
               "below partial threshold skips extraction");

  report.section("Empty library vs. poor match");
  MatchResult empty = matcher.match(observed, {});
  report.check(empty.outcome == MatchOutcome::NoTemplatesAvailable,
               "no candidates is reported as no templates available");
  report.check(!empty.bestTemplate && empty.ranked.empty(),
               "no best template and no ranking");

  MatchResult poor =
      matcher.match(observed, {templateWith("unsigned", std::nullopt)});
  report.check(poor.outcome == MatchOutcome::NoMatch,
               "zero-scoring candidates are a plain no-match");
  report.check(poor.ranked.size() == 1,
               "no-match still carries the ranked candidate");
  report.check(!poor.proceedsToExtraction() && !empty.proceedsToExtraction(),
               "neither proceeds to extraction");

  report.section("Signature comparison");
  report.check(matcher.compareSignatures(StructuralSignature(),
                                         StructuralSignature()) == 1.0,
               "two empty signatures are identical");
  report.check(matcher.compareSignatures(observed, StructuralSignature()) ==
                   0.0,
               "empty against non-empty scores zero");

  StructuralSignature withNoise = receiptSignature();
  withNoise.zones.push_back(makeZone(ZoneKind::Other, 0.4, 0.5, 0.02, 0.01));
  double noisy = matcher.compareSignatures(withNoise, receiptSignature());
  double missingFooter = 0.0;
  {
    StructuralSignature truncated = receiptSignature();
    truncated.zones.pop_back();
    missingFooter = matcher.compareSignatures(truncated, receiptSignature());
  }
  std::cout << "    extra noise block: " << noisy
            << ", missing footer: " << missingFooter << std::endl;
  report.check(noisy > missingFooter,
               "stray other block costs less than a missing footer");

  report.section("Zone order in stored signatures");
  StructuralSignature twoTables;
  twoTables.zones.push_back(makeZone(ZoneKind::Header, 0.0, 0.0, 1.0, 0.15));
  twoTables.zones.push_back(makeZone(ZoneKind::Table, 0.0, 0.2, 1.0, 0.3));
  twoTables.zones.push_back(makeZone(ZoneKind::Table, 0.0, 0.6, 1.0, 0.2));
  twoTables.zones.push_back(makeZone(ZoneKind::Footer, 0.0, 0.85, 1.0, 0.15));
  twoTables.totalContentRatio = 0.8;

  StructuralSignature bottomFirst = twoTables;
  std::swap(bottomFirst.zones[1], bottomFirst.zones[2]);
  std::swap(bottomFirst.zones[0], bottomFirst.zones[3]);

  double inOrder = matcher.compareSignatures(twoTables, twoTables);
  double shuffled = matcher.compareSignatures(twoTables, bottomFirst);
  std::cout << "    listed top-down: " << inOrder
            << ", listed bottom-up: " << shuffled << std::endl;
  report.check(std::abs(inOrder - 1.0) < 1e-9 &&
                   std::abs(shuffled - 1.0) < 1e-9,
               "same layout scores 1.0 whatever order zones are listed in");
  report.check(std::abs(matcher.compareSignatures(bottomFirst, twoTables) -
                        1.0) < 1e-9,
               "order of the observed signature does not matter either");

  return report.finish();
}

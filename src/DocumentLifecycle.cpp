#include "DocumentLifecycle.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <thread>

namespace docintel {

namespace {

struct MatchingOutput {
  StructuralSignature signature;
  MatchResult match;
};

struct ExtractionOutput {
  std::vector<ExtractedField> fields;
  ValidationResult validation;
  std::string templateId;
};

// Runs work on a detached thread when a timeout is set. A timed-out stage
// keeps running until it finishes on its own; its result is dropped.
template <typename Result>
Result runWithTimeout(const std::string &stage, long timeoutMs,
                      std::function<Result()> work) {
  if (timeoutMs <= 0) {
    return work();
  }

  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(work));
  std::future<Result> future = task->get_future();
  std::thread([task]() { (*task)(); }).detach();

  if (future.wait_for(std::chrono::milliseconds(timeoutMs)) !=
      std::future_status::ready) {
    throw StageTimeoutError(stage, timeoutMs);
  }
  return future.get();
}

} // namespace

StageTimeoutError::StageTimeoutError(const std::string &stage, long timeoutMs)
    : std::runtime_error("stage '" + stage + "' exceeded its timeout of " +
                         std::to_string(timeoutMs) + " ms") {}

DocumentLifecycle::DocumentLifecycle(LifecycleComponents components,
                                     const LifecycleConfig &config,
                                     bool verbose)
    : m_components(std::move(components)), m_config(config),
      m_verbose(verbose) {
  if (!m_components.normalizer || !m_components.signatureExtractor ||
      !m_components.library || !m_components.matcher ||
      !m_components.fieldExtractor || !m_components.validator ||
      !m_components.store) {
    throw std::invalid_argument(
        "DocumentLifecycle requires every component except the sink");
  }

  double pdfDpi = m_components.normalizer->getConfig().pdfRenderDpi;
  m_rasterSource = [pdfDpi](const std::string &path) {
    return loadRaster(path, pdfDpi);
  };
}

void DocumentLifecycle::setRasterSource(RasterSource source) {
  m_rasterSource = std::move(source);
}

DocumentState DocumentLifecycle::run(Document &doc,
                                     const CancelCheck &isCancelled) {
  while (!isTerminal(doc.state)) {
    const std::string stage = toString(doc.state);

    if (isCancelled && isCancelled()) {
      fail(doc, stage, ErrorKind::Cancelled, "cancelled before " + stage);
      break;
    }

    try {
      switch (doc.state) {
      case DocumentState::Pending:
        transition(doc, DocumentState::Preprocessing);
        break;
      case DocumentState::Preprocessing:
        runPreprocessing(doc);
        break;
      case DocumentState::Matching:
        runMatching(doc);
        break;
      case DocumentState::Extracting:
        runExtracting(doc);
        break;
      default:
        break;
      }
    } catch (const StageTimeoutError &e) {
      fail(doc, stage, ErrorKind::Timeout, e.what());
    } catch (const std::exception &e) {
      fail(doc, stage, ErrorKind::Exception, e.what());
    } catch (...) {
      fail(doc, stage, ErrorKind::Exception, "unknown exception");
    }
  }

  return doc.state;
}

void DocumentLifecycle::transition(Document &doc, DocumentState next) {
  DocumentState previous = doc.state;

  StateTransition record;
  record.state = next;
  record.at = Clock::now();

  doc.state = next;
  doc.transitions.push_back(record);
  m_components.store->save(doc);

  std::cerr << "[DocumentLifecycle] " << doc.id << ": " << toString(previous)
            << " -> " << toString(next) << std::endl;
}

void DocumentLifecycle::fail(Document &doc, const std::string &stage,
                             ErrorKind kind, const std::string &message) {
  ErrorDetail detail;
  detail.stage = stage;
  detail.kind = kind;
  detail.message = message;
  doc.error = detail;

  std::cerr << "[DocumentLifecycle] Error: document " << doc.id
            << " failed in stage '" << stage << "' (" << toString(kind)
            << "): " << message << std::endl;

  transition(doc, DocumentState::Failed);
}

NormalizedImage DocumentLifecycle::loadArtifact(const Document &doc) const {
  NormalizedImage normalized;
  normalized.image = m_components.store->loadNormalizedImage(doc.id);
  if (normalized.image.empty()) {
    throw std::runtime_error("normalized image of document " + doc.id +
                             " is missing");
  }
  normalized.params = doc.normalization.value_or(NormalizationParams());
  return normalized;
}

void DocumentLifecycle::runPreprocessing(Document &doc) {
  auto normalizer = m_components.normalizer;
  RasterSource source = m_rasterSource;
  std::string path = doc.sourcePath;

  NormalizedImage normalized = runWithTimeout<NormalizedImage>(
      "preprocessing", m_config.preprocessingTimeoutMs,
      [normalizer, source, path]() {
        RasterLoadResult raster = source(path);
        if (!raster.success) {
          throw std::runtime_error(raster.errorMessage);
        }
        return normalizer->normalize(raster.image, raster.knownDpi);
      });

  m_components.store->saveNormalizedImage(doc.id, normalized.image);
  doc.normalization = normalized.params;
  transition(doc, DocumentState::Matching);
}

void DocumentLifecycle::runMatching(Document &doc) {
  NormalizedImage normalized = loadArtifact(doc);

  auto extractor = m_components.signatureExtractor;
  auto library = m_components.library;
  auto matcher = m_components.matcher;
  std::string appId = doc.appId;
  std::string docId = doc.id;

  MatchingOutput output = runWithTimeout<MatchingOutput>(
      "matching", m_config.matchingTimeoutMs,
      [normalized, extractor, library, matcher, appId, docId]() {
        MatchingOutput out;
        out.signature = extractor->extract(normalized);

        std::vector<Template> candidates = library->candidates(appId);
        if (candidates.empty()) {
          std::cerr << "[DocumentLifecycle] " << docId
                    << ": no templates cached for scope '" << appId
                    << "', forcing a refresh" << std::endl;
          library->refresh(appId, true);
          candidates = library->candidates(appId);
        }

        out.match = matcher->match(out.signature, candidates);
        return out;
      });

  const MatchResult &match = output.match;
  doc.signature = output.signature;
  doc.matchOutcome = match.outcome;
  doc.matchScore = match.score;
  doc.suggestions = match.suggestions;
  doc.matchedTemplateId = match.bestTemplate ? match.bestTemplate->id : "";

  // Proposed only once the stage result is accepted
  if (match.outcome == MatchOutcome::VariantMatch && match.bestTemplate) {
    VariantProposal proposal = library->proposeVariant(
        *match.bestTemplate, output.signature, match.score);
    doc.variantProposalId = proposal.id;
  }

  if (m_verbose) {
    std::cerr << "[DocumentLifecycle] DEBUG: " << doc.id << " matched "
              << (doc.matchedTemplateId.empty() ? "nothing"
                                                : doc.matchedTemplateId)
              << " (" << toString(match.outcome) << ", score " << match.score
              << ")" << std::endl;
  }

  switch (match.outcome) {
  case MatchOutcome::NoTemplatesAvailable:
    sendToReview(doc, {"no templates available"});
    break;
  case MatchOutcome::NoMatch:
    sendToReview(doc, {"no usable template match"});
    break;
  case MatchOutcome::AutoMatch:
  case MatchOutcome::VariantMatch:
    transition(doc, DocumentState::Extracting);
    break;
  }
}

void DocumentLifecycle::runExtracting(Document &doc) {
  if (doc.matchedTemplateId.empty()) {
    throw std::runtime_error("document " + doc.id +
                             " reached extraction without a matched template");
  }

  NormalizedImage normalized = loadArtifact(doc);

  auto library = m_components.library;
  auto fieldExtractor = m_components.fieldExtractor;
  auto validator = m_components.validator;
  std::string appId = doc.appId;
  std::string templateId = doc.matchedTemplateId;
  std::optional<StructuralSignature> observed = doc.signature;

  ValidationContext context;
  context.matchScore = doc.matchScore;
  context.variantMatch = doc.matchOutcome == MatchOutcome::VariantMatch;

  ExtractionOutput output = runWithTimeout<ExtractionOutput>(
      "extracting", m_config.extractingTimeoutMs,
      [normalized, library, fieldExtractor, validator, appId, templateId,
       observed, context]() {
        std::optional<Template> tmpl = library->find(appId, templateId);
        if (!tmpl) {
          throw std::runtime_error("template '" + templateId +
                                   "' is no longer available");
        }

        ExtractionOutput out;
        out.templateId = tmpl->id;
        out.fields = fieldExtractor->extract(normalized, *tmpl, observed);
        out.validation = validator->validate(out.fields, *tmpl, context);
        return out;
      });

  doc.fields = output.fields;
  doc.validation = output.validation;

  if (output.validation.routing != RoutingDecision::AutoCommit) {
    sendToReview(doc, output.validation.reviewReasons);
    return;
  }

  if (m_components.sink) {
    FinalizePayload payload;
    payload.documentId = doc.id;
    payload.appId = doc.appId;
    payload.templateId = output.templateId;
    payload.fields = doc.fields;
    payload.overallConfidence = output.validation.overallConfidence;

    try {
      m_components.sink->finalize(payload);
    } catch (const std::exception &e) {
      fail(doc, "finalize", ErrorKind::Exception, e.what());
      return;
    }
  }

  doc.reviewRequired = false;
  doc.reviewReasons.clear();
  transition(doc, DocumentState::Completed);
}

void DocumentLifecycle::sendToReview(Document &doc,
                                     const std::vector<std::string> &reasons) {
  doc.reviewRequired = true;
  doc.reviewReasons = reasons;

  if (m_verbose) {
    for (const auto &reason : reasons) {
      std::cerr << "[DocumentLifecycle] DEBUG: " << doc.id
                << " review reason: " << reason << std::endl;
    }
  }

  transition(doc, DocumentState::Review);
}

} // namespace docintel

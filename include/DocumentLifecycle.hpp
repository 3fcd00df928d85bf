#ifndef DOCINTEL_DOCUMENT_LIFECYCLE_HPP
#define DOCINTEL_DOCUMENT_LIFECYCLE_HPP

#include "ConfidenceValidator.hpp"
#include "DocumentStore.hpp"
#include "DocumentTypes.hpp"
#include "DownstreamSink.hpp"
#include "FieldExtractor.hpp"
#include "ImageNormalizer.hpp"
#include "PipelineConfig.hpp"
#include "RasterLoader.hpp"
#include "StructuralSignatureExtractor.hpp"
#include "TemplateLibrary.hpp"
#include "TemplateMatcher.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace docintel {

/**
 * @brief Thrown when a stage exceeds its configured timeout
 */
class StageTimeoutError : public std::runtime_error {
public:
  StageTimeoutError(const std::string &stage, long timeoutMs);
};

/**
 * @brief Collaborators used by the lifecycle
 *
 * sink may be null, in which case completed documents are only persisted.
 */
struct LifecycleComponents {
  std::shared_ptr<ImageNormalizer> normalizer;
  std::shared_ptr<StructuralSignatureExtractor> signatureExtractor;
  std::shared_ptr<TemplateLibrary> library;
  std::shared_ptr<TemplateMatcher> matcher;
  std::shared_ptr<FieldExtractor> fieldExtractor;
  std::shared_ptr<ConfidenceValidator> validator;
  std::shared_ptr<DocumentStore> store;
  std::shared_ptr<DownstreamSink> sink;
};

/**
 * @brief State machine that drives one document to a terminal state
 *
 * pending -> preprocessing -> matching -> extracting -> review | completed,
 * with failed reachable from any non-terminal state. Every transition is
 * saved to the DocumentStore before the next stage starts, so run() on a
 * reloaded document resumes at its persisted state.
 *
 * A stage that throws, or exceeds its timeout, moves the document to
 * failed with an ErrorDetail; nothing is retried automatically.
 * Cancellation is checked only between stages.
 */
class DocumentLifecycle {
public:
  using CancelCheck = std::function<bool()>;
  using RasterSource = std::function<RasterLoadResult(const std::string &)>;

  DocumentLifecycle(LifecycleComponents components,
                    const LifecycleConfig &config = LifecycleConfig(),
                    bool verbose = false);

  /**
   * @brief Advance a document until it reaches a terminal state
   * @param doc Document to advance; updated in place and persisted
   * @param isCancelled Polled before every stage; may be empty
   * @return Terminal state reached
   */
  DocumentState run(Document &doc, const CancelCheck &isCancelled = nullptr);

  /**
   * @brief Replace how source files are decoded (default: loadRaster)
   */
  void setRasterSource(RasterSource source);

private:
  void transition(Document &doc, DocumentState next);
  void fail(Document &doc, const std::string &stage, ErrorKind kind,
            const std::string &message);

  void runPreprocessing(Document &doc);
  void runMatching(Document &doc);
  void runExtracting(Document &doc);
  void sendToReview(Document &doc, const std::vector<std::string> &reasons);

  NormalizedImage loadArtifact(const Document &doc) const;

  LifecycleComponents m_components;
  LifecycleConfig m_config;
  bool m_verbose;
  RasterSource m_rasterSource;
};

} // namespace docintel

#endif // DOCINTEL_DOCUMENT_LIFECYCLE_HPP

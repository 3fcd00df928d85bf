#include "DocumentPipeline.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>

using namespace docintel;
using docintel::testing::FakeRecognizer;
using docintel::testing::InMemoryTemplateSource;
using docintel::testing::RecordingSink;
using docintel::testing::TestReport;
using docintel::testing::recognized;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<DocumentLifecycle>
makeLifecycle(const std::shared_ptr<DocumentStore> &store) {
  auto source = std::make_shared<InMemoryTemplateSource>();
  source->setTemplates({docintel::testing::receiptTemplate()});

  NormalizerConfig normalizerConfig;
  normalizerConfig.borderRemovalEnabled = false;

  LifecycleComponents components;
  components.normalizer = std::make_shared<ImageNormalizer>(normalizerConfig);
  components.signatureExtractor =
      std::make_shared<StructuralSignatureExtractor>();
  components.library = std::make_shared<TemplateLibrary>(source);
  components.matcher = std::make_shared<TemplateMatcher>();
  components.fieldExtractor =
      std::make_shared<FieldExtractor>(std::make_shared<FakeRecognizer>(
          std::vector<RecognitionResult>{recognized("TOTAL $162.00", 0.995)}));
  components.validator = std::make_shared<ConfidenceValidator>();
  components.store = store;
  components.sink = std::make_shared<RecordingSink>();

  auto lifecycle = std::make_shared<DocumentLifecycle>(components);

  // Paths containing "corrupt" fail to decode
  lifecycle->setRasterSource([](const std::string &path) {
    RasterLoadResult result;
    if (path.find("corrupt") != std::string::npos) {
      result.errorMessage = "Failed to decode image: " + path;
      return result;
    }
    result.success = true;
    result.image = docintel::testing::drawReceiptLayout(600, 800);
    result.knownDpi = 300.0;
    return result;
  });
  return lifecycle;
}

} // namespace

int main() {
  std::cout << "=== Test DocumentPipeline ===" << std::endl;
  TestReport report;
  fs::path root = docintel::testing::scratchDirectory("pipeline");

  report.section("Enqueue validation");
  {
    auto store = std::make_shared<FileDocumentStore>(root / "validation");
    DocumentPipeline pipeline(makeLifecycle(store), store, 1);

    EnqueueResult relative = pipeline.enqueue("scans/receipt.png", "hq");
    report.check(!relative.success && !relative.errorMessage.empty(),
                 "relative path is rejected");

    EnqueueResult noApp = pipeline.enqueue("/scans/receipt.png", "");
    report.check(!noApp.success, "missing application id is rejected");

    Metadata metadata{{"original_filename", "receipt.png"},
                      {"source_channel", "watcher"}};
    EnqueueResult accepted =
        pipeline.enqueue("/scans/receipt.png", "hq", metadata);
    report.check(accepted.success && !accepted.documentId.empty(),
                 "absolute path is accepted");

    std::optional<Document> stored = pipeline.document(accepted.documentId);
    report.check(stored && stored->state == DocumentState::Pending &&
                     stored->metadata.at("source_channel") == "watcher",
                 "document is persisted as pending with its metadata");

    EnqueueResult again = pipeline.enqueue("/scans/receipt.png", "hq");
    report.check(again.success && again.documentId != accepted.documentId,
                 "re-enqueueing the same file creates a new document");
  }

  report.section("Failing document does not stall the others");
  {
    auto store = std::make_shared<FileDocumentStore>(root / "workers");
    DocumentPipeline pipeline(makeLifecycle(store), store, 2);
    report.check(pipeline.workerCount() == 2, "two workers configured");

    std::vector<std::string> good;
    EnqueueResult bad = pipeline.enqueue("/scans/corrupt.png", "hq");
    for (int i = 0; i < 3; ++i) {
      EnqueueResult result = pipeline.enqueue(
          "/scans/receipt-" + std::to_string(i) + ".png", "hq");
      good.push_back(result.documentId);
    }

    pipeline.start();
    pipeline.waitIdle();

    std::optional<Document> failed = pipeline.document(bad.documentId);
    report.check(failed && failed->state == DocumentState::Failed &&
                     failed->error &&
                     failed->error->stage == "preprocessing",
                 "corrupt document failed in preprocessing");

    bool allCompleted = true;
    for (const auto &id : good) {
      std::optional<Document> doc = pipeline.document(id);
      allCompleted = allCompleted && doc &&
                     doc->state == DocumentState::Completed;
    }
    report.check(allCompleted, "the other documents completed");

    std::vector<Document> failures = pipeline.failedDocuments();
    report.check(failures.size() == 1 && failures[0].id == bad.documentId,
                 "failed list holds only the corrupt document");
    report.check(pipeline.reviewQueue().empty(), "review queue is empty");

    EnqueueResult late = pipeline.enqueue("/scans/late.png", "hq");
    pipeline.waitIdle();
    std::optional<Document> lateDoc = pipeline.document(late.documentId);
    report.check(lateDoc && lateDoc->state == DocumentState::Completed,
                 "running pipeline picks up new work");
    pipeline.stop();
  }

  report.section("Cancellation");
  {
    auto store = std::make_shared<FileDocumentStore>(root / "cancel");
    DocumentPipeline pipeline(makeLifecycle(store), store, 1);

    EnqueueResult queued = pipeline.enqueue("/scans/receipt.png", "hq");
    report.check(pipeline.cancel(queued.documentId),
                 "queued document accepts cancellation");
    report.check(!pipeline.cancel("doc-unknown"),
                 "unknown document cannot be cancelled");

    pipeline.start();
    pipeline.waitIdle();

    std::optional<Document> doc = pipeline.document(queued.documentId);
    report.check(doc && doc->state == DocumentState::Failed && doc->error &&
                     doc->error->kind == ErrorKind::Cancelled,
                 "cancelled document is failed, not dropped");
    report.check(!pipeline.cancel(queued.documentId),
                 "terminal document cannot be cancelled");
  }

  report.section("Recovery on start");
  {
    auto store = std::make_shared<FileDocumentStore>(root / "recovery");
    std::string pendingId;
    {
      DocumentPipeline crashed(makeLifecycle(store), store, 1);
      pendingId = crashed.enqueue("/scans/receipt.png", "hq").documentId;
      // Never started: the document stays pending on disk
    }

    DocumentPipeline restarted(makeLifecycle(store), store, 1);
    restarted.start();
    restarted.waitIdle();

    std::optional<Document> doc = restarted.document(pendingId);
    report.check(doc && doc->state == DocumentState::Completed,
                 "persisted pending document is processed after restart");
  }

  fs::remove_all(root);
  return report.finish();
}

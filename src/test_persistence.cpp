#include "DocumentStore.hpp"
#include "DownstreamSink.hpp"
#include "FileUtils.hpp"
#include "JsonSerialization.hpp"
#include "RasterLoader.hpp"
#include "TemplateSource.hpp"
#include "TestSupport.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>

using namespace docintel;
using docintel::testing::TestReport;
using docintel::testing::near;

namespace fs = std::filesystem;

namespace {

Document reviewedDocument() {
  Document doc;
  doc.id = "doc-0001";
  doc.sourcePath = "/scans/receipt.png";
  doc.appId = "hq";
  doc.metadata["original_filename"] = "receipt.png";
  doc.state = DocumentState::Review;

  StateTransition t;
  t.state = DocumentState::Review;
  t.at = Clock::now();
  doc.transitions.push_back(t);

  NormalizationParams params;
  params.skewAngleDegrees = -1.5;
  params.deskewApplied = true;
  params.estimatedInputDpi = 200.0;
  params.scaleFactor = 1.5;
  params.borderCrop = cv::Rect(10, 20, 300, 400);
  params.warnings.push_back("denoise: test");
  doc.normalization = params;

  doc.signature = docintel::testing::receiptSignature();
  doc.matchOutcome = MatchOutcome::VariantMatch;
  doc.matchedTemplateId = "receipt-v1";
  doc.matchScore = 0.72;
  doc.suggestions.push_back({"receipt-v1", "acme receipt", 0.72});
  doc.variantProposalId = "proposal-receipt-v1-1-0";

  ExtractedField total;
  total.name = "total_amount";
  total.rawValue = "TOTAL $162.00";
  total.value = "162.00";
  total.confidence = 0.8;
  doc.fields.push_back(total);

  ValidationResult validation;
  validation.highStakesIssues.push_back("total_amount confidence 0.800");
  validation.mandatoryReview = true;
  validation.overallConfidence = 0.77;
  validation.routing = RoutingDecision::Review;
  validation.reviewReasons.push_back("variant match requires review");
  doc.validation = validation;

  doc.reviewRequired = true;
  doc.reviewReasons = validation.reviewReasons;
  return doc;
}

} // namespace

int main() {
  std::cout << "=== Test persistence ===" << std::endl;
  TestReport report;
  fs::path root = docintel::testing::scratchDirectory("persistence");

  report.section("Document store");
  {
    FileDocumentStore store(root / "documents");
    Document original = reviewedDocument();
    store.save(original);

    std::optional<Document> loaded = store.load(original.id);
    report.check(loaded.has_value(), "saved document loads");
    if (loaded) {
      report.check(loaded->state == DocumentState::Review &&
                       loaded->reviewRequired &&
                       loaded->reviewReasons == original.reviewReasons,
                   "state and review payload survive");
      report.check(loaded->matchOutcome == MatchOutcome::VariantMatch &&
                       loaded->suggestions.size() == 1 &&
                       loaded->suggestions[0].label == "acme receipt",
                   "match result survives");
      report.check(loaded->signature &&
                       loaded->signature->zones.size() == 3 &&
                       loaded->signature->zones[2].kind == ZoneKind::Footer,
                   "signature survives");
      report.check(loaded->normalization &&
                       loaded->normalization->borderCrop ==
                           cv::Rect(10, 20, 300, 400) &&
                       loaded->normalization->deskewApplied,
                   "normalization parameters survive");
      report.check(loaded->fields.size() == 1 &&
                       loaded->fields[0].value == "162.00" &&
                       near(loaded->fields[0].confidence, 0.8, 1e-12),
                   "fields survive");
      report.check(loaded->validation && loaded->validation->mandatoryReview,
                   "validation survives");
      report.check(loaded->transitions.size() == 1 &&
                       formatTimestamp(loaded->transitions[0].at) ==
                           formatTimestamp(original.transitions[0].at),
                   "transition timestamps survive");
      report.check(!loaded->error.has_value(), "absent error stays absent");
    }

    report.check(!store.load("doc-unknown"), "unknown id loads nothing");

    Document failed;
    failed.id = "doc-0002";
    failed.sourcePath = "/scans/corrupt.png";
    failed.appId = "hq";
    failed.state = DocumentState::Failed;
    failed.error = ErrorDetail{"preprocessing", ErrorKind::Exception, "boom"};
    store.save(failed);

    writeFileAtomically(root / "documents" / "doc-0003" / "document.json",
                        "{ truncated");

    std::vector<Document> all = store.listAll();
    report.check(all.size() == 2, "corrupt record is skipped when listing");
    std::vector<Document> failures = store.listByState(DocumentState::Failed);
    report.check(failures.size() == 1 && failures[0].error &&
                     failures[0].error->message == "boom",
                 "listing by state filters");

    bool threw = false;
    try {
      store.load("../escape");
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    report.check(threw, "path-like ids are rejected");

    cv::Mat artifact = docintel::testing::drawReceiptLayout(120, 160);
    store.saveNormalizedImage("doc-0001", artifact);
    cv::Mat reloaded = store.loadNormalizedImage("doc-0001");
    report.check(reloaded.size() == artifact.size() &&
                     cv::countNonZero(reloaded != artifact) == 0,
                 "normalized image round-trips losslessly");
    report.check(store.loadNormalizedImage("doc-0002").empty(),
                 "missing artifact loads empty");
  }

  report.section("File template source");
  {
    FileTemplateSource source(root / "templates");

    Template invoice = docintel::testing::receiptTemplate();
    invoice.id = "invoice-v2";
    invoice.documentType = "invoice";
    invoice.vendor = "globex";
    invoice.signature.reset();
    Template receipt = docintel::testing::receiptTemplate();
    std::reverse(receipt.signature->zones.begin(),
                 receipt.signature->zones.end());
    source.saveTemplates("hq", {receipt, invoice});

    TemplateQuery all;
    all.appId = "hq";
    std::vector<Template> pulled = source.pullTemplates(all);
    report.check(pulled.size() == 2, "both templates are pulled");
    report.check(pulled.size() == 2 && pulled[0].signature &&
                     !pulled[1].signature,
                 "missing signature stays missing");
    report.check(pulled.size() == 2 && pulled[0].signature &&
                     pulled[0].signature->zones.size() == 3 &&
                     pulled[0].signature->zones[0].kind == ZoneKind::Header &&
                     pulled[0].signature->zones[2].kind == ZoneKind::Footer,
                 "loaded signature zones read top to bottom");
    report.check(pulled.size() == 2 && pulled[0].fieldMap.size() == 2 &&
                     pulled[0].fieldMap[1].required &&
                     pulled[0].fieldMap[1].type == FieldType::Currency,
                 "field map survives");

    TemplateQuery byVendor = all;
    byVendor.vendor = "globex";
    std::vector<Template> filtered = source.pullTemplates(byVendor);
    report.check(filtered.size() == 1 && filtered[0].id == "invoice-v2",
                 "vendor filter applies");

    TemplateQuery otherApp;
    otherApp.appId = "branch";
    report.check(source.pullTemplates(otherApp).empty(),
                 "unknown application has no templates");

    TemplateQuery escaping;
    escaping.appId = "../outside";
    bool pullRejected = false;
    try {
      source.pullTemplates(escaping);
    } catch (const std::invalid_argument &) {
      pullRejected = true;
    }
    report.check(pullRejected, "path-like application id is rejected");

    VariantProposal stray;
    stray.id = "proposal-x";
    stray.appId = "..";
    bool pushRejected = false;
    try {
      source.pushProposal(stray);
    } catch (const std::invalid_argument &) {
      pushRejected = true;
    }
    report.check(pushRejected && !fs::exists(root / "proposals"),
                 "proposal cannot be written outside the template root");

    VariantProposal proposal;
    proposal.id = "proposal-receipt-v1-1-0";
    proposal.baseTemplateId = "receipt-v1";
    proposal.appId = "hq";
    proposal.observedSignature = docintel::testing::receiptSignature();
    proposal.similarity = 0.7;
    proposal.createdAt = Clock::now();
    source.pushProposal(proposal);

    fs::path written =
        root / "templates" / "hq" / "proposals" / (proposal.id + ".json");
    report.check(fs::exists(written), "proposal file is written");
    if (fs::exists(written)) {
      VariantProposal back =
          nlohmann::json::parse(readFile(written)).get<VariantProposal>();
      report.check(back.submitted && back.baseTemplateId == "receipt-v1" &&
                       back.observedSignature.zones.size() == 3,
                   "proposal file holds the observed signature");
    }
  }

  report.section("Downstream sink");
  {
    FileDownstreamSink sink(root / "finalized");
    FinalizePayload payload;
    payload.documentId = "doc-0001";
    payload.appId = "hq";
    payload.templateId = "receipt-v1";
    payload.fields = reviewedDocument().fields;
    payload.overallConfidence = 0.93;
    sink.finalize(payload);

    fs::path written = root / "finalized" / "doc-0001.json";
    report.check(fs::exists(written), "payload file is written");
    if (fs::exists(written)) {
      nlohmann::json j = nlohmann::json::parse(readFile(written));
      report.check(j.at("template_id") == "receipt-v1" &&
                       j.at("fields").size() == 1,
                   "payload carries template and fields");
    }

    payload.overallConfidence = 0.95;
    sink.finalize(payload);
    int files = 0;
    for (const auto &entry : fs::directory_iterator(root / "finalized")) {
      files += entry.path().extension() == ".json" ? 1 : 0;
    }
    nlohmann::json again = nlohmann::json::parse(readFile(written));
    report.check(files == 1 && again.at("overall_confidence") == 0.95,
                 "repeated delivery replaces the earlier payload");

    FinalizePayload escaping = payload;
    escaping.documentId = "../doc-0001";
    bool rejected = false;
    try {
      sink.finalize(escaping);
    } catch (const std::invalid_argument &) {
      rejected = true;
    }
    report.check(rejected, "path-like document id is rejected");
  }

  report.section("Raster loading");
  {
    fs::path png = root / "scan.png";
    cv::imwrite(png.string(), docintel::testing::drawReceiptLayout(120, 160));

    RasterLoadResult loaded = loadRaster(png.string());
    report.check(loaded.success && loaded.image.cols == 120 &&
                     loaded.image.rows == 160,
                 "PNG is decoded");
    report.check(loaded.knownDpi == 0.0, "image resolution is unknown");

    RasterLoadResult missing = loadRaster((root / "nothing.png").string());
    report.check(!missing.success && !missing.errorMessage.empty(),
                 "missing file is reported");

    fs::path notImage = root / "notes.png";
    writeFileAtomically(notImage, "plain text");
    report.check(!loadRaster(notImage.string()).success,
                 "undecodable file is reported");
  }

  fs::remove_all(root);
  return report.finish();
}

#include "DocumentLifecycle.hpp"
#include "DocumentPipeline.hpp"
#include "DocumentStore.hpp"
#include "DownstreamSink.hpp"
#include "PipelineConfig.hpp"
#include "TemplateSource.hpp"
#include "TextRecognizer.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <file> -a <app_id> -t <template_root>"
      << " [options]\n"
      << "\nOptions:\n"
      << "  -a, --app <id>          Application id (required)\n"
      << "  -t, --templates <dir>   Template root directory (required)\n"
      << "  -s, --state <dir>       State directory (default from config)\n"
      << "  -c, --config <file>     JSON configuration file\n"
      << "  -w, --workers <n>       Worker threads (default: hardware)\n"
      << "  -v, --verbose           Print debug output\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " receipt.png -a hq -t templates\n"
      << "  " << programName
      << " invoice.pdf -a hq -t templates -s state -c pipeline.json -v\n";
}

void printDocument(const docintel::Document &doc) {
  std::cout << "\n[Document " << doc.id << "]\n";
  std::cout << "-------------------------------------------\n";
  std::cout << "State:    " << docintel::toString(doc.state) << "\n";
  if (doc.matchOutcome) {
    std::cout << "Match:    " << docintel::toString(*doc.matchOutcome);
    if (!doc.matchedTemplateId.empty()) {
      std::cout << " (" << doc.matchedTemplateId << ")";
    }
    std::cout << ", score " << std::fixed << std::setprecision(3)
              << doc.matchScore << "\n";
  }
  if (doc.validation) {
    std::cout << "Routing:  " << docintel::toString(doc.validation->routing)
              << ", overall confidence " << std::fixed << std::setprecision(3)
              << doc.validation->overallConfidence << "\n";
  }
  if (doc.error) {
    std::cout << "Error:    stage '" << doc.error->stage << "' ("
              << docintel::toString(doc.error->kind)
              << "): " << doc.error->message << "\n";
  }

  if (!doc.fields.empty()) {
    std::cout << "\n[Fields]\n";
    std::cout << std::setw(20) << std::left << "Name" << std::setw(10)
              << std::right << "Conf" << "  Value\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto &field : doc.fields) {
      std::cout << std::setw(20) << std::left << field.name << std::setw(10)
                << std::right << std::fixed << std::setprecision(3)
                << field.confidence << "  " << field.value << "\n";
    }
  }

  if (doc.reviewRequired) {
    std::cout << "\n[Review reasons]\n";
    for (const auto &reason : doc.reviewReasons) {
      std::cout << "  - " << reason << "\n";
    }
  }

  if (!doc.suggestions.empty()) {
    std::cout << "\n[Suggested templates]\n";
    for (size_t i = 0; i < doc.suggestions.size(); ++i) {
      const auto &candidate = doc.suggestions[i];
      std::cout << std::setw(4) << i + 1 << ". " << candidate.label << " ["
                << candidate.templateId << "] " << std::fixed
                << std::setprecision(3) << candidate.score << "\n";
    }
  }
  std::cout << "-------------------------------------------\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string filePath;
  std::string appId;
  std::string templateRoot;
  std::string stateDir;
  std::string configPath;
  int workers = -1;
  bool verbose = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-a" || arg == "--app") {
      if (i + 1 < argc) {
        appId = argv[++i];
      } else {
        std::cerr << "Error: --app requires an argument\n";
        return 1;
      }
    } else if (arg == "-t" || arg == "--templates") {
      if (i + 1 < argc) {
        templateRoot = argv[++i];
      } else {
        std::cerr << "Error: --templates requires an argument\n";
        return 1;
      }
    } else if (arg == "-s" || arg == "--state") {
      if (i + 1 < argc) {
        stateDir = argv[++i];
      } else {
        std::cerr << "Error: --state requires an argument\n";
        return 1;
      }
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        configPath = argv[++i];
      } else {
        std::cerr << "Error: --config requires an argument\n";
        return 1;
      }
    } else if (arg == "-w" || arg == "--workers") {
      if (i + 1 < argc) {
        try {
          workers = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --workers expects a number\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --workers requires an argument\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg[0] != '-') {
      filePath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (filePath.empty() || appId.empty() || templateRoot.empty()) {
    std::cerr << "Error: a file, --app and --templates are required\n";
    printUsage(argv[0]);
    return 1;
  }

  docintel::PipelineConfig config;
  if (!configPath.empty()) {
    docintel::ConfigLoadResult loaded = docintel::ConfigLoader::load(configPath);
    if (!loaded.success) {
      std::cerr << "Failed to load configuration: " << loaded.errorMessage
                << "\n";
      return 1;
    }
    config = loaded.config;
  } else {
    docintel::ConfigLoader::applyEnvironmentOverrides(config);
  }
  if (verbose) {
    config.verbose = true;
  }
  if (workers >= 0) {
    config.lifecycle.workerCount = workers;
  }
  if (!stateDir.empty()) {
    config.lifecycle.stateDirectory = stateDir;
  }

  std::cout << "=== Document Pipeline ===\n"
            << "Tesseract version: "
            << docintel::TesseractRecognizer::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Application: " << appId << "\n"
            << "State directory: " << config.lifecycle.stateDirectory << "\n"
            << "=========================\n\n";

  auto recognizer = std::make_shared<docintel::TesseractRecognizer>(config.ocr);
  if (!recognizer->initialize()) {
    std::cerr
        << "Failed to initialize OCR engine.\n"
        << "Make sure Tesseract is installed and tessdata is available.\n";
    return 1;
  }

  try {
    fs::path stateRoot(config.lifecycle.stateDirectory);
    auto store = std::make_shared<docintel::FileDocumentStore>(
        stateRoot / "documents");

    docintel::LifecycleComponents components;
    components.normalizer = std::make_shared<docintel::ImageNormalizer>(
        config.normalizer, config.verbose);
    components.signatureExtractor =
        std::make_shared<docintel::StructuralSignatureExtractor>(
            config.signature, config.verbose);
    components.library = std::make_shared<docintel::TemplateLibrary>(
        std::make_shared<docintel::FileTemplateSource>(templateRoot),
        config.library, config.verbose);
    components.matcher =
        std::make_shared<docintel::TemplateMatcher>(config.matcher);
    components.fieldExtractor = std::make_shared<docintel::FieldExtractor>(
        recognizer, config.extractor, config.verbose);
    components.validator = std::make_shared<docintel::ConfidenceValidator>(
        config.validator, config.verbose);
    components.store = store;
    components.sink =
        std::make_shared<docintel::FileDownstreamSink>(stateRoot / "finalized");

    auto lifecycle = std::make_shared<docintel::DocumentLifecycle>(
        components, config.lifecycle, config.verbose);
    docintel::DocumentPipeline pipeline(lifecycle, store,
                                        config.lifecycle.workerCount,
                                        config.verbose);

    docintel::Metadata metadata;
    metadata["original_filename"] = fs::path(filePath).filename().string();
    metadata["source_channel"] = "cli";
    metadata["received_at"] =
        docintel::formatTimestamp(docintel::Clock::now());

    docintel::EnqueueResult enqueued = pipeline.enqueue(
        fs::absolute(filePath).lexically_normal().string(), appId, metadata);
    if (!enqueued.success) {
      std::cerr << "Enqueue failed: " << enqueued.errorMessage << "\n";
      return 1;
    }

    pipeline.start();
    pipeline.waitIdle();
    pipeline.stop();

    std::optional<docintel::Document> doc =
        pipeline.document(enqueued.documentId);
    if (!doc) {
      std::cerr << "Document " << enqueued.documentId << " was not persisted\n";
      return 1;
    }
    printDocument(*doc);

    return doc->state == docintel::DocumentState::Failed ? 2 : 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

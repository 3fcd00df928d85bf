#ifndef DOCINTEL_TEST_SUPPORT_HPP
#define DOCINTEL_TEST_SUPPORT_HPP

// Shared helpers for the test_*.cpp programs: check counters, synthetic
// page layouts and in-process fakes for the external collaborators.

#include "DocumentTypes.hpp"
#include "DownstreamSink.hpp"
#include "TemplateSource.hpp"
#include "TextRecognizer.hpp"

#include <opencv2/imgproc.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace docintel {
namespace testing {

/**
 * @brief Counts [PASS]/[FAIL] lines; finish() is the process exit code
 */
class TestReport {
public:
  void check(bool condition, const std::string &description) {
    if (condition) {
      m_passed++;
      std::cout << "  [PASS] " << description << std::endl;
    } else {
      m_failed++;
      std::cout << "  [FAIL] " << description << std::endl;
    }
  }

  void section(const std::string &title) {
    std::cout << std::endl << "--- " << title << " ---" << std::endl;
  }

  int finish() const {
    std::cout << std::endl
              << "Passed: " << m_passed << ", failed: " << m_failed
              << std::endl;
    return m_failed == 0 ? 0 : 1;
  }

private:
  int m_passed = 0;
  int m_failed = 0;
};

inline bool near(double a, double b, double eps) {
  return std::abs(a - b) <= eps;
}

/**
 * @brief Draw a receipt-like page: header bar, ruled table, footer bar
 *
 * Block ratios: header y 0.01-0.14, table y 0.17-0.83 (16 rows),
 * footer y 0.86-0.99, all spanning x 0.02-0.98.
 */
inline cv::Mat drawReceiptLayout(int width, int height) {
  cv::Mat page(height, width, CV_8UC1, cv::Scalar(255));
  auto px = [width](double r) {
    return static_cast<int>(std::lround(r * width));
  };
  auto py = [height](double r) {
    return static_cast<int>(std::lround(r * height));
  };
  const int thickness = std::max(3, width / 200);

  cv::rectangle(page, cv::Point(px(0.02), py(0.01)),
                cv::Point(px(0.98), py(0.14)), cv::Scalar(0), cv::FILLED);

  const int top = py(0.17);
  const int bottom = py(0.83);
  cv::rectangle(page, cv::Point(px(0.02), top), cv::Point(px(0.98), bottom),
                cv::Scalar(0), thickness);
  const int rows = 16;
  for (int i = 1; i < rows; ++i) {
    int y = top + (bottom - top) * i / rows;
    cv::line(page, cv::Point(px(0.02), y), cv::Point(px(0.98), y),
             cv::Scalar(0), thickness);
  }

  cv::rectangle(page, cv::Point(px(0.02), py(0.86)),
                cv::Point(px(0.98), py(0.99)), cv::Scalar(0), cv::FILLED);
  return page;
}

inline Zone makeZone(ZoneKind kind, double x, double y, double w, double h) {
  Zone zone;
  zone.kind = kind;
  zone.xRatio = x;
  zone.yRatio = y;
  zone.widthRatio = w;
  zone.heightRatio = h;
  zone.areaRatio = w * h;
  return zone;
}

/**
 * @brief Header 0-0.15, table 0.15-0.85, footer 0.85-1.0, full width
 */
inline StructuralSignature receiptSignature() {
  StructuralSignature signature;
  signature.zones.push_back(makeZone(ZoneKind::Header, 0.0, 0.0, 1.0, 0.15));
  signature.zones.push_back(makeZone(ZoneKind::Table, 0.0, 0.15, 1.0, 0.70));
  signature.zones.push_back(makeZone(ZoneKind::Footer, 0.0, 0.85, 1.0, 0.15));
  signature.totalContentRatio = 1.0;
  return signature;
}

/**
 * @brief Receipt template: vendor_name in the header, required
 * total_amount in the footer
 */
inline Template receiptTemplate(const std::string &appId = "hq") {
  Template tmpl;
  tmpl.id = "receipt-v1";
  tmpl.appId = appId;
  tmpl.documentType = "receipt";
  tmpl.vendor = "acme";
  tmpl.formatName = "ACME till receipt";
  tmpl.signature = receiptSignature();

  FieldDefinition vendor;
  vendor.name = "vendor_name";
  vendor.zoneKind = ZoneKind::Header;
  vendor.type = FieldType::Text;
  tmpl.fieldMap.push_back(vendor);

  FieldDefinition total;
  total.name = "total_amount";
  total.zoneKind = ZoneKind::Footer;
  total.type = FieldType::Currency;
  total.required = true;
  tmpl.fieldMap.push_back(total);

  return tmpl;
}

inline RecognitionResult recognized(const std::string &text,
                                    double confidence) {
  RecognitionResult result;
  result.success = true;
  result.text = text;
  result.confidence = confidence;
  return result;
}

/**
 * @brief Recognizer that replays a script, cycling by call index
 */
class FakeRecognizer : public TextRecognizer {
public:
  explicit FakeRecognizer(std::vector<RecognitionResult> script,
                          int delayMs = 0)
      : m_script(std::move(script)), m_delayMs(delayMs) {}

  RecognitionResult recognize(const cv::Mat &) override {
    if (m_delayMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(m_delayMs));
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_script.empty()) {
      return recognized("", 0.0);
    }
    return m_script[m_calls++ % m_script.size()];
  }

  void setScript(std::vector<RecognitionResult> script) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_script = std::move(script);
    m_calls = 0;
  }

private:
  std::mutex m_mutex;
  std::vector<RecognitionResult> m_script;
  size_t m_calls = 0;
  int m_delayMs;
};

/**
 * @brief In-process template source with call counters and failure toggles
 */
class InMemoryTemplateSource : public TemplateSource {
public:
  std::vector<Template> pullTemplates(const TemplateQuery &query) override {
    pulls++;
    int delay = delayMs.load();
    if (delay > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
    if (failPull) {
      throw std::runtime_error("template service unavailable");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Template> result;
    for (const auto &tmpl : m_templates) {
      if (tmpl.appId == query.appId) {
        result.push_back(tmpl);
      }
    }
    return result;
  }

  void pushProposal(const VariantProposal &proposal) override {
    if (failPush) {
      throw std::runtime_error("proposal endpoint unavailable");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pushed.push_back(proposal);
  }

  void setTemplates(std::vector<Template> templates) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_templates = std::move(templates);
  }

  std::vector<VariantProposal> pushed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pushed;
  }

  std::atomic<int> pulls{0};
  std::atomic<int> delayMs{0};
  std::atomic<bool> failPull{false};
  std::atomic<bool> failPush{false};

private:
  std::mutex m_mutex;
  std::vector<Template> m_templates;
  std::vector<VariantProposal> m_pushed;
};

/**
 * @brief Sink that records payloads, or throws when told to
 */
class RecordingSink : public DownstreamSink {
public:
  void finalize(const FinalizePayload &payload) override {
    if (fail) {
      throw std::runtime_error("business system rejected the document");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_payloads.push_back(payload);
  }

  std::vector<FinalizePayload> payloads() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_payloads;
  }

  std::atomic<bool> fail{false};

private:
  std::mutex m_mutex;
  std::vector<FinalizePayload> m_payloads;
};

/**
 * @brief Fresh scratch directory under the system temp dir
 */
inline std::filesystem::path scratchDirectory(const std::string &name) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              ("docintel_" + name + "_" +
                               std::to_string(stamp));
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace testing
} // namespace docintel

#endif // DOCINTEL_TEST_SUPPORT_HPP

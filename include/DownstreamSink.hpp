#ifndef DOCINTEL_DOWNSTREAM_SINK_HPP
#define DOCINTEL_DOWNSTREAM_SINK_HPP

#include "DocumentTypes.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Record handed to the business system for a completed document
 *
 * documentId doubles as the idempotency key: a payload may be delivered
 * more than once for the same document, always with the same id.
 */
struct FinalizePayload {
  std::string documentId;
  std::string appId;
  std::string templateId;
  std::vector<ExtractedField> fields;
  double overallConfidence = 0.0;
};

/**
 * @brief Business system that receives completed documents
 */
class DownstreamSink {
public:
  virtual ~DownstreamSink() = default;

  /**
   * @brief Deliver a completed document; throws if delivery failed
   *
   * Delivery is at-least-once. A crash after delivery but before the
   * completed state is saved re-runs extraction on restart and delivers
   * again, so implementations must treat a repeated documentId as a replace.
   */
  virtual void finalize(const FinalizePayload &payload) = 0;
};

/**
 * @brief Sink that writes each payload to <dir>/<documentId>.json
 *
 * A repeated delivery overwrites the earlier file.
 */
class FileDownstreamSink : public DownstreamSink {
public:
  explicit FileDownstreamSink(const std::filesystem::path &outputDir);

  void finalize(const FinalizePayload &payload) override;

private:
  std::filesystem::path m_outputDir;
};

} // namespace docintel

#endif // DOCINTEL_DOWNSTREAM_SINK_HPP

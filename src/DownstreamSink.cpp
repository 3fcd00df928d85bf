#include "DownstreamSink.hpp"

#include "FileUtils.hpp"
#include "JsonSerialization.hpp"

#include <stdexcept>

namespace docintel {

using json = nlohmann::json;

FileDownstreamSink::FileDownstreamSink(const std::filesystem::path &outputDir)
    : m_outputDir(outputDir) {}

void FileDownstreamSink::finalize(const FinalizePayload &payload) {
  if (!isSafePathComponent(payload.documentId)) {
    throw std::invalid_argument("Invalid document id: '" +
                                payload.documentId + "'");
  }
  json j{{"document_id", payload.documentId},
         {"app_id", payload.appId},
         {"template_id", payload.templateId},
         {"fields", payload.fields},
         {"overall_confidence", payload.overallConfidence}};
  writeFileAtomically(m_outputDir / (payload.documentId + ".json"), j.dump(2));
}

} // namespace docintel

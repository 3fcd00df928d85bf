#include "TemplateSource.hpp"

#include "FileUtils.hpp"
#include "JsonSerialization.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace docintel {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

fs::path scopeDir(const fs::path &root, const std::string &appId) {
  if (!isSafePathComponent(appId)) {
    throw std::invalid_argument("Invalid application id: '" + appId + "'");
  }
  return root / appId;
}

} // namespace

FileTemplateSource::FileTemplateSource(const fs::path &rootDir)
    : m_root(rootDir) {}

std::vector<Template>
FileTemplateSource::pullTemplates(const TemplateQuery &query) {
  std::vector<Template> templates;

  fs::path file = scopeDir(m_root, query.appId) / "templates.json";
  if (!fs::exists(file)) {
    return templates;
  }

  json j = json::parse(readFile(file));
  if (!j.is_array()) {
    throw std::runtime_error("Template file is not an array: " +
                             file.string());
  }

  for (const auto &entry : j) {
    Template tmpl = entry.get<Template>();
    if (tmpl.appId.empty()) {
      tmpl.appId = query.appId;
    }
    if (tmpl.appId != query.appId) {
      continue;
    }
    if (query.documentType && tmpl.documentType != *query.documentType) {
      continue;
    }
    if (query.vendor && tmpl.vendor != *query.vendor) {
      continue;
    }
    templates.push_back(tmpl);
  }

  return templates;
}

void FileTemplateSource::pushProposal(const VariantProposal &proposal) {
  if (!isSafePathComponent(proposal.id)) {
    throw std::invalid_argument("Invalid proposal id: '" + proposal.id + "'");
  }
  fs::path dir = scopeDir(m_root, proposal.appId) / "proposals";

  json j = proposal;
  // The proposal is pending until a human approves it upstream
  j["submitted"] = true;
  writeFileAtomically(dir / (proposal.id + ".json"), j.dump(2));
}

void FileTemplateSource::saveTemplates(const std::string &appId,
                                       const std::vector<Template> &templates) {
  json j = templates;
  writeFileAtomically(scopeDir(m_root, appId) / "templates.json", j.dump(2));
}

} // namespace docintel

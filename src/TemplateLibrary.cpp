#include "TemplateLibrary.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace docintel {

TemplateLibrary::TemplateLibrary(std::shared_ptr<TemplateSource> source,
                                 const LibraryConfig &config, bool verbose)
    : m_source(std::move(source)), m_config(config), m_verbose(verbose),
      m_now([] { return Clock::now(); }) {
  if (!m_source) {
    throw std::invalid_argument("TemplateLibrary requires a template source");
  }
}

void TemplateLibrary::setTimeSource(TimeSource now) {
  std::lock_guard<std::mutex> lock(m_timeMutex);
  m_now = std::move(now);
}

Clock::time_point TemplateLibrary::now() const {
  std::lock_guard<std::mutex> lock(m_timeMutex);
  return m_now();
}

bool TemplateLibrary::isFresh(const std::string &scope) const {
  Clock::time_point current = now();
  std::shared_lock<std::shared_mutex> lock(m_cacheMutex);
  auto it = m_cache.find(scope);
  if (it == m_cache.end()) {
    return false;
  }
  return current - it->second.syncedAt <
         std::chrono::seconds(m_config.cacheTtlSeconds);
}

std::timed_mutex &TemplateLibrary::refreshLock(const std::string &scope) {
  std::lock_guard<std::mutex> lock(m_lockTableMutex);
  auto &slot = m_refreshLocks[scope];
  if (!slot) {
    slot = std::make_unique<std::timed_mutex>();
  }
  return *slot;
}

bool TemplateLibrary::refresh(const std::string &scope, bool force) {
  if (!force && isFresh(scope)) {
    return true;
  }

  std::unique_lock<std::timed_mutex> guard(refreshLock(scope),
                                           std::defer_lock);
  if (!guard.try_lock_for(
          std::chrono::milliseconds(m_config.refreshLockTimeoutMs))) {
    std::cerr << "[TemplateLibrary] Warning: refresh of scope '" << scope
              << "' is held by another caller; serving cached templates"
              << std::endl;
    return false;
  }

  // Another caller may have refreshed while this one waited
  if (!force && isFresh(scope)) {
    return true;
  }

  std::vector<Template> pulled;
  try {
    TemplateQuery query;
    query.appId = scope;
    pulled = m_source->pullTemplates(query);
  } catch (const std::exception &e) {
    std::cerr << "[TemplateLibrary] Warning: pull failed for scope '" << scope
              << "': " << e.what() << "; serving cached templates"
              << std::endl;
    return false;
  }

  {
    std::unique_lock<std::shared_mutex> lock(m_cacheMutex);
    CacheEntry &entry = m_cache[scope];
    entry.templates = std::move(pulled);
    entry.syncedAt = now();

    if (m_verbose) {
      std::cerr << "[TemplateLibrary] DEBUG: scope '" << scope << "' now has "
                << entry.templates.size() << " templates" << std::endl;
    }
  }

  return true;
}

std::vector<Template> TemplateLibrary::candidates(const std::string &scope) {
  refresh(scope, false);

  std::vector<Template> result;
  std::shared_lock<std::shared_mutex> lock(m_cacheMutex);
  auto it = m_cache.find(scope);
  if (it == m_cache.end()) {
    return result;
  }

  for (const auto &tmpl : it->second.templates) {
    if (tmpl.signature) {
      result.push_back(tmpl);
    }
  }
  return result;
}

std::vector<Template> TemplateLibrary::candidates(const TemplateQuery &query) {
  std::vector<Template> result;
  for (auto &tmpl : candidates(query.appId)) {
    if (query.documentType && tmpl.documentType != *query.documentType) {
      continue;
    }
    if (query.vendor && tmpl.vendor != *query.vendor) {
      continue;
    }
    result.push_back(std::move(tmpl));
  }
  return result;
}

std::optional<Template> TemplateLibrary::find(const std::string &scope,
                                              const std::string &templateId) {
  refresh(scope, false);

  std::shared_lock<std::shared_mutex> lock(m_cacheMutex);
  auto it = m_cache.find(scope);
  if (it == m_cache.end()) {
    return std::nullopt;
  }
  for (const auto &tmpl : it->second.templates) {
    if (tmpl.id == templateId) {
      return tmpl;
    }
  }
  return std::nullopt;
}

VariantProposal
TemplateLibrary::proposeVariant(const Template &baseTemplate,
                                const StructuralSignature &observed,
                                double similarity) {
  VariantProposal proposal;
  proposal.createdAt = now();

  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    proposal.createdAt.time_since_epoch())
                    .count();
  std::ostringstream id;
  id << "proposal-" << baseTemplate.id << "-" << millis << "-"
     << m_proposalCounter.fetch_add(1);

  proposal.id = id.str();
  proposal.baseTemplateId = baseTemplate.id;
  proposal.appId = baseTemplate.appId;
  proposal.documentType = baseTemplate.documentType;
  proposal.vendor = baseTemplate.vendor;
  proposal.observedSignature = observed;
  proposal.similarity = similarity;

  try {
    m_source->pushProposal(proposal);
    proposal.submitted = true;
    std::cerr << "[TemplateLibrary] Proposed variant " << proposal.id
              << " of template '" << baseTemplate.id << "' (similarity "
              << similarity << ")" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[TemplateLibrary] Warning: could not submit variant "
              << proposal.id << ": " << e.what() << "; kept locally"
              << std::endl;
  }

  std::lock_guard<std::mutex> lock(m_proposalMutex);
  m_proposals[proposal.appId].push_back(proposal);
  return proposal;
}

std::vector<VariantProposal>
TemplateLibrary::pendingProposals(const std::string &scope) const {
  std::lock_guard<std::mutex> lock(m_proposalMutex);
  auto it = m_proposals.find(scope);
  if (it == m_proposals.end()) {
    return {};
  }
  return it->second;
}

} // namespace docintel

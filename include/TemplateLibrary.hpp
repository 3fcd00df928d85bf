#ifndef DOCINTEL_TEMPLATE_LIBRARY_HPP
#define DOCINTEL_TEMPLATE_LIBRARY_HPP

#include "DocumentTypes.hpp"
#include "PipelineConfig.hpp"
#include "TemplateSource.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Read-through cache of templates, one entry per application id
 *
 * Reads take a shared lock and run concurrently. A refresh pulls from the
 * TemplateSource under a per-scope timed lock; a caller that cannot get the
 * lock within refreshLockTimeoutMs serves the existing cache instead of
 * waiting. A failed pull keeps serving the stale cache.
 *
 * Example usage:
 * @code
 * auto source = std::make_shared<docintel::FileTemplateSource>("templates");
 * docintel::TemplateLibrary library(source);
 * auto templates = library.candidates("hq");
 * @endcode
 */
class TemplateLibrary {
public:
  using TimeSource = std::function<Clock::time_point()>;

  explicit TemplateLibrary(std::shared_ptr<TemplateSource> source,
                           const LibraryConfig &config = LibraryConfig(),
                           bool verbose = false);

  TemplateLibrary(const TemplateLibrary &) = delete;
  TemplateLibrary &operator=(const TemplateLibrary &) = delete;

  /**
   * @brief Templates of a scope that carry a computed signature
   *
   * Refreshes the scope first when its cache entry is missing or stale.
   */
  std::vector<Template> candidates(const std::string &scope);

  /**
   * @brief Candidates of query.appId filtered by document type and vendor
   */
  std::vector<Template> candidates(const TemplateQuery &query);

  /**
   * @brief Pull the templates of a scope from the source
   * @param scope Application id
   * @param force Pull even if the cache entry is still fresh
   * @return true if the cache entry is fresh afterwards
   */
  bool refresh(const std::string &scope, bool force = false);

  /**
   * @brief Look up one template by id, with or without a signature
   */
  std::optional<Template> find(const std::string &scope,
                               const std::string &templateId);

  /**
   * @brief Propose a variant of a template for a near-miss document
   *
   * The proposal is pushed to the source and kept locally. A push failure
   * is logged and the proposal stays local with submitted == false.
   */
  VariantProposal proposeVariant(const Template &baseTemplate,
                                 const StructuralSignature &observed,
                                 double similarity);

  /**
   * @brief Proposals created in this process for a scope
   */
  std::vector<VariantProposal> pendingProposals(const std::string &scope) const;

  /**
   * @brief Replace the clock used for TTL checks
   */
  void setTimeSource(TimeSource now);

private:
  struct CacheEntry {
    std::vector<Template> templates;
    Clock::time_point syncedAt;
  };

  bool isFresh(const std::string &scope) const;
  std::timed_mutex &refreshLock(const std::string &scope);
  Clock::time_point now() const;

  std::shared_ptr<TemplateSource> m_source;
  LibraryConfig m_config;
  bool m_verbose;

  mutable std::shared_mutex m_cacheMutex;
  std::map<std::string, CacheEntry> m_cache;

  std::mutex m_lockTableMutex;
  std::map<std::string, std::unique_ptr<std::timed_mutex>> m_refreshLocks;

  mutable std::mutex m_proposalMutex;
  std::map<std::string, std::vector<VariantProposal>> m_proposals;
  std::atomic<unsigned long> m_proposalCounter{0};

  mutable std::mutex m_timeMutex;
  TimeSource m_now;
};

} // namespace docintel

#endif // DOCINTEL_TEMPLATE_LIBRARY_HPP

#ifndef DOCINTEL_TEMPLATE_SOURCE_HPP
#define DOCINTEL_TEMPLATE_SOURCE_HPP

#include "DocumentTypes.hpp"

#include <filesystem>
#include <vector>

namespace docintel {

/**
 * @brief Authoritative template store owned by the business system
 *
 * Both operations may block on I/O and may throw on transport errors.
 */
class TemplateSource {
public:
  virtual ~TemplateSource() = default;

  /**
   * @brief Pull template definitions visible to a query
   */
  virtual std::vector<Template> pullTemplates(const TemplateQuery &query) = 0;

  /**
   * @brief Submit a variant proposal for human approval
   */
  virtual void pushProposal(const VariantProposal &proposal) = 0;
};

/**
 * @brief Template source backed by a directory tree
 *
 * Layout: <root>/<appId>/templates.json holds an array of templates;
 * proposals are written to <root>/<appId>/proposals/<proposalId>.json.
 */
class FileTemplateSource : public TemplateSource {
public:
  explicit FileTemplateSource(const std::filesystem::path &rootDir);

  std::vector<Template> pullTemplates(const TemplateQuery &query) override;
  void pushProposal(const VariantProposal &proposal) override;

  /**
   * @brief Write the template list of one application
   */
  void saveTemplates(const std::string &appId,
                     const std::vector<Template> &templates);

private:
  std::filesystem::path m_root;
};

} // namespace docintel

#endif // DOCINTEL_TEMPLATE_SOURCE_HPP

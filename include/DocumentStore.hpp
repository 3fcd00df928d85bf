#ifndef DOCINTEL_DOCUMENT_STORE_HPP
#define DOCINTEL_DOCUMENT_STORE_HPP

#include "DocumentTypes.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docintel {

/**
 * @brief Durable record of documents and their derived artifacts
 *
 * save() must be durable when it returns; the lifecycle relies on it to
 * resume a crashed run from the last persisted state.
 */
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  virtual void save(const Document &doc) = 0;
  virtual std::optional<Document> load(const std::string &id) = 0;
  virtual std::vector<Document> listAll() = 0;

  /**
   * @brief Documents currently in @p state
   */
  virtual std::vector<Document> listByState(DocumentState state);

  /**
   * @brief Persist the normalized raster of a document
   */
  virtual void saveNormalizedImage(const std::string &id,
                                   const cv::Mat &image) = 0;

  /**
   * @brief Load the normalized raster; empty Mat if none was saved
   */
  virtual cv::Mat loadNormalizedImage(const std::string &id) = 0;
};

/**
 * @brief DocumentStore with one directory per document
 *
 * <root>/<id>/document.json holds the record and is replaced atomically;
 * <root>/<id>/normalized.png holds the NormalizedImage raster.
 */
class FileDocumentStore : public DocumentStore {
public:
  explicit FileDocumentStore(const std::filesystem::path &rootDir);

  void save(const Document &doc) override;
  std::optional<Document> load(const std::string &id) override;
  std::vector<Document> listAll() override;

  void saveNormalizedImage(const std::string &id,
                           const cv::Mat &image) override;
  cv::Mat loadNormalizedImage(const std::string &id) override;

private:
  std::filesystem::path documentDir(const std::string &id) const;

  std::filesystem::path m_root;
  std::mutex m_mutex;
};

} // namespace docintel

#endif // DOCINTEL_DOCUMENT_STORE_HPP

#ifndef DOCINTEL_DOCUMENT_PIPELINE_HPP
#define DOCINTEL_DOCUMENT_PIPELINE_HPP

#include "DocumentLifecycle.hpp"
#include "DocumentStore.hpp"
#include "DocumentTypes.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace docintel {

/**
 * @brief Result of handing a file to the pipeline
 */
struct EnqueueResult {
  bool success = false;
  std::string errorMessage;
  std::string documentId;
};

/**
 * @brief Entry point for documents: persistent queue plus worker pool
 *
 * Each document is driven end-to-end by one worker through the
 * DocumentLifecycle. Workers share one FIFO queue; nothing is ordered
 * across documents.
 */
class DocumentPipeline {
public:
  /**
   * @param workerCount Number of worker threads; 0 = hardware concurrency
   */
  DocumentPipeline(std::shared_ptr<DocumentLifecycle> lifecycle,
                   std::shared_ptr<DocumentStore> store, int workerCount = 0,
                   bool verbose = false);
  ~DocumentPipeline();

  DocumentPipeline(const DocumentPipeline &) = delete;
  DocumentPipeline &operator=(const DocumentPipeline &) = delete;

  /**
   * @brief Register a new document and queue it for processing
   * @param sourcePath Absolute path of the image or PDF
   * @param appId Calling application; scopes template lookup
   * @param metadata Free-form bag (original filename, channel, timestamp)
   */
  EnqueueResult enqueue(const std::string &sourcePath, const std::string &appId,
                        const Metadata &metadata = Metadata());

  /**
   * @brief Re-queue persisted unfinished documents and start the workers
   */
  void start();

  /**
   * @brief Stop the workers after their current document
   *
   * Queued documents stay persisted and are picked up by the next start().
   */
  void stop();

  /**
   * @brief Block until the queue is empty and no worker is busy
   */
  void waitIdle();

  /**
   * @brief Request cancellation; takes effect at the next stage boundary
   * @return false if the document is unknown or already terminal
   */
  bool cancel(const std::string &documentId);

  std::vector<Document> reviewQueue();
  std::vector<Document> failedDocuments();
  std::optional<Document> document(const std::string &documentId);

  int workerCount() const { return m_workerCount; }

private:
  void workerLoop();
  void process(const std::string &documentId);
  bool isCancelled(const std::string &documentId);
  std::string generateId(const std::string &sourcePath,
                         const std::string &appId);

  std::shared_ptr<DocumentLifecycle> m_lifecycle;
  std::shared_ptr<DocumentStore> m_store;
  int m_workerCount;
  bool m_verbose;

  std::mutex m_mutex;
  std::condition_variable m_workAvailable;
  std::condition_variable m_idle;
  std::deque<std::string> m_queue;
  std::set<std::string> m_queued;
  std::set<std::string> m_cancelled;
  std::size_t m_active = 0;
  bool m_running = false;
  bool m_stopping = false;
  unsigned long m_idCounter = 0;
  std::vector<std::thread> m_workers;
};

} // namespace docintel

#endif // DOCINTEL_DOCUMENT_PIPELINE_HPP

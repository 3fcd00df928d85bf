#include "DocumentPipeline.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace docintel {

namespace {

// 64-bit FNV-1a
std::uint64_t fnv1a(const std::string &text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

} // namespace

DocumentPipeline::DocumentPipeline(std::shared_ptr<DocumentLifecycle> lifecycle,
                                   std::shared_ptr<DocumentStore> store,
                                   int workerCount, bool verbose)
    : m_lifecycle(std::move(lifecycle)), m_store(std::move(store)),
      m_workerCount(workerCount), m_verbose(verbose) {
  if (!m_lifecycle || !m_store) {
    throw std::invalid_argument(
        "DocumentPipeline requires a lifecycle and a document store");
  }
  if (m_workerCount <= 0) {
    m_workerCount = static_cast<int>(std::thread::hardware_concurrency());
  }
  if (m_workerCount < 1) {
    m_workerCount = 1;
  }
}

DocumentPipeline::~DocumentPipeline() { stop(); }

std::string DocumentPipeline::generateId(const std::string &sourcePath,
                                         const std::string &appId) {
  unsigned long counter;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    counter = ++m_idCounter;
  }
  auto now = Clock::now().time_since_epoch().count();

  std::ostringstream key;
  key << sourcePath << '|' << appId << '|' << now << '|' << counter;

  std::ostringstream id;
  id << "doc-" << std::hex << std::setw(16) << std::setfill('0')
     << fnv1a(key.str());
  return id.str();
}

EnqueueResult DocumentPipeline::enqueue(const std::string &sourcePath,
                                        const std::string &appId,
                                        const Metadata &metadata) {
  EnqueueResult result;

  if (sourcePath.empty() || !std::filesystem::path(sourcePath).is_absolute()) {
    result.errorMessage = "Source path must be absolute: '" + sourcePath + "'";
    std::cerr << "[DocumentPipeline] Error: " << result.errorMessage
              << std::endl;
    return result;
  }
  if (appId.empty()) {
    result.errorMessage = "Application id is required";
    std::cerr << "[DocumentPipeline] Error: " << result.errorMessage
              << std::endl;
    return result;
  }

  Document doc;
  doc.id = generateId(sourcePath, appId);
  doc.sourcePath = sourcePath;
  doc.appId = appId;
  doc.metadata = metadata;
  doc.state = DocumentState::Pending;

  StateTransition created;
  created.state = DocumentState::Pending;
  created.at = Clock::now();
  doc.transitions.push_back(created);

  try {
    m_store->save(doc);
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Failed to persist document: ") + e.what();
    std::cerr << "[DocumentPipeline] Error: " << result.errorMessage
              << std::endl;
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.push_back(doc.id);
    m_queued.insert(doc.id);
  }
  m_workAvailable.notify_one();

  std::cerr << "[DocumentPipeline] Enqueued " << doc.id << " (" << sourcePath
            << ", app '" << appId << "')" << std::endl;

  result.success = true;
  result.documentId = doc.id;
  return result;
}

void DocumentPipeline::start() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
      return;
    }
  }

  int recovered = 0;
  for (const auto &doc : m_store->listAll()) {
    if (isTerminal(doc.state)) {
      continue;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queued.insert(doc.id).second) {
      m_queue.push_back(doc.id);
      recovered++;
    }
  }
  if (recovered > 0) {
    std::cerr << "[DocumentPipeline] Recovered " << recovered
              << " unfinished document(s)" << std::endl;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_running = true;
  m_stopping = false;
  for (int i = 0; i < m_workerCount; i++) {
    m_workers.emplace_back(&DocumentPipeline::workerLoop, this);
  }

  if (m_verbose) {
    std::cerr << "[DocumentPipeline] DEBUG: started " << m_workerCount
              << " worker(s), " << m_queue.size() << " queued" << std::endl;
  }
}

void DocumentPipeline::stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running) {
      return;
    }
    m_stopping = true;
    workers.swap(m_workers);
  }
  m_workAvailable.notify_all();

  for (auto &worker : workers) {
    worker.join();
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_running = false;
  m_idle.notify_all();
}

void DocumentPipeline::waitIdle() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle.wait(lock, [this]() {
    return m_active == 0 && (m_queue.empty() || !m_running);
  });
}

bool DocumentPipeline::cancel(const std::string &documentId) {
  std::optional<Document> doc = m_store->load(documentId);
  if (!doc || isTerminal(doc->state)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_cancelled.insert(documentId);
  std::cerr << "[DocumentPipeline] Cancellation requested for " << documentId
            << std::endl;
  return true;
}

bool DocumentPipeline::isCancelled(const std::string &documentId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_cancelled.count(documentId) > 0;
}

std::vector<Document> DocumentPipeline::reviewQueue() {
  return m_store->listByState(DocumentState::Review);
}

std::vector<Document> DocumentPipeline::failedDocuments() {
  return m_store->listByState(DocumentState::Failed);
}

std::optional<Document> DocumentPipeline::document(const std::string &documentId) {
  return m_store->load(documentId);
}

void DocumentPipeline::workerLoop() {
  while (true) {
    std::string documentId;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_workAvailable.wait(
          lock, [this]() { return m_stopping || !m_queue.empty(); });
      if (m_stopping) {
        return;
      }
      documentId = m_queue.front();
      m_queue.pop_front();
      m_active++;
    }

    process(documentId);

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queued.erase(documentId);
      m_cancelled.erase(documentId);
      m_active--;
      if (m_active == 0 && m_queue.empty()) {
        m_idle.notify_all();
      }
    }
  }
}

void DocumentPipeline::process(const std::string &documentId) {
  try {
    std::optional<Document> doc = m_store->load(documentId);
    if (!doc) {
      std::cerr << "[DocumentPipeline] Warning: document " << documentId
                << " disappeared from the store" << std::endl;
      return;
    }

    DocumentState finalState = m_lifecycle->run(
        *doc, [this, documentId]() { return isCancelled(documentId); });

    if (m_verbose) {
      std::cerr << "[DocumentPipeline] DEBUG: " << documentId << " finished in "
                << toString(finalState) << std::endl;
    }
  } catch (const std::exception &e) {
    // The lifecycle converts stage errors itself; this only sees store failures
    std::cerr << "[DocumentPipeline] Error: processing " << documentId
              << " aborted: " << e.what() << std::endl;
  }
}

} // namespace docintel

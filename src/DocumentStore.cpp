#include "DocumentStore.hpp"

#include "FileUtils.hpp"
#include "JsonSerialization.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace docintel {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::vector<Document> DocumentStore::listByState(DocumentState state) {
  std::vector<Document> matching;
  for (auto &doc : listAll()) {
    if (doc.state == state) {
      matching.push_back(std::move(doc));
    }
  }
  return matching;
}

FileDocumentStore::FileDocumentStore(const fs::path &rootDir)
    : m_root(rootDir) {
  fs::create_directories(m_root);
}

fs::path FileDocumentStore::documentDir(const std::string &id) const {
  if (!isSafePathComponent(id)) {
    throw std::invalid_argument("Invalid document id: '" + id + "'");
  }
  return m_root / id;
}

void FileDocumentStore::save(const Document &doc) {
  json j = doc;
  std::lock_guard<std::mutex> lock(m_mutex);
  writeFileAtomically(documentDir(doc.id) / "document.json", j.dump(2));
}

std::optional<Document> FileDocumentStore::load(const std::string &id) {
  fs::path file = documentDir(id) / "document.json";

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!fs::exists(file)) {
    return std::nullopt;
  }
  return json::parse(readFile(file)).get<Document>();
}

std::vector<Document> FileDocumentStore::listAll() {
  std::vector<Document> documents;

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!fs::exists(m_root)) {
    return documents;
  }

  for (const auto &entry : fs::directory_iterator(m_root)) {
    if (!entry.is_directory()) {
      continue;
    }
    fs::path file = entry.path() / "document.json";
    if (!fs::exists(file)) {
      continue;
    }
    try {
      documents.push_back(json::parse(readFile(file)).get<Document>());
    } catch (const std::exception &e) {
      // One corrupt record must not hide the others
      std::cerr << "[FileDocumentStore] Warning: skipping unreadable record "
                << file << ": " << e.what() << std::endl;
    }
  }

  std::sort(documents.begin(), documents.end(),
            [](const Document &a, const Document &b) { return a.id < b.id; });
  return documents;
}

void FileDocumentStore::saveNormalizedImage(const std::string &id,
                                            const cv::Mat &image) {
  fs::path dir = documentDir(id);
  fs::path finalPath = dir / "normalized.png";
  fs::path tempPath = dir / "normalized.tmp.png";

  std::lock_guard<std::mutex> lock(m_mutex);
  fs::create_directories(dir);

  if (!cv::imwrite(tempPath.string(), image)) {
    throw std::runtime_error("Failed to write normalized image: " +
                             tempPath.string());
  }
  fs::rename(tempPath, finalPath);
}

cv::Mat FileDocumentStore::loadNormalizedImage(const std::string &id) {
  fs::path file = documentDir(id) / "normalized.png";

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!fs::exists(file)) {
    return cv::Mat();
  }
  return cv::imread(file.string(), cv::IMREAD_GRAYSCALE);
}

} // namespace docintel

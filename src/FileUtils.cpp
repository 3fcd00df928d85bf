#include "FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace docintel {

namespace fs = std::filesystem;

void writeFileAtomically(const fs::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }

  fs::path tempPath = path;
  tempPath += ".tmp";

  {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Failed to open temp file: " +
                               tempPath.string());
    }
    out << content;
    out.flush();
    if (out.fail()) {
      out.close();
      std::error_code ignored;
      fs::remove(tempPath, ignored);
      throw std::runtime_error("Write failed: " + tempPath.string());
    }
  }

  std::error_code ec;
  fs::rename(tempPath, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tempPath, ignored);
    throw std::runtime_error("Rename failed for " + path.string() + ": " +
                             ec.message());
  }
}

std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool isSafePathComponent(const std::string &name) {
  return !name.empty() && name != "." && name != ".." &&
         name.find_first_of("/\\") == std::string::npos;
}

} // namespace docintel

#ifndef DOCINTEL_FILE_UTILS_HPP
#define DOCINTEL_FILE_UTILS_HPP

#include <filesystem>
#include <string>

namespace docintel {

/**
 * @brief Write a file via a temporary sibling and an atomic rename
 *
 * Parent directories are created as needed. Readers never observe a
 * partially written file.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void writeFileAtomically(const std::filesystem::path &path,
                         const std::string &content);

/**
 * @brief Read a whole file into a string
 * @throws std::runtime_error if the file cannot be opened
 */
std::string readFile(const std::filesystem::path &path);

/**
 * @brief True when @p name can be used as a single directory entry
 *
 * Rejects empty names, "." and "..", and anything containing a separator.
 */
bool isSafePathComponent(const std::string &name);

} // namespace docintel

#endif // DOCINTEL_FILE_UTILS_HPP

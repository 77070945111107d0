#ifndef GITPORT_FILE_UTILS_HPP
#define GITPORT_FILE_UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitport {
namespace fs = std::filesystem;

/**
 * @brief `true` for names that do not start with `.` and end in `.yaml` or
 *        `.yml`.
 */
bool is_visible_yaml(const std::string& name);

/**
 * @brief Non-recursive, sorted listing of the visible YAML files in
 *        @p root or @p root / @p subpath.
 *
 * Only regular files (symlinks are followed) are considered.
 *
 * @throws gitport::Error FileNotFound if the directory does not exist, Io if
 *         it is not a directory or cannot be read.
 */
std::vector<std::string> list_files(const fs::path& root,
                                    const std::optional<std::string>& subpath = std::nullopt);

/**
 * @brief Read @p root / @p file and return its bytes base64 encoded.
 *
 * @throws gitport::Error FileNotFound if the file does not exist, Io if it is
 *         not a regular file or cannot be read.
 */
std::string read_file(const fs::path& root, const std::string& file);

/// Standard (RFC 4648, padded) base64 encoding of arbitrary bytes.
std::string base64_encode(const std::string& bytes);

/**
 * @brief Decode padded standard base64.
 *
 * @return Decoded bytes, or `std::nullopt` on malformed input.
 */
std::optional<std::string> base64_decode(const std::string& text);

} // namespace gitport

#endif // GITPORT_FILE_UTILS_HPP

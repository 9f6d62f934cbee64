/**
 * @file deletion.cpp
 * @brief Deletion batch implementation
 */

#include "video_tagger/deletion.hpp"

#include <filesystem>

#include "video_tagger/logging.hpp"

namespace video_tagger {

namespace fs = std::filesystem;

DeletionReport execute_deletion(const std::vector<std::string> &paths) {
  for (const auto &path : paths) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (!ec && !removed)
      ec = std::make_error_code(std::errc::no_such_file_or_directory);

    if (ec) {
      LOG_ERROR("Failed to delete {}: {}", path, ec.message());
      return DeletionReport{path, false, ec};
    }
    LOG_INFO("Deleted {}", path);
  }
  return DeletionReport{std::string(), true, std::error_code()};
}

} // namespace video_tagger

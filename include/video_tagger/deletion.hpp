/**
 * @file deletion.hpp
 * @brief Execution of a pending deletion batch
 *
 * @details Files are removed in order. The first failure aborts the rest of
 *          the batch: files already removed stay removed (no rollback) and
 *          the report names the path that failed.
 */

#ifndef VIDEO_TAGGER_DELETION_HPP
#define VIDEO_TAGGER_DELETION_HPP

#include <string>
#include <system_error>
#include <vector>

namespace video_tagger {

/**
 * @struct DeletionReport
 * @brief Outcome of one deletion batch.
 * @note success == true with an empty path means every listed file was
 *       removed. Otherwise path names the first file that could not be.
 */
struct DeletionReport {
  std::string path;
  bool success = false;
  std::error_code error;

  bool all_removed() const { return success && path.empty(); }
};

/**
 * @brief Remove each path in order, stopping at the first failure.
 * @note A path that no longer exists is a failure.
 */
DeletionReport execute_deletion(const std::vector<std::string> &paths);

} // namespace video_tagger

#endif // VIDEO_TAGGER_DELETION_HPP

/**
 * @file verification.cpp
 * @brief Hash verification implementation
 */

#include "video_tagger/verification.hpp"

#include "video_tagger/filename_codec.hpp"
#include "video_tagger/metadata_extractor.hpp"

namespace video_tagger {

VerifyResult verify_file(const std::string &path) {
  VerifyResult result;
  result.path = path;

  if (!is_video_file(path)) {
    result.status = VerifyStatus::NotAVideoFile;
    return result;
  }

  if (!extract_hash(path, result.expected)) {
    result.status = VerifyStatus::NotTagged;
    return result;
  }

  uint32_t crc = 0;
  if (!compute_crc32(path, crc, result.error)) {
    result.status = VerifyStatus::HashFailed;
    return result;
  }

  result.actual = format_hash(crc);
  result.status = hashes_equal(result.expected, result.actual)
                      ? VerifyStatus::Verified
                      : VerifyStatus::Mismatch;
  return result;
}

std::vector<VerifyResult> verify_files(const std::vector<std::string> &paths) {
  std::vector<VerifyResult> results;
  results.reserve(paths.size());
  for (const auto &path : paths) {
    results.push_back(verify_file(path));
  }
  return results;
}

} // namespace video_tagger

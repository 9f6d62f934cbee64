/**
 * @file verification.hpp
 * @brief Check embedded hashes against the current file contents
 */

#ifndef VIDEO_TAGGER_VERIFICATION_HPP
#define VIDEO_TAGGER_VERIFICATION_HPP

#include <string>
#include <vector>

namespace video_tagger {

enum class VerifyStatus {
  Verified,      //< Embedded hash matches the contents
  Mismatch,      //< Contents changed since tagging
  NotAVideoFile, //< Extension not in the supported set
  NotTagged,     //< No metadata suffix
  HashFailed     //< File could not be read
};

inline const char *to_string(VerifyStatus status) {
  switch (status) {
  case VerifyStatus::Verified:
    return "verified";
  case VerifyStatus::Mismatch:
    return "mismatch";
  case VerifyStatus::NotAVideoFile:
    return "not a video file";
  case VerifyStatus::NotTagged:
    return "not tagged";
  case VerifyStatus::HashFailed:
    return "hash failed";
  }
  return "unknown";
}

/**
 * @struct VerifyResult
 * @brief Outcome of verifying one file.
 */
struct VerifyResult {
  std::string path;
  VerifyStatus status = VerifyStatus::NotTagged;
  std::string expected; //< Hash embedded in the name
  std::string actual;   //< Recomputed hash (empty unless computed)
  std::string error;    //< HashFailed only
};

/**
 * @brief Recompute the CRC-32 of a tagged file and compare it.
 * @note Comparison is case-insensitive.
 */
VerifyResult verify_file(const std::string &path);

/// verify_file() over every path, in order
std::vector<VerifyResult> verify_files(const std::vector<std::string> &paths);

} // namespace video_tagger

#endif // VIDEO_TAGGER_VERIFICATION_HPP

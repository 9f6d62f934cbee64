/**
 * @file types.hpp
 * @brief Core data types and error taxonomy for Video Tagger
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - MetadataTriple: the resolution/duration/hash embedded in names
 *
 *          - VideoFile: a discovered file and what its name carries
 *
 *          - TagError / TagResult: per-file outcome of a tagging pass
 */

#ifndef VIDEO_TAGGER_TYPES_HPP
#define VIDEO_TAGGER_TYPES_HPP

#include <cstdint>
#include <string>

namespace video_tagger {

// **----- DATA STRUCTURES -----**

/**
 * @struct MetadataTriple
 * @brief The metadata embedded in a tagged filename.
 * @note Immutable once embedded; a rename produces a new identity.
 */
struct MetadataTriple {
  std::string resolution;    //< "WxH", both decimal integers
  long duration_minutes = 0; //< Rounded, non-negative
  std::string hash;          //< 8 hex digits (case-insensitive)
};

/**
 * @struct VideoFile
 * @brief A video file identified by its path.
 * @note The metadata field is meaningful only when tagged is true.
 */
struct VideoFile {
  std::string path;
  std::uintmax_t size = 0;
  bool tagged = false;
  MetadataTriple metadata;
};

// **----- ERROR TAXONOMY -----**

enum class TagErrorKind {
  None,
  NotAVideoFile,            //< Unrecognised extension (informational skip)
  AlreadyTagged,            //< Name already carries metadata (silent skip)
  DirectoryInput,           //< Path is a directory (informational skip)
  StatFailed,               //< Path could not be inspected
  MetadataExtractionFailed, //< Prober failed (see ExtractStage)
  HashComputationFailed,    //< Checksum could not be computed
  RenameFailed,             //< File stays untagged and is retried next run
  Aborted                   //< Exception escaped while processing the file
};

/// Step of the extractor that failed
enum class ExtractStage { None, Resolution, Duration, Hash };

inline const char *to_string(TagErrorKind kind) {
  switch (kind) {
  case TagErrorKind::None:
    return "ok";
  case TagErrorKind::NotAVideoFile:
    return "not a video file";
  case TagErrorKind::AlreadyTagged:
    return "already tagged";
  case TagErrorKind::DirectoryInput:
    return "is a directory";
  case TagErrorKind::StatFailed:
    return "cannot access";
  case TagErrorKind::MetadataExtractionFailed:
    return "metadata extraction failed";
  case TagErrorKind::HashComputationFailed:
    return "hash computation failed";
  case TagErrorKind::RenameFailed:
    return "rename failed";
  case TagErrorKind::Aborted:
    return "aborted";
  }
  return "unknown";
}

inline const char *to_string(ExtractStage stage) {
  switch (stage) {
  case ExtractStage::None:
    return "none";
  case ExtractStage::Resolution:
    return "resolution";
  case ExtractStage::Duration:
    return "duration";
  case ExtractStage::Hash:
    return "hash";
  }
  return "unknown";
}

/**
 * @struct TagError
 * @brief Failure or skip reason attached to one file.
 */
struct TagError {
  TagErrorKind kind = TagErrorKind::None;
  ExtractStage stage = ExtractStage::None;
  std::string message; //< Short reason, collaborator text wrapped verbatim

  bool ok() const { return kind == TagErrorKind::None; }

  /// Skips are informational; they are not counted as failures
  bool is_skip() const {
    return kind == TagErrorKind::NotAVideoFile ||
           kind == TagErrorKind::AlreadyTagged ||
           kind == TagErrorKind::DirectoryInput;
  }
};

/**
 * @struct TagResult
 * @brief Outcome of tagging a single file.
 */
struct TagResult {
  std::string path;            //< Input path
  std::string new_path;        //< Renamed path (empty unless renamed)
  TagError error;              //< kind == None on success
  long processing_time_us = 0; //< Wall time spent on this file

  bool success() const { return error.ok() && !new_path.empty(); }
};

} // namespace video_tagger

#endif // VIDEO_TAGGER_TYPES_HPP

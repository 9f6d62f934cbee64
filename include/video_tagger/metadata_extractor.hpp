/**
 * @file metadata_extractor.hpp
 * @brief Resolution, duration and checksum extraction for one file
 *
 * @details Provides:
 *          - MetadataProber: interface to the tool that reports stream
 *            dimensions and container duration
 *
 *          - LibavProber: in-process prober built on libavformat
 *
 *          - compute_crc32: streaming whole-file CRC-32 (IEEE)
 *
 *          - MetadataExtractor: runs the three steps and reports which
 *            one failed
 *
 * @note No retries: a transient failure fails the file for this pass only.
 *       The file stays untagged and is picked up again on the next run.
 */

#ifndef VIDEO_TAGGER_METADATA_EXTRACTOR_HPP
#define VIDEO_TAGGER_METADATA_EXTRACTOR_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "types.hpp"

namespace video_tagger {

/**
 * @class MetadataProber
 * @brief Source of stream dimensions and container duration.
 * @note Implementations must be safe to call from several workers at once.
 */
class MetadataProber {
public:
  virtual ~MetadataProber() = default;

  /**
   * @brief Report the first video stream's dimensions as "WxH".
   * @param error Output: collaborator message on failure
   */
  virtual bool probe_resolution(const std::string &path,
                                std::string &resolution,
                                std::string &error) = 0;

  /**
   * @brief Report the container duration in seconds.
   * @param error Output: collaborator message on failure
   */
  virtual bool probe_duration(const std::string &path, double &seconds,
                              std::string &error) = 0;
};

/**
 * @class LibavProber
 * @brief MetadataProber backed by libavformat.
 * @note Each call opens its own AVFormatContext; nothing is shared.
 */
class LibavProber : public MetadataProber {
public:
  bool probe_resolution(const std::string &path, std::string &resolution,
                        std::string &error) override;
  bool probe_duration(const std::string &path, double &seconds,
                      std::string &error) override;
};

/// Progress callback: bytes hashed so far and total file size
using HashProgressFn = std::function<void(uint64_t done, uint64_t total)>;

/**
 * @brief Compute the CRC-32 (IEEE, zlib-compatible) of a whole file.
 *
 * @param path File to read
 * @param crc Output: checksum
 * @param error Output: errno text on failure
 * @param progress Optional callback invoked after every block
 * @return true on success
 */
bool compute_crc32(const std::string &path, uint32_t &crc, std::string &error,
                   const HashProgressFn &progress = {});

/**
 * @struct ExtractedMetadata
 * @brief Raw extractor output before rounding and encoding.
 */
struct ExtractedMetadata {
  std::string resolution;      //< "WxH"
  double duration_minutes = 0; //< seconds / 60, not rounded
  uint32_t crc = 0;            //< Whole-file CRC-32
};

/**
 * @class MetadataExtractor
 * @brief Runs resolution probe, duration probe and checksum for one file.
 */
class MetadataExtractor {
public:
  /**
   * @param prober Collaborator used for resolution and duration; must
   *               outlive the extractor
   */
  explicit MetadataExtractor(MetadataProber &prober);

  /**
   * @brief Extract everything needed to tag one file.
   *
   * @param path File to inspect
   * @param out Output: extracted metadata
   * @param error Output: failing stage and wrapped collaborator message
   * @param progress Optional hashing progress callback
   * @return true if all three steps succeeded
   */
  bool extract(const std::string &path, ExtractedMetadata &out,
               TagError &error, const HashProgressFn &progress = {}) const;

private:
  MetadataProber &prober_;
};

} // namespace video_tagger

#endif // VIDEO_TAGGER_METADATA_EXTRACTOR_HPP

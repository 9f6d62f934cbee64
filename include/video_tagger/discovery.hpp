/**
 * @file discovery.hpp
 * @brief Discovery of tagged and untagged video files under a directory
 *
 * @details Two enumeration strategies produce the same result set:
 *
 *          - WalkEnumerator: portable recursive std::filesystem walk
 *            (always available)
 *
 *          - FdEnumerator: the external `fd` tool; its raw output is
 *            post-filtered through the same predicates as the walk
 *
 *          DiscoveryScanner tries the accelerated strategy first and falls
 *          back to the walk when it is unavailable or fails. Callers never
 *          observe which one ran.
 */

#ifndef VIDEO_TAGGER_DISCOVERY_HPP
#define VIDEO_TAGGER_DISCOVERY_HPP

#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "types.hpp"

namespace video_tagger {

/// Which side of the tag classification a scan collects
enum class DiscoveryFilter { Untagged, Tagged };

/**
 * @brief Shared post-filter: recognised video extension and tag state.
 */
bool matches_filter(const std::string &path, DiscoveryFilter filter);

/**
 * @class FileEnumerator
 * @brief One strategy for listing candidate files under a root.
 */
class FileEnumerator {
public:
  virtual ~FileEnumerator() = default;

  /// Strategy name for log messages
  virtual const char *name() const = 0;

  /**
   * @brief List files under root that pass matches_filter().
   * @param out Output: matching paths, in enumeration order
   * @param error Output: reason when the strategy failed
   * @return false if the strategy could not complete
   */
  virtual bool enumerate(const std::string &root, DiscoveryFilter filter,
                         std::vector<std::string> &out,
                         std::string &error) = 0;
};

/**
 * @class WalkEnumerator
 * @brief Portable recursive directory walk.
 * @note Directory symlinks are not followed. Any entry that is not a
 *       directory is a candidate.
 */
class WalkEnumerator : public FileEnumerator {
public:
  const char *name() const override { return "walk"; }
  bool enumerate(const std::string &root, DiscoveryFilter filter,
                 std::vector<std::string> &out, std::string &error) override;
};

/**
 * @class FdEnumerator
 * @brief Accelerated enumeration through the external `fd` tool.
 * @note Runs with --hidden --no-ignore so the result set matches the walk.
 */
class FdEnumerator : public FileEnumerator {
public:
  /// @param binary Executable name (looked up on PATH) or path
  explicit FdEnumerator(std::string binary);

  const char *name() const override { return "fd"; }

  /// Whether the executable can be found
  bool available() const { return !resolved_.empty(); }

  bool enumerate(const std::string &root, DiscoveryFilter filter,
                 std::vector<std::string> &out, std::string &error) override;

private:
  std::string binary_;
  std::string resolved_;
};

/**
 * @class DiscoveryScanner
 * @brief Finds tagged / untagged video files, hiding the strategy used.
 *
 * @note Results are sorted so both strategies return identical lists.
 */
class DiscoveryScanner {
public:
  /// Accelerated strategy configured from Config::use_fd / fd_binary
  DiscoveryScanner();

  /**
   * @param accelerated Strategy tried before the walk (nullptr = walk only)
   */
  explicit DiscoveryScanner(std::unique_ptr<FileEnumerator> accelerated);

  /// Untagged video files under root
  bool find_untagged(const std::string &root, std::vector<std::string> &out,
                     std::string &error);

  /// Tagged video files under root
  bool find_tagged(const std::string &root, std::vector<std::string> &out,
                   std::string &error);

private:
  bool find(const std::string &root, DiscoveryFilter filter,
            std::vector<std::string> &out, std::string &error);

  std::unique_ptr<FileEnumerator> accelerated_;
  WalkEnumerator walk_;
};

/**
 * @brief Inspect one file: size and decoded tag metadata.
 * @param ec Output: filesystem error, if any
 */
bool inspect_video_file(const std::string &path, VideoFile &file,
                        std::error_code &ec);

} // namespace video_tagger

#endif // VIDEO_TAGGER_DISCOVERY_HPP

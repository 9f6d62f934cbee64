/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/video_tagger.env for detailed documentation of each
 *          parameter.
 */

#ifndef VIDEO_TAGGER_CONFIG_HPP
#define VIDEO_TAGGER_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace video_tagger {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @note A malformed value falls back to the default instead of throwing.
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || *val == '\0')
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val != '\0') ? std::string(val) : std::string(default_val);
}

// **---- TAGGING ----**

/**
 * @brief Worker count override for the tag command
 * @note 0 = auto (1 on network mounts, logical core count otherwise).
 *       The --workers command-line flag takes precedence over this value.
 */
inline int tag_workers() {
  static int val = get_env_int("TAG_WORKERS", 0);
  return val;
}

/// Minimum milliseconds between two progress events of one worker
inline int progress_interval_ms() {
  static int val = get_env_int("PROGRESS_INTERVAL_MS", 50);
  return val;
}

/// Read block size in KiB used while computing the file checksum
inline int hash_buffer_kb() {
  static int val = get_env_int("HASH_BUFFER_KB", 256);
  return val > 0 ? val : 256;
}

/// Print the per-file timing table after a tag run
inline bool show_timing() {
  static bool val = (get_env_int("SHOW_TIMING", 0) != 0);
  return val;
}

// **---- DISCOVERY ----**

/**
 * @brief Allow the accelerated `fd` enumerator
 * @note When disabled, or when the binary cannot be found, discovery always
 *       uses the portable directory walk.
 */
inline bool use_fd() {
  static bool val = (get_env_int("USE_FD", 1) != 0);
  return val;
}

/// Executable name or path of the accelerated enumerator
inline const std::string &fd_binary() {
  static std::string val = get_env_string("FD_BINARY", "fd");
  return val;
}

} // namespace Config
} // namespace video_tagger

#endif // VIDEO_TAGGER_CONFIG_HPP

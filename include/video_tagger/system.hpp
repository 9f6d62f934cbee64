/**
 * @file system.hpp
 * @brief System utilities: CPU detection, mount heuristics, child processes
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Network-mount detection and the tagging worker-count policy
 *
 *          - PATH lookup and captured execution of external tools
 *
 *          - Time formatting utilities
 */

#ifndef VIDEO_TAGGER_SYSTEM_HPP
#define VIDEO_TAGGER_SYSTEM_HPP

#include <string>
#include <vector>

namespace video_tagger {

// **---- CPU Detection ----**

/**
 * @brief Number of logical CPUs on the host.
 *
 * @return std::thread::hardware_concurrency(), or 1 when it is unknown
 */
int logical_cpu_count();

// **---- Network Mounts ----**

/**
 * @brief Heuristically decide whether a path lives on a network mount.
 *
 * @note Matches, in order:
 *
 *        - UNC-style prefixes (`//`, `\\`)
 *
 *        - Mount prefixes `/mnt/`, `/media/`, `/Volumes/` of the absolute path
 *
 *        - nfs/cifs/smb/webdav/ftp/sftp anywhere in the lower-cased path
 *
 *        - statfs() filesystem type NFS, SMB, SMB2, CIFS, AFS, Coda, Ceph
 *          (only when the path or its parent exists)
 */
bool is_network_path(const std::string &path);

/**
 * @brief Decide how many tagging workers to run.
 *
 * @param paths Input paths of the batch
 * @param override_count Explicit worker count (> 0 always wins)
 * @param cpu_count Logical core count used when no override is given
 * @return 1 if any path is on a network mount, otherwise cpu_count
 */
int resolve_worker_count(const std::vector<std::string> &paths,
                         int override_count, int cpu_count);

// **---- External Tools ----**

/**
 * @brief Resolve an executable name against PATH.
 * @note Names containing '/' are checked directly.
 * @return Full path of the executable, or empty if not found
 */
std::string find_executable(const std::string &name);

/// Quote a string for safe use as one /bin/sh word
std::string shell_quote(const std::string &arg);

/**
 * @brief Run a shell command and capture its standard output.
 *
 * @param command Command line passed to /bin/sh
 * @param output Output: everything the command wrote to stdout
 * @param exit_status Output: exit status (-1 if it did not exit normally)
 * @return false if the process could not be started
 */
bool run_command(const std::string &command, std::string &output,
                 int &exit_status);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

} // namespace video_tagger

#endif // VIDEO_TAGGER_SYSTEM_HPP

/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Logical CPU count for the default worker pool size
 *
 *          - Network-mount heuristics for the worker-count policy
 *
 *          - PATH lookup and popen-based command capture
 *
 *          - Time formatting utilities
 *
 * @note statfs() filesystem magic numbers are Linux-specific; other
 *       platforms rely on the prefix heuristics only.
 */

#include "video_tagger/system.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/vfs.h>
#endif

#include <fmt/core.h>

namespace video_tagger {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

#ifdef __linux__
/// Filesystem magic numbers of network filesystems (see statfs(2))
constexpr std::array<uint32_t, 8> NETWORK_FS_MAGIC = {
    0x6969,     // NFS_SUPER_MAGIC
    0x517B,     // SMB_SUPER_MAGIC
    0xFE534D42, // SMB2_MAGIC_NUMBER
    0xFF534D42, // CIFS_MAGIC_NUMBER
    0x5346414F, // AFS_SUPER_MAGIC
    0x73757245, // CODA_SUPER_MAGIC
    0x00C36400, // CEPH_SUPER_MAGIC
    0x01021997, // V9FS_MAGIC
};

bool is_network_filesystem(const fs::path &path) {
  std::error_code ec;
  fs::path probe = path;
  if (!fs::exists(probe, ec)) {
    probe = probe.parent_path();
    if (probe.empty() || !fs::exists(probe, ec))
      return false;
  }

  struct statfs st;
  if (statfs(probe.c_str(), &st) != 0)
    return false;

  uint32_t type = static_cast<uint32_t>(st.f_type);
  return std::find(NETWORK_FS_MAGIC.begin(), NETWORK_FS_MAGIC.end(), type) !=
         NETWORK_FS_MAGIC.end();
}
#endif

} // anonymous namespace

// **---- CPU Detection ----**

int logical_cpu_count() {
  unsigned int count = std::thread::hardware_concurrency();
  return count > 0 ? static_cast<int>(count) : 1;
}

// **---- Network Mounts ----**

bool is_network_path(const std::string &path) {
  /// UNC paths are checked before making the path absolute
  if (path.rfind("//", 0) == 0 || path.rfind("\\\\", 0) == 0)
    return true;

  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  if (ec)
    return false;
  std::string abs_str = abs.lexically_normal().string();

  static const std::array<const char *, 3> prefixes = {"/mnt/", "/media/",
                                                       "/Volumes/"};
  for (const char *prefix : prefixes) {
    if (abs_str.rfind(prefix, 0) == 0)
      return true;
  }

  std::string lower = abs_str;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  static const std::array<const char *, 6> indicators = {
      "nfs", "cifs", "smb", "webdav", "ftp", "sftp"};
  for (const char *indicator : indicators) {
    if (lower.find(indicator) != std::string::npos)
      return true;
  }

#ifdef __linux__
  if (is_network_filesystem(abs))
    return true;
#endif

  return false;
}

int resolve_worker_count(const std::vector<std::string> &paths,
                         int override_count, int cpu_count) {
  /// Explicit override always wins
  if (override_count > 0)
    return override_count;

  /// Any network input forces a single worker
  for (const auto &path : paths) {
    if (is_network_path(path))
      return 1;
  }

  return std::max(1, cpu_count);
}

// **---- External Tools ----**

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};

  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : std::string();
  }

  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return {};

  std::string path_list = path_env;
  size_t pos = 0;
  while (pos <= path_list.size()) {
    size_t end = path_list.find(':', pos);
    if (end == std::string::npos)
      end = path_list.size();

    std::string dir = path_list.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";
    std::string candidate = dir + "/" + name;

    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) &&
        access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    pos = end + 1;
  }
  return {};
}

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

bool run_command(const std::string &command, std::string &output,
                 int &exit_status) {
  output.clear();
  exit_status = -1;

  std::FILE *pipe = popen(command.c_str(), "r");
  if (!pipe)
    return false;

  std::array<char, 4096> buffer;
  size_t n;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), n);
  }

  int status = pclose(pipe);
  if (status != -1 && WIFEXITED(status)) {
    exit_status = WEXITSTATUS(status);
  }
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace video_tagger

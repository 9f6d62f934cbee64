/**
 * @file discovery.cpp
 * @brief Directory discovery implementation
 *
 * @details Provides implementations for:
 *
 *          - WalkEnumerator: std::filesystem::recursive_directory_iterator
 *
 *          - FdEnumerator: `fd` invoked through /bin/sh, output post-filtered
 *
 *          - DiscoveryScanner: accelerated-first with transparent fallback
 */

#include "video_tagger/discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>

#include <fmt/core.h>

#include "video_tagger/config.hpp"
#include "video_tagger/filename_codec.hpp"
#include "video_tagger/logging.hpp"
#include "video_tagger/system.hpp"

namespace video_tagger {

namespace fs = std::filesystem;

namespace {

/// fd patterns; the post-filter stays authoritative
constexpr const char *FD_UNTAGGED_PATTERN =
    R"(\.(mp4|webm|mov|flv|mkv|avi|wmv|mpg)$)";
constexpr const char *FD_TAGGED_PATTERN =
    R"(_\[\d+x\d+\]\[\d+min\]\[[0-9a-fA-F]{8}\]\.[^.]*$)";

} // anonymous namespace

bool matches_filter(const std::string &path, DiscoveryFilter filter) {
  if (path.empty() || !is_video_file(path))
    return false;
  bool tagged = is_tagged(path);
  return filter == DiscoveryFilter::Tagged ? tagged : !tagged;
}

// **---- WalkEnumerator ----**

bool WalkEnumerator::enumerate(const std::string &root, DiscoveryFilter filter,
                               std::vector<std::string> &out,
                               std::string &error) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    error = fmt::format("{}: {}", root,
                        ec ? ec.message() : std::string("not a directory"));
    return false;
  }

  fs::recursive_directory_iterator it(root, ec);
  if (ec) {
    error = fmt::format("{}: {}", root, ec.message());
    return false;
  }

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      error = fmt::format("{}: {}", root, ec.message());
      return false;
    }

    const fs::directory_entry &entry = *it;
    std::error_code type_ec;
    if (entry.is_symlink(type_ec) || !entry.is_regular_file(type_ec))
      continue;

    std::string path = entry.path().string();
    if (matches_filter(path, filter))
      out.push_back(std::move(path));
  }

  if (ec) {
    error = fmt::format("{}: {}", root, ec.message());
    return false;
  }
  return true;
}

// **---- FdEnumerator ----**

FdEnumerator::FdEnumerator(std::string binary)
    : binary_(std::move(binary)), resolved_(find_executable(binary_)) {}

bool FdEnumerator::enumerate(const std::string &root, DiscoveryFilter filter,
                             std::vector<std::string> &out,
                             std::string &error) {
  if (resolved_.empty()) {
    error = fmt::format("{} not found in PATH", binary_);
    return false;
  }

  const char *pattern = filter == DiscoveryFilter::Tagged
                            ? FD_TAGGED_PATTERN
                            : FD_UNTAGGED_PATTERN;

  std::string cmd = fmt::format(
      "{} --type f --hidden --no-ignore --ignore-case --color never -- {} {} "
      "2>/dev/null",
      shell_quote(resolved_), shell_quote(pattern), shell_quote(root));

  std::string output;
  int status = -1;
  if (!run_command(cmd, output, status)) {
    error = fmt::format("failed to start {}", resolved_);
    return false;
  }
  if (status != 0) {
    error = fmt::format("{} exited with status {}", resolved_, status);
    return false;
  }

  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (matches_filter(line, filter))
      out.push_back(line);
  }
  return true;
}

// **---- DiscoveryScanner ----**

DiscoveryScanner::DiscoveryScanner() {
  if (Config::use_fd()) {
    auto fd = std::make_unique<FdEnumerator>(Config::fd_binary());
    if (fd->available())
      accelerated_ = std::move(fd);
  }
}

DiscoveryScanner::DiscoveryScanner(std::unique_ptr<FileEnumerator> accelerated)
    : accelerated_(std::move(accelerated)) {}

bool DiscoveryScanner::find_untagged(const std::string &root,
                                     std::vector<std::string> &out,
                                     std::string &error) {
  return find(root, DiscoveryFilter::Untagged, out, error);
}

bool DiscoveryScanner::find_tagged(const std::string &root,
                                   std::vector<std::string> &out,
                                   std::string &error) {
  return find(root, DiscoveryFilter::Tagged, out, error);
}

bool DiscoveryScanner::find(const std::string &root, DiscoveryFilter filter,
                            std::vector<std::string> &out,
                            std::string &error) {
  std::vector<std::string> found;

  bool ok = false;
  if (accelerated_) {
    std::string reason;
    ok = accelerated_->enumerate(root, filter, found, reason);
    if (!ok) {
      /// Not an error: the walk takes over
      LOG_WARN("{} enumeration unavailable ({}), using directory walk",
               accelerated_->name(), reason);
      found.clear();
    }
  }

  if (!ok && !walk_.enumerate(root, filter, found, error))
    return false;

  std::sort(found.begin(), found.end());
  out.insert(out.end(), std::make_move_iterator(found.begin()),
             std::make_move_iterator(found.end()));
  return true;
}

bool inspect_video_file(const std::string &path, VideoFile &file,
                        std::error_code &ec) {
  file.path = path;
  file.size = fs::file_size(path, ec);
  if (ec)
    return false;
  file.tagged = decode(path, file.metadata);
  return true;
}

} // namespace video_tagger

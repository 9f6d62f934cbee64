/**
 * @file filename_codec.cpp
 * @brief Filename metadata codec implementation
 */

#include "video_tagger/filename_codec.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <stdexcept>

#include <fmt/core.h>

namespace video_tagger {

namespace {

/// Anchored tag suffix: _[WxH][Dmin][HHHHHHHH].ext at the end of the name
const std::regex &tag_suffix_regex() {
  static const std::regex re(
      R"(_\[(\d+x\d+)\]\[(\d+)min\]\[([0-9a-fA-F]{8})\]\.[^.]*$)");
  return re;
}

/// Any bracketed 8-hex-digit token
const std::regex &hash_token_regex() {
  static const std::regex re(R"(\[([0-9a-fA-F]{8})\])");
  return re;
}

const std::regex &resolution_regex() {
  static const std::regex re(R"(^\d+x\d+$)");
  return re;
}

constexpr std::array<const char *, 8> VIDEO_EXTENSIONS = {
    ".mp4", ".webm", ".mov", ".flv", ".mkv", ".avi", ".wmv", ".mpg"};

/// Final path segment (after the last '/')
std::string base_name(const std::string &path) {
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

/// Offset of the extension dot in path, or path.size() when there is none
size_t extension_offset(const std::string &path) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return path.size();
  }
  return dot;
}

} // anonymous namespace

bool is_video_file(const std::string &path) {
  size_t dot = extension_offset(path);
  if (dot == path.size())
    return false;

  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  return std::find(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(), ext) !=
         VIDEO_EXTENSIONS.end();
}

std::string encode(const std::string &path, const MetadataTriple &metadata) {
  size_t dot = extension_offset(path);
  return fmt::format("{}_[{}][{}min][{}]{}", path.substr(0, dot),
                     metadata.resolution, metadata.duration_minutes,
                     metadata.hash, path.substr(dot));
}

bool is_tagged(const std::string &path) {
  std::string name = base_name(path);
  return std::regex_search(name, tag_suffix_regex());
}

bool extract_hash(const std::string &path, std::string &hash) {
  std::string name = base_name(path);
  if (!std::regex_search(name, tag_suffix_regex()))
    return false;

  std::string last;
  for (std::sregex_iterator it(name.begin(), name.end(), hash_token_regex()),
       end;
       it != end; ++it) {
    last = (*it)[1].str();
  }
  if (last.empty())
    return false;

  hash = last;
  return true;
}

bool decode(const std::string &path, MetadataTriple &metadata) {
  std::string name = base_name(path);
  std::smatch m;
  if (!std::regex_search(name, m, tag_suffix_regex()))
    return false;

  metadata.resolution = m[1].str();
  try {
    metadata.duration_minutes = std::stol(m[2].str());
  } catch (const std::out_of_range &) {
    return false;
  }
  metadata.hash = m[3].str();
  return true;
}

bool is_valid_resolution(const std::string &resolution) {
  return std::regex_match(resolution, resolution_regex());
}

std::string format_hash(uint32_t crc) { return fmt::format("{:08X}", crc); }

bool hashes_equal(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(),
                    [](unsigned char x, unsigned char y) {
                      return std::toupper(x) == std::toupper(y);
                    });
}

std::string normalize_hash(const std::string &hash) {
  std::string out = hash;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return out;
}

} // namespace video_tagger

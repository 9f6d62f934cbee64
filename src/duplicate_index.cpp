/**
 * @file duplicate_index.cpp
 * @brief Duplicate index builder implementation
 */

#include "video_tagger/duplicate_index.hpp"

#include "video_tagger/filename_codec.hpp"
#include "video_tagger/logging.hpp"

namespace video_tagger {

DuplicateIndex group_by_hash(const std::vector<std::string> &tagged_paths) {
  DuplicateIndex by_hash;
  for (const auto &path : tagged_paths) {
    std::string hash;
    if (!extract_hash(path, hash))
      continue;
    by_hash[normalize_hash(hash)].push_back(path);
  }

  for (auto it = by_hash.begin(); it != by_hash.end();) {
    if (it->second.size() < 2)
      it = by_hash.erase(it);
    else
      ++it;
  }
  return by_hash;
}

bool build_duplicate_index(const std::string &root, DiscoveryScanner &scanner,
                           DuplicateIndex &index, std::string &error) {
  std::vector<std::string> tagged;
  if (!scanner.find_tagged(root, tagged, error))
    return false;

  index = group_by_hash(tagged);
  LOG_INFO("Scanned {} tagged files, {} duplicate groups", tagged.size(),
           index.size());
  return true;
}

} // namespace video_tagger

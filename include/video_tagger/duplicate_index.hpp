/**
 * @file duplicate_index.hpp
 * @brief Grouping of tagged files by their embedded hash
 */

#ifndef VIDEO_TAGGER_DUPLICATE_INDEX_HPP
#define VIDEO_TAGGER_DUPLICATE_INDEX_HPP

#include <map>
#include <string>
#include <vector>

#include "discovery.hpp"

namespace video_tagger {

/**
 * @brief Upper-cased hash -> paths sharing it (only entries with >= 2 paths).
 * @note Paths keep scan order within a group; groups iterate in hash order.
 */
using DuplicateIndex = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Group paths by embedded hash, dropping singleton groups.
 * @note Paths whose hash cannot be extracted are silently excluded.
 */
DuplicateIndex group_by_hash(const std::vector<std::string> &tagged_paths);

/**
 * @brief Scan root for tagged files and group them by hash.
 *
 * @param root Directory to scan
 * @param scanner Discovery strategy holder
 * @param index Output: duplicate groups
 * @param error Output: discovery failure reason
 * @return false if the directory could not be scanned
 */
bool build_duplicate_index(const std::string &root, DiscoveryScanner &scanner,
                           DuplicateIndex &index, std::string &error);

} // namespace video_tagger

#endif // VIDEO_TAGGER_DUPLICATE_INDEX_HPP

/**
 * @file filename_codec.hpp
 * @brief Encode and decode metadata embedded in video filenames
 *
 * @details A tagged filename carries its metadata as a fixed suffix placed
 *          immediately before the extension:
 *
 *          <base>_[<W>x<H>][<D>min][<HHHHHHHH>]<.ext>
 *
 *          Classification is anchored on that suffix. Hash extraction then
 *          takes the LAST bracketed 8-hex-digit token of the filename, so
 *          cosmetic tokens such as [S02E03] inserted earlier are tolerated.
 *
 * @note All functions are pure string operations; none touch the disk.
 */

#ifndef VIDEO_TAGGER_FILENAME_CODEC_HPP
#define VIDEO_TAGGER_FILENAME_CODEC_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace video_tagger {

/**
 * @brief Check whether the extension is a recognised video container.
 * @note Recognised: .mp4 .webm .mov .flv .mkv .avi .wmv .mpg (any case).
 */
bool is_video_file(const std::string &path);

/**
 * @brief Build the tagged path for a file.
 *
 * @param path Original path (directory part is preserved)
 * @param metadata Resolution, rounded duration and hash to embed
 * @return path with `_[WxH][Dmin][HASH]` inserted before the extension
 * @note Without an extension the suffix is appended as is, and is_tagged()
 *       rejects the result; round-tripping needs an extension.
 */
std::string encode(const std::string &path, const MetadataTriple &metadata);

/**
 * @brief Check whether the final path segment ends with the tag suffix.
 */
bool is_tagged(const std::string &path);

/**
 * @brief Extract the embedded hash from a tagged path.
 *
 * @param path Path or bare filename
 * @param hash Output: last bracketed 8-hex-digit token, case preserved
 * @return false unless is_tagged(path)
 */
bool extract_hash(const std::string &path, std::string &hash);

/**
 * @brief Parse the anchored suffix into its three fields.
 * @return false unless is_tagged(path)
 */
bool decode(const std::string &path, MetadataTriple &metadata);

/// Check a resolution string against ^\d+x\d+$
bool is_valid_resolution(const std::string &resolution);

/// Format a checksum as 8 upper-case hex digits
std::string format_hash(uint32_t crc);

/// Case-insensitive hash comparison
bool hashes_equal(const std::string &a, const std::string &b);

/// Upper-cased copy of a hash, used as the grouping key
std::string normalize_hash(const std::string &hash);

} // namespace video_tagger

#endif // VIDEO_TAGGER_FILENAME_CODEC_HPP

#include <cassert>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "test_support.hpp"
#include "video_tagger/discovery.hpp"
#include "video_tagger/duplicate_index.hpp"

using namespace video_tagger;
using video_tagger::test::TempDir;
using video_tagger::test::write_file;

namespace {

void test_group_by_hash() {
  fmt::print("[Test] Grouping keeps only shared hashes...\n");
  const std::vector<std::string> paths = {
      "/v/A_[1920x1080][45min][DEADBEEF].mp4",
      "/v/B_[1280x720][45min][deadbeef].mkv",
      "/v/C_[1920x1080][45min][01234567].mp4",
      "/v/plain.mp4",
  };

  DuplicateIndex index = group_by_hash(paths);
  assert(index.size() == 1);
  auto it = index.find("DEADBEEF");
  assert(it != index.end());
  const std::vector<std::string> expected = {paths[0], paths[1]};
  assert(it->second == expected);
}

void test_groups_in_hash_order() {
  fmt::print("[Test] Groups iterate in ascending hash order...\n");
  const std::vector<std::string> paths = {
      "z1_[1x1][1min][FFFF0000].mp4", "a1_[1x1][1min][0000FFFF].mp4",
      "z2_[1x1][1min][ffff0000].mp4", "a2_[1x1][1min][0000ffff].mp4",
      "m1_[1x1][1min][80000000].mp4", "m2_[1x1][1min][80000000].mp4",
      "m3_[1x1][1min][80000000].mp4",
  };
  DuplicateIndex index = group_by_hash(paths);
  std::vector<std::string> keys;
  for (const auto &entry : index)
    keys.push_back(entry.first);
  const std::vector<std::string> expected = {"0000FFFF", "80000000",
                                             "FFFF0000"};
  assert(keys == expected);
  assert(index["80000000"].size() == 3);
}

void test_build_from_directory() {
  fmt::print("[Test] Build the index from a directory scan...\n");
  TempDir dir;
  write_file(dir.file("A_[1920x1080][45min][DEADBEEF].mp4"), "a");
  write_file(dir.file("sub/B_[1920x1080][45min][DEADBEEF].mp4"), "b");
  write_file(dir.file("C_[1920x1080][45min][CAFEF00D].mp4"), "c");
  write_file(dir.file("untagged.mp4"), "u");

  DiscoveryScanner scanner(nullptr);
  DuplicateIndex index;
  std::string error;
  assert(build_duplicate_index(dir.path(), scanner, index, error));
  assert(index.size() == 1);
  const std::vector<std::string> expected = {
      dir.file("A_[1920x1080][45min][DEADBEEF].mp4"),
      dir.file("sub/B_[1920x1080][45min][DEADBEEF].mp4")};
  assert(index["DEADBEEF"] == expected);

  DuplicateIndex untouched;
  assert(!build_duplicate_index(dir.file("absent"), scanner, untouched, error));
  assert(!error.empty());
}

} // namespace

int main() {
  fmt::print("[Test] Starting duplicate index tests...\n");

  test_group_by_hash();
  test_groups_in_hash_order();
  test_build_from_directory();

  fmt::print("[PASS] duplicate index\n");
  return 0;
}

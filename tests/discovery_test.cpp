#include <cassert>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "test_support.hpp"
#include "video_tagger/discovery.hpp"

using namespace video_tagger;
using video_tagger::test::TempDir;
using video_tagger::test::write_file;
using video_tagger::test::write_script;

namespace fs = std::filesystem;

namespace {

/// Mixed tree: tagged, untagged, non-video, nested and hidden files
void populate(const TempDir &dir) {
  write_file(dir.file("a.mp4"), "a");
  write_file(dir.file("B.MKV"), "b");
  write_file(dir.file("notes.txt"), "n");
  write_file(dir.file("done_[1920x1080][45min][DEADBEEF].mp4"), "d");
  write_file(dir.file("sub/c.webm"), "c");
  write_file(dir.file("sub/deeper/d.avi"), "d");
  write_file(dir.file("sub/deeper/e_[640x360][1min][cafebabe].mov"), "e");
  write_file(dir.file(".hidden/f.mpg"), "f");
  fs::create_directories(dir.file("empty.mp4.d"));
}

void test_walk_filters() {
  fmt::print("[Test] Walk collects untagged and tagged videos...\n");
  TempDir dir;
  populate(dir);

  DiscoveryScanner scanner(nullptr);
  std::vector<std::string> untagged;
  std::string error;
  assert(scanner.find_untagged(dir.path(), untagged, error));

  const std::vector<std::string> expected_untagged = {
      dir.file(".hidden/f.mpg"), dir.file("B.MKV"), dir.file("a.mp4"),
      dir.file("sub/c.webm"), dir.file("sub/deeper/d.avi")};
  assert(untagged == expected_untagged);

  std::vector<std::string> tagged;
  assert(scanner.find_tagged(dir.path(), tagged, error));
  const std::vector<std::string> expected_tagged = {
      dir.file("done_[1920x1080][45min][DEADBEEF].mp4"),
      dir.file("sub/deeper/e_[640x360][1min][cafebabe].mov")};
  assert(tagged == expected_tagged);
}

void test_walk_skips_symlinks() {
  fmt::print("[Test] Walk ignores symbolic links...\n");
  TempDir dir;
  write_file(dir.file("real.mp4"), "r");
  fs::create_symlink(dir.file("real.mp4"), dir.file("link.mp4"));

  DiscoveryScanner scanner(nullptr);
  std::vector<std::string> found;
  std::string error;
  assert(scanner.find_untagged(dir.path(), found, error));
  assert(found.size() == 1);
  assert(found[0] == dir.file("real.mp4"));
}

void test_walk_rejects_missing_root() {
  fmt::print("[Test] Missing root is a discovery failure...\n");
  TempDir dir;
  DiscoveryScanner scanner(nullptr);
  std::vector<std::string> found;
  std::string error;
  assert(!scanner.find_untagged(dir.file("nope"), found, error));
  assert(!error.empty());

  write_file(dir.file("file.mp4"), "x");
  error.clear();
  assert(!scanner.find_tagged(dir.file("file.mp4"), found, error));
  assert(!error.empty());
  assert(found.empty());
}

void test_accelerated_matches_walk() {
  fmt::print("[Test] External enumerator yields the walk's result...\n");
  TempDir tools;
  /// Stands in for fd: lists every regular file under the last argument
  std::string fake_fd = write_script(tools.file("fake-fd"),
                                     "for last; do :; done\n"
                                     "find \"$last\" -type f");

  TempDir dir;
  populate(dir);

  auto enumerator = std::make_unique<FdEnumerator>(fake_fd);
  assert(enumerator->available());
  DiscoveryScanner accelerated(std::move(enumerator));
  DiscoveryScanner walk(nullptr);

  for (DiscoveryFilter filter :
       {DiscoveryFilter::Untagged, DiscoveryFilter::Tagged}) {
    std::vector<std::string> a;
    std::vector<std::string> b;
    std::string error;
    if (filter == DiscoveryFilter::Untagged) {
      assert(accelerated.find_untagged(dir.path(), a, error));
      assert(walk.find_untagged(dir.path(), b, error));
    } else {
      assert(accelerated.find_tagged(dir.path(), a, error));
      assert(walk.find_tagged(dir.path(), b, error));
    }
    assert(!a.empty());
    assert(a == b);
  }
}

void test_fallback_to_walk() {
  fmt::print("[Test] Unavailable or failing enumerator falls back...\n");
  TempDir dir;
  populate(dir);

  DiscoveryScanner walk(nullptr);
  std::vector<std::string> expected;
  std::string error;
  assert(walk.find_untagged(dir.path(), expected, error));

  {
    auto missing = std::make_unique<FdEnumerator>(
        dir.file("no-such-binary-for-discovery"));
    assert(!missing->available());
    DiscoveryScanner scanner(std::move(missing));
    std::vector<std::string> found;
    assert(scanner.find_untagged(dir.path(), found, error));
    assert(found == expected);
  }
  {
    TempDir tools;
    std::string broken = write_script(tools.file("broken-fd"),
                                      "echo garbage.mp4\nexit 2");
    DiscoveryScanner scanner(std::make_unique<FdEnumerator>(broken));
    std::vector<std::string> found;
    assert(scanner.find_untagged(dir.path(), found, error));
    assert(found == expected);
  }
}

void test_results_append() {
  fmt::print("[Test] Results are appended to the output list...\n");
  TempDir dir;
  write_file(dir.file("x.mp4"), "x");
  DiscoveryScanner scanner(nullptr);
  std::vector<std::string> found = {"previous"};
  std::string error;
  assert(scanner.find_untagged(dir.path(), found, error));
  assert(found.size() == 2);
  assert(found[0] == "previous");
}

void test_inspect_video_file() {
  fmt::print("[Test] Inspect size and decoded tag...\n");
  TempDir dir;
  std::string tagged =
      write_file(dir.file("m_[1280x720][12min][0A0B0C0D].mkv"), "12345");
  std::string plain = write_file(dir.file("plain.mkv"), "12");

  VideoFile file;
  std::error_code ec;
  assert(inspect_video_file(tagged, file, ec));
  assert(file.size == 5);
  assert(file.tagged);
  assert(file.metadata.resolution == "1280x720");
  assert(file.metadata.duration_minutes == 12);
  assert(file.metadata.hash == "0A0B0C0D");

  VideoFile other;
  assert(inspect_video_file(plain, other, ec));
  assert(other.size == 2);
  assert(!other.tagged);

  assert(!inspect_video_file(dir.file("gone.mkv"), other, ec));
  assert(ec);
}

} // namespace

int main() {
  fmt::print("[Test] Starting discovery tests...\n");

  test_walk_filters();
  test_walk_skips_symlinks();
  test_walk_rejects_missing_root();
  test_accelerated_matches_walk();
  test_fallback_to_walk();
  test_results_append();
  test_inspect_video_file();

  fmt::print("[PASS] discovery\n");
  return 0;
}

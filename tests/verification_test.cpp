#include <cassert>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "test_support.hpp"
#include "video_tagger/verification.hpp"

using namespace video_tagger;
using video_tagger::test::TempDir;
using video_tagger::test::write_file;

namespace {

void test_verify_statuses() {
  fmt::print("[Test] Verification statuses...\n");
  TempDir dir;
  std::string good =
      write_file(dir.file("good_[1x1][0min][cbf43926].mp4"), "123456789");
  std::string changed =
      write_file(dir.file("changed_[1x1][0min][CBF43926].mp4"), "12345678");
  std::string plain = write_file(dir.file("plain.mp4"), "123456789");
  std::string text = write_file(dir.file("readme.txt"), "123456789");
  std::string gone = dir.file("gone_[1x1][0min][CBF43926].mp4");

  std::vector<VerifyResult> results =
      verify_files({good, changed, plain, text, gone});
  assert(results.size() == 5);

  assert(results[0].status == VerifyStatus::Verified);
  assert(results[0].expected == "cbf43926");
  assert(results[0].actual == "CBF43926");

  assert(results[1].status == VerifyStatus::Mismatch);
  assert(results[1].actual != "CBF43926");

  assert(results[2].status == VerifyStatus::NotTagged);
  assert(results[3].status == VerifyStatus::NotAVideoFile);

  assert(results[4].status == VerifyStatus::HashFailed);
  assert(!results[4].error.empty());
  assert(results[4].actual.empty());
}

} // namespace

int main() {
  fmt::print("[Test] Starting verification tests...\n");

  test_verify_statuses();

  fmt::print("[PASS] verification\n");
  return 0;
}

#include <cassert>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "test_support.hpp"
#include "video_tagger/deletion.hpp"
#include "video_tagger/duplicate_resolver.hpp"

using namespace video_tagger;
using video_tagger::test::TempDir;
using video_tagger::test::write_file;

namespace fs = std::filesystem;

namespace {

DuplicateGroup make_group(const std::string &hash,
                          const std::vector<std::string> &paths) {
  DuplicateGroup group;
  group.hash = hash;
  for (const auto &path : paths)
    group.files.push_back({path, false});
  return group;
}

std::vector<ResolverCommand> send(DuplicateResolver &resolver, Intent intent) {
  return resolver.update(ResolverMessage::from_intent(intent));
}

std::vector<ResolverCommand> complete(DuplicateResolver &resolver,
                                      DeletionReport report) {
  return resolver.update(ResolverMessage::deletion_complete(std::move(report)));
}

DeletionReport all_removed() {
  DeletionReport report;
  report.success = true;
  return report;
}

void test_construction() {
  fmt::print("[Test] Singleton groups are dropped on construction...\n");
  DuplicateResolver empty(DuplicateIndex{});
  assert(empty.state() == ResolverState::IdleNoGroups);

  DuplicateResolver resolver(std::vector<DuplicateGroup>{
      make_group("AAAAAAAA", {"/x"}), make_group("BBBBBBBB", {"/y", "/z"})});
  assert(resolver.state() == ResolverState::IdleWithGroups);
  assert(resolver.groups().size() == 1);
  assert(resolver.groups()[0].hash == "BBBBBBBB");

  DuplicateIndex index;
  index["22222222"] = {"/b1", "/b2"};
  index["11111111"] = {"/a1", "/a2", "/a3"};
  DuplicateResolver from_index(index);
  assert(from_index.groups().size() == 2);
  assert(from_index.groups()[0].hash == "11111111");
  assert(from_index.groups()[0].files.size() == 3);
}

void test_no_groups_only_quits() {
  fmt::print("[Test] Without groups only quit and help apply...\n");
  DuplicateResolver resolver(DuplicateIndex{});
  assert(send(resolver, Intent::CursorDown).empty());
  assert(send(resolver, Intent::RequestDelete).empty());
  assert(resolver.state() == ResolverState::IdleNoGroups);

  bool help = resolver.show_help();
  send(resolver, Intent::ToggleHelp);
  assert(resolver.show_help() != help);

  auto cmds = send(resolver, Intent::Quit);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::Quit);
  assert(resolver.state() == ResolverState::Quitting);
}

void test_navigation_and_selection() {
  fmt::print("[Test] Cursor movement and selection...\n");
  DuplicateResolver resolver(std::vector<DuplicateGroup>{
      make_group("G1", {"/a", "/b", "/c"}), make_group("G2", {"/d", "/e"})});

  assert(send(resolver, Intent::CursorUp).empty());
  auto cmds = send(resolver, Intent::CursorDown);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::FileSelected);
  assert(cmds[0].index == 1);
  send(resolver, Intent::CursorDown);
  assert(send(resolver, Intent::CursorDown).empty());
  assert(resolver.current_file() == 2);

  cmds = send(resolver, Intent::ToggleSelection);
  assert(cmds.size() == 1 && cmds[0].selected);
  assert(resolver.groups()[0].files[2].selected);

  cmds = send(resolver, Intent::NextGroup);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::GroupSelected);
  assert(cmds[0].index == 1);
  assert(resolver.current_file() == 0);
  assert(send(resolver, Intent::NextGroup).empty());

  cmds = send(resolver, Intent::SelectAll);
  assert(cmds.size() == 2);
  assert(resolver.selected_paths().size() == 3);

  cmds = send(resolver, Intent::ClearAll);
  assert(cmds.size() == 2 && !cmds[1].selected);
  /// Clear only touches the current group
  assert(resolver.selected_paths() == std::vector<std::string>{"/c"});

  send(resolver, Intent::PrevGroup);
  assert(resolver.current_group() == 0);
  assert(send(resolver, Intent::PrevGroup).empty());
}

void test_cross_group_deletion() {
  fmt::print("[Test] Deletion gathers selections from every group...\n");
  DuplicateResolver resolver(std::vector<DuplicateGroup>{
      make_group("G1", {"/a", "/b", "/c"}), make_group("G2", {"/d", "/e"})});

  send(resolver, Intent::CursorDown);
  send(resolver, Intent::ToggleSelection); //< b
  send(resolver, Intent::NextGroup);
  send(resolver, Intent::ToggleSelection); //< d

  auto cmds = send(resolver, Intent::RequestDelete);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::DeleteRequested);
  const std::vector<std::string> batch = {"/b", "/d"};
  assert(cmds[0].paths == batch);
  assert(resolver.state() == ResolverState::ConfirmingDeletion);
  assert(resolver.pending_deletion() == batch);

  /// Quit is not a confirmation answer
  assert(send(resolver, Intent::Quit).empty());
  assert(resolver.state() == ResolverState::ConfirmingDeletion);

  cmds = send(resolver, Intent::Confirm);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::ExecuteDeletion);
  assert(cmds[0].paths == batch);
  assert(resolver.deletion_in_flight());

  /// Nothing is accepted until the batch reports back
  assert(send(resolver, Intent::Cancel).empty());
  assert(send(resolver, Intent::Confirm).empty());
  assert(send(resolver, Intent::Quit).empty());
  assert(resolver.deletion_in_flight());

  cmds = complete(resolver, all_removed());
  assert(!resolver.deletion_in_flight());
  assert(cmds.size() == 2);
  assert(cmds[0].kind == CommandKind::DeletionComplete);
  assert(cmds[1].kind == CommandKind::GroupSelected);

  assert(resolver.state() == ResolverState::IdleWithGroups);
  assert(resolver.groups().size() == 1);
  const DuplicateGroup &g1 = resolver.groups()[0];
  assert(g1.hash == "G1");
  assert(g1.files.size() == 2);
  assert(g1.files[0].path == "/a" && g1.files[1].path == "/c");
  assert(g1.deleted_files == std::vector<std::string>{"/b"});
  assert(resolver.current_group() == 0);
  assert(resolver.current_file() >= 0 && resolver.current_file() < 2);
  assert(resolver.pending_deletion().empty());
  assert(resolver.selected_paths().empty());
}

void test_cursor_follows_surviving_group() {
  fmt::print("[Test] Cursor shifts past removed groups...\n");
  DuplicateResolver resolver(std::vector<DuplicateGroup>{
      make_group("G1", {"/a", "/b"}), make_group("G2", {"/c", "/d"}),
      make_group("G3", {"/e", "/f", "/g"})});

  send(resolver, Intent::ToggleSelection); //< a
  send(resolver, Intent::NextGroup);
  send(resolver, Intent::NextGroup);
  send(resolver, Intent::CursorDown);
  send(resolver, Intent::CursorDown);
  send(resolver, Intent::ToggleSelection); //< g
  assert(resolver.current_group() == 2 && resolver.current_file() == 2);

  send(resolver, Intent::RequestDelete);
  send(resolver, Intent::Confirm);
  complete(resolver, all_removed());

  assert(resolver.groups().size() == 2);
  assert(resolver.groups()[resolver.current_group()].hash == "G3");
  assert(resolver.current_group() == 1);
  /// Cursor stays in range after the group shrank
  assert(resolver.current_file() == 1);
}

void test_last_group_deleted_quits() {
  fmt::print("[Test] Deleting the only group ends the session...\n");
  DuplicateResolver resolver(
      std::vector<DuplicateGroup>{make_group("G", {"/a", "/b"})});
  send(resolver, Intent::ToggleSelection);
  send(resolver, Intent::RequestDelete);
  send(resolver, Intent::Confirm);

  auto cmds = complete(resolver, all_removed());
  assert(cmds.size() == 2);
  assert(cmds[0].kind == CommandKind::DeletionComplete);
  assert(cmds[1].kind == CommandKind::Quit);
  assert(resolver.state() == ResolverState::Quitting);
  assert(resolver.groups().empty());
}

void test_partial_failure() {
  fmt::print("[Test] Partial failure stops the batch without re-index...\n");
  TempDir dir;
  std::string a = write_file(dir.file("a.mp4"), "a");
  std::string b = dir.file("b.mp4"); //< never created
  std::string c = write_file(dir.file("c.mp4"), "c");

  DuplicateResolver resolver(
      std::vector<DuplicateGroup>{make_group("G", {a, b, c})});
  send(resolver, Intent::SelectAll);
  send(resolver, Intent::RequestDelete);
  auto cmds = send(resolver, Intent::Confirm);
  assert(cmds.size() == 1);

  DeletionReport report = execute_deletion(cmds[0].paths);
  assert(!report.success);
  assert(!report.all_removed());
  assert(report.path == b);
  assert(report.error == std::errc::no_such_file_or_directory);
  assert(!fs::exists(a));
  assert(fs::exists(c));

  cmds = complete(resolver, report);
  assert(cmds.size() == 1);
  assert(cmds[0].kind == CommandKind::DeletionComplete);
  assert(cmds[0].report.path == b);
  assert(resolver.state() == ResolverState::IdleWithGroups);
  assert(resolver.groups().size() == 1);
  assert(resolver.groups()[0].files.size() == 3);
  assert(resolver.pending_deletion().empty());
}

void test_cancel_and_empty_selection() {
  fmt::print("[Test] Cancel and empty requests leave state alone...\n");
  DuplicateResolver resolver(
      std::vector<DuplicateGroup>{make_group("G", {"/a", "/b"})});

  assert(send(resolver, Intent::RequestDelete).empty());
  assert(resolver.state() == ResolverState::IdleWithGroups);

  send(resolver, Intent::ToggleSelection);
  send(resolver, Intent::RequestDelete);
  assert(resolver.state() == ResolverState::ConfirmingDeletion);
  assert(send(resolver, Intent::CursorDown).empty());

  send(resolver, Intent::Cancel);
  assert(resolver.state() == ResolverState::IdleWithGroups);
  assert(resolver.pending_deletion().empty());
  assert(resolver.groups()[0].files[0].selected);

  /// A completion nobody asked for is ignored
  assert(complete(resolver, all_removed()).empty());
  assert(resolver.groups()[0].files.size() == 2);
}

void test_skip() {
  fmt::print("[Test] Skip advances and quits after the last group...\n");
  DuplicateResolver resolver(std::vector<DuplicateGroup>{
      make_group("G1", {"/a", "/b"}), make_group("G2", {"/c", "/d"})});
  auto cmds = send(resolver, Intent::Skip);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::GroupSelected);
  assert(resolver.current_group() == 1);

  cmds = send(resolver, Intent::Skip);
  assert(cmds.size() == 1 && cmds[0].kind == CommandKind::Quit);
  assert(resolver.state() == ResolverState::Quitting);
  assert(send(resolver, Intent::CursorDown).empty());
}

} // namespace

int main() {
  fmt::print("[Test] Starting duplicate resolver tests...\n");

  test_construction();
  test_no_groups_only_quits();
  test_navigation_and_selection();
  test_cross_group_deletion();
  test_cursor_follows_surviving_group();
  test_last_group_deleted_quits();
  test_partial_failure();
  test_cancel_and_empty_selection();
  test_skip();

  fmt::print("[PASS] duplicate resolver\n");
  return 0;
}

/**
 * @file duplicate_resolver.hpp
 * @brief Interactive duplicate resolution state machine
 *
 * @details DuplicateResolver holds the active duplicate groups, the operator
 *          cursor and per-file selection flags. It is a reducer: every input
 *          is a ResolverMessage handed to update(), which mutates the state
 *          and returns the commands the driver must carry out or display.
 *
 * @attention STATES:
 *
 *   - IdleWithGroups: navigation, selection, skip, request-delete
 *
 *   - IdleNoGroups: only quit is meaningful
 *
 *   - ConfirmingDeletion: confirm or cancel the pending batch; once
 *     confirmed, every intent is refused until the completion message
 *
 *   - Quitting: terminal
 *
 * @note Deletion is batch-wide: request-delete gathers the selected files of
 *       ALL groups, so several groups may collapse in one re-index pass.
 */

#ifndef VIDEO_TAGGER_DUPLICATE_RESOLVER_HPP
#define VIDEO_TAGGER_DUPLICATE_RESOLVER_HPP

#include <string>
#include <utility>
#include <vector>

#include "deletion.hpp"
#include "duplicate_index.hpp"

namespace video_tagger {

/**
 * @struct GroupEntry
 * @brief One file of a duplicate group with its selection flag.
 */
struct GroupEntry {
  std::string path;
  bool selected = false;
};

/**
 * @struct DuplicateGroup
 * @brief Files sharing one embedded hash.
 * @note A group with fewer than two files is dropped from the active set.
 */
struct DuplicateGroup {
  std::string hash;
  std::vector<GroupEntry> files;
  std::vector<std::string> deleted_files; //< Removed during this session
};

enum class ResolverState {
  IdleWithGroups,
  IdleNoGroups,
  ConfirmingDeletion,
  Quitting
};

/// Operator intents dispatched by the presentation layer
enum class Intent {
  CursorUp,
  CursorDown,
  PrevGroup,
  NextGroup,
  ToggleSelection,
  SelectAll,
  ClearAll,
  Skip,
  RequestDelete,
  Confirm,
  Cancel,
  ToggleHelp,
  Quit
};

enum class MessageKind { Intent, DeletionComplete };

/**
 * @struct ResolverMessage
 * @brief Input to the state machine: an intent or a deletion result.
 */
struct ResolverMessage {
  MessageKind kind = MessageKind::Intent;
  Intent intent = Intent::Quit;
  DeletionReport report;

  static ResolverMessage from_intent(Intent intent) {
    ResolverMessage msg;
    msg.kind = MessageKind::Intent;
    msg.intent = intent;
    return msg;
  }

  static ResolverMessage deletion_complete(DeletionReport report) {
    ResolverMessage msg;
    msg.kind = MessageKind::DeletionComplete;
    msg.report = std::move(report);
    return msg;
  }
};

enum class CommandKind {
  GroupSelected,    //< index
  FileSelected,     //< index, selected
  DeleteRequested,  //< paths
  ExecuteDeletion,  //< paths (driver runs them and reports completion)
  DeletionComplete, //< report
  Quit
};

/**
 * @struct ResolverCommand
 * @brief Output of the state machine, discriminated by kind.
 */
struct ResolverCommand {
  CommandKind kind = CommandKind::Quit;
  int index = 0;
  bool selected = false;
  std::vector<std::string> paths;
  DeletionReport report;
};

/**
 * @class DuplicateResolver
 * @brief Cursor, selection and stage/confirm/execute cycle over groups.
 */
class DuplicateResolver {
public:
  /// Groups in index (hash) order
  explicit DuplicateResolver(const DuplicateIndex &index);

  /// Groups in the given order; groups with < 2 files are dropped
  explicit DuplicateResolver(std::vector<DuplicateGroup> groups);

  /**
   * @brief Process one message.
   * @return Commands for the driver, in order
   */
  std::vector<ResolverCommand> update(const ResolverMessage &msg);

  ResolverState state() const { return state_; }
  const std::vector<DuplicateGroup> &groups() const { return groups_; }
  int current_group() const { return current_group_; }
  int current_file() const { return current_file_; }
  const std::vector<std::string> &pending_deletion() const {
    return pending_deletion_;
  }
  bool deletion_in_flight() const { return deletion_in_flight_; }
  bool show_help() const { return show_help_; }

  /// Selected paths across every group, group by group
  std::vector<std::string> selected_paths() const;

private:
  std::vector<DuplicateGroup> groups_;
  ResolverState state_ = ResolverState::IdleNoGroups;
  int current_group_ = 0;
  int current_file_ = 0;
  std::vector<std::string> pending_deletion_;
  bool deletion_in_flight_ = false;
  bool show_help_ = true;

  void handle_idle_input(Intent intent, std::vector<ResolverCommand> &out);
  void handle_confirmation_input(Intent intent,
                                 std::vector<ResolverCommand> &out);
  void handle_deletion_complete(const DeletionReport &report,
                                std::vector<ResolverCommand> &out);
  void reindex_after_deletion(std::vector<ResolverCommand> &out);

  void select_group(int index, std::vector<ResolverCommand> &out);
  void quit(std::vector<ResolverCommand> &out);
  ResolverState idle_state() const;
};

} // namespace video_tagger

#endif // VIDEO_TAGGER_DUPLICATE_RESOLVER_HPP

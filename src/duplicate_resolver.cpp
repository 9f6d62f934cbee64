/**
 * @file duplicate_resolver.cpp
 * @brief Duplicate resolution state machine implementation
 *
 * @details Provides implementations for:
 *
 *          - Idle input: cursor movement, selection, skip, request-delete
 *
 *          - Confirmation input: confirm (starts execution) or cancel
 *
 *          - Deletion completion and cross-group re-indexing
 */

#include "video_tagger/duplicate_resolver.hpp"

#include <algorithm>
#include <unordered_set>

namespace video_tagger {

// **---- Construction ----**

DuplicateResolver::DuplicateResolver(const DuplicateIndex &index) {
  groups_.reserve(index.size());
  for (const auto &entry : index) {
    if (entry.second.size() < 2)
      continue;
    DuplicateGroup group;
    group.hash = entry.first;
    for (const auto &path : entry.second) {
      group.files.push_back({path, false});
    }
    groups_.push_back(std::move(group));
  }
  state_ = idle_state();
}

DuplicateResolver::DuplicateResolver(std::vector<DuplicateGroup> groups) {
  for (auto &group : groups) {
    if (group.files.size() >= 2)
      groups_.push_back(std::move(group));
  }
  state_ = idle_state();
}

ResolverState DuplicateResolver::idle_state() const {
  return groups_.empty() ? ResolverState::IdleNoGroups
                         : ResolverState::IdleWithGroups;
}

// **---- Dispatch ----**

std::vector<ResolverCommand>
DuplicateResolver::update(const ResolverMessage &msg) {
  std::vector<ResolverCommand> out;

  if (msg.kind == MessageKind::DeletionComplete) {
    /// A completion nobody is waiting for carries no batch to apply
    if (deletion_in_flight_)
      handle_deletion_complete(msg.report, out);
    return out;
  }

  /// Nothing mutates while a confirmed batch is executing
  if (deletion_in_flight_)
    return out;

  switch (state_) {
  case ResolverState::IdleWithGroups:
    handle_idle_input(msg.intent, out);
    break;
  case ResolverState::IdleNoGroups:
    if (msg.intent == Intent::Quit)
      quit(out);
    else if (msg.intent == Intent::ToggleHelp)
      show_help_ = !show_help_;
    break;
  case ResolverState::ConfirmingDeletion:
    handle_confirmation_input(msg.intent, out);
    break;
  case ResolverState::Quitting:
    break;
  }
  return out;
}

// **---- Idle ----**

void DuplicateResolver::handle_idle_input(Intent intent,
                                          std::vector<ResolverCommand> &out) {
  DuplicateGroup &group = groups_[current_group_];
  const int file_count = static_cast<int>(group.files.size());

  switch (intent) {
  case Intent::Quit:
    quit(out);
    break;

  case Intent::ToggleHelp:
    show_help_ = !show_help_;
    break;

  case Intent::CursorUp:
    if (current_file_ > 0) {
      current_file_--;
      out.push_back({CommandKind::FileSelected, current_file_,
                     group.files[current_file_].selected, {}, {}});
    }
    break;

  case Intent::CursorDown:
    if (current_file_ < file_count - 1) {
      current_file_++;
      out.push_back({CommandKind::FileSelected, current_file_,
                     group.files[current_file_].selected, {}, {}});
    }
    break;

  case Intent::PrevGroup:
    if (current_group_ > 0)
      select_group(current_group_ - 1, out);
    break;

  case Intent::NextGroup:
    if (current_group_ < static_cast<int>(groups_.size()) - 1)
      select_group(current_group_ + 1, out);
    break;

  case Intent::ToggleSelection: {
    GroupEntry &entry = group.files[current_file_];
    entry.selected = !entry.selected;
    out.push_back(
        {CommandKind::FileSelected, current_file_, entry.selected, {}, {}});
    break;
  }

  case Intent::SelectAll:
  case Intent::ClearAll: {
    const bool value = (intent == Intent::SelectAll);
    for (int i = 0; i < file_count; ++i) {
      group.files[i].selected = value;
      out.push_back({CommandKind::FileSelected, i, value, {}, {}});
    }
    break;
  }

  case Intent::Skip:
    if (current_group_ < static_cast<int>(groups_.size()) - 1)
      select_group(current_group_ + 1, out);
    else
      quit(out);
    break;

  case Intent::RequestDelete: {
    std::vector<std::string> selected = selected_paths();
    if (selected.empty())
      break;
    pending_deletion_ = std::move(selected);
    state_ = ResolverState::ConfirmingDeletion;
    out.push_back(
        {CommandKind::DeleteRequested, 0, false, pending_deletion_, {}});
    break;
  }

  case Intent::Confirm:
  case Intent::Cancel:
    break;
  }
}

void DuplicateResolver::select_group(int index,
                                     std::vector<ResolverCommand> &out) {
  current_group_ = index;
  current_file_ = 0;
  out.push_back({CommandKind::GroupSelected, current_group_, false, {}, {}});
}

void DuplicateResolver::quit(std::vector<ResolverCommand> &out) {
  state_ = ResolverState::Quitting;
  out.push_back({CommandKind::Quit, 0, false, {}, {}});
}

std::vector<std::string> DuplicateResolver::selected_paths() const {
  std::vector<std::string> selected;
  for (const auto &group : groups_) {
    for (const auto &entry : group.files) {
      if (entry.selected)
        selected.push_back(entry.path);
    }
  }
  return selected;
}

// **---- Confirmation ----**

void DuplicateResolver::handle_confirmation_input(
    Intent intent, std::vector<ResolverCommand> &out) {
  switch (intent) {
  case Intent::Confirm:
    deletion_in_flight_ = true;
    out.push_back(
        {CommandKind::ExecuteDeletion, 0, false, pending_deletion_, {}});
    break;

  case Intent::Cancel:
    pending_deletion_.clear();
    state_ = idle_state();
    break;

  default:
    break;
  }
}

// **---- Completion ----**

void DuplicateResolver::handle_deletion_complete(
    const DeletionReport &report, std::vector<ResolverCommand> &out) {
  deletion_in_flight_ = false;
  state_ = idle_state();

  out.push_back({CommandKind::DeletionComplete, 0, false, {}, report});

  if (report.all_removed())
    reindex_after_deletion(out);

  pending_deletion_.clear();
}

void DuplicateResolver::reindex_after_deletion(
    std::vector<ResolverCommand> &out) {
  const std::unordered_set<std::string> batch(pending_deletion_.begin(),
                                              pending_deletion_.end());

  std::vector<DuplicateGroup> survivors;
  survivors.reserve(groups_.size());
  int removed_at_or_before_cursor = 0;

  for (int g = 0; g < static_cast<int>(groups_.size()); ++g) {
    DuplicateGroup &group = groups_[g];

    std::vector<GroupEntry> remaining;
    remaining.reserve(group.files.size());
    for (auto &entry : group.files) {
      if (batch.count(entry.path))
        group.deleted_files.push_back(entry.path);
      else
        remaining.push_back(std::move(entry));
    }
    group.files = std::move(remaining);

    if (group.files.size() <= 1) {
      if (g <= current_group_)
        removed_at_or_before_cursor++;
      continue;
    }
    survivors.push_back(std::move(group));
  }
  groups_ = std::move(survivors);

  if (groups_.empty()) {
    current_group_ = 0;
    current_file_ = 0;
    quit(out);
    return;
  }

  current_group_ -= removed_at_or_before_cursor;
  current_group_ = std::max(
      0, std::min(current_group_, static_cast<int>(groups_.size()) - 1));

  const int file_count =
      static_cast<int>(groups_[current_group_].files.size());
  if (current_file_ >= file_count)
    current_file_ = file_count - 1;
  if (current_file_ < 0)
    current_file_ = 0;

  state_ = ResolverState::IdleWithGroups;
  out.push_back({CommandKind::GroupSelected, current_group_, false, {}, {}});
}

} // namespace video_tagger

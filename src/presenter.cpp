/**
 * @file presenter.cpp
 * @brief Console presentation implementation
 */

#include "video_tagger/presenter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <istream>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

#include "video_tagger/discovery.hpp"
#include "video_tagger/logging.hpp"

namespace fs = std::filesystem;

namespace video_tagger {

namespace {

std::string display_name(const std::string &path) {
  return fs::path(path).filename().string();
}

} // namespace

// **----- STYLES -----**

Styles Styles::colored() {
  Styles s;
  s.header = fg(fmt::color::cyan) | fmt::emphasis::bold;
  s.info = fmt::text_style();
  s.processing = fg(fmt::color::yellow);
  s.success = fg(fmt::color::green);
  s.error = fg(fmt::color::red);
  s.warning = fg(fmt::color::orange);
  s.cursor = fg(fmt::color::magenta) | fmt::emphasis::bold;
  return s;
}

Styles Styles::plain() { return Styles(); }

// **----- TAG OBSERVER -----**

ConsoleTagObserver::ConsoleTagObserver(const Styles &styles)
    : styles_(styles) {}

void ConsoleTagObserver::on_event(const TagEvent &event) {
  std::lock_guard<std::mutex> lock(log_mutex);

  switch (event.kind) {
  case TagEventKind::WorkerStarted:
    last_quarter_[event.worker_id] = 0;
    fmt::print(styles_.processing, "[Worker {}] Processing: {}\n",
               event.worker_id, display_name(event.path));
    break;

  case TagEventKind::WorkerProgress: {
    /// Only 25/50/75% marks; completion is reported by WorkerCompleted
    int quarter = static_cast<int>(event.progress * 4);
    int &last = last_quarter_[event.worker_id];
    if (quarter > last && quarter < 4) {
      last = quarter;
      fmt::print(styles_.info, "[Worker {}] Hashing {}: {}% ({} / {} bytes)\n",
                 event.worker_id, display_name(event.path), quarter * 25,
                 event.bytes, event.total_bytes);
    }
    break;
  }

  case TagEventKind::WorkerCompleted: {
    const TagResult &r = event.result;
    last_quarter_.erase(event.worker_id);
    if (r.success()) {
      fmt::print(styles_.success, "[Worker {}] Tagged: {} -> {} ({:.1f}s)\n",
                 event.worker_id, display_name(r.path),
                 display_name(r.new_path), r.processing_time_us / 1000000.0);
    } else if (r.error.kind == TagErrorKind::AlreadyTagged) {
      break;
    } else if (r.error.is_skip()) {
      fmt::print(styles_.info, "[Worker {}] Skipped: {} ({})\n",
                 event.worker_id, r.path, r.error.message);
    } else {
      fmt::print(styles_.error, "[Worker {}] Failed: {}: {}\n",
                 event.worker_id, r.path, r.error.message);
    }
    break;
  }

  case TagEventKind::OverallProgress:
    fmt::print(styles_.header, "[Batch] Progress: {}/{} files\n",
               event.completed, event.total);
    break;
  }
  std::fflush(stdout);
}

// **----- SUMMARIES -----**

void print_tag_summary(const std::vector<TagResult> &results,
                       double wall_clock_sec, int workers,
                       const Styles &styles) {
  TagSummary summary = summarize(results);
  long total_time_us = 0;
  for (const auto &result : results) {
    total_time_us += result.processing_time_us;
  }
  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(styles.header,
             "=================== TAGGING SUMMARY ==================\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", results.size());
  fmt::print("{:<25} {:>25}\n", "Tagged:", summary.tagged);
  fmt::print("{:<25} {:>25}\n", "Skipped:", summary.skipped);
  fmt::print("{:<25} {:>25}\n", "Failed:", summary.failed);
  fmt::print("{:<25} {:>25}\n", "Workers:", workers);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of file times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  fmt::print(styles.header,
             "======================================================\n");

  if (summary.failed > 0) {
    fmt::print(styles.error, "\nFailed files:\n");
    for (const auto &result : results) {
      if (!result.success() && !result.error.is_skip()) {
        fmt::print(styles.error, "  - {} [{}] {}\n", result.path,
                   to_string(result.error.kind), result.error.message);
      }
    }
  }
  std::fflush(stdout);
}

void print_verify_summary(const std::vector<VerifyResult> &results,
                          const Styles &styles) {
  int verified = 0;
  int problems = 0;

  std::lock_guard<std::mutex> lock(log_mutex);
  for (const auto &r : results) {
    switch (r.status) {
    case VerifyStatus::Verified:
      verified++;
      fmt::print(styles.success, "[OK]       {} ({})\n", r.path, r.expected);
      break;
    case VerifyStatus::Mismatch:
      problems++;
      fmt::print(styles.error, "[MISMATCH] {} (name {}, content {})\n", r.path,
                 r.expected, r.actual);
      break;
    case VerifyStatus::HashFailed:
      problems++;
      fmt::print(styles.error, "[ERROR]    {}: {}\n", r.path, r.error);
      break;
    case VerifyStatus::NotAVideoFile:
    case VerifyStatus::NotTagged:
      fmt::print(styles.warning, "[SKIP]     {} ({})\n", r.path,
                 to_string(r.status));
      break;
    }
  }
  fmt::print(styles.header, "\nVerified {}/{} file(s), {} problem(s)\n",
             verified, results.size(), problems);
  std::fflush(stdout);
}

std::string describe_duplicate_file(const std::string &path) {
  VideoFile file;
  std::error_code ec;
  if (!inspect_video_file(path, file, ec)) {
    return fmt::format("{}  (unavailable: {})", path, ec.message());
  }
  if (!file.tagged) {
    return fmt::format("{}  {} bytes", path, file.size);
  }
  return fmt::format("{}  {} bytes  {} {}min", path, file.size,
                     file.metadata.resolution, file.metadata.duration_minutes);
}

void print_duplicate_index(const DuplicateIndex &index, const Styles &styles) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (index.empty()) {
    fmt::print(styles.success, "No duplicates found.\n");
    std::fflush(stdout);
    return;
  }
  for (const auto &entry : index) {
    fmt::print(styles.header, "{} ({} files)\n", entry.first,
               entry.second.size());
    for (const auto &path : entry.second) {
      fmt::print("  {}\n", describe_duplicate_file(path));
    }
  }
  std::fflush(stdout);
}

// **----- INPUT MAPPING -----**

bool parse_intent(const std::string &line, ResolverState state,
                  Intent &intent) {
  std::string key = line;
  if (!key.empty() && key.back() == '\r') {
    key.pop_back();
  }

  /// A line of blanks is the space key; anything else is trimmed
  bool blank = !key.empty() && std::all_of(key.begin(), key.end(),
                                           [](unsigned char c) {
                                             return c == ' ' || c == '\t';
                                           });
  if (blank) {
    key = " ";
  } else {
    auto first = key.find_first_not_of(" \t");
    auto last = key.find_last_not_of(" \t");
    key = (first == std::string::npos) ? std::string()
                                       : key.substr(first, last - first + 1);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
  }

  if (state == ResolverState::ConfirmingDeletion) {
    if (key == "y" || key == "yes") {
      intent = Intent::Confirm;
      return true;
    }
    if (key == "n" || key == "no" || key == "esc" || key == "q") {
      intent = Intent::Cancel;
      return true;
    }
    return false;
  }

  if (key == "k" || key == "up") {
    intent = Intent::CursorUp;
  } else if (key == "j" || key == "down") {
    intent = Intent::CursorDown;
  } else if (key == "p" || key == "left") {
    intent = Intent::PrevGroup;
  } else if (key == "n" || key == "right") {
    intent = Intent::NextGroup;
  } else if (key == " " || key == "x" || key == "space") {
    intent = Intent::ToggleSelection;
  } else if (key == "a") {
    intent = Intent::SelectAll;
  } else if (key == "c") {
    intent = Intent::ClearAll;
  } else if (key == "s") {
    intent = Intent::Skip;
  } else if (key.empty() || key == "d" || key == "enter") {
    intent = Intent::RequestDelete;
  } else if (key == "h" || key == "?") {
    intent = Intent::ToggleHelp;
  } else if (key == "q" || key == "quit") {
    intent = Intent::Quit;
  } else {
    return false;
  }
  return true;
}

// **----- RESOLVER VIEW -----**

ConsoleResolverView::ConsoleResolverView(const Styles &styles)
    : styles_(styles) {}

void ConsoleResolverView::render(const DuplicateResolver &resolver) const {
  std::lock_guard<std::mutex> lock(log_mutex);
  switch (resolver.state()) {
  case ResolverState::IdleNoGroups:
    fmt::print(styles_.success, "\nNo duplicate groups found.\n");
    fmt::print("Press q to quit.\n");
    break;
  case ResolverState::IdleWithGroups:
    render_main(resolver);
    break;
  case ResolverState::ConfirmingDeletion:
    render_confirmation(resolver);
    break;
  case ResolverState::Quitting:
    break;
  }
  std::fflush(stdout);
}

void ConsoleResolverView::render_main(const DuplicateResolver &resolver) const {
  const auto &groups = resolver.groups();
  const DuplicateGroup &group = groups[resolver.current_group()];

  fmt::print("\n");
  fmt::print(styles_.header, "Group {} of {} [{}] ({} files)\n",
             resolver.current_group() + 1, groups.size(), group.hash,
             group.files.size());

  for (size_t i = 0; i < group.files.size(); i++) {
    const GroupEntry &entry = group.files[i];
    bool at_cursor = static_cast<int>(i) == resolver.current_file();
    std::string line = fmt::format("{} [{}] {}", at_cursor ? ">" : " ",
                                   entry.selected ? "x" : " ", entry.path);
    if (at_cursor) {
      fmt::print(styles_.cursor, "{}\n", line);
    } else if (entry.selected) {
      fmt::print(styles_.warning, "{}\n", line);
    } else {
      fmt::print("{}\n", line);
    }
  }

  for (const auto &path : group.deleted_files) {
    fmt::print(styles_.error, "    (deleted) {}\n", path);
  }

  size_t selected = resolver.selected_paths().size();
  if (selected > 0) {
    fmt::print(styles_.warning, "{} file(s) selected across all groups\n",
               selected);
  }

  if (resolver.show_help()) {
    render_help();
  }
}

void ConsoleResolverView::render_confirmation(
    const DuplicateResolver &resolver) const {
  const auto &pending = resolver.pending_deletion();
  fmt::print("\n");
  fmt::print(styles_.error, "Delete {} file(s)? This cannot be undone.\n",
             pending.size());
  for (const auto &path : pending) {
    fmt::print("  - {}\n", path);
  }
  if (resolver.deletion_in_flight()) {
    fmt::print(styles_.processing, "Deleting...\n");
  } else {
    fmt::print("[y] confirm   [n] cancel\n");
  }
}

void ConsoleResolverView::render_help() const {
  fmt::print(styles_.info,
             "  j/k: move   p/n: prev/next group   space: toggle   "
             "a: select all   c: clear\n"
             "  enter: delete selected   s: skip group   h: help   q: quit\n");
}

void ConsoleResolverView::render_command(const ResolverCommand &command) const {
  if (command.kind != CommandKind::DeletionComplete) {
    return;
  }
  const DeletionReport &report = command.report;
  std::lock_guard<std::mutex> lock(log_mutex);
  if (report.all_removed()) {
    fmt::print(styles_.success, "Deletion complete.\n");
  } else {
    fmt::print(styles_.error, "Deletion stopped at {}: {}\n", report.path,
               report.error.message());
  }
  std::fflush(stdout);
}

// **----- DRIVER LOOP -----**

int run_resolver_console(DuplicateResolver &resolver, const Styles &styles,
                         std::istream &in) {
  ConsoleResolverView view(styles);
  std::deque<ResolverMessage> inbox;
  int failed_batches = 0;
  std::string line;

  while (resolver.state() != ResolverState::Quitting) {
    if (inbox.empty()) {
      view.render(resolver);
      fmt::print("> ");
      std::fflush(stdout);

      if (!std::getline(in, line)) {
        LOG_INFO("Input closed, leaving duplicate resolution");
        break;
      }

      Intent intent = Intent::Quit;
      if (!parse_intent(line, resolver.state(), intent)) {
        LOG_WARN("Unknown key: '{}' (h for help)", line);
        continue;
      }
      inbox.push_back(ResolverMessage::from_intent(intent));
    }

    ResolverMessage msg = std::move(inbox.front());
    inbox.pop_front();

    for (const auto &command : resolver.update(msg)) {
      view.render_command(command);

      if (command.kind == CommandKind::ExecuteDeletion) {
        /// Runs to completion before the next input line is read
        view.render(resolver);
        inbox.push_back(
            ResolverMessage::deletion_complete(execute_deletion(command.paths)));
      } else if (command.kind == CommandKind::DeletionComplete &&
                 !command.report.all_removed()) {
        failed_batches++;
      }
    }
  }
  return failed_batches;
}

} // namespace video_tagger

/**
 * @file tag_pipeline.cpp
 * @brief Parallel tagging implementation
 *
 * @details Implements the TagPipeline class:
 *
 *          - Per-file classification, extraction and atomic rename
 *
 *          - Fixed worker pool over a closed work queue
 *
 *          - Rate-limited hashing progress events
 *
 *          - Caller-side event draining and result collection
 */

#include "video_tagger/tag_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <thread>

#include <fmt/core.h>

#include "video_tagger/channel.hpp"
#include "video_tagger/config.hpp"
#include "video_tagger/filename_codec.hpp"
#include "video_tagger/logging.hpp"
#include "video_tagger/system.hpp"

namespace video_tagger {

namespace fs = std::filesystem;

TagSummary summarize(const std::vector<TagResult> &results) {
  TagSummary summary;
  for (const auto &result : results) {
    if (result.success())
      summary.tagged++;
    else if (result.error.is_skip())
      summary.skipped++;
    else
      summary.failed++;
  }
  return summary;
}

TagPipeline::TagPipeline(const MetadataExtractor &extractor,
                         TagObserver *observer)
    : extractor_(extractor), observer_(observer) {}

void TagPipeline::notify(const TagEvent &event) const {
  if (observer_)
    observer_->on_event(event);
}

// **---- Per-file Processing ----**

TagResult TagPipeline::tag_file(const std::string &path, int worker_id,
                                const EventSink &emit) const {
  auto start_time = std::chrono::steady_clock::now();

  TagResult result;
  result.path = path;

  auto complete = [&](TagErrorKind kind, std::string message) {
    result.error.kind = kind;
    if (!message.empty())
      result.error.message = std::move(message);
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());

    TagEvent event;
    event.kind = TagEventKind::WorkerCompleted;
    event.worker_id = worker_id;
    event.path = path;
    event.result = result;
    emit(std::move(event));
    return result;
  };

  // **----- CLASSIFY -----**

  std::error_code ec;
  fs::file_status status = fs::status(path, ec);
  if (ec) {
    return complete(TagErrorKind::StatFailed,
                    fmt::format("cannot access {}: {}", path, ec.message()));
  }
  if (fs::is_directory(status)) {
    return complete(TagErrorKind::DirectoryInput, "is a directory");
  }
  if (!is_video_file(path)) {
    return complete(TagErrorKind::NotAVideoFile, "not a video file");
  }
  if (is_tagged(path)) {
    return complete(TagErrorKind::AlreadyTagged, "already tagged");
  }

  {
    TagEvent started;
    started.kind = TagEventKind::WorkerStarted;
    started.worker_id = worker_id;
    started.path = path;
    emit(std::move(started));
  }

  // **----- EXTRACT -----**

  /// Progress is an approximation: at most one event per interval
  const auto interval =
      std::chrono::milliseconds(std::max(0, Config::progress_interval_ms()));
  auto last_emit = std::chrono::steady_clock::time_point{};
  HashProgressFn on_progress = [&](uint64_t done, uint64_t total) {
    auto now = std::chrono::steady_clock::now();
    if (done < total && now - last_emit < interval)
      return;
    last_emit = now;

    TagEvent event;
    event.kind = TagEventKind::WorkerProgress;
    event.worker_id = worker_id;
    event.path = path;
    event.bytes = done;
    event.total_bytes = total;
    event.progress =
        total > 0 ? static_cast<double>(done) / static_cast<double>(total)
                  : 1.0;
    emit(std::move(event));
  };

  ExtractedMetadata meta;
  TIMER_START(hash);
  if (!extractor_.extract(path, meta, result.error, on_progress)) {
    return complete(result.error.kind, std::string());
  }
  TIMER_END(hash, fs::path(path).filename().string());

  // **----- RENAME -----**

  MetadataTriple triple;
  triple.resolution = meta.resolution;
  triple.duration_minutes =
      std::max(0L, static_cast<long>(std::nearbyint(meta.duration_minutes)));
  triple.hash = format_hash(meta.crc);

  std::string new_path = encode(path, triple);

  if (fs::exists(new_path, ec)) {
    return complete(TagErrorKind::RenameFailed,
                    fmt::format("target already exists: {}", new_path));
  }

  fs::rename(path, new_path, ec);
  if (ec) {
    return complete(TagErrorKind::RenameFailed,
                    fmt::format("rename {}: {}", path, ec.message()));
  }

  result.new_path = new_path;
  return complete(TagErrorKind::None, std::string());
}

TagResult TagPipeline::tag_file_guarded(const std::string &path,
                                        int worker_id,
                                        const EventSink &emit) const {
  try {
    return tag_file(path, worker_id, emit);
  } catch (const std::exception &e) {
    LOG_ERROR("[Worker {}] Aborted on {}: {}", worker_id, path, e.what());

    TagResult result;
    result.path = path;
    result.error.kind = TagErrorKind::Aborted;
    result.error.message = e.what();

    TagEvent event;
    event.kind = TagEventKind::WorkerCompleted;
    event.worker_id = worker_id;
    event.path = path;
    event.result = result;
    emit(std::move(event));
    return result;
  }
}

// **---- Batch Processing ----**

std::vector<TagResult>
TagPipeline::process(const std::vector<std::string> &paths,
                     int worker_count) {
  if (paths.empty()) {
    LOG_WARN("No input files to process");
    last_worker_count_ = 0;
    return {};
  }

  const int cpus = logical_cpu_count();
  int workers = resolve_worker_count(paths, worker_count, cpus);
  if (worker_count <= 0 && workers == 1 && cpus > 1) {
    LOG_WARN("Network drive detected, using 1 worker");
  }

  /// Never start more workers than files
  workers = std::min(workers, static_cast<int>(paths.size()));
  last_worker_count_ = workers;

  LOG_PHASE("==================== TAGGING ====================");
  LOG_INFO("Files to process: {}", paths.size());
  LOG_INFO("Workers: {}", workers);
  LOG_PHASE("=================================================");

  if (workers <= 1)
    return process_inline(paths);
  return process_pool(paths, workers);
}

std::vector<TagResult>
TagPipeline::process_inline(const std::vector<std::string> &paths) {
  std::vector<TagResult> results;
  results.reserve(paths.size());

  const int total = static_cast<int>(paths.size());
  EventSink sink = [this](TagEvent event) { notify(event); };

  for (const auto &path : paths) {
    results.push_back(tag_file_guarded(path, 1, sink));

    TagEvent overall;
    overall.kind = TagEventKind::OverallProgress;
    overall.completed = static_cast<int>(results.size());
    overall.total = total;
    notify(overall);
  }
  return results;
}

std::vector<TagResult>
TagPipeline::process_pool(const std::vector<std::string> &paths,
                          int workers) {
  /// Fully populate, then close: workers exit once it is drained
  Channel<std::string> work_queue;
  for (const auto &path : paths) {
    work_queue.push(path);
  }
  work_queue.close();

  Channel<TagEvent> events;
  std::atomic<int> active{workers};

  std::vector<std::thread> pool;
  pool.reserve(static_cast<size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    const int worker_id = i + 1;
    pool.emplace_back([this, worker_id, &work_queue, &events, &active]() {
      EventSink sink = [&events](TagEvent event) {
        events.push(std::move(event));
      };

      std::string path;
      while (work_queue.pop(path)) {
        tag_file_guarded(path, worker_id, sink);
      }

      /// The last worker out closes the event channel
      if (--active == 0) {
        events.close();
      }
    });
  }

  std::vector<TagResult> results;
  results.reserve(paths.size());
  const int total = static_cast<int>(paths.size());

  TagEvent event;
  while (events.pop(event)) {
    notify(event);
    if (event.kind != TagEventKind::WorkerCompleted)
      continue;

    results.push_back(std::move(event.result));

    TagEvent overall;
    overall.kind = TagEventKind::OverallProgress;
    overall.completed = static_cast<int>(results.size());
    overall.total = total;
    notify(overall);
  }

  for (auto &worker : pool) {
    worker.join();
  }

  return results;
}

} // namespace video_tagger

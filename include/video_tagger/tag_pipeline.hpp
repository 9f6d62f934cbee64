/**
 * @file tag_pipeline.hpp
 * @brief Parallel tagging of video files
 *
 * @details The TagPipeline class tags a batch of files:
 *
 *          - The work queue is filled with every path, then closed
 *
 *          - A fixed pool of workers drains it; each worker processes one
 *            file end-to-end (classify, probe, hash, rename) before taking
 *            the next
 *
 *          - Workers share nothing but the work queue and the event
 *            channel; the caller thread drains events, collects results
 *            and forwards everything to an optional TagObserver
 *
 *          - A single file or a single worker runs the same per-file logic
 *            inline, without threads
 *
 * @note A per-file failure never aborts the batch. Files that failed stay
 *       untagged and are retried by the next run.
 */

#ifndef VIDEO_TAGGER_TAG_PIPELINE_HPP
#define VIDEO_TAGGER_TAG_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "metadata_extractor.hpp"
#include "types.hpp"

namespace video_tagger {

enum class TagEventKind {
  WorkerStarted,   //< worker_id, path
  WorkerProgress,  //< worker_id, path, progress, bytes, total_bytes
  WorkerCompleted, //< worker_id, result
  OverallProgress  //< completed, total
};

/**
 * @struct TagEvent
 * @brief One event of the tagging stream, discriminated by kind.
 */
struct TagEvent {
  TagEventKind kind = TagEventKind::WorkerStarted;
  int worker_id = 0;
  std::string path;
  double progress = 0;      //< 0.0 to 1.0, approximate
  uint64_t bytes = 0;       //< Bytes hashed so far
  uint64_t total_bytes = 0; //< File size
  TagResult result;         //< WorkerCompleted only
  int completed = 0;        //< OverallProgress only
  int total = 0;            //< OverallProgress only
};

/**
 * @class TagObserver
 * @brief Presentation hook for tagging events.
 * @note Always invoked on the thread that called TagPipeline::process().
 */
class TagObserver {
public:
  virtual ~TagObserver() = default;
  virtual void on_event(const TagEvent &event) = 0;
};

/**
 * @struct TagSummary
 * @brief Aggregate counts computed from a result list.
 */
struct TagSummary {
  int tagged = 0;
  int skipped = 0;
  int failed = 0;
};

TagSummary summarize(const std::vector<TagResult> &results);

/**
 * @class TagPipeline
 * @brief Tags files in place with a bounded worker pool.
 */
class TagPipeline {
public:
  /**
   * @param extractor Metadata/hash extractor (must outlive the pipeline)
   * @param observer Optional event consumer (nullptr = no events)
   */
  explicit TagPipeline(const MetadataExtractor &extractor,
                       TagObserver *observer = nullptr);

  /**
   * @brief Tag every path of the batch.
   *
   * @param paths Files to tag
   * @param worker_count Explicit worker count; 0 applies the auto policy
   *                     (1 on network mounts, logical cores otherwise)
   * @return One result per input path; order across workers is unspecified
   */
  std::vector<TagResult> process(const std::vector<std::string> &paths,
                                 int worker_count = 0);

  /// Worker count used by the last process() call
  int last_worker_count() const { return last_worker_count_; }

  /// Sink for events produced while tagging one file
  using EventSink = std::function<void(TagEvent)>;

  /**
   * @brief Tag a single file.
   *
   * @param path File to tag
   * @param worker_id Id reported in events
   * @param emit Receives start/progress/completion events
   * @return Result also carried by the completion event
   */
  TagResult tag_file(const std::string &path, int worker_id,
                     const EventSink &emit) const;

private:
  const MetadataExtractor &extractor_;
  TagObserver *observer_;
  int last_worker_count_ = 0;

  std::vector<TagResult> process_inline(const std::vector<std::string> &paths);
  std::vector<TagResult> process_pool(const std::vector<std::string> &paths,
                                      int workers);

  /// tag_file() that turns an escaping exception into an Aborted result
  TagResult tag_file_guarded(const std::string &path, int worker_id,
                             const EventSink &emit) const;

  void notify(const TagEvent &event) const;
};

} // namespace video_tagger

#endif // VIDEO_TAGGER_TAG_PIPELINE_HPP

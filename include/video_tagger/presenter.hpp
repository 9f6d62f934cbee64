/**
 * @file presenter.hpp
 * @brief Console presentation of tagging events and duplicate resolution
 *
 * @details Provides:
 *          - Styles: immutable text styles built once and passed by reference
 *
 *          - ConsoleTagObserver: renders the tagging event stream
 *
 *          - print_tag_summary / print_verify_summary: aggregate reports
 *
 *          - ConsoleResolverView + run_resolver_console: line-oriented
 *            driver for DuplicateResolver
 *
 * @note The presentation layer never mutates subsystem state directly; it
 *       only dispatches intents back into the resolver.
 */

#ifndef VIDEO_TAGGER_PRESENTER_HPP
#define VIDEO_TAGGER_PRESENTER_HPP

#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/color.h>

#include "duplicate_index.hpp"
#include "duplicate_resolver.hpp"
#include "tag_pipeline.hpp"
#include "verification.hpp"

namespace video_tagger {

/**
 * @struct Styles
 * @brief Text styles shared by every console view.
 */
struct Styles {
  fmt::text_style header;
  fmt::text_style info;
  fmt::text_style processing;
  fmt::text_style success;
  fmt::text_style error;
  fmt::text_style warning;
  fmt::text_style cursor;

  /// Coloured styles for terminals
  static Styles colored();

  /// Unstyled output (pipes, NO_COLOR)
  static Styles plain();
};

/**
 * @class ConsoleTagObserver
 * @brief Prints worker start, quarter-step progress and completion lines.
 * @note Already-tagged files are skipped silently.
 */
class ConsoleTagObserver : public TagObserver {
public:
  explicit ConsoleTagObserver(const Styles &styles);
  void on_event(const TagEvent &event) override;

private:
  const Styles &styles_;
  std::unordered_map<int, int> last_quarter_; //< worker id -> 0..4
};

/// Print tagged/skipped/failed counts and the failed files
void print_tag_summary(const std::vector<TagResult> &results,
                       double wall_clock_sec, int workers,
                       const Styles &styles);

/// Print one line per verified file and the aggregate counts
void print_verify_summary(const std::vector<VerifyResult> &results,
                          const Styles &styles);

/// One listing line for a duplicate: path, size and embedded metadata
std::string describe_duplicate_file(const std::string &path);

/// Print duplicate groups without starting the resolver
void print_duplicate_index(const DuplicateIndex &index, const Styles &styles);

/**
 * @brief Map one input line to an intent.
 *
 * @param line Key as typed (j/k, p/n, space, a, c, s, enter, y/n, h, q)
 * @param state Current resolver state (y/n mean confirm/cancel only while
 *              confirming)
 * @param intent Output: mapped intent
 * @return false for unknown keys
 */
bool parse_intent(const std::string &line, ResolverState state,
                  Intent &intent);

/**
 * @class ConsoleResolverView
 * @brief Renders the resolver state and the commands it emits.
 */
class ConsoleResolverView {
public:
  explicit ConsoleResolverView(const Styles &styles);

  void render(const DuplicateResolver &resolver) const;
  void render_command(const ResolverCommand &command) const;

private:
  const Styles &styles_;

  void render_main(const DuplicateResolver &resolver) const;
  void render_confirmation(const DuplicateResolver &resolver) const;
  void render_help() const;
};

/**
 * @brief Drive a resolver from line input until it quits or input ends.
 *
 * @note Confirmed deletions run synchronously; their completion message is
 *       fed back before more input is read.
 *
 * @return Number of deletion batches that failed
 */
int run_resolver_console(DuplicateResolver &resolver, const Styles &styles,
                         std::istream &in);

} // namespace video_tagger

#endif // VIDEO_TAGGER_PRESENTER_HPP

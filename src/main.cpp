/**
 * @file main.cpp
 * @brief Entry point for the video tagger
 *
 * @details Main entry point that handles:
 *
 *          - tag [--workers N] <path>...: embed resolution, duration and
 *            CRC-32 into file names (directories are scanned recursively)
 *
 *          - duplicates [--list] [dir]: group tagged files by hash and
 *            resolve them interactively, or just list the groups
 *
 *          - verify <file>...: recompute hashes of tagged files
 *
 * @note Worker count precedence: --workers, then TAG_WORKERS, then the
 *       automatic policy (1 on network mounts, logical cores otherwise).
 */

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "video_tagger/config.hpp"
#include "video_tagger/discovery.hpp"
#include "video_tagger/duplicate_index.hpp"
#include "video_tagger/duplicate_resolver.hpp"
#include "video_tagger/logging.hpp"
#include "video_tagger/metadata_extractor.hpp"
#include "video_tagger/presenter.hpp"
#include "video_tagger/system.hpp"
#include "video_tagger/tag_pipeline.hpp"
#include "video_tagger/verification.hpp"

using namespace video_tagger;
namespace fs = std::filesystem;

namespace {

void print_usage() {
  LOG_WARN("Usage:\n"
           "  video_tagger tag [--workers N] <file|dir>...\n"
           "  video_tagger duplicates [--list] [dir]\n"
           "  video_tagger verify <file>...");
}

Styles make_styles() {
  if (std::getenv("NO_COLOR") != nullptr || !isatty(STDOUT_FILENO)) {
    return Styles::plain();
  }
  return Styles::colored();
}

bool parse_worker_count(const std::string &value, int &workers) {
  char *end = nullptr;
  long parsed = std::strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || parsed < 1 || parsed > 1024) {
    return false;
  }
  workers = static_cast<int>(parsed);
  return true;
}

/// Expand directories into their untagged videos; plain files pass through
bool collect_inputs(const std::vector<std::string> &args,
                    DiscoveryScanner &scanner,
                    std::vector<std::string> &files) {
  for (const auto &arg : args) {
    std::error_code ec;
    fs::file_status status = fs::status(arg, ec);
    if (ec || !fs::exists(status)) {
      LOG_ERROR("Cannot access {}: {}",
                arg, ec ? ec.message() : "no such file or directory");
      return false;
    }

    if (fs::is_directory(status)) {
      std::vector<std::string> found;
      std::string error;
      if (!scanner.find_untagged(arg, found, error)) {
        LOG_ERROR("Cannot scan {}: {}", arg, error);
        return false;
      }
      LOG_INFO("Found {} untagged video file(s) in {}", found.size(), arg);
      files.insert(files.end(), found.begin(), found.end());
    } else {
      files.push_back(arg);
    }
  }
  return true;
}

// **---- COMMANDS ----**

int run_tag(const std::vector<std::string> &args, const Styles &styles) {
  int workers = Config::tag_workers(); //< 0 = auto
  std::vector<std::string> inputs;

  for (size_t i = 0; i < args.size(); i++) {
    const std::string &arg = args[i];
    if (arg == "--workers" || arg == "-w") {
      if (i + 1 >= args.size() || !parse_worker_count(args[i + 1], workers)) {
        LOG_ERROR("--workers needs a positive number");
        return 1;
      }
      i++;
    } else if (arg.rfind("--workers=", 0) == 0) {
      if (!parse_worker_count(arg.substr(10), workers)) {
        LOG_ERROR("--workers needs a positive number");
        return 1;
      }
    } else {
      inputs.push_back(arg);
    }
  }

  if (inputs.empty()) {
    print_usage();
    return 1;
  }

  DiscoveryScanner scanner;
  std::vector<std::string> files;
  if (!collect_inputs(inputs, scanner, files)) {
    return 1;
  }
  if (files.empty()) {
    LOG_SUCCESS("Nothing to tag");
    return 0;
  }

  LibavProber prober;
  MetadataExtractor extractor(prober);
  ConsoleTagObserver observer(styles);
  TagPipeline pipeline(extractor, &observer);

  auto start = std::chrono::steady_clock::now();
  std::vector<TagResult> results = pipeline.process(files, workers);
  double wall_clock_sec = std::chrono::duration<double>(
                              std::chrono::steady_clock::now() - start)
                              .count();

  print_tag_summary(results, wall_clock_sec, pipeline.last_worker_count(),
                    styles);
  LOG_INFO("Batch finished in {}", format_time(wall_clock_sec));

  if (Config::show_timing()) {
    TimingCollector::print_summary();
  }
  return summarize(results).failed > 0 ? 1 : 0;
}

int run_duplicates(const std::vector<std::string> &args,
                   const Styles &styles) {
  bool list_only = false;
  std::string root = ".";
  bool root_given = false;

  for (const auto &arg : args) {
    if (arg == "--list" || arg == "-l") {
      list_only = true;
    } else if (!root_given) {
      root = arg;
      root_given = true;
    } else {
      print_usage();
      return 1;
    }
  }

  DiscoveryScanner scanner;
  DuplicateIndex index;
  std::string error;
  if (!build_duplicate_index(root, scanner, index, error)) {
    LOG_ERROR("Cannot scan {}: {}", root, error);
    return 1;
  }

  if (list_only) {
    print_duplicate_index(index, styles);
    return 0;
  }

  DuplicateResolver resolver(index);
  int failed_batches = run_resolver_console(resolver, styles, std::cin);
  return failed_batches > 0 ? 1 : 0;
}

int run_verify(const std::vector<std::string> &args, const Styles &styles) {
  if (args.empty()) {
    print_usage();
    return 1;
  }

  std::vector<VerifyResult> results = verify_files(args);
  print_verify_summary(results, styles);

  for (const auto &r : results) {
    if (r.status == VerifyStatus::Mismatch ||
        r.status == VerifyStatus::HashFailed) {
      return 1;
    }
  }
  return 0;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  const Styles styles = make_styles();

  if (command == "tag") {
    return run_tag(args, styles);
  }
  if (command == "duplicates") {
    return run_duplicates(args, styles);
  }
  if (command == "verify") {
    return run_verify(args, styles);
  }

  LOG_ERROR("Unknown command: {}", command);
  print_usage();
  return 1;
}

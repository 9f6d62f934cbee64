/**
 * @file metadata_extractor.cpp
 * @brief Metadata and checksum extraction implementation
 *
 * @details Provides implementations for:
 *
 *          - LibavProber: avformat_open_input + avformat_find_stream_info
 *
 *          - compute_crc32: block reads fed through av_crc
 *
 *          - MetadataExtractor::extract: resolution, duration, hash
 */

#include "video_tagger/metadata_extractor.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/crc.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "video_tagger/config.hpp"
#include "video_tagger/filename_codec.hpp"
#include "video_tagger/logging.hpp"

namespace video_tagger {

// **---- Internal Helpers ----**

namespace {

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

/// Closes the format context when the probe goes out of scope
struct FormatContextCloser {
  void operator()(AVFormatContext *ctx) const {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

/// Open a container and read enough packets to know its streams
bool open_container(const std::string &path, FormatContextPtr &out,
                    std::string &error) {
  AVFormatContext *ctx = nullptr;
  int ret = avformat_open_input(&ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    error = fmt::format("{}: {}", path, av_error_string(ret));
    return false;
  }
  out.reset(ctx);

  ret = avformat_find_stream_info(ctx, nullptr);
  if (ret < 0) {
    error = fmt::format("{}: {}", path, av_error_string(ret));
    return false;
  }
  return true;
}

/// RAII file descriptor
class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ != -1)
      close(fd_);
  }
  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;

  int get() const { return fd_; }
  bool is_valid() const { return fd_ != -1; }

private:
  int fd_;
};

} // anonymous namespace

// **---- LibavProber ----**

bool LibavProber::probe_resolution(const std::string &path,
                                   std::string &resolution,
                                   std::string &error) {
  FormatContextPtr ctx;
  if (!open_container(path, ctx, error))
    return false;

  /// First video stream, matching `-select_streams v:0`
  for (unsigned int i = 0; i < ctx->nb_streams; ++i) {
    const AVCodecParameters *par = ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      resolution = fmt::format("{}x{}", par->width, par->height);
      return true;
    }
  }

  error = fmt::format("{}: no video stream found", path);
  return false;
}

bool LibavProber::probe_duration(const std::string &path, double &seconds,
                                 std::string &error) {
  FormatContextPtr ctx;
  if (!open_container(path, ctx, error))
    return false;

  if (ctx->duration == AV_NOPTS_VALUE || ctx->duration < 0) {
    error = fmt::format("{}: container duration is unknown", path);
    return false;
  }

  seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
  return true;
}

// **---- Checksum ----**

bool compute_crc32(const std::string &path, uint32_t &crc, std::string &error,
                   const HashProgressFn &progress) {
  FileDescriptor fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.is_valid()) {
    error = fmt::format("open {}: {}", path, std::strerror(errno));
    return false;
  }

  struct stat sb;
  if (fstat(fd.get(), &sb) == -1) {
    error = fmt::format("stat {}: {}", path, std::strerror(errno));
    return false;
  }
  const uint64_t total = static_cast<uint64_t>(sb.st_size);

#ifdef POSIX_FADV_SEQUENTIAL
  /// Enable aggressive read-ahead; failure only costs throughput
  (void)posix_fadvise(fd.get(), 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

  const AVCRC *table = av_crc_get_table(AV_CRC_32_IEEE_LE);
  std::vector<uint8_t> buffer(static_cast<size_t>(Config::hash_buffer_kb()) *
                              1024);

  uint32_t state = UINT32_MAX;
  uint64_t done = 0;
  for (;;) {
    ssize_t n = read(fd.get(), buffer.data(), buffer.size());
    if (n == 0)
      break;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = fmt::format("read {}: {}", path, std::strerror(errno));
      return false;
    }
    state = av_crc(table, state, buffer.data(), static_cast<size_t>(n));
    done += static_cast<uint64_t>(n);
    if (progress)
      progress(done, total);
  }

  crc = state ^ UINT32_MAX;
  return true;
}

// **---- MetadataExtractor ----**

MetadataExtractor::MetadataExtractor(MetadataProber &prober)
    : prober_(prober) {}

bool MetadataExtractor::extract(const std::string &path,
                                ExtractedMetadata &out, TagError &error,
                                const HashProgressFn &progress) const {
  std::string message;

  if (!prober_.probe_resolution(path, out.resolution, message)) {
    error = {TagErrorKind::MetadataExtractionFailed, ExtractStage::Resolution,
             fmt::format("failed to get resolution: {}", message)};
    return false;
  }

  /// Some containers report a trailing separator or several streams
  size_t newline = out.resolution.find('\n');
  if (newline != std::string::npos)
    out.resolution.erase(newline);
  while (!out.resolution.empty() &&
         (out.resolution.back() == 'x' || out.resolution.back() == ' ' ||
          out.resolution.back() == '\r')) {
    out.resolution.pop_back();
  }
  if (!is_valid_resolution(out.resolution)) {
    error = {TagErrorKind::MetadataExtractionFailed, ExtractStage::Resolution,
             fmt::format("invalid resolution format: {}", out.resolution)};
    return false;
  }

  double seconds = 0;
  if (!prober_.probe_duration(path, seconds, message)) {
    error = {TagErrorKind::MetadataExtractionFailed, ExtractStage::Duration,
             fmt::format("failed to get duration: {}", message)};
    return false;
  }
  if (!std::isfinite(seconds) || seconds < 0) {
    error = {TagErrorKind::MetadataExtractionFailed, ExtractStage::Duration,
             fmt::format("invalid duration: {}", seconds)};
    return false;
  }
  out.duration_minutes = seconds / 60.0;

  if (!compute_crc32(path, out.crc, message, progress)) {
    error = {TagErrorKind::HashComputationFailed, ExtractStage::Hash,
             fmt::format("failed to compute hash: {}", message)};
    return false;
  }

  return true;
}

} // namespace video_tagger

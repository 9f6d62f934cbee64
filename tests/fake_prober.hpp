/**
 * @file fake_prober.hpp
 * @brief Scriptable MetadataProber for tests
 */

#ifndef VIDEO_TAGGER_FAKE_PROBER_HPP
#define VIDEO_TAGGER_FAKE_PROBER_HPP

#include <atomic>
#include <stdexcept>
#include <string>

#include "video_tagger/metadata_extractor.hpp"

namespace video_tagger {
namespace test {

class FakeProber : public MetadataProber {
public:
  std::string resolution = "1920x1080";
  double seconds = 2700.0;
  bool fail_resolution = false;
  bool fail_duration = false;
  std::string fail_path;  //< Fails both probes for this path only
  std::string throw_path; //< Throws from the resolution probe

  std::atomic<int> calls{0};

  bool probe_resolution(const std::string &path, std::string &out,
                        std::string &error) override {
    calls++;
    if (path == throw_path)
      throw std::runtime_error("prober crashed");
    if (fail_resolution || path == fail_path) {
      error = "exit status 1";
      return false;
    }
    out = resolution;
    return true;
  }

  bool probe_duration(const std::string &path, double &out,
                      std::string &error) override {
    if (fail_duration || path == fail_path) {
      error = "exit status 1";
      return false;
    }
    out = seconds;
    return true;
  }
};

} // namespace test
} // namespace video_tagger

#endif // VIDEO_TAGGER_FAKE_PROBER_HPP

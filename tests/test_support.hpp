/**
 * @file test_support.hpp
 * @brief Temporary directories and file helpers shared by the tests
 */

#ifndef VIDEO_TAGGER_TEST_SUPPORT_HPP
#define VIDEO_TAGGER_TEST_SUPPORT_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace video_tagger {
namespace test {

/**
 * @class TempDir
 * @brief Unique directory under the system temp dir, removed on scope exit.
 */
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "video_tagger_test_XXXXXX")
            .string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr)
      throw std::runtime_error("mkdtemp failed");
    path_ = buf.data();
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::string &path() const { return path_; }

  /// Absolute path of a file inside the directory
  std::string file(const std::string &name) const {
    return (std::filesystem::path(path_) / name).string();
  }

private:
  std::string path_;
};

/// Write content to path, creating parent directories
inline std::string write_file(const std::string &path,
                              const std::string &content) {
  std::filesystem::create_directories(
      std::filesystem::path(path).parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  return path;
}

/// Write a /bin/sh script and mark it executable
inline std::string write_script(const std::string &path,
                                const std::string &body) {
  write_file(path, "#!/bin/sh\n" + body + "\n");
  chmod(path.c_str(), 0755);
  return path;
}

inline bool exists(const std::string &path) {
  return std::filesystem::exists(path);
}

} // namespace test
} // namespace video_tagger

#endif // VIDEO_TAGGER_TEST_SUPPORT_HPP

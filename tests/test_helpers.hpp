#ifndef VIDCAP_TEST_HELPERS_HPP
#define VIDCAP_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace vidcap_test {

/// Scratch directory under the system temp dir, removed with its contents
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("vidcap_test_" + std::to_string(stamp) + "_" +
             std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::filesystem::path subdir(const std::string &name) const {
    auto p = path_ / name;
    std::filesystem::create_directories(p);
    return p;
  }

private:
  std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path &p,
                       const std::string &content = "") {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const std::filesystem::path &p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

} // namespace vidcap_test

#endif // VIDCAP_TEST_HELPERS_HPP

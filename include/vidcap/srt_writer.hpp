/**
 * @file srt_writer.hpp
 * @brief SubRip caption file output
 */

#ifndef VIDCAP_SRT_WRITER_HPP
#define VIDCAP_SRT_WRITER_HPP

#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace vidcap {

/**
 * @brief Format seconds as an SRT timestamp "HH:MM:SS,mmm".
 * @note Negative input is treated as zero.
 */
std::string format_srt_timestamp(double seconds);

/**
 * @brief Write chunks as a SubRip file (1-based cues, blank-line separated).
 * @return false if the file cannot be written
 */
bool write_srt(const std::vector<CaptionChunk> &chunks,
               const std::string &path);

/**
 * @class TempFileGuard
 * @brief Removes a file when the guard goes out of scope.
 * @note Removal failures are logged, never thrown.
 */
class TempFileGuard {
  std::string path_;

public:
  explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
  ~TempFileGuard();

  TempFileGuard(const TempFileGuard &) = delete;
  TempFileGuard &operator=(const TempFileGuard &) = delete;

  const std::string &path() const { return path_; }
};

} // namespace vidcap

#endif // VIDCAP_SRT_WRITER_HPP

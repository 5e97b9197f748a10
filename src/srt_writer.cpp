/**
 * @file srt_writer.cpp
 * @brief SubRip output and temporary file cleanup
 */

#include "vidcap/srt_writer.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fmt/core.h>

#include "vidcap/logging.hpp"

namespace vidcap {

std::string format_srt_timestamp(double seconds) {
  if (seconds < 0)
    seconds = 0;
  long long total_ms = std::llround(seconds * 1000.0);
  long long h = total_ms / 3600000;
  long long m = (total_ms % 3600000) / 60000;
  long long s = (total_ms % 60000) / 1000;
  long long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d},{:03d}", h, m, s, ms);
}

bool write_srt(const std::vector<CaptionChunk> &chunks,
               const std::string &path) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    LOG_ERROR("Failed to open caption file for writing: {}", path);
    return false;
  }

  int cue = 1;
  for (const auto &chunk : chunks) {
    out << cue++ << '\n'
        << format_srt_timestamp(chunk.start) << " --> "
        << format_srt_timestamp(chunk.end) << '\n'
        << chunk.text << "\n\n";
  }

  out.flush();
  if (!out) {
    LOG_ERROR("Failed to write caption file: {}", path);
    return false;
  }
  return true;
}

TempFileGuard::~TempFileGuard() {
  std::error_code ec;
  if (std::filesystem::remove(path_, ec)) {
    return;
  }
  if (ec) {
    LOG_WARN("Could not remove temporary file {}: {}", path_, ec.message());
  }
}

} // namespace vidcap

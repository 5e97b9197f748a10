/**
 * @file progress_parser.cpp
 * @brief Encoder progress marker parsing
 */

#include "vidcap/progress_parser.hpp"

#include <algorithm>
#include <cmath>
#include <regex>

namespace vidcap {

namespace {

const std::regex &frame_pattern() {
  static const std::regex re(R"(frame=\s*(\d+))");
  return re;
}

const std::regex &time_pattern() {
  static const std::regex re(
      R"(time=((?:\d{1,2}:)?\d{1,2}:\d{2}(?:\.\d+)?))");
  return re;
}

} // anonymous namespace

std::optional<double> parse_clock(const std::string &text) {
  static const std::regex re(R"(^(?:(\d{1,2}):)?(\d{1,2}):(\d{2}(?:\.\d+)?)$)");
  std::smatch m;
  if (!std::regex_match(text, m, re))
    return std::nullopt;
  double h = m[1].matched ? std::stod(m[1].str()) : 0.0;
  double mins = std::stod(m[2].str());
  double secs = std::stod(m[3].str());
  return h * 3600.0 + mins * 60.0 + secs;
}

ProgressTracker::ProgressTracker(double duration, int fps)
    : duration_(duration), fps_(fps) {}

int ProgressTracker::encode_band(double fraction) const {
  fraction = std::max(0.0, fraction);
  int step = static_cast<int>(std::floor(PROGRESS_ENCODE_SPAN * fraction));
  return PROGRESS_ENCODE_START + std::min(PROGRESS_ENCODE_SPAN, step);
}

std::optional<int> ProgressTracker::parse_line(const std::string &line) const {
  if (duration_ <= 0)
    return std::nullopt;

  std::smatch m;
  if (std::regex_search(line, m, frame_pattern())) {
    double total_frames = duration_ * std::max(1, fps_);
    double frame = std::stod(m[1].str());
    return encode_band(frame / total_frames);
  }

  if (std::regex_search(line, m, time_pattern())) {
    auto elapsed = parse_clock(m[1].str());
    if (elapsed)
      return encode_band(*elapsed / duration_);
  }

  return std::nullopt;
}

bool ProgressTracker::update(int percent) {
  if (percent <= last_)
    return false;
  last_ = percent;
  return true;
}

std::optional<int> ProgressTracker::feed(const std::string &line) {
  auto pct = parse_line(line);
  if (pct && update(*pct))
    return pct;
  return std::nullopt;
}

} // namespace vidcap

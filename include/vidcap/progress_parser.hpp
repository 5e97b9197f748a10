/**
 * @file progress_parser.hpp
 * @brief Maps encoder diagnostic lines to a monotonic job percentage
 *
 * @details Bands: 0-20 setup and transcription, 20-99 encoding, 100 after
 *          cleanup. The encoder reports either "frame=N" or
 *          "time=[HH:]MM:SS[.cc]"; the frame counter wins when both appear.
 */

#ifndef VIDCAP_PROGRESS_PARSER_HPP
#define VIDCAP_PROGRESS_PARSER_HPP

#include <optional>
#include <string>

namespace vidcap {

constexpr int PROGRESS_TRANSCRIBE = 5;
constexpr int PROGRESS_ENCODE_START = 20;
constexpr int PROGRESS_ENCODE_SPAN = 79;
constexpr int PROGRESS_FINALIZING = 99;
constexpr int PROGRESS_DONE = 100;

/**
 * @class ProgressTracker
 * @brief Per-job progress state. Reported values never decrease.
 */
class ProgressTracker {
public:
  /**
   * @param duration Expected output length in seconds
   * @param fps Output frame rate
   */
  ProgressTracker(double duration, int fps);

  /**
   * @brief Map one diagnostic line to a percentage without updating state.
   * @return nullopt if the line carries no progress marker
   */
  std::optional<int> parse_line(const std::string &line) const;

  /**
   * @brief Record a percentage.
   * @return true if it is higher than everything reported so far
   */
  bool update(int percent);

  /**
   * @brief parse_line + update.
   * @return The new percentage, or nullopt if nothing new should be reported
   */
  std::optional<int> feed(const std::string &line);

  int current() const { return last_; }

private:
  double duration_;
  int fps_;
  int last_ = -1;

  int encode_band(double fraction) const;
};

/**
 * @brief Parse "[HH:]MM:SS[.cc]" into seconds.
 */
std::optional<double> parse_clock(const std::string &text);

} // namespace vidcap

#endif // VIDCAP_PROGRESS_PARSER_HPP

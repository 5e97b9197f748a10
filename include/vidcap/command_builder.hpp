/**
 * @file command_builder.hpp
 * @brief Encoder invocation assembly
 *
 * @details Input order is fixed:
 *
 *          - One looped still input per image, each lasting duration / count
 *
 *          - Exactly one audio input (the narration)
 *
 *          - One looping overlay input, only when the effect plan has one
 *
 *          The filter graph runs per-image prep -> concat -> transforms ->
 *          overlay -> subtitle burn-in and ends in the [vout] label.
 */

#ifndef VIDCAP_COMMAND_BUILDER_HPP
#define VIDCAP_COMMAND_BUILDER_HPP

#include <string>
#include <utility>
#include <vector>

#include "motion_effects.hpp"
#include "subtitle_style.hpp"
#include "types.hpp"

namespace vidcap {

/**
 * @struct BitrateProfile
 * @brief Tunable bitrate heuristic: int(base + fps * per_fps) megabits.
 */
struct BitrateProfile {
  double static_base = 1.0;
  double static_per_fps = 0.03;
  double static_max_base = 1.5;
  double static_max_per_fps = 0.04;
  double motion_base = 1.5;
  double motion_per_fps = 0.05;
  double motion_max_base = 2.0;
  double motion_max_per_fps = 0.06;
  std::string bufsize = "4M";

  /// Load every constant from the process configuration
  static BitrateProfile from_config();

  int target_mbps(int fps, bool motion) const;
  int max_mbps(int fps, bool motion) const;
};

/**
 * @struct EncodeOptions
 * @brief Output parameters that are not part of the style or effect plan.
 */
struct EncodeOptions {
  Resolution resolution;
  int fps = 30;
  int quality = 28;
  bool accelerator_available = false;
  bool manual_crop = false;
  std::string fontconfig_dir; //< Bundled fonts with a fonts.conf, or empty
};

/**
 * @struct EncodeCommand
 * @brief Argument vector for the encoder (args[0] is the executable).
 */
struct EncodeCommand {
  std::vector<std::string> args;
  std::string filter_graph; //< Same string as the -filter_complex argument
  bool accelerated_decode = false; //< -hwaccel cuda requested
  bool accelerated_encode = false; //< h264_nvenc instead of libx264
  std::vector<std::pair<std::string, std::string>> env; //< Extra variables

  /// Single-quoted shell command line, prefixed with NAME='value' for env
  std::string to_shell() const;
};

/**
 * @class CommandBuilder
 * @brief Builds the full encoder invocation for one job.
 */
class CommandBuilder {
public:
  CommandBuilder(std::string ffmpeg_bin, BitrateProfile bitrates);

  /**
   * @brief Assemble the command.
   *
   * @param project Images and voiceover, in order
   * @param image_filters One prep fragment per image (same order)
   * @param style Subtitle style for the burn-in stage
   * @param plan Effect plan (may be empty)
   * @param duration Narration length in seconds
   * @param subtitle_path SRT file to burn in
   * @param output_path Output video file
   * @param options Resolution, frame rate, quality, accelerator flags
   */
  EncodeCommand build(const ProjectInput &project,
                      const std::vector<std::string> &image_filters,
                      const StyleDescriptor &style, const EffectPlan &plan,
                      double duration, const std::string &subtitle_path,
                      const std::string &output_path,
                      const EncodeOptions &options) const;

  /// Hardware decode needs a device and no manual crop
  static bool accelerate_decode(const EncodeOptions &options);

  /// Hardware encode needs only a device
  static bool accelerate_encode(const EncodeOptions &options);

private:
  std::string ffmpeg_bin_;
  BitrateProfile bitrates_;
};

/**
 * @brief Escape a path for use inside a quoted filter argument.
 * @note Backslashes become '/', ':' becomes "\:", and "'" becomes "'\''".
 */
std::string escape_filter_path(const std::string &path);

/**
 * @brief Quote one argument for a POSIX shell.
 */
std::string shell_quote(const std::string &arg);

} // namespace vidcap

#endif // VIDCAP_COMMAND_BUILDER_HPP

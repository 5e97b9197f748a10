/**
 * @file command_builder.cpp
 * @brief Encoder argument and filter graph assembly
 */

#include "vidcap/command_builder.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/core.h>

#include "vidcap/config.hpp"
#include "vidcap/logging.hpp"

namespace vidcap {

// **---- BitrateProfile ----**

BitrateProfile BitrateProfile::from_config() {
  BitrateProfile p;
  p.static_base = Config::bitrate_static_base();
  p.static_per_fps = Config::bitrate_static_per_fps();
  p.static_max_base = Config::maxrate_static_base();
  p.static_max_per_fps = Config::maxrate_static_per_fps();
  p.motion_base = Config::bitrate_motion_base();
  p.motion_per_fps = Config::bitrate_motion_per_fps();
  p.motion_max_base = Config::maxrate_motion_base();
  p.motion_max_per_fps = Config::maxrate_motion_per_fps();
  p.bufsize = Config::encoder_bufsize();
  return p;
}

int BitrateProfile::target_mbps(int fps, bool motion) const {
  double v = motion ? motion_base + fps * motion_per_fps
                    : static_base + fps * static_per_fps;
  return std::max(1, static_cast<int>(v));
}

int BitrateProfile::max_mbps(int fps, bool motion) const {
  double v = motion ? motion_max_base + fps * motion_max_per_fps
                    : static_max_base + fps * static_max_per_fps;
  return std::max(1, static_cast<int>(v));
}

// **---- Quoting ----**

std::string escape_filter_path(const std::string &path) {
  std::string out;
  out.reserve(path.size() + 8);
  for (char ch : path) {
    switch (ch) {
    case '\\':
      out += '/';
      break;
    case ':':
      out += "\\:";
      break;
    case '\'':
      out += "'\\''";
      break;
    default:
      out += ch;
    }
  }
  return out;
}

std::string shell_quote(const std::string &arg) {
  std::string out = "'";
  for (char ch : arg) {
    if (ch == '\'')
      out += "'\\''";
    else
      out += ch;
  }
  out += '\'';
  return out;
}

std::string EncodeCommand::to_shell() const {
  std::string cmd;
  for (const auto &var : env) {
    cmd += var.first + '=' + shell_quote(var.second) + ' ';
  }
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      cmd += ' ';
    cmd += shell_quote(args[i]);
  }
  return cmd;
}

// **---- CommandBuilder ----**

CommandBuilder::CommandBuilder(std::string ffmpeg_bin, BitrateProfile bitrates)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), bitrates_(std::move(bitrates)) {}

bool CommandBuilder::accelerate_decode(const EncodeOptions &options) {
  return options.accelerator_available && !options.manual_crop;
}

bool CommandBuilder::accelerate_encode(const EncodeOptions &options) {
  return options.accelerator_available;
}

EncodeCommand CommandBuilder::build(
    const ProjectInput &project, const std::vector<std::string> &image_filters,
    const StyleDescriptor &style, const EffectPlan &plan, double duration,
    const std::string &subtitle_path, const std::string &output_path,
    const EncodeOptions &options) const {
  EncodeCommand cmd;
  auto &a = cmd.args;
  cmd.accelerated_decode = accelerate_decode(options);
  cmd.accelerated_encode = accelerate_encode(options);

  const size_t image_count = project.images.size();
  const double per_image = image_count > 0 ? duration / image_count : duration;
  const int fps = options.fps;

  if (!options.fontconfig_dir.empty()) {
    cmd.env = {{"FONTCONFIG_FILE",
                (std::filesystem::path(options.fontconfig_dir) / "fonts.conf")
                    .string()},
               {"FONTCONFIG_PATH", options.fontconfig_dir}};
  }

  a = {ffmpeg_bin_, "-nostdin", "-y"};
  if (cmd.accelerated_decode) {
    a.insert(a.end(), {"-hwaccel", "cuda"});
  }

  // **---- Inputs ----**

  for (const auto &image : project.images) {
    a.insert(a.end(), {"-loop", "1", "-framerate", std::to_string(fps), "-t",
                       fmt::format("{:.3f}", per_image), "-i", image});
  }

  const size_t audio_index = image_count;
  a.insert(a.end(), {"-i", project.voiceover});

  const size_t overlay_index = image_count + 1;
  if (plan.overlay) {
    a.insert(a.end(), {"-stream_loop", "-1", "-i", plan.overlay->asset_path});
  }

  // **---- Filter graph ----**

  std::string graph;
  std::string concat_inputs;
  for (size_t i = 0; i < image_count; ++i) {
    const std::string prep =
        i < image_filters.size()
            ? image_filters[i]
            : fmt::format("scale={}:{}", options.resolution.width,
                          options.resolution.height);
    graph += fmt::format("[{}:v]{},setsar=1,fps={}[v{}];", i, prep, fps, i);
    concat_inputs += fmt::format("[v{}]", i);
  }
  graph += fmt::format("{}concat=n={}:v=1:a=0[vconcat]", concat_inputs,
                       image_count);

  std::string current = "vconcat";
  if (plan.has_transforms()) {
    graph += fmt::format(";[{}]{}[vfx]", current, plan.transform_chain());
    current = "vfx";
  }

  if (plan.overlay) {
    graph += fmt::format(";[{}:v]scale={}:{},format=rgba,"
                         "colorchannelmixer=aa={:.2f}[grain]",
                         overlay_index, options.resolution.width,
                         options.resolution.height, plan.overlay->opacity);
    graph += fmt::format(";[{}][grain]overlay=shortest=1[vov]", current);
    current = "vov";
  }

  graph += fmt::format(";[{}]subtitles='{}':force_style='{}'[vout]", current,
                       escape_filter_path(subtitle_path),
                       style.to_force_style());
  cmd.filter_graph = graph;

  a.insert(a.end(), {"-filter_complex", graph, "-map", "[vout]", "-map",
                     fmt::format("{}:a", audio_index)});

  // **---- Encoder ----**

  const bool motion = !plan.empty();
  const std::string quality = std::to_string(options.quality);

  if (cmd.accelerated_encode) {
    a.insert(a.end(),
             {"-c:v", "h264_nvenc", "-preset", "p1", "-tune", "hq", "-rc",
              "vbr", "-cq", quality, "-b:v",
              fmt::format("{}M", bitrates_.target_mbps(fps, motion)),
              "-maxrate", fmt::format("{}M", bitrates_.max_mbps(fps, motion)),
              "-bufsize", bitrates_.bufsize, "-profile:v", "high", "-level",
              "4.2", "-spatial-aq", "1", "-temporal-aq", "1", "-rc-lookahead",
              "20"});
  } else {
    a.insert(a.end(), {"-c:v", "libx264", "-preset", "faster", "-tune", "film",
                       "-crf", quality, "-profile:v", "high", "-level", "4.2"});
  }

  a.insert(a.end(),
           {"-pix_fmt", "yuv420p", "-r", std::to_string(fps), "-c:a", "aac",
            "-b:a", "128k", "-ar", "48000", "-t",
            fmt::format("{:.3f}", duration), "-movflags", "+faststart",
            "-threads", "0", output_path});

  return cmd;
}

} // namespace vidcap

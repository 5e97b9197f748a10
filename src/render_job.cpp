/**
 * @file render_job.cpp
 * @brief Per-project render pipeline
 */

#include "vidcap/render_job.hpp"

#include <chrono>
#include <filesystem>

#include <fmt/core.h>

#include "vidcap/caption_segmenter.hpp"
#include "vidcap/command_builder.hpp"
#include "vidcap/config.hpp"
#include "vidcap/logging.hpp"
#include "vidcap/media_probe.hpp"
#include "vidcap/progress_parser.hpp"
#include "vidcap/project_scanner.hpp"
#include "vidcap/srt_writer.hpp"
#include "vidcap/subtitle_style.hpp"
#include "vidcap/system.hpp"

namespace vidcap {

namespace fs = std::filesystem;

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Queued:
    return "Queued";
  case JobState::Transcribing:
    return "Transcribing";
  case JobState::Segmenting:
    return "Segmenting";
  case JobState::Assembling:
    return "Assembling";
  case JobState::Encoding:
    return "Encoding";
  case JobState::Complete:
    return "Complete";
  case JobState::Failed:
    return "Failed";
  }
  return "Unknown";
}

RenderServices default_render_services() {
  RenderServices s;
  s.probe_duration = probe_duration;
  s.probe_image = probe_image_size;
  s.run_encoder = execute_encoder;
  s.accelerator_available = gpu_available;
  return s;
}

CaptionLimits CaptionLimits::from_config() {
  CaptionLimits l;
  l.max_words = Config::caption_max_words();
  l.max_chars = Config::caption_max_chars();
  l.wrap_chars = Config::caption_wrap_chars();
  return l;
}

RenderJob::RenderJob(int job_id, ProjectInput project, RenderSettings settings,
                     CaptionLimits limits)
    : job_id_(job_id), project_(std::move(project)),
      settings_(std::move(settings)), limits_(limits) {}

void RenderJob::transition(JobState next) {
  if (state_ == JobState::Complete || state_ == JobState::Failed)
    return;
  if (static_cast<int>(next) <= static_cast<int>(state_))
    return;
  state_ = next;
}

void RenderJob::report(int percent, const std::string &status) {
  if (percent < progress_ || (percent == progress_ && status == status_))
    return;
  progress_ = percent;
  status_ = status;
  if (on_progress_ && *on_progress_)
    (*on_progress_)(project_.folder, percent, status);
}

bool RenderJob::run_stages(TranscriptionService &transcriber,
                           const RenderServices &services,
                           const std::string &subtitle_path,
                           const std::string &output_path) {
  // **---- TRANSCRIBE ----**

  transition(JobState::Transcribing);
  report(PROGRESS_TRANSCRIBE, "Transcribing");

  TIMER_START(transcribe);
  std::vector<CaptionSegment> segments =
      transcriber.transcribe(project_.voiceover);
  TIMER_END_JOB(transcribe, job_id_);

  // **---- SEGMENT ----**

  transition(JobState::Segmenting);
  report(10, "Creating captions");

  CaptionSegmenter segmenter(limits_.max_words, limits_.max_chars);
  auto chunks = segmenter.split(segments);
  finalize_chunks(chunks, settings_.text_case,
                  settings_.native_wrap ? 0 : limits_.wrap_chars);
  LOG_INFO("[Job {}] {} segments -> {} captions", job_id_, segments.size(),
           chunks.size());

  if (!write_srt(chunks, subtitle_path)) {
    LOG_ERROR("[Job {}] Could not write captions", job_id_);
    return false;
  }

  // **---- ASSEMBLE ----**

  transition(JobState::Assembling);
  report(15, "Building filter graph");

  double duration = 0.0;
  if (!services.probe_duration ||
      !services.probe_duration(project_.voiceover, duration) ||
      duration <= 0) {
    LOG_ERROR("[Job {}] Could not read narration duration", job_id_);
    return false;
  }

  StyleDescriptor style = build_style(settings_, settings_.resolution);

  MotionEffectBuilder effects(settings_.resolution, EffectDefaults::standard(),
                              Config::grain_overlay(), services.probe_image);
  std::vector<std::string> image_filters;
  image_filters.reserve(project_.images.size());
  for (const auto &image : project_.images) {
    image_filters.push_back(
        effects.build_per_image_filter(settings_.crop, image));
  }
  EffectPlan plan =
      effects.build_effect_plan(settings_.motion_effects,
                                settings_.effect_intensities, duration,
                                settings_.fps);

  EncodeOptions options;
  options.resolution = settings_.resolution;
  options.fps = settings_.fps;
  options.quality = settings_.quality;
  options.accelerator_available =
      services.accelerator_available && services.accelerator_available();
  options.manual_crop = settings_.crop.has_value();
  options.fontconfig_dir = bundled_fontconfig_dir(Config::fonts_dir());

  CommandBuilder builder(Config::ffmpeg_bin(), BitrateProfile::from_config());
  EncodeCommand command =
      builder.build(project_, image_filters, style, plan, duration,
                    subtitle_path, output_path, options);

  LOG_INFO("[Job {}] {:.1f}s narration, {} image(s), {} transform(s){}, {} "
           "decode, {} encode",
           job_id_, duration, project_.images.size(), plan.transforms.size(),
           plan.overlay ? " + overlay" : "",
           command.accelerated_decode ? "accelerated" : "software",
           command.accelerated_encode ? "accelerated" : "software");

  // **---- ENCODE ----**

  transition(JobState::Encoding);
  report(PROGRESS_ENCODE_START, "Encoding");

  if (!services.run_encoder) {
    LOG_ERROR("[Job {}] No encoder configured", job_id_);
    return false;
  }

  ProgressTracker tracker(duration, settings_.fps);
  tracker.update(PROGRESS_ENCODE_START);

  TIMER_START(encode);
  EncodeOutcome outcome = services.run_encoder(
      command,
      [&](const std::string &line) {
        if (auto pct = tracker.feed(line))
          report(*pct, "Encoding");
      },
      job_id_);
  TIMER_END_JOB(encode, job_id_);

  if (outcome.exit_code != 0) {
    LOG_ERROR("[Job {}] Encoder exited with status {}. Last output:", job_id_,
              outcome.exit_code);
    for (const auto &line : outcome.tail) {
      LOG_ERROR("[Job {}]   {}", job_id_, line);
    }
    return false;
  }

  report(PROGRESS_FINALIZING, "Finalizing");
  return true;
}

RenderResult RenderJob::run(TranscriptionService &transcriber,
                            const RenderServices &services,
                            const ProgressCallback &on_progress) {
  on_progress_ = &on_progress;

  RenderResult result;
  result.folder = project_.folder;

  const std::string name = fs::path(project_.folder).filename().string();
  const std::string subtitle_path =
      (fs::path(project_.folder) / TEMP_SUBTITLE_NAME).string();
  const std::string output_path = output_path_for(project_.folder);

  LOG_INFO("[Job {}] Starting {}", job_id_, name);
  if (!project_.script.empty()) {
    LOG_INFO("[Job {}] Script found, captions still follow the narration",
             job_id_);
  }

  auto start = std::chrono::high_resolution_clock::now();
  TIMER_START(total);

  bool ok = false;
  {
    /// Removed when this scope ends, whatever happens inside it
    TempFileGuard subtitle_guard(subtitle_path);
    try {
      ok = run_stages(transcriber, services, subtitle_path, output_path);
    } catch (const TranscriptionError &e) {
      LOG_ERROR("[Job {}] Transcription failed: {}", job_id_, e.what());
      ok = false;
    } catch (const std::exception &e) {
      LOG_ERROR("[Job {}] Unexpected error: {}", job_id_, e.what());
      ok = false;
    } catch (...) {
      LOG_ERROR("[Job {}] Unexpected non-standard exception", job_id_);
      ok = false;
    }
  }

  TIMER_END_JOB(total, job_id_);
  auto end = std::chrono::high_resolution_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count();

  if (ok) {
    transition(JobState::Complete);
    result.success = true;
    result.output_path = output_path;
    /// The video is already on disk; a throwing listener cannot undo that
    try {
      report(PROGRESS_DONE, "Complete");
    } catch (const std::exception &e) {
      LOG_WARN("[Job {}] Progress listener failed: {}", job_id_, e.what());
    } catch (...) {
      LOG_WARN("[Job {}] Progress listener failed", job_id_);
    }
  } else {
    transition(JobState::Failed);
    result.success = false;
    result.output_path.clear();
  }

  on_progress_ = nullptr;
  return result;
}

} // namespace vidcap

/**
 * @file render_job.hpp
 * @brief One project folder through transcription, captions and encoding
 *
 * @details Stages and progress bands:
 *
 *          - Transcribing (5) -> Segmenting -> Assembling (0-20 setup)
 *
 *          - Encoding (20-99, parsed from encoder output)
 *
 *          - Complete (100, after the temporary caption file is removed)
 *
 *          Any failure ends the job as Failed with an empty output path. The
 *          temporary caption file is removed on every path.
 */

#ifndef VIDCAP_RENDER_JOB_HPP
#define VIDCAP_RENDER_JOB_HPP

#include <functional>
#include <string>

#include "ffmpeg_executor.hpp"
#include "motion_effects.hpp"
#include "render_settings.hpp"
#include "transcription_service.hpp"
#include "types.hpp"

namespace vidcap {

/**
 * @struct RenderServices
 * @brief External effects a job depends on. Replaced by fakes in tests.
 */
struct RenderServices {
  std::function<bool(const std::string &, double &)> probe_duration;
  ImageProbe probe_image;
  std::function<EncodeOutcome(const EncodeCommand &, const LineHandler &, int)>
      run_encoder;
  std::function<bool()> accelerator_available;
};

/// libav probes, the real encoder process and nvidia-smi detection
RenderServices default_render_services();

/**
 * @struct CaptionLimits
 * @brief Segmenter bounds and the manual wrap width.
 */
struct CaptionLimits {
  int max_words = 15;
  int max_chars = 75;
  int wrap_chars = 42;

  static CaptionLimits from_config();
};

/// (folder, percent, status text)
using ProgressCallback =
    std::function<void(const std::string &, int, const std::string &)>;

/**
 * @class RenderJob
 * @brief State machine for a single project. Owned by one worker.
 */
class RenderJob {
public:
  /**
   * @param job_id Zero-based batch index (log prefix)
   * @param project Discovered project files
   * @param settings Settings snapshot (copied)
   * @param limits Caption bounds
   */
  RenderJob(int job_id, ProjectInput project, RenderSettings settings,
            CaptionLimits limits = CaptionLimits::from_config());

  /**
   * @brief Run every stage to completion or failure.
   * @note Never throws: failures become RenderResult{success=false}.
   */
  RenderResult run(TranscriptionService &transcriber,
                   const RenderServices &services,
                   const ProgressCallback &on_progress);

  JobState state() const { return state_; }
  int progress() const { return progress_; }
  int id() const { return job_id_; }
  const std::string &folder() const { return project_.folder; }

private:
  int job_id_;
  ProjectInput project_;
  RenderSettings settings_;
  CaptionLimits limits_;
  JobState state_ = JobState::Queued;
  int progress_ = 0;
  std::string status_;
  const ProgressCallback *on_progress_ = nullptr;

  /// Stages up to and including the encoder exit
  bool run_stages(TranscriptionService &transcriber,
                  const RenderServices &services,
                  const std::string &subtitle_path,
                  const std::string &output_path);

  /// Forward-only state change
  void transition(JobState next);

  /// Emit progress unless it is lower than the last value, or equal with
  /// the same status
  void report(int percent, const std::string &status);
};

} // namespace vidcap

#endif // VIDCAP_RENDER_JOB_HPP

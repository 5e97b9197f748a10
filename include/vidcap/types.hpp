/**
 * @file types.hpp
 * @brief Core data types shared across the render pipeline
 *
 * @details Contains the fundamental value types used throughout vidcap:
 *          - Caption timing (CaptionSegment, CaptionChunk)
 *
 *          - Geometry (Resolution, ImageSize, CropRegion)
 *
 *          - Project inputs and per-job results
 *
 *          - Job state machine states
 */

#ifndef VIDCAP_TYPES_HPP
#define VIDCAP_TYPES_HPP

#include <string>
#include <vector>

namespace vidcap {

// **----- CONSTANTS -----**

/// Smallest crop extent (both axes) that is still usable for output.
constexpr int MIN_CROP_EXTENT = 100;

/// Fraction of output width reserved on each side of the captions.
constexpr double SAFE_SIDE_MARGIN = 0.10;
constexpr int SAFE_SIDE_DIVISOR = 10; //< 1 / SAFE_SIDE_MARGIN

/// Name of the per-job temporary subtitle file inside the project folder.
constexpr const char *TEMP_SUBTITLE_NAME = "temp_captions.srt";

// **----- DATA STRUCTURES -----**

/**
 * @struct CaptionSegment
 * @brief Timed text [start, end) in seconds as emitted by the transcriber.
 */
struct CaptionSegment {
  double start; //< Start time in seconds
  double end;   //< End time in seconds
  std::string text;
};

/// A display-sized caption. Same shape as a segment, bounded by the
/// segmenter's word and character limits.
using CaptionChunk = CaptionSegment;

/**
 * @struct Resolution
 * @brief Output frame size in pixels.
 */
struct Resolution {
  int width = 1920;
  int height = 1080;
};

/// Pixel dimensions of a source image.
struct ImageSize {
  int width = 0;
  int height = 0;
};

/**
 * @struct CropRegion
 * @brief Crop rectangle in source-image pixel space.
 */
struct CropRegion {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

inline bool operator==(const CropRegion &a, const CropRegion &b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height;
}

/**
 * @struct ProjectInput
 * @brief Files making up one project folder.
 * @note Built once per job by the discovery step and never modified.
 */
struct ProjectInput {
  std::string folder;
  std::string voiceover;           //< Narration audio (required)
  std::vector<std::string> images; //< Ordered image paths (>= 1)
  std::string script;              //< Optional pre-written script (may be empty)
};

/**
 * @struct RenderResult
 * @brief Terminal outcome of one job.
 * @note output_path is empty whenever success is false.
 */
struct RenderResult {
  std::string folder;
  bool success = false;
  std::string output_path;
  long processing_time_us = 0;
};

/**
 * @enum JobState
 * @brief Per-job state machine. Transitions only move forward.
 */
enum class JobState {
  Queued,
  Transcribing,
  Segmenting,
  Assembling,
  Encoding,
  Complete,
  Failed
};

/// Printable name of a job state.
const char *to_string(JobState state);

} // namespace vidcap

#endif // VIDCAP_TYPES_HPP

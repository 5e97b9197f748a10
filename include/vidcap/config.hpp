/**
 * @file config.hpp
 * @brief Process configuration via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Style and effect choices are not read here; they arrive per batch
 *          as a RenderSettings snapshot (see render_settings.hpp).
 *
 */

#ifndef VIDCAP_CONFIG_HPP
#define VIDCAP_CONFIG_HPP

#include <algorithm>
#include <cstdlib>
#include <string>

namespace vidcap {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of projects rendered simultaneously.
 * @note Each job holds a transcription model and runs its own encoder, and
 *       any accelerator is shared between jobs, so the useful range is small.
 *       Values are clamped to [1, 4].
 */
inline int parallel_jobs() {
  static int val = std::clamp(get_env_int("PARALLEL_JOBS", 2), 1, 4);
  return val;
}

/**
 * @brief Inference threads per transcription backend (0 = auto).
 * @note Auto divides the detected CPU limit between the workers.
 */
inline int whisper_threads() {
  static int val = get_env_int("WHISPER_THREADS", 0);
  return val;
}

// **---- EXTERNAL TOOLS AND ASSETS ----**

/// Encoder executable
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Path of the ggml whisper model file
inline const std::string &whisper_model() {
  static std::string val =
      get_env_string("WHISPER_MODEL", "models/ggml-base.bin");
  return val;
}

/// Spoken language hint for the transcriber ("auto" lets the model detect)
inline const std::string &whisper_language() {
  static std::string val = get_env_string("WHISPER_LANGUAGE", "en");
  return val;
}

/// Looping grain texture composited by the "Noise" effect
inline const std::string &grain_overlay() {
  static std::string val = get_env_string("GRAIN_OVERLAY", "assets/grain.mp4");
  return val;
}

/**
 * @brief Directory of bundled caption fonts.
 * @note Used only when it holds a fonts.conf; the encoder then resolves font
 *       names through that configuration.
 */
inline const std::string &fonts_dir() {
  static std::string val = get_env_string("FONTS_DIR", "resources/fonts");
  return val;
}

/**
 * @brief Allow accelerated transcription and encoding when a device exists.
 * @note USE_GPU=0 forces the fallback paths everywhere.
 */
inline bool use_gpu() {
  static bool val = (get_env_int("USE_GPU", 1) != 0);
  return val;
}

// **---- CAPTION SEGMENTATION ----**

/// Maximum words per on-screen caption
inline int caption_max_words() {
  static int val = get_env_int("CAPTION_MAX_WORDS", 15);
  return val;
}

/// Maximum characters per on-screen caption
inline int caption_max_chars() {
  static int val = get_env_int("CAPTION_MAX_CHARS", 75);
  return val;
}

/**
 * @brief Width above which a caption gets a manual line break.
 * @note Only used when the renderer is told not to wrap on its own.
 */
inline int caption_wrap_chars() {
  static int val = get_env_int("CAPTION_WRAP_CHARS", 42);
  return val;
}

// **---- ENCODER BITRATE HEURISTICS ----**

/**
 * @brief Bitrate targets are int(base + fps * per_fps) megabits.
 * @note Static content compresses better, so it gets the lower pair.
 */
inline double bitrate_static_base() {
  static double val = get_env_double("BITRATE_STATIC_BASE", 1.0);
  return val;
}

inline double bitrate_static_per_fps() {
  static double val = get_env_double("BITRATE_STATIC_PER_FPS", 0.03);
  return val;
}

inline double maxrate_static_base() {
  static double val = get_env_double("MAXRATE_STATIC_BASE", 1.5);
  return val;
}

inline double maxrate_static_per_fps() {
  static double val = get_env_double("MAXRATE_STATIC_PER_FPS", 0.04);
  return val;
}

inline double bitrate_motion_base() {
  static double val = get_env_double("BITRATE_MOTION_BASE", 1.5);
  return val;
}

inline double bitrate_motion_per_fps() {
  static double val = get_env_double("BITRATE_MOTION_PER_FPS", 0.05);
  return val;
}

inline double maxrate_motion_base() {
  static double val = get_env_double("MAXRATE_MOTION_BASE", 2.0);
  return val;
}

inline double maxrate_motion_per_fps() {
  static double val = get_env_double("MAXRATE_MOTION_PER_FPS", 0.06);
  return val;
}

/// Rate-control buffer size passed to the accelerated encoder
inline const std::string &encoder_bufsize() {
  static std::string val = get_env_string("ENCODER_BUFSIZE", "4M");
  return val;
}

} // namespace Config
} // namespace vidcap

#endif // VIDCAP_CONFIG_HPP

/**
 * @file render_settings.hpp
 * @brief Style, effect and output settings snapshot for a batch
 *
 * @details A RenderSettings value is loaded once (from the JSON snapshot the
 *          editing front-end persists), normalized, and then copied into every
 *          job. Jobs never mutate it.
 */

#ifndef VIDCAP_RENDER_SETTINGS_HPP
#define VIDCAP_RENDER_SETTINGS_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace vidcap {

// **----- PRESETS -----**

constexpr int FPS_CINEMA = 24;
constexpr int FPS_STANDARD = 30;
constexpr int FPS_SMOOTH = 60;

/// Quality presets map straight onto CRF / CQ values (lower is better).
constexpr int QUALITY_LOW = 32;
constexpr int QUALITY_MEDIUM = 28;
constexpr int QUALITY_HIGH = 23;
constexpr int QUALITY_MAX = 18;

/**
 * @enum TextCase
 * @brief Case folding applied to caption text after segmentation.
 */
enum class TextCase { None, Title, Upper };

/**
 * @struct CaptionAnchor
 * @brief Normalized caption position, both axes in [0, 1].
 */
struct CaptionAnchor {
  double x = 0.5;
  double y = 0.9;
};

/**
 * @struct RenderSettings
 * @brief Immutable snapshot of everything that shapes one rendered video.
 */
struct RenderSettings {
  // Font
  std::string font_family = "Arial";
  int font_size = 48;
  bool bold = true;
  TextCase text_case = TextCase::Title;

  // Colors are "#RRGGBB"
  std::string text_color = "#FFFF00";
  bool has_background = true;
  std::string bg_color = "#000000";
  int bg_opacity = 80; //< Percent, 100 = fully opaque box
  bool has_outline = false;
  std::string outline_color = "#000000";
  int outline_width = 3;
  int shadow_depth = 2;

  CaptionAnchor caption_position;
  bool native_wrap = true; //< Let the subtitle renderer wrap long lines

  // Effects
  std::vector<std::string> motion_effects{"Static"};
  std::map<std::string, int> effect_intensities; //< Name -> 0..100
  std::optional<CropRegion> crop;

  // Output
  Resolution resolution;
  int fps = FPS_STANDARD;
  int quality = QUALITY_MEDIUM;
};

/**
 * @brief Enforce the settings invariants in place.
 *
 * @note Never rejects input: anchors are clamped to [0, 1], percentages to
 *       [0, 100], fps and quality to the encoder's usable range. When both the
 *       background box and the outline are off, outline is switched on so
 *       captions always have one legibility treatment.
 */
void normalize_settings(RenderSettings &settings);

/**
 * @brief Map a resolution label ("720p", "1080p", "2K", "4K") to pixels.
 * @return The preset, or 1080p for unknown labels
 */
Resolution resolution_from_string(const std::string &label);

/**
 * @brief Parse a text case label ("title", "upper", anything else = none).
 */
TextCase text_case_from_string(const std::string &label);

/**
 * @brief Load a settings snapshot from a JSON file.
 *
 * @param path JSON file written by the editing front-end
 * @param out Receives the loaded and normalized settings
 * @return false if the file cannot be opened or parsed
 * @note Missing keys keep their defaults. The legacy single "motion_effect"
 *       key is migrated into "motion_effects".
 */
bool load_settings_file(const std::string &path, RenderSettings &out);

/**
 * @brief Preset names for the output settings, e.g. "1080p @ 30fps, Medium".
 * @note Values off the preset grid are shown as numbers / "Custom".
 */
std::string describe_settings(const RenderSettings &settings);

/**
 * @brief Log the resolved settings in a readable block.
 */
void log_settings(const RenderSettings &settings);

} // namespace vidcap

#endif // VIDCAP_RENDER_SETTINGS_HPP

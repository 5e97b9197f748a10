/**
 * @file subtitle_style.hpp
 * @brief Caption presentation style for subtitle burn-in
 *
 * @details Turns the font, colour, background/outline and anchor settings
 *          into a StyleDescriptor, which renders as the force_style string of
 *          the encoder's subtitles filter (ASS style fields).
 *
 * @note Colours use the ASS &HAABBGGRR layout: alpha is the most significant
 *       byte and the RGB channels are reversed. Alpha 00 is opaque.
 */

#ifndef VIDCAP_SUBTITLE_STYLE_HPP
#define VIDCAP_SUBTITLE_STYLE_HPP

#include <cstdint>
#include <string>

#include "render_settings.hpp"
#include "types.hpp"

namespace vidcap {

/// ASS BorderStyle values
constexpr int BORDER_STYLE_OUTLINE = 1;
constexpr int BORDER_STYLE_BOX = 4;

/// ASS numpad alignment: bottom row 1-3, middle 4-6, top 7-9
constexpr int ALIGN_BOTTOM_CENTER = 2;
constexpr int ALIGN_MIDDLE_CENTER = 5;
constexpr int ALIGN_TOP_CENTER = 8;

/// Vertical anchor thresholds on the normalized y axis
constexpr double TOP_ANCHOR_LIMIT = 0.33;
constexpr double BOTTOM_ANCHOR_LIMIT = 0.66;

/**
 * @struct RgbColor
 * @brief 8-bit colour channels.
 */
struct RgbColor {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
};

/**
 * @struct StyleDescriptor
 * @brief Derived style for one job. Fully determined by settings + resolution.
 */
struct StyleDescriptor {
  std::string font_name;
  int font_size = 48;
  bool bold = true;

  std::string primary_colour; //< Text colour, &HAABBGGRR
  std::string back_colour;    //< Box / shadow colour
  std::string outline_colour; //< Stroke colour

  int border_style = BORDER_STYLE_BOX;
  int outline = 0;
  int shadow = 0;

  int margin_v = 0; //< May be negative for middle anchoring
  int margin_l = 0;
  int margin_r = 0;
  int alignment = ALIGN_BOTTOM_CENTER;
  int wrap_style = 0; //< 0 = renderer wraps, 2 = no wrapping

  /**
   * @brief Render as "Key=Value,..." for the subtitles filter force_style.
   */
  std::string to_force_style() const;
};

/**
 * @brief Build the style descriptor for a job.
 * @note Never fails: bad colours fall back to defaults, anchors are clamped.
 *       Left/right margins are always 10% of the output width.
 */
StyleDescriptor build_style(const RenderSettings &settings,
                            const Resolution &resolution);

/**
 * @brief Font family as it may appear inside force_style='...'.
 * @note Drops ',' (ASS field separator) and both quote characters; an empty
 *       result falls back to the default family.
 */
std::string sanitize_font_name(const std::string &family);

/**
 * @brief Directory to hand the encoder as its fontconfig root.
 * @return fonts_dir if it contains a fonts.conf, otherwise empty
 */
std::string bundled_fontconfig_dir(const std::string &fonts_dir);

/**
 * @brief Parse "#RRGGBB" (leading '#' optional).
 * @return false if the string is not six hex digits
 */
bool parse_hex_color(const std::string &hex, RgbColor &out);

/**
 * @brief Encode a colour as &HAABBGGRR.
 * @param alpha 0 = opaque, 255 = transparent
 */
std::string encode_ass_color(const RgbColor &color, int alpha = 0);

/**
 * @brief Convert an opacity percentage into an ASS alpha byte.
 * @note round((100 - opacity) * 2.55), clamped to [0, 255].
 */
int opacity_to_alpha(int opacity_percent);

} // namespace vidcap

#endif // VIDCAP_SUBTITLE_STYLE_HPP

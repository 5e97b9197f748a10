/**
 * @file subtitle_style.cpp
 * @brief Subtitle style computation
 */

#include "vidcap/subtitle_style.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

const RgbColor DEFAULT_TEXT{255, 255, 0};
const RgbColor DEFAULT_BLACK{0, 0, 0};

RgbColor color_or(const std::string &hex, const RgbColor &fallback) {
  RgbColor c;
  if (parse_hex_color(hex, c))
    return c;
  LOG_WARN("Invalid colour '{}', using default", hex);
  return fallback;
}

int hex_digit(char ch) {
  if (ch >= '0' && ch <= '9')
    return ch - '0';
  ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (ch >= 'a' && ch <= 'f')
    return ch - 'a' + 10;
  return -1;
}

} // anonymous namespace

bool parse_hex_color(const std::string &hex, RgbColor &out) {
  std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
  if (digits.size() != 6)
    return false;

  uint8_t channels[3];
  for (int i = 0; i < 3; ++i) {
    int hi = hex_digit(digits[i * 2]);
    int lo = hex_digit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0)
      return false;
    channels[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  out = {channels[0], channels[1], channels[2]};
  return true;
}

std::string encode_ass_color(const RgbColor &color, int alpha) {
  alpha = std::clamp(alpha, 0, 255);
  return fmt::format("&H{:02X}{:02X}{:02X}{:02X}", alpha, color.b, color.g,
                     color.r);
}

int opacity_to_alpha(int opacity_percent) {
  int op = std::clamp(opacity_percent, 0, 100);
  /// (100 - op) * 2.55 rounded half up, kept in integers
  return ((100 - op) * 255 + 50) / 100;
}

std::string sanitize_font_name(const std::string &family) {
  std::string out;
  out.reserve(family.size());
  for (char ch : family) {
    if (ch != ',' && ch != '\'' && ch != '"')
      out += ch;
  }
  if (out.find_first_not_of(' ') == std::string::npos)
    return RenderSettings{}.font_family;
  return out;
}

std::string bundled_fontconfig_dir(const std::string &fonts_dir) {
  if (fonts_dir.empty())
    return "";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(
          std::filesystem::path(fonts_dir) / "fonts.conf", ec))
    return "";
  return fonts_dir;
}

StyleDescriptor build_style(const RenderSettings &settings,
                            const Resolution &resolution) {
  StyleDescriptor style;
  style.font_name = sanitize_font_name(settings.font_family);
  style.font_size = std::max(1, settings.font_size);
  style.bold = settings.bold;

  style.primary_colour =
      encode_ass_color(color_or(settings.text_color, DEFAULT_TEXT));

  /// Background wins when both are on; with neither, outline is drawn
  if (settings.has_background) {
    style.border_style = BORDER_STYLE_BOX;
    style.back_colour =
        encode_ass_color(color_or(settings.bg_color, DEFAULT_BLACK),
                         opacity_to_alpha(settings.bg_opacity));
    style.outline_colour = encode_ass_color(DEFAULT_BLACK);
    style.outline = 0;
    style.shadow = 0;
  } else {
    style.border_style = BORDER_STYLE_OUTLINE;
    style.back_colour = encode_ass_color(DEFAULT_BLACK, 255);
    style.outline_colour =
        encode_ass_color(color_or(settings.outline_color, DEFAULT_BLACK));
    style.outline = std::max(0, settings.outline_width);
    style.shadow = std::max(0, settings.shadow_depth);
  }

  // **---- Position ----**

  const int width = resolution.width;
  const int height = resolution.height;
  const double y = std::clamp(settings.caption_position.y, 0.0, 1.0);

  if (y < TOP_ANCHOR_LIMIT) {
    style.alignment = ALIGN_TOP_CENTER;
    style.margin_v = static_cast<int>(std::lround(y * height));
  } else if (y > BOTTOM_ANCHOR_LIMIT) {
    style.alignment = ALIGN_BOTTOM_CENTER;
    style.margin_v = static_cast<int>(std::lround((1.0 - y) * height));
  } else {
    style.alignment = ALIGN_MIDDLE_CENTER;
    style.margin_v = static_cast<int>(std::lround((0.5 - y) * height));
  }

  /// Fixed side inset regardless of the requested x anchor, rounded up so it
  /// never falls below SAFE_SIDE_MARGIN of the width
  const int side = (width + SAFE_SIDE_DIVISOR - 1) / SAFE_SIDE_DIVISOR;
  style.margin_l = side;
  style.margin_r = side;

  style.wrap_style = settings.native_wrap ? 0 : 2;
  return style;
}

std::string StyleDescriptor::to_force_style() const {
  return fmt::format(
      "FontName={},FontSize={},Bold={},PrimaryColour={},BackColour={},"
      "OutlineColour={},BorderStyle={},Outline={},Shadow={},MarginV={},"
      "MarginL={},MarginR={},Alignment={},WrapStyle={}",
      font_name, font_size, bold ? -1 : 0, primary_colour, back_colour,
      outline_colour, border_style, outline, shadow, margin_v, margin_l,
      margin_r, alignment, wrap_style);
}

} // namespace vidcap

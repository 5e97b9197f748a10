/**
 * @file render_settings.cpp
 * @brief Settings snapshot loading and normalization
 */

#include "vidcap/render_settings.hpp"

#include <algorithm>
#include <fstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vidcap/logging.hpp"

namespace vidcap {

using json = nlohmann::json;

namespace {

const char *text_case_name(TextCase text_case) {
  switch (text_case) {
  case TextCase::Title:
    return "title";
  case TextCase::Upper:
    return "upper";
  default:
    return "none";
  }
}

const char *quality_name(int quality) {
  switch (quality) {
  case QUALITY_LOW:
    return "Low";
  case QUALITY_MEDIUM:
    return "Medium";
  case QUALITY_HIGH:
    return "High";
  case QUALITY_MAX:
    return "Maximum";
  default:
    return "Custom";
  }
}

std::string resolution_name(const Resolution &r) {
  if (r.width == 1280 && r.height == 720)
    return "720p";
  if (r.width == 1920 && r.height == 1080)
    return "1080p";
  if (r.width == 2560 && r.height == 1440)
    return "2K";
  if (r.width == 3840 && r.height == 2160)
    return "4K";
  return fmt::format("{}x{}", r.width, r.height);
}

/// "Arial Bold" -> ("Arial", bold)
void apply_font_label(const std::string &label, RenderSettings &s) {
  const std::string suffix = " Bold";
  auto pos = label.find(suffix);
  if (pos != std::string::npos) {
    s.font_family = label.substr(0, pos) + label.substr(pos + suffix.size());
    s.bold = true;
  } else {
    s.font_family = label;
    s.bold = false;
  }
}

template <typename T>
void read_if_present(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

} // anonymous namespace

void normalize_settings(RenderSettings &s) {
  s.caption_position.x = std::clamp(s.caption_position.x, 0.0, 1.0);
  s.caption_position.y = std::clamp(s.caption_position.y, 0.0, 1.0);
  s.bg_opacity = std::clamp(s.bg_opacity, 0, 100);
  s.outline_width = std::max(0, s.outline_width);
  s.shadow_depth = std::max(0, s.shadow_depth);
  s.font_size = std::max(1, s.font_size);

  for (auto &kv : s.effect_intensities) {
    kv.second = std::clamp(kv.second, 0, 100);
  }

  if (!s.has_background && !s.has_outline) {
    LOG_WARN("Background and outline both disabled; enabling outline");
    s.has_outline = true;
  }

  if (s.resolution.width <= 0 || s.resolution.height <= 0) {
    s.resolution = Resolution{};
  }
  s.fps = std::clamp(s.fps, 1, 120);
  s.quality = std::clamp(s.quality, 0, 51);
}

Resolution resolution_from_string(const std::string &label) {
  if (label == "720p")
    return {1280, 720};
  if (label == "2K")
    return {2560, 1440};
  if (label == "4K")
    return {3840, 2160};
  return {1920, 1080};
}

TextCase text_case_from_string(const std::string &label) {
  if (label == "title")
    return TextCase::Title;
  if (label == "upper")
    return TextCase::Upper;
  return TextCase::None;
}

bool load_settings_file(const std::string &path, RenderSettings &out) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Failed to open settings file: {}", path);
    return false;
  }

  json root;
  try {
    in >> root;
  } catch (const json::parse_error &e) {
    LOG_ERROR("Failed to parse settings file {}: {}", path, e.what());
    return false;
  }

  RenderSettings s;
  try {
    if (root.contains("font") && root["font"].is_string()) {
      apply_font_label(root["font"].get<std::string>(), s);
    }
    read_if_present(root, "bold", s.bold);
    read_if_present(root, "font_size", s.font_size);
    if (root.contains("text_case") && root["text_case"].is_string()) {
      s.text_case = text_case_from_string(root["text_case"].get<std::string>());
    }

    read_if_present(root, "text_color", s.text_color);
    read_if_present(root, "has_background", s.has_background);
    read_if_present(root, "bg_color", s.bg_color);
    read_if_present(root, "bg_opacity", s.bg_opacity);

    /// Outline defaults to the opposite of the background toggle
    s.has_outline = !s.has_background;
    read_if_present(root, "has_outline", s.has_outline);
    read_if_present(root, "outline_color", s.outline_color);
    read_if_present(root, "outline_width", s.outline_width);
    read_if_present(root, "shadow_depth", s.shadow_depth);
    read_if_present(root, "native_wrap", s.native_wrap);

    if (root.contains("caption_position") &&
        root["caption_position"].is_object()) {
      const auto &pos = root["caption_position"];
      read_if_present(pos, "x", s.caption_position.x);
      read_if_present(pos, "y", s.caption_position.y);
    }

    /// Older snapshots carry a single "motion_effect" string
    if (root.contains("motion_effects")) {
      const auto &effects = root["motion_effects"];
      if (effects.is_string()) {
        s.motion_effects = {effects.get<std::string>()};
      } else if (effects.is_array()) {
        s.motion_effects = effects.get<std::vector<std::string>>();
      }
    } else if (root.contains("motion_effect") &&
               root["motion_effect"].is_string()) {
      s.motion_effects = {root["motion_effect"].get<std::string>()};
    }

    if (root.contains("motion_effect_intensities") &&
        root["motion_effect_intensities"].is_object()) {
      for (const auto &item : root["motion_effect_intensities"].items()) {
        s.effect_intensities[item.key()] = item.value().get<int>();
      }
    }

    if (root.contains("crop_settings") && root["crop_settings"].is_object()) {
      const auto &c = root["crop_settings"];
      CropRegion crop;
      crop.x = c.value("x", 0);
      crop.y = c.value("y", 0);
      crop.width = c.value("width", 0);
      crop.height = c.value("height", 0);
      s.crop = crop;
    }

    if (root.contains("video_resolution") &&
        root["video_resolution"].is_string()) {
      s.resolution =
          resolution_from_string(root["video_resolution"].get<std::string>());
    }
    read_if_present(root, "fps", s.fps);
    read_if_present(root, "quality", s.quality);
  } catch (const json::exception &e) {
    LOG_ERROR("Invalid value in settings file {}: {}", path, e.what());
    return false;
  }

  normalize_settings(s);
  out = std::move(s);
  return true;
}

std::string describe_settings(const RenderSettings &s) {
  return fmt::format("{} @ {}fps, {} quality", resolution_name(s.resolution),
                     s.fps, quality_name(s.quality));
}

void log_settings(const RenderSettings &s) {
  std::string effects;
  for (size_t i = 0; i < s.motion_effects.size(); ++i) {
    if (i > 0)
      effects += ", ";
    effects += s.motion_effects[i];
  }

  LOG_PHASE("====================== SETTINGS ======================");
  LOG_INFO("Font: {} {}px (bold: {}, case: {})", s.font_family, s.font_size,
           s.bold, text_case_name(s.text_case));
  LOG_INFO("Text color: {}", s.text_color);
  if (s.has_background) {
    LOG_INFO("Background: {} at {}%", s.bg_color, s.bg_opacity);
  } else {
    LOG_INFO("Outline: {} width {} (shadow {})", s.outline_color,
             s.outline_width, s.shadow_depth);
  }
  LOG_INFO("Caption position: ({:.2f}, {:.2f})", s.caption_position.x,
           s.caption_position.y);
  LOG_INFO("Motion effects: [{}]", effects);
  if (s.crop) {
    LOG_INFO("Crop: {}x{} at ({},{})", s.crop->width, s.crop->height,
             s.crop->x, s.crop->y);
  }
  LOG_INFO("Output: {} (CRF/CQ {})", describe_settings(s), s.quality);
  LOG_PHASE("======================================================");
}

} // namespace vidcap

/**
 * @file motion_effects.cpp
 * @brief Crop validation and effect filter construction
 */

#include "vidcap/motion_effects.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>

#include <fmt/core.h>

#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

constexpr double PI = 3.14159265358979323846;

/// Round up to an even pixel count (encoders reject odd chroma sizes)
int even_ceil(double v) {
  int n = static_cast<int>(std::ceil(v));
  return (n % 2 == 0) ? n : n + 1;
}

double unit(int intensity) {
  return std::clamp(intensity, 0, 100) / 100.0;
}

} // anonymous namespace

// **---- EffectDefaults ----**

EffectDefaults EffectDefaults::standard() {
  EffectDefaults d;
  for (const char *name : {EFFECT_NOISE, EFFECT_TILT, EFFECT_DYNAMIC_TILT,
                           EFFECT_ZOOM_IN, EFFECT_ZOOM_OUT}) {
    d.intensities[name] = DEFAULT_EFFECT_INTENSITY;
  }
  return d;
}

int EffectDefaults::intensity_for(
    const std::string &name,
    const std::map<std::string, int> &overrides) const {
  auto it = overrides.find(name);
  if (it != overrides.end())
    return std::clamp(it->second, 0, 100);
  auto def = intensities.find(name);
  if (def != intensities.end())
    return std::clamp(def->second, 0, 100);
  return DEFAULT_EFFECT_INTENSITY;
}

// **---- EffectPlan ----**

std::string EffectPlan::transform_chain() const {
  std::string chain;
  for (size_t i = 0; i < transforms.size(); ++i) {
    if (i > 0)
      chain += ',';
    chain += transforms[i].filter;
  }
  return chain;
}

EffectPlan EffectPlan::assemble(std::vector<EffectStep> steps) {
  EffectPlan plan;
  for (auto &step : steps) {
    if (auto *t = std::get_if<TransformEffect>(&step)) {
      plan.transforms.push_back(std::move(*t));
    } else if (auto *o = std::get_if<OverlayEffect>(&step)) {
      if (plan.overlay) {
        LOG_WARN("Only one overlay effect is supported, ignoring '{}'",
                 o->name);
        continue;
      }
      plan.overlay = std::move(*o);
    }
  }
  return plan;
}

// **---- Crop validation ----**

std::optional<CropRegion> validate_crop(const CropRegion &crop,
                                        const ImageSize &image) {
  if (image.width <= 0 || image.height <= 0)
    return std::nullopt;

  int x0 = std::clamp(crop.x, 0, image.width);
  int y0 = std::clamp(crop.y, 0, image.height);
  int x1 = std::clamp(crop.x + crop.width, 0, image.width);
  int y1 = std::clamp(crop.y + crop.height, 0, image.height);

  CropRegion clipped{x0, y0, x1 - x0, y1 - y0};
  if (clipped.width < MIN_CROP_EXTENT || clipped.height < MIN_CROP_EXTENT)
    return std::nullopt;
  return clipped;
}

bool is_static_effect(const std::string &name) {
  return name.empty() || name == EFFECT_STATIC || name == "None";
}

double rotation_cover_factor(double angle_deg, const Resolution &output) {
  double a = std::abs(angle_deg) * PI / 180.0;
  double w = output.width;
  double h = output.height;
  double aspect = std::max(w / h, h / w);
  return std::cos(a) + aspect * std::sin(a);
}

// **---- MotionEffectBuilder ----**

MotionEffectBuilder::MotionEffectBuilder(Resolution output,
                                         EffectDefaults defaults,
                                         std::string grain_path,
                                         ImageProbe probe)
    : output_(output), defaults_(std::move(defaults)),
      grain_path_(std::move(grain_path)), probe_(std::move(probe)) {}

std::string MotionEffectBuilder::auto_crop_filter() const {
  return fmt::format("scale={}:{}:force_original_aspect_ratio=increase,"
                     "crop={}:{}",
                     output_.width, output_.height, output_.width,
                     output_.height);
}

std::string MotionEffectBuilder::build_per_image_filter(
    const std::optional<CropRegion> &crop,
    const std::string &image_path) const {
  if (!crop)
    return auto_crop_filter();

  std::string name = std::filesystem::path(image_path).filename().string();

  ImageSize size;
  if (!probe_ || !probe_(image_path, size)) {
    LOG_WARN("Could not read size of {}, using auto crop", name);
    return auto_crop_filter();
  }

  auto valid = validate_crop(*crop, size);
  if (!valid) {
    LOG_WARN("Crop {}x{}+{}+{} leaves less than {}px inside {} ({}x{}), "
             "using auto crop",
             crop->width, crop->height, crop->x, crop->y, MIN_CROP_EXTENT,
             name, size.width, size.height);
    return auto_crop_filter();
  }

  if (!(*valid == *crop)) {
    LOG_WARN("Crop clamped to {}x{}+{}+{} for {}", valid->width,
             valid->height, valid->x, valid->y, name);
  }

  return fmt::format("crop={}:{}:{}:{},scale={}:{}:flags=lanczos",
                     valid->width, valid->height, valid->x, valid->y,
                     output_.width, output_.height);
}

std::string MotionEffectBuilder::tilt_filter(double amplitude_deg,
                                             double period) const {
  double cover = rotation_cover_factor(amplitude_deg, output_);
  int sw = even_ceil(output_.width * cover);
  int sh = even_ceil(output_.height * cover);
  return fmt::format("scale={}:{},rotate=a='{:.4f}*PI/180*sin(2*PI*t/{:.1f})'"
                     ":ow=iw:oh=ih:c=black,crop={}:{}",
                     sw, sh, amplitude_deg, period, output_.width,
                     output_.height);
}

std::string MotionEffectBuilder::zoom_filter(const std::string &zoom_expr,
                                             int fps) const {
  return fmt::format("zoompan=z='{}':x='iw/2-(iw/zoom/2)':y='ih/2-(ih/zoom/2)'"
                     ":d=1:s={}x{}:fps={}",
                     zoom_expr, output_.width, output_.height, fps);
}

EffectPlan MotionEffectBuilder::build_effect_plan(
    const std::vector<std::string> &effect_names,
    const std::map<std::string, int> &intensities, double total_duration,
    int fps) const {
  std::vector<EffectStep> steps;
  const long total_frames =
      std::max(1L, static_cast<long>(std::ceil(total_duration * fps)));

  for (const auto &name : effect_names) {
    if (is_static_effect(name))
      continue;

    double t = unit(defaults_.intensity_for(name, intensities));

    if (name == EFFECT_NOISE) {
      OverlayEffect overlay;
      overlay.name = name;
      overlay.asset_path = grain_path_;
      overlay.opacity = 0.1 + 0.4 * t;
      overlay.duration = total_duration;
      steps.emplace_back(std::move(overlay));
    } else if (name == EFFECT_TILT) {
      double amplitude = 0.3 + 4.7 * t;
      steps.emplace_back(
          TransformEffect{name, tilt_filter(amplitude, TILT_PERIOD)});
    } else if (name == EFFECT_DYNAMIC_TILT) {
      double amplitude = 1.0 + 9.0 * t;
      double zoom = 0.15 + 0.15 * t;
      std::string zoom_expr = fmt::format(
          "1+{:.4f}*(0.5-0.5*cos(2*PI*on/({:.1f}*{})))", zoom,
          DYNAMIC_TILT_PERIOD, fps);
      steps.emplace_back(TransformEffect{
          name, tilt_filter(amplitude, DYNAMIC_TILT_PERIOD) + "," +
                    zoom_filter(zoom_expr, fps)});
    } else if (name == EFFECT_ZOOM_IN || name == EFFECT_ZOOM_OUT) {
      double zoom = 0.1 + 0.2 * t;
      std::string progress = fmt::format("min(on/{},1)", total_frames);
      std::string zoom_expr =
          (name == EFFECT_ZOOM_IN)
              ? fmt::format("1+{:.4f}*{}", zoom, progress)
              : fmt::format("1+{:.4f}*(1-{})", zoom, progress);
      steps.emplace_back(TransformEffect{name, zoom_filter(zoom_expr, fps)});
    } else {
      LOG_WARN("Unknown motion effect '{}', ignoring", name);
    }
  }

  return EffectPlan::assemble(std::move(steps));
}

} // namespace vidcap

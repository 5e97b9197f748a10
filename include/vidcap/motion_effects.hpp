/**
 * @file motion_effects.hpp
 * @brief Per-image crop/scale filters and whole-video motion effects
 *
 * @details Two stages of the filter graph are built here:
 *
 *          - Per image: auto cover-crop to the output size, or the user's
 *            crop region (validated against the real image size) followed by
 *            an exact scale.
 *
 *          - Whole video: after concatenation, the selected effects become an
 *            EffectPlan of transform filters plus at most one overlay.
 *
 * @attention Transforms are always applied before the overlay so the grain
 *            texture is never rotated or zoomed with the picture.
 */

#ifndef VIDCAP_MOTION_EFFECTS_HPP
#define VIDCAP_MOTION_EFFECTS_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace vidcap {

// **----- EFFECT NAMES -----**

constexpr const char *EFFECT_STATIC = "Static";
constexpr const char *EFFECT_NOISE = "Noise";
constexpr const char *EFFECT_TILT = "Tilt";
constexpr const char *EFFECT_DYNAMIC_TILT = "Dynamic Tilt";
constexpr const char *EFFECT_ZOOM_IN = "Zoom In";
constexpr const char *EFFECT_ZOOM_OUT = "Zoom Out";

/// Intensity used when neither the settings nor the defaults name an effect
constexpr int DEFAULT_EFFECT_INTENSITY = 50;

/// Oscillation periods in seconds
constexpr double TILT_PERIOD = 8.0;
constexpr double DYNAMIC_TILT_PERIOD = 6.0;

/**
 * @struct EffectDefaults
 * @brief Default intensity per effect name, passed into the builder.
 */
struct EffectDefaults {
  std::map<std::string, int> intensities;

  /// All catalogue effects at DEFAULT_EFFECT_INTENSITY
  static EffectDefaults standard();

  /// Override from settings, then the default, then DEFAULT_EFFECT_INTENSITY
  int intensity_for(const std::string &name,
                    const std::map<std::string, int> &overrides) const;
};

/**
 * @struct TransformEffect
 * @brief A filter chained onto the concatenated video stream.
 */
struct TransformEffect {
  std::string name;
  std::string filter; //< Filter chain fragment, no labels
};

/**
 * @struct OverlayEffect
 * @brief A looping texture composited over the video.
 */
struct OverlayEffect {
  std::string name;
  std::string asset_path;
  double opacity = 0.0; //< 0..1
  double duration = 0.0;
};

/// One selected effect before plan assembly
using EffectStep = std::variant<TransformEffect, OverlayEffect>;

/**
 * @struct EffectPlan
 * @brief Ordered transforms plus an optional overlay. Empty = no effect stage.
 */
struct EffectPlan {
  std::vector<TransformEffect> transforms;
  std::optional<OverlayEffect> overlay;

  bool empty() const { return transforms.empty() && !overlay; }
  bool has_transforms() const { return !transforms.empty(); }

  /// Transform fragments joined with ','
  std::string transform_chain() const;

  /**
   * @brief Assemble a plan from steps in selection order.
   * @note Only the first overlay is kept; later ones are dropped with a
   *       warning.
   */
  static EffectPlan assemble(std::vector<EffectStep> steps);
};

/// Reads the pixel size of an image. Returns false if it cannot be read.
using ImageProbe = std::function<bool(const std::string &, ImageSize &)>;

/**
 * @brief Clip a crop region to the image bounds.
 * @return The clipped region, or nullopt if it is smaller than
 *         MIN_CROP_EXTENT on either axis after clipping
 * @note A region already inside the image is returned unchanged.
 */
std::optional<CropRegion> validate_crop(const CropRegion &crop,
                                        const ImageSize &image);

/**
 * @class MotionEffectBuilder
 * @brief Builds per-image prep filters and the whole-video effect plan.
 */
class MotionEffectBuilder {
public:
  /**
   * @param output Output frame size
   * @param defaults Default intensity map
   * @param grain_path Looping grain asset for the Noise overlay
   * @param probe Image size reader used to validate manual crops
   */
  MotionEffectBuilder(Resolution output, EffectDefaults defaults,
                      std::string grain_path, ImageProbe probe);

  /**
   * @brief Filter that brings one source image to the output size.
   *
   * @param crop Optional manual crop in source pixels
   * @param image_path Image the crop is validated against
   * @return "scale=...,crop=..." (auto) or "crop=...,scale=..." (manual)
   */
  std::string build_per_image_filter(const std::optional<CropRegion> &crop,
                                     const std::string &image_path) const;

  /**
   * @brief Map selected effect names and intensities to a plan.
   *
   * @param effect_names Names in selection order
   * @param intensities Per-name intensity overrides (0..100)
   * @param total_duration Video length in seconds
   * @param fps Output frame rate
   * @note Unknown names are skipped with a warning. Only "Static" (or no
   *       effects at all) yields an empty plan.
   */
  EffectPlan build_effect_plan(const std::vector<std::string> &effect_names,
                               const std::map<std::string, int> &intensities,
                               double total_duration, int fps) const;

  const Resolution &output() const { return output_; }

private:
  Resolution output_;
  EffectDefaults defaults_;
  std::string grain_path_;
  ImageProbe probe_;

  std::string auto_crop_filter() const;
  std::string tilt_filter(double amplitude_deg, double period) const;
  std::string zoom_filter(const std::string &zoom_expr, int fps) const;
};

/**
 * @brief True if the name is the null effect ("Static" / "None" / empty).
 */
bool is_static_effect(const std::string &name);

/**
 * @brief Scale needed so a frame rotated by angle_deg still covers the
 *        output frame.
 */
double rotation_cover_factor(double angle_deg, const Resolution &output);

} // namespace vidcap

#endif // VIDCAP_MOTION_EFFECTS_HPP

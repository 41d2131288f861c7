// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * detection.hpp
 *
 * CFAR detection configuration: background window, false-alarm
 * probability, clutter model, and edge handling.
 */

#ifndef ICEAREA_CONFIG_DETECTION_HPP
#define ICEAREA_CONFIG_DETECTION_HPP

namespace icearea {

/// How the gamma clutter parameters are estimated.
enum class ClutterModel {
  LocalMoments,  ///< Per-pixel shape/scale from local mean and variance
  GlobalEnl      ///< Scene-wide ENL as shape, local mean as scale·shape
};

/// Treatment of pixels whose outer window crosses the raster edge.
enum class EdgePolicy {
  Clip,    ///< Clip the window to the raster, flag pixel low-confidence
  Exclude  ///< Exclude the pixel from detection
};

/**
 * @brief Annular background window (outer square minus guard square).
 *
 * Both sizes are odd side lengths in pixels, guard_size < outer_size.
 */
struct WindowSpec {
  int outer_size = 29;
  int guard_size = 21;

  int outerHalf() const { return outer_size / 2; }
  int guardHalf() const { return guard_size / 2; }

  /// Number of samples in an unclipped annulus.
  int annulusSize() const {
    return outer_size * outer_size - guard_size * guard_size;
  }
};

/// Throws InvalidWindowConfig unless both sizes are positive odd and
/// guard_size < outer_size.
void validateWindow(const WindowSpec& window);

namespace config {

/// Per-channel CFAR parameters.
struct Cfar {
  WindowSpec window;
  double pfa = 1e-6;  ///< Target false-alarm probability, in (0, 1)
  ClutterModel clutter_model = ClutterModel::LocalMoments;
  /// Variance floor as coefficient of variation: var >= (min_cv * mean)².
  double min_cv = 0.05;
  EdgePolicy edge_policy = EdgePolicy::Clip;
};

/// Throws InvalidWindowConfig / InvalidConfig for unusable parameters.
void validate(const Cfar& cfg);

}  // namespace config
}  // namespace icearea

#endif  // ICEAREA_CONFIG_DETECTION_HPP

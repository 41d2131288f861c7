// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cfar.hpp
 *
 * Constant false-alarm rate detector under a gamma clutter model.
 *
 * For every valid pixel the background annulus gives a local mean μ and
 * variance σ². The gamma parameters follow by method of moments
 *
 *   shape k = μ² / σ²,  scale θ = σ² / μ
 *
 * and the threshold T solves Q(k, T / θ) = Pfa, where Q is the regularized
 * upper incomplete gamma function. A pixel is flagged iff value > T.
 */

#ifndef ICEAREA_DETECTION_CFAR_HPP
#define ICEAREA_DETECTION_CFAR_HPP

#include <Eigen/Core>

#include "icearea/config/detection.hpp"
#include "icearea/raster.hpp"

namespace icearea {

/**
 * @brief Per-pixel CFAR result of one channel.
 *
 * threshold and clutter_mean are NaN where a pixel took no part in
 * detection (nodata, undefined statistics, excluded edge pixel).
 */
struct DetectionMask {
  Channel channel = Channel::HH;
  MaskGrid mask;                ///< value > threshold
  Eigen::MatrixXd threshold;    ///< Adaptive threshold T
  Eigen::MatrixXd clutter_mean;  ///< Local background mean μ
  MaskGrid low_confidence;      ///< Outer window clipped at the raster edge

  // Diagnostics
  int flagged_pixels = 0;
  int floored_pixels = 0;    ///< Variance raised to the floor
  int undefined_pixels = 0;  ///< Valid pixel without a usable threshold
  int edge_excluded_pixels = 0;
  double enl = 0.0;  ///< Scene ENL (GlobalEnl model only)

  int rows() const { return static_cast<int>(mask.rows()); }
  int cols() const { return static_cast<int>(mask.cols()); }
  bool at(int row, int col) const { return mask(row, col); }
};

/**
 * @brief Value exceeded with probability pfa by a gamma(shape, scale) variate.
 *
 * @return NaN if shape/scale are not positive finite or the inverse fails
 */
double gammaThreshold(double shape, double scale, double pfa);

/// Threshold-to-mean ratio for a gamma clutter with the given number of looks.
double gammaMultiplier(double looks, double pfa);

/**
 * @brief Local method-of-moments threshold for one pixel.
 *
 * The variance is floored at (min_cv · mean)², which bounds the shape at
 * 1 / min_cv². Returns NaN for a non-positive or non-finite mean.
 *
 * @param floored Set to true when the floor was applied (optional)
 */
double clutterThreshold(double mean, double variance, const config::Cfar& cfg,
                        bool* floored = nullptr);

/**
 * @brief Scene-wide equivalent number of looks.
 *
 * Method of moments over valid samples below twice the scene median,
 * capped at 1 / min_cv².
 */
double estimateEnl(const Raster& raster, double min_cv);

/**
 * @brief Run CFAR detection on one channel.
 *
 * @throws InvalidWindowConfig, InvalidConfig for unusable parameters
 * @throws NoValidData if the raster has no valid pixel
 */
DetectionMask detect(const Raster& raster, const config::Cfar& cfg);

}  // namespace icearea

#endif  // ICEAREA_DETECTION_CFAR_HPP

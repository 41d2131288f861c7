// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * local_statistics.hpp
 *
 * Per-pixel mean and variance of the annular background window
 * (outer square minus guard square), ignoring nodata pixels.
 *
 * Uses summed-area tables of value, value² and valid count, so each
 * pixel costs two box queries regardless of window size.
 */

#ifndef ICEAREA_DETECTION_LOCAL_STATISTICS_HPP
#define ICEAREA_DETECTION_LOCAL_STATISTICS_HPP

#include <Eigen/Core>
#include <cmath>

#include "icearea/config/detection.hpp"
#include "icearea/raster.hpp"

namespace icearea {

/**
 * @brief Local background statistics of a raster.
 *
 * mean/variance are NaN where the statistics are undefined: the center
 * pixel is nodata, or the (clipped) annulus holds no valid sample.
 * Variance is the population variance (divides by the sample count).
 */
struct LocalStatistics {
  Eigen::MatrixXd mean;
  Eigen::MatrixXd variance;
  Eigen::MatrixXi sample_count;  ///< Valid samples in the annulus
  MaskGrid low_confidence;       ///< Outer window clipped at the raster edge

  int rows() const { return static_cast<int>(mean.rows()); }
  int cols() const { return static_cast<int>(mean.cols()); }

  bool isDefined(int row, int col) const {
    return std::isfinite(mean(row, col)) && std::isfinite(variance(row, col));
  }
};

/// Throws InvalidWindowConfig for an unusable window.
LocalStatistics computeLocalStatistics(const Raster& raster,
                                       const WindowSpec& window);

namespace detail {

/// Inclusive-exclusive summed-area table with one padding row/col.
struct IntegralImage {
  Eigen::MatrixXd sum;
  Eigen::MatrixXd sum_sq;
  Eigen::MatrixXi count;

  explicit IntegralImage(const Raster& raster);

  /// Sums over rows [r0, r1] x cols [c0, c1], clipped to the raster.
  void boxQuery(int r0, int c0, int r1, int c1, double& s, double& sq,
                int& n) const;
};

}  // namespace detail
}  // namespace icearea

#endif  // ICEAREA_DETECTION_LOCAL_STATISTICS_HPP

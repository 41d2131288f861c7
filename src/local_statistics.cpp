// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * local_statistics.cpp
 *
 * Annular-window background statistics via summed-area tables.
 */

#include "icearea/detection/local_statistics.hpp"

#include <algorithm>
#include <cmath>

namespace icearea {

namespace detail {

IntegralImage::IntegralImage(const Raster& raster) {
  const int rows = raster.rows();
  const int cols = raster.cols();
  sum = Eigen::MatrixXd::Zero(rows + 1, cols + 1);
  sum_sq = Eigen::MatrixXd::Zero(rows + 1, cols + 1);
  count = Eigen::MatrixXi::Zero(rows + 1, cols + 1);

  for (int r = 0; r < rows; ++r) {
    double row_sum = 0.0;
    double row_sum_sq = 0.0;
    int row_count = 0;
    for (int c = 0; c < cols; ++c) {
      if (raster.isValid(r, c)) {
        const double v = raster.at(r, c);
        row_sum += v;
        row_sum_sq += v * v;
        ++row_count;
      }
      sum(r + 1, c + 1) = sum(r, c + 1) + row_sum;
      sum_sq(r + 1, c + 1) = sum_sq(r, c + 1) + row_sum_sq;
      count(r + 1, c + 1) = count(r, c + 1) + row_count;
    }
  }
}

void IntegralImage::boxQuery(int r0, int c0, int r1, int c1, double& s,
                             double& sq, int& n) const {
  const int rows = static_cast<int>(sum.rows()) - 1;
  const int cols = static_cast<int>(sum.cols()) - 1;
  r0 = std::max(r0, 0);
  c0 = std::max(c0, 0);
  r1 = std::min(r1, rows - 1);
  c1 = std::min(c1, cols - 1);
  if (r0 > r1 || c0 > c1) {
    s = 0.0;
    sq = 0.0;
    n = 0;
    return;
  }

  // Table index is exclusive: entry (r, c) sums rows [0, r) x cols [0, c)
  const int ra = r0, rb = r1 + 1, ca = c0, cb = c1 + 1;
  s = sum(rb, cb) - sum(ra, cb) - sum(rb, ca) + sum(ra, ca);
  sq = sum_sq(rb, cb) - sum_sq(ra, cb) - sum_sq(rb, ca) + sum_sq(ra, ca);
  n = count(rb, cb) - count(ra, cb) - count(rb, ca) + count(ra, ca);
}

}  // namespace detail

LocalStatistics computeLocalStatistics(const Raster& raster,
                                       const WindowSpec& window) {
  validateWindow(window);

  const int rows = raster.rows();
  const int cols = raster.cols();
  const int h = window.outerHalf();
  const int g = window.guardHalf();

  LocalStatistics stats;
  stats.mean = Eigen::MatrixXd::Constant(rows, cols, NAN);
  stats.variance = Eigen::MatrixXd::Constant(rows, cols, NAN);
  stats.sample_count = Eigen::MatrixXi::Zero(rows, cols);
  stats.low_confidence = MaskGrid::Constant(rows, cols, false);

  if (raster.empty()) return stats;

  const detail::IntegralImage integral(raster);

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      stats.low_confidence(r, c) =
          r - h < 0 || r + h >= rows || c - h < 0 || c + h >= cols;

      if (!raster.isValid(r, c)) continue;

      double outer_sum, outer_sq, guard_sum, guard_sq;
      int outer_n, guard_n;
      integral.boxQuery(r - h, c - h, r + h, c + h, outer_sum, outer_sq,
                        outer_n);
      integral.boxQuery(r - g, c - g, r + g, c + g, guard_sum, guard_sq,
                        guard_n);

      const int n = outer_n - guard_n;
      stats.sample_count(r, c) = n;
      if (n <= 0) continue;

      const double inv_n = 1.0 / static_cast<double>(n);
      const double mean = (outer_sum - guard_sum) * inv_n;
      // E[x²] - E[x]² may dip below zero by rounding on flat backgrounds
      const double variance =
          std::max(0.0, (outer_sq - guard_sq) * inv_n - mean * mean);

      stats.mean(r, c) = mean;
      stats.variance(r, c) = variance;
    }
  }

  return stats;
}

}  // namespace icearea

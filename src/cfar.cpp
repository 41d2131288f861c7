// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "icearea/detection/cfar.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/math/special_functions/gamma.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include "icearea/detection/local_statistics.hpp"
#include "icearea/errors.hpp"

namespace icearea {

namespace {

namespace bmp = boost::math::policies;

// Report failures as NaN/inf instead of throwing; the caller excludes the
// pixel on a non-finite result.
using QuietPolicy = bmp::policy<bmp::domain_error<bmp::ignore_error>,
                                bmp::overflow_error<bmp::ignore_error>,
                                bmp::evaluation_error<bmp::ignore_error>,
                                bmp::pole_error<bmp::ignore_error>>;

bool positiveFinite(double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

double gammaThreshold(double shape, double scale, double pfa) {
  if (!positiveFinite(shape) || !positiveFinite(scale)) return NAN;
  if (!(pfa > 0.0 && pfa < 1.0)) return NAN;
  const double x = boost::math::gamma_q_inv(shape, pfa, QuietPolicy());
  const double t = x * scale;
  return std::isfinite(t) ? t : NAN;
}

double gammaMultiplier(double looks, double pfa) {
  return gammaThreshold(looks, 1.0 / looks, pfa);
}

double clutterThreshold(double mean, double variance, const config::Cfar& cfg,
                        bool* floored) {
  if (floored) *floored = false;
  if (!positiveFinite(mean) || !std::isfinite(variance)) return NAN;

  const double floor = cfg.min_cv * cfg.min_cv * mean * mean;
  double var = std::max(variance, 0.0);
  if (var < floor) {
    var = floor;
    if (floored) *floored = true;
  }
  return gammaThreshold(mean * mean / var, var / mean, cfg.pfa);
}

double estimateEnl(const Raster& raster, double min_cv) {
  const double max_enl =
      min_cv > 0.0 ? 1.0 / (min_cv * min_cv) : std::numeric_limits<double>::max();

  std::vector<float> samples;
  samples.reserve(static_cast<size_t>(raster.rows()) * raster.cols());
  for (int c = 0; c < raster.cols(); ++c) {
    for (int r = 0; r < raster.rows(); ++r) {
      if (raster.isValid(r, c)) samples.push_back(raster.at(r, c));
    }
  }
  if (samples.empty()) return max_enl;

  auto mid = samples.begin() + samples.size() / 2;
  std::nth_element(samples.begin(), mid, samples.end());
  const double cutoff = 2.0 * static_cast<double>(*mid);

  double sum = 0.0;
  double sum_sq = 0.0;
  size_t n = 0;
  for (float v : samples) {
    if (v < cutoff) {
      sum += v;
      sum_sq += static_cast<double>(v) * v;
      ++n;
    }
  }
  if (n == 0) return max_enl;

  const double mean = sum / n;
  const double var = std::max(0.0, sum_sq / n - mean * mean);
  if (var <= 0.0 || mean <= 0.0) return max_enl;
  return std::min(mean * mean / var, max_enl);
}

DetectionMask detect(const Raster& raster, const config::Cfar& cfg) {
  config::validate(cfg);
  if (!raster.hasValidData()) {
    throw NoValidData(std::string("channel ") + toString(raster.channel()) +
                      " contains no valid pixel");
  }

  const int rows = raster.rows();
  const int cols = raster.cols();
  const LocalStatistics stats = computeLocalStatistics(raster, cfg.window);

  DetectionMask out;
  out.channel = raster.channel();
  out.mask = MaskGrid::Constant(rows, cols, false);
  out.threshold = Eigen::MatrixXd::Constant(rows, cols, NAN);
  out.clutter_mean = Eigen::MatrixXd::Constant(rows, cols, NAN);
  out.low_confidence = stats.low_confidence;

  const bool global = cfg.clutter_model == ClutterModel::GlobalEnl;
  double multiplier = NAN;
  if (global) {
    out.enl = estimateEnl(raster, cfg.min_cv);
    multiplier = gammaMultiplier(out.enl, cfg.pfa);
    spdlog::debug("[CFAR] {} scene ENL {:.3f}, threshold multiplier {:.4f}",
                  toString(raster.channel()), out.enl, multiplier);
  }

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!raster.isValid(r, c)) continue;

      if (cfg.edge_policy == EdgePolicy::Exclude && stats.low_confidence(r, c)) {
        ++out.edge_excluded_pixels;
        continue;
      }
      if (!stats.isDefined(r, c)) {
        ++out.undefined_pixels;
        continue;
      }

      const double mean = stats.mean(r, c);
      double t = NAN;
      if (global) {
        if (mean > 0.0) t = mean * multiplier;
      } else {
        bool floored = false;
        t = clutterThreshold(mean, stats.variance(r, c), cfg, &floored);
        if (floored) ++out.floored_pixels;
      }
      if (!std::isfinite(t)) {
        ++out.undefined_pixels;
        continue;
      }

      out.clutter_mean(r, c) = mean;
      out.threshold(r, c) = t;
      if (static_cast<double>(raster.at(r, c)) > t) {
        out.mask(r, c) = true;
        ++out.flagged_pixels;
      }
    }
  }

  spdlog::debug(
      "[CFAR] {}: {} flagged, {} floored, {} undefined, {} edge-excluded "
      "({}x{} px)",
      toString(raster.channel()), out.flagged_pixels, out.floored_pixels,
      out.undefined_pixels, out.edge_excluded_pixels, rows, cols);
  return out;
}

}  // namespace icearea

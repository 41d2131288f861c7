// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * feature_extraction.cpp
 *
 * Backscatter, clutter and shape statistics per detected object.
 */

#include "icearea/features/feature_extraction.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "icearea/geometry/polygon.hpp"

namespace icearea {

namespace {

constexpr std::array<const char*, kFeatureCount> kFeatureNames = {
    "root_area",    "area_cfar",   "pixel_count",     "mean",
    "std",          "min",         "max",             "mean_db",
    "clutter_mean", "contrast_db", "compactness",     "perimeter_index",
    "max_length",   "length_root_length_ratio",       "incidence_angle_mean"};

constexpr double kPi = 3.14159265358979323846;

double toDecibels(double linear) {
  return linear > 0.0 ? 10.0 * std::log10(linear) : NAN;
}

}  // namespace

const char* featureName(Feature feature) {
  const int i = static_cast<int>(feature);
  return (i >= 0 && i < kFeatureCount) ? kFeatureNames[i] : "unknown";
}

std::optional<Feature> featureFromName(const std::string& name) {
  for (int i = 0; i < kFeatureCount; ++i) {
    if (name == kFeatureNames[i]) return static_cast<Feature>(i);
  }
  return std::nullopt;
}

FeatureVector computeFeatures(const Blob& blob, const Raster& raster,
                              const DetectionMask& mask,
                              const Eigen::MatrixXf& incidence_angle) {
  FeatureVector fv;

  // Backscatter (single pass)
  double sum = 0.0;
  double sum_sq = 0.0;
  double vmin = std::numeric_limits<double>::infinity();
  double vmax = -std::numeric_limits<double>::infinity();
  int n = 0;
  double clutter_sum = 0.0;
  int clutter_n = 0;

  for (const auto& p : blob.pixels) {
    if (raster.isValid(p.row, p.col)) {
      const double v = raster.at(p.row, p.col);
      sum += v;
      sum_sq += v * v;
      vmin = std::min(vmin, v);
      vmax = std::max(vmax, v);
      ++n;
    }
    const double clutter = mask.clutter_mean(p.row, p.col);
    if (std::isfinite(clutter)) {
      clutter_sum += clutter;
      ++clutter_n;
    }
  }

  if (n > 0) {
    const double mean = sum / n;
    fv[Feature::Mean] = mean;
    fv[Feature::Std] = std::sqrt(std::max(0.0, sum_sq / n - mean * mean));
    fv[Feature::Min] = vmin;
    fv[Feature::Max] = vmax;
    fv[Feature::MeanDb] = toDecibels(mean);
  }
  if (clutter_n > 0) {
    const double clutter_mean = clutter_sum / clutter_n;
    fv[Feature::ClutterMean] = clutter_mean;
    if (n > 0 && clutter_mean > 0.0) {
      fv[Feature::ContrastDb] = toDecibels(fv[Feature::Mean] / clutter_mean);
    }
  }

  // Size
  const double a = blob.area_cfar;
  fv[Feature::AreaCfar] = a;
  fv[Feature::RootArea] = std::sqrt(std::max(0.0, a));
  fv[Feature::PixelCount] = blob.pixel_count;

  // Shape
  const double p = blob.perimeter;
  if (a > 0.0) fv[Feature::Compactness] = p * p / a;
  if (p > 0.0) fv[Feature::PerimeterIndex] = 2.0 * std::sqrt(kPi * a) / p;
  const double length = maxLength(blob.outline);
  fv[Feature::MaxLength] = length;
  if (a > 0.0) fv[Feature::LengthRatio] = length / std::sqrt(a);

  // Acquisition geometry
  if (incidence_angle.rows() == raster.rows() &&
      incidence_angle.cols() == raster.cols()) {
    double ia_sum = 0.0;
    int ia_n = 0;
    for (const auto& px : blob.pixels) {
      const double ia = incidence_angle(px.row, px.col);
      if (!std::isfinite(ia)) continue;
      ia_sum += ia;
      ++ia_n;
    }
    if (ia_n > 0) fv[Feature::IncidenceAngleMean] = ia_sum / ia_n;
  }

  return fv;
}

}  // namespace icearea

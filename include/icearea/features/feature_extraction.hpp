// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * feature_extraction.hpp
 *
 * Per-object backscatter and shape features used as regression inputs.
 *
 * The feature layout is a fixed, versioned schema. Any change to the order
 * or meaning of entries must bump kFeatureSchemaVersion so that models
 * trained on the old layout are rejected (ModelMismatch).
 */

#ifndef ICEAREA_FEATURES_FEATURE_EXTRACTION_HPP
#define ICEAREA_FEATURES_FEATURE_EXTRACTION_HPP

#include <Eigen/Core>
#include <cmath>
#include <optional>
#include <string>

#include "icearea/detection/blob_extraction.hpp"
#include "icearea/detection/cfar.hpp"
#include "icearea/raster.hpp"

namespace icearea {

constexpr int kFeatureSchemaVersion = 2;

/// Feature slots, in schema order.
enum class Feature : int {
  RootArea = 0,    ///< sqrt(area_cfar)
  AreaCfar,        ///< pixel_count × pixel area [map units²]
  PixelCount,
  Mean,            ///< Linear backscatter
  Std,             ///< Population standard deviation
  Min,
  Max,
  MeanDb,          ///< 10·log10(mean)
  ClutterMean,     ///< Mean local background over the object
  ContrastDb,      ///< 10·log10(mean / clutter_mean)
  Compactness,     ///< perimeter² / area
  PerimeterIndex,  ///< 2·sqrt(π·area) / perimeter, 1 for a disc
  MaxLength,       ///< Largest outline vertex distance [map units]
  LengthRatio,     ///< max_length / root_area, elongation
  IncidenceAngleMean,  ///< Mean incidence angle [deg], NaN without layer
  Count
};

constexpr int kFeatureCount = static_cast<int>(Feature::Count);

/// Schema name of a feature ("root_area", "contrast_db", ...).
const char* featureName(Feature feature);

/// Inverse of featureName(). Returns nullopt for unknown names.
std::optional<Feature> featureFromName(const std::string& name);

struct FeatureVector {
  int schema_version = kFeatureSchemaVersion;
  Eigen::VectorXd values = Eigen::VectorXd::Constant(kFeatureCount, NAN);

  double operator[](Feature f) const { return values(static_cast<int>(f)); }
  double& operator[](Feature f) { return values(static_cast<int>(f)); }
  int size() const { return static_cast<int>(values.size()); }
};

/**
 * @brief Compute the feature vector of one blob.
 *
 * Backscatter statistics use the raster values at the blob's pixels;
 * clutter statistics use the detection's local background mean.
 * Undefined entries (e.g. contrast without background) are NaN.
 *
 * @param incidence_angle  Per-pixel incidence angle [deg] on the raster
 *                         grid. Empty or mismatched: incidence_angle_mean
 *                         stays NaN.
 */
FeatureVector computeFeatures(
    const Blob& blob, const Raster& raster, const DetectionMask& mask,
    const Eigen::MatrixXf& incidence_angle = Eigen::MatrixXf());

}  // namespace icearea

#endif  // ICEAREA_FEATURES_FEATURE_EXTRACTION_HPP

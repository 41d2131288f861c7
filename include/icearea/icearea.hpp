// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * icearea.hpp
 *
 * icearea: iceberg area estimation from SAR backscatter.
 *
 * Per channel: local statistics -> CFAR detection -> blob extraction ->
 * features -> area correction -> classification. Channels run
 * independently and their results are merged at the end.
 */

#ifndef ICEAREA_ICEAREA_HPP
#define ICEAREA_ICEAREA_HPP

#include <map>
#include <memory>
#include <optional>
#include <vector>

// Configs
#include "icearea/config/icearea.hpp"

// Data types
#include "icearea/errors.hpp"
#include "icearea/geometry/polygon.hpp"
#include "icearea/raster.hpp"

// Stages
#include "icearea/classification/object_classifier.hpp"
#include "icearea/correction/area_model.hpp"
#include "icearea/detection/blob_extraction.hpp"
#include "icearea/detection/cfar.hpp"
#include "icearea/detection/local_statistics.hpp"
#include "icearea/features/feature_extraction.hpp"

namespace icearea {

/// Detected object with its raw and corrected area.
struct IcebergObject {
  Blob blob;
  FeatureVector features;
  /// Empty if no model was given, the correction step failed or the
  /// prediction was not finite.
  std::optional<double> area_backscatter_rl;
  /// Empty if no classifier was given or the object could not be scored.
  std::optional<Classification> classification;

  int id() const { return blob.id; }
  Channel channel() const { return blob.channel; }
  double areaCfar() const { return blob.area_cfar; }
  const Polygon& outline() const { return blob.outline; }
  std::optional<bool> isIceberg() const {
    if (!classification) return std::nullopt;
    return classification->is_iceberg;
  }
};

/// Counters collected while processing one channel.
struct ChannelDiagnostics {
  int flagged_pixels = 0;
  int floored_pixels = 0;
  int undefined_pixels = 0;
  int edge_excluded_pixels = 0;
  int blobs_detected = 0;
  int blobs_filtered = 0;    ///< Removed by min_pixel_count / drop_truncated
  int blobs_outside_aoi = 0;
};

struct ChannelResult {
  Channel channel = Channel::HH;
  bool detected = false;  ///< Detection ran to completion
  std::vector<IcebergObject> objects;
  std::vector<ChannelError> errors;    ///< Fatal for a stage of this channel
  std::vector<ChannelError> warnings;  ///< Recovered, e.g. NumericalInstability
  ChannelDiagnostics diagnostics;
};

struct Results {
  std::map<Channel, ChannelResult> channels;
  /// HH/HV de-duplicated objects (or the only channel's objects).
  std::vector<IcebergObject> merged;

  const ChannelResult* find(Channel channel) const {
    auto it = channels.find(channel);
    return it != channels.end() ? &it->second : nullptr;
  }
};

using ModelSet = std::map<Channel, std::shared_ptr<const AreaModel>>;
using ClassifierSet =
    std::map<Channel, std::shared_ptr<const ObjectClassifier>>;

/**
 * @brief Load the model of every enabled channel that names a model_path.
 *
 * A channel whose model fails to load is left out of the set and its
 * failure appended to errors; the other channels are still loaded.
 */
ModelSet loadModels(const Config& cfg, std::vector<ChannelError>& errors);

/// Same as loadModels() for the classifier_path of every enabled channel.
ClassifierSet loadClassifiers(const Config& cfg,
                              std::vector<ChannelError>& errors);

/**
 * @brief Run detection, correction and classification for every enabled
 * channel.
 *
 * Errors of one channel are recorded in its ChannelResult and never stop
 * the others, whatever exception a stage throws. A model or classifier
 * failure keeps the channel's objects with area_backscatter_rl or
 * classification empty.
 *
 * @param aoi Overrides cfg.area_of_interest when given. Objects whose
 *            outline does not intersect it are dropped before features.
 * @param incidence_angle Per-pixel incidence angle [deg] on the raster
 *            grid, used for features and classification. May be empty.
 */
Results runPipeline(const RasterSet& rasters, const Config& cfg,
                    const ModelSet& models = {},
                    const std::optional<Polygon>& aoi = std::nullopt,
                    const ClassifierSet& classifiers = {},
                    const Eigen::MatrixXf& incidence_angle = Eigen::MatrixXf());

/**
 * @brief Remove HH/HV duplicates of the same object.
 *
 * For each HH object, HV objects within buffer_distance are overlapping.
 * If the largest overlapping HV object has the larger area_cfar, it
 * replaces the HH object and the other overlapping HV objects are dropped;
 * otherwise all overlapping HV objects are dropped.
 *
 * @return Surviving HH objects followed by surviving HV objects
 */
std::vector<IcebergObject> mergeChannels(const ChannelResult& hh,
                                         const ChannelResult& hv,
                                         double buffer_distance);

}  // namespace icearea

#endif  // ICEAREA_ICEAREA_HPP

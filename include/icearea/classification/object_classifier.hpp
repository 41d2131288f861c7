// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * object_classifier.hpp
 *
 * Iceberg / non-iceberg tagging of detected objects against a reference
 * population of validated icebergs.
 */

#ifndef ICEAREA_CLASSIFICATION_OBJECT_CLASSIFIER_HPP
#define ICEAREA_CLASSIFICATION_OBJECT_CLASSIFIER_HPP

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "icearea/features/feature_extraction.hpp"

namespace icearea {

/// Standardized distances of one object to the reference population.
struct Classification {
  double perimeter_index_score = NAN;
  double backscatter_score = NAN;
  bool is_iceberg = false;
};

/**
 * @brief Abstract base class for object classifiers.
 *
 * classify() returns nullopt when the features needed for a decision are
 * undefined.
 */
class ObjectClassifier {
 public:
  virtual ~ObjectClassifier() = default;

  virtual std::optional<Classification> classify(
      const FeatureVector& features) const = 0;
};

/// One validated iceberg of the reference population.
struct ReferenceSample {
  double incidence_angle = 0.0;  ///< [deg]
  double mean = 0.0;             ///< Linear backscatter
};

/**
 * @brief z-score classifier on shape and backscatter.
 *
 * perimeter_index is scored against a fixed reference mean/std. The mean
 * backscatter is scored against the reference samples whose incidence
 * angle lies in [ia - band, ia + band); all samples are used when the
 * object has no incidence angle. An object is an iceberg when both scores
 * reach their thresholds.
 */
class ReferenceClassifier : public ObjectClassifier {
 public:
  struct Params {
    double perimeter_index_mean = 0.0;
    double perimeter_index_std = 1.0;
    std::vector<ReferenceSample> samples;
    double incidence_band = 2.0;  ///< Half width [deg]
    double perimeter_index_threshold = -2.0;
    double backscatter_threshold = -2.0;
  };

  /// @throws InvalidConfig on non-positive std/band or empty samples
  explicit ReferenceClassifier(Params params);

  std::optional<Classification> classify(
      const FeatureVector& features) const override;

  const Params& params() const { return params_; }

 private:
  Params params_;
};

/**
 * @brief Load a reference classifier artifact from YAML.
 *
 * @code
 *   type: reference
 *   perimeter_index: { mean: 0.78, std: 0.08 }
 *   thresholds: { perimeter_index: -2.0, backscatter: -2.0 }
 *   incidence_angle_band: 2.0
 *   samples: [[20.5, 0.31], [21.0, 0.27]]   # [incidence_angle, mean]
 * @endcode
 *
 * @throws std::runtime_error on parse failure or unknown type
 * @throws InvalidConfig on unusable reference statistics
 */
std::shared_ptr<const ObjectClassifier> loadObjectClassifier(
    const std::string& path);

}  // namespace icearea

#endif  // ICEAREA_CLASSIFICATION_OBJECT_CLASSIFIER_HPP

// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * area_model.hpp
 *
 * Regression-based area correction.
 *
 * An AreaModel maps a FeatureVector to a corrected area. Models are
 * trained elsewhere and injected per channel; the pipeline only prepares
 * features and keeps the output physically meaningful (>= 0).
 */

#ifndef ICEAREA_CORRECTION_AREA_MODEL_HPP
#define ICEAREA_CORRECTION_AREA_MODEL_HPP

#include <Eigen/Core>
#include <memory>
#include <optional>
#include <string>

#include "icearea/config/correction.hpp"
#include "icearea/features/feature_extraction.hpp"

namespace icearea {

/**
 * @brief Abstract base class for area regression models.
 *
 * predict() may return any real value; clamping to a valid area is done
 * by predictArea().
 */
class AreaModel {
 public:
  virtual ~AreaModel() = default;

  /// Feature schema version the model was trained on.
  virtual int schemaVersion() const = 0;

  /// Number of features the model expects.
  virtual int featureCount() const { return kFeatureCount; }

  /// Raw area prediction [map units²].
  virtual double predict(const FeatureVector& features) const = 0;
};

/// Quantity the regression was fit to.
enum class RegressionTarget {
  Area,     ///< Area directly
  RootArea  ///< Root length sqrt(area); predictions are squared back
};

/**
 * @brief Linear model: y = intercept + coefficients · features.
 *
 * With RegressionTarget::RootArea a prediction r >= 0 becomes r². A
 * negative r is passed through so that it is clamped like any other
 * negative area.
 */
class LinearAreaModel : public AreaModel {
 public:
  LinearAreaModel(double intercept, Eigen::VectorXd coefficients,
                  RegressionTarget target = RegressionTarget::Area,
                  int schema_version = kFeatureSchemaVersion);

  int schemaVersion() const override { return schema_version_; }
  int featureCount() const override {
    return static_cast<int>(coefficients_.size());
  }
  double predict(const FeatureVector& features) const override;

  double intercept() const { return intercept_; }
  const Eigen::VectorXd& coefficients() const { return coefficients_; }
  RegressionTarget target() const { return target_; }

 private:
  double intercept_;
  Eigen::VectorXd coefficients_;
  RegressionTarget target_;
  int schema_version_;
};

/**
 * @brief Load a model artifact from YAML.
 *
 * @code
 *   type: linear
 *   schema_version: 2
 *   channel: hh            # optional, informational
 *   target: root_area      # area | root_area
 *   intercept: 0.0
 *   coefficients: { root_area: 1.05, contrast_db: -0.02 }
 * @endcode
 *
 * Features not listed get a zero coefficient.
 *
 * @throws std::runtime_error on parse failure or unknown model type
 * @throws ModelMismatch if a coefficient names an unknown feature
 */
std::shared_ptr<const AreaModel> loadAreaModel(const std::string& path);

/**
 * @brief Corrected area of one object, never negative.
 *
 * Finite negative predictions are replaced per cfg.negative_area_policy
 * (0 or one pixel's area).
 *
 * @return nullopt if the model's prediction is not finite
 * @throws ModelMismatch if the feature schema differs from the model's
 */
std::optional<double> predictArea(const FeatureVector& features,
                                  const AreaModel& model,
                                  const config::Correction& cfg,
                                  double pixel_area);

}  // namespace icearea

#endif  // ICEAREA_CORRECTION_AREA_MODEL_HPP

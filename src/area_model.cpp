// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "icearea/correction/area_model.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "icearea/errors.hpp"

namespace icearea {

LinearAreaModel::LinearAreaModel(double intercept,
                                 Eigen::VectorXd coefficients,
                                 RegressionTarget target, int schema_version)
    : intercept_(intercept),
      coefficients_(std::move(coefficients)),
      target_(target),
      schema_version_(schema_version) {}

double LinearAreaModel::predict(const FeatureVector& features) const {
  if (features.size() != coefficients_.size()) {
    throw ModelMismatch("linear model expects " +
                        std::to_string(coefficients_.size()) +
                        " features, got " + std::to_string(features.size()));
  }
  // NaN features contribute nothing when their coefficient is zero
  double y = intercept_;
  for (int i = 0; i < coefficients_.size(); ++i) {
    if (coefficients_(i) != 0.0) y += coefficients_(i) * features.values(i);
  }
  if (target_ == RegressionTarget::RootArea && y >= 0.0) return y * y;
  return y;
}

std::shared_ptr<const AreaModel> loadAreaModel(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load area model: " + path + " - " +
                             e.what());
  }

  try {
    const std::string type = root["type"] ? root["type"].as<std::string>()
                                          : std::string("linear");
    if (type != "linear") {
      throw std::runtime_error("Failed to load area model: " + path +
                               " - unsupported type '" + type + "'");
    }

    const int schema_version = root["schema_version"]
                                   ? root["schema_version"].as<int>()
                                   : kFeatureSchemaVersion;

    RegressionTarget target = RegressionTarget::Area;
    if (root["target"]) {
      const auto t = root["target"].as<std::string>();
      if (t == "root_area" || t == "root_length") {
        target = RegressionTarget::RootArea;
      } else if (t != "area") {
        throw std::runtime_error("Failed to load area model: " + path +
                                 " - unknown target '" + t + "'");
      }
    }

    const double intercept =
        root["intercept"] ? root["intercept"].as<double>() : 0.0;

    Eigen::VectorXd coefficients = Eigen::VectorXd::Zero(kFeatureCount);
    if (auto coeffs = root["coefficients"]) {
      for (const auto& kv : coeffs) {
        const auto name = kv.first.as<std::string>();
        const auto feature = featureFromName(name);
        if (!feature) {
          throw ModelMismatch("area model " + path +
                              " references unknown feature '" + name + "'");
        }
        coefficients(static_cast<int>(*feature)) = kv.second.as<double>();
      }
    }

    spdlog::info("[AreaModel] Loaded linear model {} (schema v{}, target {})",
                 path, schema_version,
                 target == RegressionTarget::RootArea ? "root_area" : "area");
    return std::make_shared<LinearAreaModel>(intercept, std::move(coefficients),
                                             target, schema_version);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load area model: " + path + " - " +
                             e.what());
  }
}

std::optional<double> predictArea(const FeatureVector& features,
                                  const AreaModel& model,
                                  const config::Correction& cfg,
                                  double pixel_area) {
  if (features.schema_version != model.schemaVersion()) {
    throw ModelMismatch("feature schema v" +
                        std::to_string(features.schema_version) +
                        " does not match model schema v" +
                        std::to_string(model.schemaVersion()));
  }
  if (features.size() != model.featureCount()) {
    throw ModelMismatch("model expects " + std::to_string(model.featureCount()) +
                        " features, got " + std::to_string(features.size()));
  }

  const double area = model.predict(features);
  if (!std::isfinite(area)) {
    spdlog::warn("[AreaModel] Non-finite prediction, area left undefined");
    return std::nullopt;
  }
  if (area >= 0.0) return area;

  return cfg.negative_area_policy == NegativeAreaPolicy::OnePixel
             ? std::max(0.0, pixel_area)
             : 0.0;
}

}  // namespace icearea

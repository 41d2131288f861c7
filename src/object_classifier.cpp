// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "icearea/classification/object_classifier.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "icearea/errors.hpp"

namespace icearea {

ReferenceClassifier::ReferenceClassifier(Params params)
    : params_(std::move(params)) {
  if (!(params_.perimeter_index_std > 0.0)) {
    throw InvalidConfig("reference perimeter_index std must be > 0");
  }
  if (!(params_.incidence_band > 0.0)) {
    throw InvalidConfig("incidence_angle_band must be > 0");
  }
  if (params_.samples.size() < 2) {
    throw InvalidConfig("reference classifier needs at least 2 samples, got " +
                        std::to_string(params_.samples.size()));
  }
}

std::optional<Classification> ReferenceClassifier::classify(
    const FeatureVector& features) const {
  const double shape = features[Feature::PerimeterIndex];
  const double mean = features[Feature::Mean];
  if (!std::isfinite(shape) || !std::isfinite(mean)) return std::nullopt;

  const double ia = features[Feature::IncidenceAngleMean];
  const bool use_band = std::isfinite(ia);

  // Population statistics of the reference backscatter in the band
  double sum = 0.0;
  double sum_sq = 0.0;
  int n = 0;
  for (const auto& s : params_.samples) {
    if (use_band && (s.incidence_angle < ia - params_.incidence_band ||
                     s.incidence_angle >= ia + params_.incidence_band)) {
      continue;
    }
    sum += s.mean;
    sum_sq += s.mean * s.mean;
    ++n;
  }
  if (n < 2) return std::nullopt;
  const double ref_mean = sum / n;
  const double ref_var = sum_sq / n - ref_mean * ref_mean;
  if (!(ref_var > 0.0)) return std::nullopt;

  Classification c;
  c.perimeter_index_score =
      (shape - params_.perimeter_index_mean) / params_.perimeter_index_std;
  c.backscatter_score = (mean - ref_mean) / std::sqrt(ref_var);
  c.is_iceberg = c.perimeter_index_score >= params_.perimeter_index_threshold &&
                 c.backscatter_score >= params_.backscatter_threshold;
  return c;
}

std::shared_ptr<const ObjectClassifier> loadObjectClassifier(
    const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load classifier: " + path + " - " +
                             e.what());
  }

  try {
    const std::string type = root["type"] ? root["type"].as<std::string>()
                                          : std::string("reference");
    if (type != "reference") {
      throw std::runtime_error("Failed to load classifier: " + path +
                               " - unsupported type '" + type + "'");
    }

    ReferenceClassifier::Params params;
    if (auto n = root["perimeter_index"]) {
      params.perimeter_index_mean = n["mean"].as<double>();
      params.perimeter_index_std = n["std"].as<double>();
    } else {
      throw InvalidConfig("classifier " + path + " has no perimeter_index");
    }
    if (auto n = root["thresholds"]) {
      if (n["perimeter_index"]) {
        params.perimeter_index_threshold = n["perimeter_index"].as<double>();
      }
      if (n["backscatter"]) {
        params.backscatter_threshold = n["backscatter"].as<double>();
      }
    }
    if (root["incidence_angle_band"]) {
      params.incidence_band = root["incidence_angle_band"].as<double>();
    }
    if (auto n = root["samples"]) {
      for (const auto& item : n) {
        const auto pair = item.as<std::vector<double>>();
        if (pair.size() != 2) {
          throw InvalidConfig("classifier " + path +
                              ": samples must be [incidence_angle, mean] "
                              "pairs");
        }
        params.samples.push_back({pair[0], pair[1]});
      }
    }

    spdlog::info("[Classifier] Loaded reference classifier {} ({} samples)",
                 path, params.samples.size());
    return std::make_shared<ReferenceClassifier>(std::move(params));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load classifier: " + path + " - " +
                             e.what());
  }
}

}  // namespace icearea

// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * icearea.cpp
 *
 * Per-channel orchestration and HH/HV merging.
 */

#include "icearea/icearea.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace icearea {

namespace {

void recordError(ChannelResult& res, ErrorKind kind, const std::string& msg) {
  spdlog::error("[Pipeline] {}: {} - {}", toString(res.channel),
                toString(kind), msg);
  res.errors.push_back({res.channel, kind, msg});
}

bool keepBlob(const Blob& blob, const config::Blobs& cfg) {
  if (blob.pixel_count < cfg.min_pixel_count) return false;
  if (cfg.drop_truncated && blob.truncated) return false;
  return true;
}

// Runtime failures of an injected model blank the corrected areas only;
// any other exception fails the whole channel.
void applyCorrection(ChannelResult& res, const AreaModel& model,
                     const config::Correction& cfg, double pixel_area) {
  try {
    for (auto& obj : res.objects) {
      obj.area_backscatter_rl =
          predictArea(obj.features, model, cfg, pixel_area);
    }
    return;
  } catch (const Error& e) {
    recordError(res, e.kind(), e.what());
  } catch (const std::runtime_error& e) {
    recordError(res, ErrorKind::ModelMismatch,
                std::string("area model failed: ") + e.what());
  }
  for (auto& obj : res.objects) obj.area_backscatter_rl.reset();
}

void applyClassifier(ChannelResult& res, const ObjectClassifier& classifier) {
  try {
    for (auto& obj : res.objects) {
      obj.classification = classifier.classify(obj.features);
    }
    return;
  } catch (const Error& e) {
    recordError(res, e.kind(), e.what());
  } catch (const std::runtime_error& e) {
    recordError(res, ErrorKind::ModelMismatch,
                std::string("classifier failed: ") + e.what());
  }
  for (auto& obj : res.objects) obj.classification.reset();
}

template <typename Set>
const typename Set::mapped_type::element_type* lookup(const Set& set,
                                                      Channel channel) {
  auto it = set.find(channel);
  return it != set.end() ? it->second.get() : nullptr;
}

struct ChannelInputs {
  const Config& cfg;
  const ModelSet& models;
  const ClassifierSet& classifiers;
  const std::optional<Polygon>& aoi;
  const Eigen::MatrixXf& incidence_angle;
};

void runChannel(ChannelResult& res, const Raster& raster,
                const ChannelInputs& in) {
  const Channel channel = res.channel;
  if (raster.channel() != channel) {
    throw InvalidConfig(std::string("raster for channel ") +
                        toString(channel) + " is tagged " +
                        toString(raster.channel()));
  }

  const DetectionMask mask = detect(raster, in.cfg.settings(channel).cfar);
  std::vector<Blob> blobs = extractBlobs(mask, raster);

  auto& diag = res.diagnostics;
  diag.flagged_pixels = mask.flagged_pixels;
  diag.floored_pixels = mask.floored_pixels;
  diag.undefined_pixels = mask.undefined_pixels;
  diag.edge_excluded_pixels = mask.edge_excluded_pixels;
  diag.blobs_detected = static_cast<int>(blobs.size());

  if (mask.floored_pixels > 0 || mask.undefined_pixels > 0) {
    res.warnings.push_back(
        {channel, ErrorKind::NumericalInstability,
         std::to_string(mask.floored_pixels) +
             " pixels used the variance floor, " +
             std::to_string(mask.undefined_pixels) +
             " pixels had no usable threshold"});
  }

  const auto& ia = in.incidence_angle;
  if (ia.size() > 0 && (ia.rows() != raster.rows() || ia.cols() != raster.cols())) {
    spdlog::warn("[Pipeline] {}: incidence angle layer is {}x{}, raster is "
                 "{}x{}; ignoring it",
                 toString(channel), ia.rows(), ia.cols(), raster.rows(),
                 raster.cols());
  }

  for (auto& blob : blobs) {
    if (!keepBlob(blob, in.cfg.blobs)) {
      ++diag.blobs_filtered;
      continue;
    }
    if (in.aoi && !intersects(blob.outline, *in.aoi)) {
      ++diag.blobs_outside_aoi;
      continue;
    }
    IcebergObject obj;
    obj.features = computeFeatures(blob, raster, mask, ia);
    obj.blob = std::move(blob);
    res.objects.push_back(std::move(obj));
  }

  if (const auto* model = lookup(in.models, channel)) {
    applyCorrection(res, *model, in.cfg.correction, raster.pixelArea());
  }
  if (const auto* classifier = lookup(in.classifiers, channel)) {
    applyClassifier(res, *classifier);
  }
  res.detected = true;

  spdlog::info("[Pipeline] {}: {} objects ({} detected, {} filtered, {} "
               "outside AOI, {} flagged px)",
               toString(channel), res.objects.size(), diag.blobs_detected,
               diag.blobs_filtered, diag.blobs_outside_aoi,
               diag.flagged_pixels);
}

ChannelResult processChannel(Channel channel, const RasterSet& rasters,
                             const ChannelInputs& in) {
  ChannelResult res;
  res.channel = channel;

  auto it = rasters.find(channel);
  if (it == rasters.end()) {
    recordError(res, ErrorKind::NoValidData,
                std::string("no raster supplied for channel ") +
                    toString(channel));
    return res;
  }

  try {
    runChannel(res, it->second, in);
    return res;
  } catch (const Error& e) {
    recordError(res, e.kind(), e.what());
  } catch (const std::exception& e) {
    recordError(res, ErrorKind::Internal, e.what());
  }
  res.detected = false;
  res.objects.clear();
  return res;
}

// Loads one artifact per enabled channel; failures are reported per channel
template <typename Set, typename Loader>
Set loadPerChannel(const Config& cfg, const char* tag,
                   const std::string config::ChannelSettings::*path_member,
                   Loader load, std::vector<ChannelError>& errors) {
  Set set;
  for (Channel channel : cfg.enabledChannels()) {
    const auto& path = cfg.settings(channel).*path_member;
    if (path.empty()) continue;
    try {
      set[channel] = load(path);
    } catch (const Error& e) {
      spdlog::error("[{}] {}: {}", tag, toString(channel), e.what());
      errors.push_back({channel, e.kind(), e.what()});
    } catch (const std::exception& e) {
      spdlog::error("[{}] {}: {}", tag, toString(channel), e.what());
      errors.push_back({channel, ErrorKind::InvalidConfig, e.what()});
    }
  }
  return set;
}

}  // namespace

ModelSet loadModels(const Config& cfg, std::vector<ChannelError>& errors) {
  return loadPerChannel<ModelSet>(cfg, "AreaModel",
                                  &config::ChannelSettings::model_path,
                                  loadAreaModel, errors);
}

ClassifierSet loadClassifiers(const Config& cfg,
                              std::vector<ChannelError>& errors) {
  return loadPerChannel<ClassifierSet>(
      cfg, "Classifier", &config::ChannelSettings::classifier_path,
      loadObjectClassifier, errors);
}

Results runPipeline(const RasterSet& rasters, const Config& cfg,
                    const ModelSet& models, const std::optional<Polygon>& aoi,
                    const ClassifierSet& classifiers,
                    const Eigen::MatrixXf& incidence_angle) {
  const std::optional<Polygon>& area_of_interest =
      aoi ? aoi : cfg.area_of_interest;
  const ChannelInputs inputs{cfg, models, classifiers, area_of_interest,
                             incidence_angle};

  Results results;
  for (Channel channel : cfg.enabledChannels()) {
    results.channels[channel] = processChannel(channel, rasters, inputs);
  }

  const ChannelResult* hh = results.find(Channel::HH);
  const ChannelResult* hv = results.find(Channel::HV);
  const bool hh_ok = hh && hh->detected;
  const bool hv_ok = hv && hv->detected;

  if (hh_ok && hv_ok && cfg.merge.enabled) {
    results.merged = mergeChannels(*hh, *hv, cfg.merge.buffer_distance);
  } else {
    for (const auto* res : {hh, hv}) {
      if (!res || !res->detected) continue;
      results.merged.insert(results.merged.end(), res->objects.begin(),
                            res->objects.end());
    }
  }

  spdlog::info("[Pipeline] {} objects after merge", results.merged.size());
  return results;
}

std::vector<IcebergObject> mergeChannels(const ChannelResult& hh,
                                         const ChannelResult& hv,
                                         double buffer_distance) {
  const auto& hh_objects = hh.objects;
  const auto& hv_objects = hv.objects;
  std::vector<bool> hh_dropped(hh_objects.size(), false);
  std::vector<bool> hv_dropped(hv_objects.size(), false);

  std::vector<BoundingBox> hv_boxes;
  hv_boxes.reserve(hv_objects.size());
  for (const auto& obj : hv_objects) hv_boxes.push_back(boundingBox(obj.outline()));

  std::vector<size_t> overlapping;
  for (size_t i = 0; i < hh_objects.size(); ++i) {
    const auto& a = hh_objects[i];
    const BoundingBox a_box = boundingBox(a.outline());

    overlapping.clear();
    for (size_t j = 0; j < hv_objects.size(); ++j) {
      if (hv_dropped[j]) continue;
      if (!a_box.intersects(hv_boxes[j], buffer_distance)) continue;
      if (distance(a.outline(), hv_objects[j].outline()) <= buffer_distance) {
        overlapping.push_back(j);
      }
    }
    if (overlapping.empty()) continue;

    const size_t largest = *std::max_element(
        overlapping.begin(), overlapping.end(), [&](size_t x, size_t y) {
          return hv_objects[x].areaCfar() < hv_objects[y].areaCfar();
        });

    if (hv_objects[largest].areaCfar() > a.areaCfar()) {
      hh_dropped[i] = true;
      for (size_t j : overlapping) {
        if (j != largest) hv_dropped[j] = true;
      }
    } else {
      for (size_t j : overlapping) hv_dropped[j] = true;
    }
  }

  std::vector<IcebergObject> merged;
  for (size_t i = 0; i < hh_objects.size(); ++i) {
    if (!hh_dropped[i]) merged.push_back(hh_objects[i]);
  }
  for (size_t j = 0; j < hv_objects.size(); ++j) {
    if (!hv_dropped[j]) merged.push_back(hv_objects[j]);
  }
  return merged;
}

}  // namespace icearea

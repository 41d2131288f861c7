// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_icearea.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include "icearea/config/icearea.hpp"
#include "icearea/errors.hpp"

namespace icearea {

void validateWindow(const WindowSpec& window) {
  auto usable = [](int size) { return size > 0 && size % 2 == 1; };
  if (!usable(window.outer_size) || !usable(window.guard_size)) {
    throw InvalidWindowConfig(
        "window sizes must be positive and odd, got outer=" +
        std::to_string(window.outer_size) +
        " guard=" + std::to_string(window.guard_size));
  }
  if (window.guard_size >= window.outer_size) {
    throw InvalidWindowConfig(
        "guard window (" + std::to_string(window.guard_size) +
        ") must be smaller than outer window (" +
        std::to_string(window.outer_size) + ")");
  }
}

namespace config {

void validate(const Cfar& cfg) {
  validateWindow(cfg.window);
  if (!(cfg.pfa > 0.0 && cfg.pfa < 1.0)) {
    throw InvalidConfig("false_alarm_probability (" + std::to_string(cfg.pfa) +
                        ") must be in (0, 1)");
  }
}

}  // namespace config

std::vector<Channel> Config::enabledChannels() const {
  std::vector<Channel> out;
  for (const auto& [channel, settings] : channels) {
    if (settings.enabled) out.push_back(channel);
  }
  return out;
}

const config::ChannelSettings& Config::settings(Channel channel) const {
  static const config::ChannelSettings kDefaults{};
  auto it = channels.find(channel);
  return it != channels.end() ? it->second : kDefaults;
}

namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

ClutterModel parseClutterModel(const std::string& name) {
  if (name == "local_moments") return ClutterModel::LocalMoments;
  if (name == "global_enl") return ClutterModel::GlobalEnl;
  spdlog::warn(
      "[Config] Unknown clutter_model '{}', defaulting to local_moments", name);
  return ClutterModel::LocalMoments;
}

EdgePolicy parseEdgePolicy(const std::string& name) {
  if (name == "clip") return EdgePolicy::Clip;
  if (name == "exclude") return EdgePolicy::Exclude;
  spdlog::warn("[Config] Unknown edge_policy '{}', defaulting to clip", name);
  return EdgePolicy::Clip;
}

NegativeAreaPolicy parseNegativeAreaPolicy(const std::string& name) {
  if (name == "zero") return NegativeAreaPolicy::Zero;
  if (name == "one_pixel") return NegativeAreaPolicy::OnePixel;
  spdlog::warn(
      "[Config] Unknown negative_area_policy '{}', defaulting to zero", name);
  return NegativeAreaPolicy::Zero;
}

// Detection keys, shared by the detection section and channel overrides
void loadCfar(const YAML::Node& n, config::Cfar& cfar) {
  load(n, "outer_window_size", cfar.window.outer_size);
  load(n, "guard_window_size", cfar.window.guard_size);
  load(n, "false_alarm_probability", cfar.pfa);
  load(n, "min_coefficient_of_variation", cfar.min_cv);
  std::string s;
  load(n, "clutter_model", s);
  if (!s.empty()) cfar.clutter_model = parseClutterModel(s);
  s.clear();
  load(n, "edge_policy", s);
  if (!s.empty()) cfar.edge_policy = parseEdgePolicy(s);
}

// Relative artifact paths are relative to the config file
void resolvePath(std::string& path, const std::string& base_dir) {
  if (path.empty() || base_dir.empty()) return;
  const std::filesystem::path p(path);
  if (p.is_relative()) path = (std::filesystem::path(base_dir) / p).string();
}

Polygon parsePolygon(const YAML::Node& n) {
  Polygon polygon;
  for (const auto& v : n) {
    const auto xy = v.as<std::vector<double>>();
    if (xy.size() != 2) {
      throw InvalidConfig("area_of_interest: vertices must be [x, y] pairs");
    }
    polygon.vertices.emplace_back(xy[0], xy[1]);
  }
  return polygon;
}

Config parse(const YAML::Node& root, const std::string& base_dir) {
  Config cfg;

  config::Cfar base;
  if (auto n = root["detection"]) loadCfar(n, base);
  for (auto& [channel, settings] : cfg.channels) settings.cfar = base;

  if (auto n = root["channels"]) {
    if (auto enabled = n["enabled"]) {
      for (auto& [channel, settings] : cfg.channels) settings.enabled = false;
      for (const auto& item : enabled) {
        const auto name = item.as<std::string>();
        const auto channel = parseChannel(name);
        if (!channel) {
          spdlog::warn("[Config] Unknown channel '{}' in channels.enabled, "
                       "ignoring",
                       name);
          continue;
        }
        cfg.channels[*channel].enabled = true;
      }
    }
    for (auto& [channel, settings] : cfg.channels) {
      std::string key = toString(channel);
      std::transform(key.begin(), key.end(), key.begin(), ::tolower);
      auto c = n[key];
      if (!c) continue;
      loadCfar(c, settings.cfar);
      load(c, "enabled", settings.enabled);
      load(c, "model_path", settings.model_path);
      load(c, "classifier_path", settings.classifier_path);
      resolvePath(settings.model_path, base_dir);
      resolvePath(settings.classifier_path, base_dir);
    }
  }

  if (auto n = root["blobs"]) {
    load(n, "min_pixel_count", cfg.blobs.min_pixel_count);
    load(n, "drop_truncated", cfg.blobs.drop_truncated);
  }

  if (auto n = root["correction"]) {
    std::string s;
    load(n, "negative_area_policy", s);
    if (!s.empty())
      cfg.correction.negative_area_policy = parseNegativeAreaPolicy(s);
  }

  if (auto n = root["merge"]) {
    load(n, "enabled", cfg.merge.enabled);
    load(n, "buffer_distance", cfg.merge.buffer_distance);
  }

  if (auto n = root["area_of_interest"]) {
    cfg.area_of_interest = parsePolygon(n);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: parameters the detector cannot run with ---
  for (const auto& [channel, settings] : cfg.channels) {
    try {
      config::validate(settings.cfar);
    } catch (const Error& e) {
      if (e.kind() == ErrorKind::InvalidWindowConfig) {
        throw InvalidWindowConfig(std::string("channels.") +
                                  toString(channel) + ": " + e.what());
      }
      throw InvalidConfig(std::string("channels.") + toString(channel) +
                          ": " + e.what());
    }
  }
  if (cfg.area_of_interest && cfg.area_of_interest->size() < 3) {
    throw InvalidConfig("area_of_interest needs at least 3 vertices, got " +
                        std::to_string(cfg.area_of_interest->size()));
  }

  // --- Non-fatal: warn and clamp ---
  for (auto& [channel, settings] : cfg.channels) {
    auto& min_cv = settings.cfar.min_cv;
    if (!std::isfinite(min_cv) || min_cv <= 0.0) {
      spdlog::warn(
          "[Config] {}.min_coefficient_of_variation ({}) must be > 0, "
          "clamping to 0.05",
          toString(channel), min_cv);
      min_cv = 0.05;
    }
  }
  if (cfg.blobs.min_pixel_count < 1) {
    spdlog::warn("[Config] blobs.min_pixel_count ({}) must be >= 1, "
                 "clamping to 1",
                 cfg.blobs.min_pixel_count);
    cfg.blobs.min_pixel_count = 1;
  }
  if (!(cfg.merge.buffer_distance >= 0.0)) {
    spdlog::warn("[Config] merge.buffer_distance ({}) must be >= 0, "
                 "clamping to 0",
                 cfg.merge.buffer_distance);
    cfg.merge.buffer_distance = 0.0;
  }
  if (cfg.enabledChannels().empty()) {
    spdlog::warn("[Config] No channel enabled, pipeline will produce nothing");
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root, const std::string& base_dir) {
  auto cfg = detail::parse(root, base_dir);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    const auto base_dir = std::filesystem::path(path).parent_path().string();
    return parseConfig(YAML::LoadFile(path), base_dir);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace icearea

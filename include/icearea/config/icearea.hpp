// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ICEAREA_CONFIG_ICEAREA_HPP
#define ICEAREA_CONFIG_ICEAREA_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

#include "icearea/config/correction.hpp"
#include "icearea/config/detection.hpp"
#include "icearea/geometry/polygon.hpp"
#include "icearea/raster.hpp"

namespace icearea {

namespace config {

/// Resolved settings of one polarization channel.
struct ChannelSettings {
  bool enabled = true;
  Cfar cfar;
  std::string model_path;       ///< Empty: no area correction for this channel
  std::string classifier_path;  ///< Empty: objects are not classified
};

}  // namespace config

/// Pipeline configuration. Channel-specific overrides are data only.
struct Config {
  std::map<Channel, config::ChannelSettings> channels = {
      {Channel::HH, {}}, {Channel::HV, {}}};
  config::Blobs blobs;
  config::Correction correction;
  config::Merge merge;
  std::optional<Polygon> area_of_interest;

  /// Enabled channels in HH, HV order.
  std::vector<Channel> enabledChannels() const;

  /// Settings for a channel (defaults if the channel is not listed).
  const config::ChannelSettings& settings(Channel channel) const;
};

Config parseConfig(const YAML::Node& root, const std::string& base_dir = "");
Config loadConfig(const std::string& path);

}  // namespace icearea

#endif  // ICEAREA_CONFIG_ICEAREA_HPP

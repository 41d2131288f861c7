// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML config loading, per-channel overrides and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "icearea/config/icearea.hpp"
#include "icearea/errors.hpp"

using namespace icearea;

namespace {

std::string writeTempYaml(const std::string& content, const std::string& name) {
  std::string path = testing::TempDir() + "/" + name;
  std::ofstream f(path);
  f << content;
  return path;
}

}  // namespace

// ─── File loading ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  auto cfg = loadConfig(ICEAREA_CONFIG_DIR "/default.yaml");

  EXPECT_EQ(cfg.enabledChannels(),
            (std::vector<Channel>{Channel::HH, Channel::HV}));
  for (Channel channel : {Channel::HH, Channel::HV}) {
    const auto& cfar = cfg.settings(channel).cfar;
    EXPECT_EQ(cfar.window.outer_size, 29);
    EXPECT_EQ(cfar.window.guard_size, 21);
    EXPECT_DOUBLE_EQ(cfar.pfa, 1e-6);
    EXPECT_EQ(cfar.clutter_model, ClutterModel::LocalMoments);
    EXPECT_DOUBLE_EQ(cfar.min_cv, 0.05);
    EXPECT_EQ(cfar.edge_policy, EdgePolicy::Clip);
  }
  EXPECT_EQ(cfg.blobs.min_pixel_count, 1);
  EXPECT_FALSE(cfg.blobs.drop_truncated);
  EXPECT_EQ(cfg.correction.negative_area_policy, NegativeAreaPolicy::Zero);
  EXPECT_TRUE(cfg.merge.enabled);
  EXPECT_DOUBLE_EQ(cfg.merge.buffer_distance, 20.0);
  EXPECT_FALSE(cfg.area_of_interest.has_value());
}

TEST(ConfigLoadTest, ModelPathsResolveAgainstConfigDir) {
  auto cfg = loadConfig(ICEAREA_CONFIG_DIR "/default.yaml");
  const std::filesystem::path hh = cfg.settings(Channel::HH).model_path;
  EXPECT_TRUE(hh.is_absolute());
  EXPECT_EQ(hh.filename().string(), "linear_hh.yaml");
  EXPECT_TRUE(std::filesystem::exists(hh));
  EXPECT_TRUE(
      std::filesystem::exists(cfg.settings(Channel::HV).model_path));
}

TEST(ConfigLoadTest, ClassifierPathsResolveAgainstConfigDir) {
  auto cfg = loadConfig(ICEAREA_CONFIG_DIR "/default.yaml");
  const std::filesystem::path hh = cfg.settings(Channel::HH).classifier_path;
  EXPECT_TRUE(hh.is_absolute());
  EXPECT_EQ(hh.filename().string(), "reference_hh.yaml");
  EXPECT_TRUE(std::filesystem::exists(hh));
  EXPECT_TRUE(
      std::filesystem::exists(cfg.settings(Channel::HV).classifier_path));
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("detection: [unclosed\n", "icearea_malformed.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
  std::remove(path.c_str());
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto path = writeTempYaml("", "icearea_empty.yaml");
  auto cfg = loadConfig(path);
  EXPECT_EQ(cfg.enabledChannels().size(), 2u);
  EXPECT_EQ(cfg.settings(Channel::HH).cfar.window.outer_size, 29);
  EXPECT_TRUE(cfg.settings(Channel::HV).model_path.empty());
  std::remove(path.c_str());
}

// ─── Channel overrides ──────────────────────────────────────────────────────

TEST(ConfigParseTest, PerChannelOverride) {
  auto cfg = parseConfig(YAML::Load(R"(
detection:
  false_alarm_probability: 1.0e-6
  outer_window_size: 31
channels:
  hv:
    false_alarm_probability: 1.0e-4
    clutter_model: global_enl
)"));
  EXPECT_DOUBLE_EQ(cfg.settings(Channel::HH).cfar.pfa, 1e-6);
  EXPECT_DOUBLE_EQ(cfg.settings(Channel::HV).cfar.pfa, 1e-4);
  EXPECT_EQ(cfg.settings(Channel::HH).cfar.clutter_model,
            ClutterModel::LocalMoments);
  EXPECT_EQ(cfg.settings(Channel::HV).cfar.clutter_model,
            ClutterModel::GlobalEnl);
  // Base value is inherited where not overridden
  EXPECT_EQ(cfg.settings(Channel::HV).cfar.window.outer_size, 31);
}

TEST(ConfigParseTest, EnabledChannelList) {
  auto cfg = parseConfig(YAML::Load("channels:\n  enabled: [hv]\n"));
  EXPECT_EQ(cfg.enabledChannels(), std::vector<Channel>{Channel::HV});

  auto disabled = parseConfig(YAML::Load(R"(
channels:
  hh:
    enabled: false
)"));
  EXPECT_EQ(disabled.enabledChannels(), std::vector<Channel>{Channel::HV});
}

TEST(ConfigParseTest, RelativeModelPathResolution) {
  auto cfg = parseConfig(YAML::Load(R"(
channels:
  hh:
    model_path: models/a.yaml
    classifier_path: models/ref.yaml
  hv:
    model_path: /abs/b.yaml
)"),
                         "/data/run");
  EXPECT_EQ(cfg.settings(Channel::HH).model_path, "/data/run/models/a.yaml");
  EXPECT_EQ(cfg.settings(Channel::HH).classifier_path,
            "/data/run/models/ref.yaml");
  EXPECT_EQ(cfg.settings(Channel::HV).model_path, "/abs/b.yaml");
  EXPECT_TRUE(cfg.settings(Channel::HV).classifier_path.empty());

  auto no_base = parseConfig(YAML::Load(R"(
channels:
  hh:
    model_path: models/a.yaml
)"));
  EXPECT_EQ(no_base.settings(Channel::HH).model_path, "models/a.yaml");
}

TEST(ConfigParseTest, PolicyNames) {
  auto cfg = parseConfig(YAML::Load(R"(
detection:
  edge_policy: exclude
correction:
  negative_area_policy: one_pixel
merge:
  enabled: false
  buffer_distance: 50.0
blobs:
  min_pixel_count: 3
  drop_truncated: true
)"));
  EXPECT_EQ(cfg.settings(Channel::HH).cfar.edge_policy, EdgePolicy::Exclude);
  EXPECT_EQ(cfg.correction.negative_area_policy, NegativeAreaPolicy::OnePixel);
  EXPECT_FALSE(cfg.merge.enabled);
  EXPECT_DOUBLE_EQ(cfg.merge.buffer_distance, 50.0);
  EXPECT_EQ(cfg.blobs.min_pixel_count, 3);
  EXPECT_TRUE(cfg.blobs.drop_truncated);
}

TEST(ConfigParseTest, UnknownPolicyFallsBackToDefault) {
  auto cfg = parseConfig(YAML::Load(R"(
detection:
  clutter_model: k_distribution
  edge_policy: mirror
)"));
  EXPECT_EQ(cfg.settings(Channel::HH).cfar.clutter_model,
            ClutterModel::LocalMoments);
  EXPECT_EQ(cfg.settings(Channel::HH).cfar.edge_policy, EdgePolicy::Clip);
}

TEST(ConfigParseTest, AreaOfInterest) {
  auto cfg = parseConfig(YAML::Load(R"(
area_of_interest: [[0, 0], [1000, 0], [1000, 1000], [0, 1000]]
)"));
  ASSERT_TRUE(cfg.area_of_interest.has_value());
  EXPECT_EQ(cfg.area_of_interest->size(), 4u);
  EXPECT_DOUBLE_EQ(cfg.area_of_interest->vertices[2].x(), 1000.0);
}

// ─── Validation ─────────────────────────────────────────────────────────────

TEST(ConfigValidateTest, EvenWindowThrows) {
  EXPECT_THROW(
      parseConfig(YAML::Load("detection:\n  outer_window_size: 30\n")),
      InvalidWindowConfig);
}

TEST(ConfigValidateTest, GuardNotSmallerThanOuterThrows) {
  EXPECT_THROW(parseConfig(YAML::Load(R"(
channels:
  hv:
    outer_window_size: 21
    guard_window_size: 21
)")),
               InvalidWindowConfig);
}

TEST(ConfigValidateTest, PfaOutOfRangeThrows) {
  EXPECT_THROW(
      parseConfig(YAML::Load("detection:\n  false_alarm_probability: 1.5\n")),
      InvalidConfig);
  EXPECT_THROW(
      parseConfig(YAML::Load("detection:\n  false_alarm_probability: 0\n")),
      InvalidConfig);
}

TEST(ConfigValidateTest, DegenerateAreaOfInterestThrows) {
  EXPECT_THROW(
      parseConfig(YAML::Load("area_of_interest: [[0, 0], [10, 10]]\n")),
      InvalidConfig);
}

TEST(ConfigValidateTest, ClampsRecoverableValues) {
  auto cfg = parseConfig(YAML::Load(R"(
detection:
  min_coefficient_of_variation: -0.1
blobs:
  min_pixel_count: 0
merge:
  buffer_distance: -5.0
)"));
  EXPECT_DOUBLE_EQ(cfg.settings(Channel::HH).cfar.min_cv, 0.05);
  EXPECT_DOUBLE_EQ(cfg.settings(Channel::HV).cfar.min_cv, 0.05);
  EXPECT_EQ(cfg.blobs.min_pixel_count, 1);
  EXPECT_DOUBLE_EQ(cfg.merge.buffer_distance, 0.0);
}

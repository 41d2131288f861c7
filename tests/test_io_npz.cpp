// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_io_npz.cpp
 *
 * Tests for .npz scene save/load, including archives laid out the way
 * numpy.savez writes them (C order, float64, ZIP64 local headers).
 */

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "icearea/io/npz.hpp"

using namespace icearea;

namespace {

void putLE(std::string& out, uint64_t v, int bytes) {
  for (int i = 0; i < bytes; ++i) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

/// .npy v1.0 file with the given header dict and raw payload.
std::string npyFile(const std::string& dict, const std::string& payload) {
  std::string header = dict;
  const size_t rem = (10 + header.size() + 1) % 64;
  if (rem != 0) header.append(64 - rem, ' ');
  header.push_back('\n');

  std::string out("\x93NUMPY\x01\x00", 8);
  putLE(out, header.size(), 2);
  return out + header + payload;
}

/// STOREd zip of local entries only, optionally with ZIP64 size fields.
void writeZip(const std::string& path,
              const std::vector<std::pair<std::string, std::string>>& entries,
              bool zip64) {
  std::string out;
  for (const auto& [name, data] : entries) {
    putLE(out, 0x04034b50, 4);
    putLE(out, zip64 ? 45 : 20, 2);
    putLE(out, 0, 2);  // flags
    putLE(out, 0, 2);  // STORE
    putLE(out, 0, 4);  // time, date
    putLE(out, 0, 4);  // crc (not checked)
    putLE(out, zip64 ? 0xFFFFFFFFu : data.size(), 4);
    putLE(out, zip64 ? 0xFFFFFFFFu : data.size(), 4);
    putLE(out, name.size(), 2);
    putLE(out, zip64 ? 20 : 0, 2);
    out += name;
    if (zip64) {
      putLE(out, 0x0001, 2);
      putLE(out, 16, 2);
      putLE(out, data.size(), 8);
      putLE(out, data.size(), 8);
    }
    out += data;
  }
  std::ofstream f(path, std::ios::binary);
  f.write(out.data(), out.size());
}

template <typename T>
std::string rawBytes(const std::vector<T>& values) {
  return std::string(reinterpret_cast<const char*>(values.data()),
                     values.size() * sizeof(T));
}

}  // namespace

class NpzTest : public ::testing::Test {
 protected:
  void SetUp() override { path_ = testing::TempDir() + "/icearea_scene.npz"; }
  void TearDown() override { std::remove(path_.c_str()); }

  std::string path_;
};

// ─── Round trip ─────────────────────────────────────────────────────────────

TEST_F(NpzTest, SaveLoadScene) {
  const auto gt =
      GeoTransform::fromGdal({500000.0, 40.0, 0.0, 7500000.0, 0.0, -40.0});
  Eigen::MatrixXf hh(4, 5);
  Eigen::MatrixXf hv(4, 5);
  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 5; ++c) {
      hh(r, c) = 0.01f * (r * 5 + c);
      hv(r, c) = 0.001f * (r * 5 + c);
    }
  }
  hh(2, 3) = NAN;

  RasterSet scene;
  scene[Channel::HH] = Raster(Channel::HH, hh, gt);
  scene[Channel::HV] = Raster(Channel::HV, hv, gt);
  ASSERT_TRUE(io::saveScene(path_, scene));

  RasterSet loaded;
  ASSERT_TRUE(io::loadScene(path_, loaded));
  ASSERT_EQ(loaded.size(), 2u);

  const auto& lhh = loaded.at(Channel::HH);
  EXPECT_EQ(lhh.channel(), Channel::HH);
  EXPECT_EQ(lhh.rows(), 4);
  EXPECT_EQ(lhh.cols(), 5);
  EXPECT_FLOAT_EQ(lhh.at(1, 4), hh(1, 4));
  EXPECT_FLOAT_EQ(loaded.at(Channel::HV).at(3, 2), hv(3, 2));
  EXPECT_TRUE(std::isnan(lhh.at(2, 3)));
  EXPECT_FALSE(lhh.isValid(2, 3));
  EXPECT_TRUE(std::isnan(lhh.nodata()));

  const auto out = lhh.transform().toGdal();
  const auto in = gt.toGdal();
  for (size_t i = 0; i < in.size(); ++i) EXPECT_DOUBLE_EQ(out[i], in[i]);
}

TEST_F(NpzTest, NumericNodataRoundTrip) {
  RasterSet scene;
  Eigen::MatrixXf v = Eigen::MatrixXf::Constant(3, 3, 0.2f);
  v(0, 0) = 0.0f;
  scene[Channel::HV] = Raster(Channel::HV, v, GeoTransform{}, 0.0f);
  ASSERT_TRUE(io::saveScene(path_, scene));

  RasterSet loaded;
  ASSERT_TRUE(io::loadScene(path_, loaded));
  ASSERT_EQ(loaded.count(Channel::HV), 1u);
  EXPECT_EQ(loaded.count(Channel::HH), 0u);
  const auto& r = loaded.at(Channel::HV);
  EXPECT_FLOAT_EQ(r.nodata(), 0.0f);
  EXPECT_FALSE(r.isValid(0, 0));
  EXPECT_TRUE(r.isValid(1, 1));
}

TEST_F(NpzTest, IncidenceAngleRoundTrip) {
  RasterSet scene;
  scene[Channel::HH] = Raster(Channel::HH, Eigen::MatrixXf::Ones(3, 4));
  Eigen::MatrixXf ia(3, 4);
  for (int c = 0; c < 4; ++c) ia.col(c).setConstant(30.0f + c);
  ASSERT_TRUE(io::saveScene(path_, scene, ia));

  RasterSet loaded;
  Eigen::MatrixXf loaded_ia;
  ASSERT_TRUE(io::loadScene(path_, loaded, loaded_ia));
  ASSERT_EQ(loaded_ia.rows(), 3);
  ASSERT_EQ(loaded_ia.cols(), 4);
  EXPECT_FLOAT_EQ(loaded_ia(2, 3), 33.0f);

  // Archives without ia.npy give an empty layer
  ASSERT_TRUE(io::saveScene(path_, scene));
  ASSERT_TRUE(io::loadScene(path_, loaded, loaded_ia));
  EXPECT_EQ(loaded_ia.size(), 0);
}

TEST_F(NpzTest, SaveRejectsMismatchedIncidenceAngle) {
  RasterSet scene;
  scene[Channel::HH] = Raster(Channel::HH, Eigen::MatrixXf::Ones(3, 4));
  EXPECT_FALSE(io::saveScene(path_, scene, Eigen::MatrixXf::Ones(4, 3)));
}

TEST_F(NpzTest, SaveRejectsMismatchedShapes) {
  RasterSet scene;
  scene[Channel::HH] = Raster(Channel::HH, Eigen::MatrixXf::Ones(4, 4));
  scene[Channel::HV] = Raster(Channel::HV, Eigen::MatrixXf::Ones(4, 5));
  EXPECT_FALSE(io::saveScene(path_, scene));
  EXPECT_FALSE(io::saveScene(path_, RasterSet{}));
}

// ─── numpy layouts ──────────────────────────────────────────────────────────

TEST_F(NpzTest, LoadCOrderFloat64) {
  const std::vector<double> values = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
  writeZip(path_,
           {{"hh.npy",
             npyFile("{'descr': '<f8', 'fortran_order': False, "
                     "'shape': (2, 3), }",
                     rawBytes(values))}},
           false);

  RasterSet loaded;
  ASSERT_TRUE(io::loadScene(path_, loaded));
  const auto& r = loaded.at(Channel::HH);
  ASSERT_EQ(r.rows(), 2);
  ASSERT_EQ(r.cols(), 3);
  EXPECT_FLOAT_EQ(r.at(0, 1), 1.0f);
  EXPECT_FLOAT_EQ(r.at(1, 0), 3.0f);
  EXPECT_FLOAT_EQ(r.at(1, 2), 5.0f);

  // No meta.npy: pixel coordinates, NaN nodata
  EXPECT_DOUBLE_EQ(r.pixelArea(), 1.0);
  EXPECT_TRUE(std::isnan(r.nodata()));
}

TEST_F(NpzTest, LoadZip64LocalHeaders) {
  const std::vector<float> values = {1.0f, 2.0f, 3.0f, 4.0f};
  const std::string meta =
      "{\"version\": 1, \"transform\": [0, 10, 0, 0, 0, -10], "
      "\"nodata\": NaN}";
  writeZip(path_,
           {{"hv.npy",
             npyFile("{'descr': '<f4', 'fortran_order': False, "
                     "'shape': (2, 2), }",
                     rawBytes(values))},
            {"meta.npy",
             npyFile("{'descr': '|S" + std::to_string(meta.size()) +
                         "', 'fortran_order': False, 'shape': (), }",
                     meta)}},
           true);

  RasterSet loaded;
  ASSERT_TRUE(io::loadScene(path_, loaded));
  const auto& r = loaded.at(Channel::HV);
  EXPECT_FLOAT_EQ(r.at(0, 1), 2.0f);
  EXPECT_FLOAT_EQ(r.at(1, 0), 3.0f);
  EXPECT_DOUBLE_EQ(r.pixelArea(), 100.0);
}

TEST_F(NpzTest, LoadUnicodeMetadata) {
  // numpy.savez(..., meta=json.dumps(...)) stores a '<U' UTF-32LE scalar
  const std::vector<float> values = {1.0f, 2.0f, 3.0f, 4.0f};
  const std::string meta =
      "{\"version\": 1, \"transform\": [0, 10, 0, 0, 0, -10], "
      "\"nodata\": 0}";
  std::string utf32;
  for (char ch : meta) utf32 += std::string{ch, '\0', '\0', '\0'};
  writeZip(path_,
           {{"hh.npy",
             npyFile("{'descr': '<f4', 'fortran_order': False, "
                     "'shape': (2, 2), }",
                     rawBytes(values))},
            {"meta.npy",
             npyFile("{'descr': '<U" + std::to_string(meta.size()) +
                         "', 'fortran_order': False, 'shape': (), }",
                     utf32)}},
           false);

  RasterSet loaded;
  ASSERT_TRUE(io::loadScene(path_, loaded));
  const auto& r = loaded.at(Channel::HH);
  EXPECT_DOUBLE_EQ(r.pixelArea(), 100.0);
  EXPECT_FLOAT_EQ(r.nodata(), 0.0f);
}

// ─── Failures ───────────────────────────────────────────────────────────────

TEST_F(NpzTest, NonexistentFileFails) {
  RasterSet loaded;
  EXPECT_FALSE(io::loadScene("/nonexistent/scene.npz", loaded));
}

TEST_F(NpzTest, GarbageFileFails) {
  {
    std::ofstream f(path_, std::ios::binary);
    f << "definitely not a zip archive";
  }
  RasterSet loaded;
  EXPECT_FALSE(io::loadScene(path_, loaded));
}

TEST_F(NpzTest, MalformedStringLengthFails) {
  const std::vector<float> values = {1.0f};
  for (const std::string descr : {"|Sx", "|S", "<U-3", "|S12abc"}) {
    writeZip(path_,
             {{"hh.npy",
               npyFile("{'descr': '<f4', 'fortran_order': False, "
                       "'shape': (1, 1), }",
                       rawBytes(values))},
              {"meta.npy",
               npyFile("{'descr': '" + descr +
                           "', 'fortran_order': False, 'shape': (), }",
                       "{}")}},
             false);
    RasterSet loaded;
    EXPECT_FALSE(io::loadScene(path_, loaded)) << descr;
  }
}

TEST_F(NpzTest, TruncatedUnicodeMetadataFails) {
  const std::vector<float> values = {1.0f};
  // '<U8' needs 32 payload bytes
  writeZip(path_,
           {{"hh.npy",
             npyFile("{'descr': '<f4', 'fortran_order': False, "
                     "'shape': (1, 1), }",
                     rawBytes(values))},
            {"meta.npy",
             npyFile("{'descr': '<U8', 'fortran_order': False, "
                     "'shape': (), }",
                     "{}")}},
           false);
  RasterSet loaded;
  EXPECT_FALSE(io::loadScene(path_, loaded));
}

TEST_F(NpzTest, UnsupportedDtypeFails) {
  const std::vector<int32_t> values = {1, 2, 3, 4};
  writeZip(path_,
           {{"hh.npy",
             npyFile("{'descr': '<i4', 'fortran_order': False, "
                     "'shape': (2, 2), }",
                     rawBytes(values))}},
           false);
  RasterSet loaded;
  EXPECT_FALSE(io::loadScene(path_, loaded));
}

TEST_F(NpzTest, NewerMetadataVersionFails) {
  const std::vector<float> values = {1.0f};
  const std::string meta = "{\"version\": 2, \"transform\": [0, 1, 0, 0, 0, 1]}";
  writeZip(path_,
           {{"hh.npy",
             npyFile("{'descr': '<f4', 'fortran_order': False, "
                     "'shape': (1, 1), }",
                     rawBytes(values))},
            {"meta.npy",
             npyFile("{'descr': '|S" + std::to_string(meta.size()) +
                         "', 'fortran_order': False, 'shape': (), }",
                     meta)}},
           false);
  RasterSet loaded;
  EXPECT_FALSE(io::loadScene(path_, loaded));
}

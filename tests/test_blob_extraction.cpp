// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_blob_extraction.cpp
 *
 * Connected-component labelling and outline tracing.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "icearea/detection/blob_extraction.hpp"

using namespace icearea;

namespace {

MaskGrid emptyMask(int rows, int cols) {
  return MaskGrid::Constant(rows, cols, false);
}

DetectionMask makeDetection(const MaskGrid& grid,
                            Channel channel = Channel::HH) {
  DetectionMask d;
  d.channel = channel;
  d.mask = grid;
  d.threshold = Eigen::MatrixXd::Constant(grid.rows(), grid.cols(), 0.5);
  d.clutter_mean = Eigen::MatrixXd::Constant(grid.rows(), grid.cols(), 0.1);
  d.low_confidence = MaskGrid::Constant(grid.rows(), grid.cols(), false);
  d.flagged_pixels = static_cast<int>(grid.count());
  return d;
}

Raster onesRaster(int rows, int cols,
                  const GeoTransform& transform = GeoTransform{}) {
  return Raster(Channel::HH, Eigen::MatrixXf::Ones(rows, cols), transform);
}

}  // namespace

// ─── Labelling ──────────────────────────────────────────────────────────────

TEST(LabelComponentsTest, EmptyMask) {
  const auto out = labelComponents(emptyMask(5, 5));
  EXPECT_EQ(out.count, 0);
  EXPECT_EQ(out.labels.maxCoeff(), 0);
}

TEST(LabelComponentsTest, DiagonalNeighboursAreConnected) {
  auto m = emptyMask(5, 5);
  m(1, 1) = true;
  m(2, 2) = true;
  m(3, 1) = true;  // touches (2, 2) diagonally
  const auto out = labelComponents(m);
  EXPECT_EQ(out.count, 1);
  EXPECT_EQ(out.labels(3, 1), 1);
}

TEST(LabelComponentsTest, BranchesMergeIntoOneComponent) {
  // V shape: two provisional labels joined on the last row
  auto m = emptyMask(4, 7);
  m(0, 1) = true;
  m(0, 5) = true;
  m(1, 2) = true;
  m(1, 4) = true;
  m(2, 3) = true;
  const auto out = labelComponents(m);
  EXPECT_EQ(out.count, 1);
  EXPECT_EQ(out.labels(0, 1), out.labels(0, 5));
}

TEST(LabelComponentsTest, IdsFollowRasterScanOrder) {
  auto m = emptyMask(10, 10);
  m(5, 1) = true;  // first pixel on row 5
  m(2, 8) = true;  // first pixel on row 2
  m(7, 7) = true;
  const auto out = labelComponents(m);
  ASSERT_EQ(out.count, 3);
  EXPECT_EQ(out.labels(2, 8), 1);
  EXPECT_EQ(out.labels(5, 1), 2);
  EXPECT_EQ(out.labels(7, 7), 3);
}

// ─── Outline ────────────────────────────────────────────────────────────────

TEST(BlobExtractionTest, SinglePixel) {
  auto m = emptyMask(5, 5);
  m(2, 3) = true;
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(5, 5));

  ASSERT_EQ(blobs.size(), 1u);
  const auto& blob = blobs[0];
  EXPECT_EQ(blob.id, 1);
  EXPECT_EQ(blob.pixel_count, 1);
  ASSERT_EQ(blob.outline.size(), 4u);
  EXPECT_DOUBLE_EQ(blob.outline.vertices[0].x(), 3.0);
  EXPECT_DOUBLE_EQ(blob.outline.vertices[0].y(), 2.0);
  EXPECT_DOUBLE_EQ(area(blob.outline), 1.0);
  EXPECT_DOUBLE_EQ(blob.perimeter, 4.0);
  EXPECT_FALSE(blob.truncated);
}

TEST(BlobExtractionTest, SquareBlock) {
  auto m = emptyMask(12, 12);
  m.block(3, 4, 5, 5).setConstant(true);
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(12, 12));

  ASSERT_EQ(blobs.size(), 1u);
  const auto& blob = blobs[0];
  EXPECT_EQ(blob.pixel_count, 25);
  EXPECT_DOUBLE_EQ(blob.area_cfar, 25.0);
  EXPECT_EQ(blob.outline.size(), 4u);  // collinear vertices removed
  EXPECT_DOUBLE_EQ(area(blob.outline), 25.0);
  EXPECT_DOUBLE_EQ(blob.perimeter, 20.0);
  EXPECT_EQ(blob.bounds.min_row, 3);
  EXPECT_EQ(blob.bounds.min_col, 4);
  EXPECT_EQ(blob.bounds.height(), 5);
  EXPECT_EQ(blob.bounds.width(), 5);
}

TEST(BlobExtractionTest, LShape) {
  auto m = emptyMask(8, 8);
  m.block(1, 1, 4, 2).setConstant(true);  // vertical bar
  m.block(3, 3, 2, 3).setConstant(true);  // foot
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(8, 8));

  ASSERT_EQ(blobs.size(), 1u);
  EXPECT_EQ(blobs[0].pixel_count, 14);
  EXPECT_EQ(blobs[0].outline.size(), 6u);
  EXPECT_DOUBLE_EQ(area(blobs[0].outline), 14.0);
}

TEST(BlobExtractionTest, DiagonalPairSharesOneRing) {
  auto m = emptyMask(4, 4);
  m(1, 1) = true;
  m(2, 2) = true;
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(4, 4));

  ASSERT_EQ(blobs.size(), 1u);
  EXPECT_EQ(blobs[0].pixel_count, 2);
  // Figure-eight through the shared corner, visited twice
  EXPECT_EQ(blobs[0].outline.size(), 8u);
  EXPECT_DOUBLE_EQ(area(blobs[0].outline), 2.0);
  EXPECT_DOUBLE_EQ(blobs[0].perimeter, 8.0);
}

TEST(BlobExtractionTest, RingOutlineIsOuterBoundary) {
  auto m = emptyMask(7, 7);
  m.block(2, 2, 3, 3).setConstant(true);
  m(3, 3) = false;
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(7, 7));

  ASSERT_EQ(blobs.size(), 1u);
  EXPECT_EQ(blobs[0].pixel_count, 8);
  EXPECT_EQ(blobs[0].outline.size(), 4u);
  EXPECT_DOUBLE_EQ(area(blobs[0].outline), 9.0);
}

TEST(BlobExtractionTest, ManySmallBlobsScaleWithTheirOwnSize) {
  // Speckle-like scene: one isolated pixel every 4th row and column
  constexpr int kSize = 1200;
  auto m = emptyMask(kSize, kSize);
  for (int r = 1; r < kSize; r += 4) {
    for (int c = 1; c < kSize; c += 4) m(r, c) = true;
  }

  const auto t0 = std::chrono::steady_clock::now();
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(kSize, kSize));
  const double seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
          .count();

  ASSERT_EQ(blobs.size(), 90000u);
  for (const auto& blob : blobs) {
    ASSERT_EQ(blob.outline.size(), 4u);
    ASSERT_DOUBLE_EQ(blob.perimeter, 4.0);
  }
  EXPECT_EQ(blobs.back().bounds.min_row, 1197);
  EXPECT_EQ(blobs.back().bounds.min_col, 1197);
  // Outline cost follows each blob's bounding box, not the raster
  EXPECT_LT(seconds, 10.0);
}

TEST(TraceOutlineTest, StartsAtTopLeftCorner) {
  const std::vector<PixelIndex> pixels = {{4, 6}, {4, 7}, {5, 5}, {5, 6}};
  const auto corners = traceOutline(pixels, {4, 5, 5, 7});
  ASSERT_EQ(corners.size(), 8u);
  EXPECT_EQ(corners[0], Eigen::Vector2i(6, 4));
}

TEST(TraceOutlineTest, DisconnectedPixelsThrow) {
  const std::vector<PixelIndex> pixels = {{0, 0}, {0, 3}};
  EXPECT_THROW(traceOutline(pixels, {0, 0, 0, 3}), std::invalid_argument);
}

// ─── Geocoding and flags ────────────────────────────────────────────────────

TEST(BlobExtractionTest, OutlineInMapCoordinates) {
  auto gt = GeoTransform::fromGdal({100.0, 10.0, 0.0, 200.0, 0.0, -10.0});
  auto m = emptyMask(6, 6);
  m(2, 3) = true;
  m(2, 4) = true;
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(6, 6, gt));

  ASSERT_EQ(blobs.size(), 1u);
  const auto& blob = blobs[0];
  EXPECT_DOUBLE_EQ(blob.outline.vertices[0].x(), 130.0);
  EXPECT_DOUBLE_EQ(blob.outline.vertices[0].y(), 180.0);
  EXPECT_DOUBLE_EQ(blob.area_cfar, 200.0);
  EXPECT_DOUBLE_EQ(area(blob.outline), blob.area_cfar);
  EXPECT_DOUBLE_EQ(blob.perimeter, 60.0);
}

TEST(BlobExtractionTest, TruncatedAtRasterBorder) {
  auto m = emptyMask(10, 10);
  m(0, 4) = true;
  m(5, 5) = true;
  m(9, 9) = true;
  const auto blobs = extractBlobs(makeDetection(m, Channel::HV),
                                  onesRaster(10, 10));

  ASSERT_EQ(blobs.size(), 3u);
  EXPECT_TRUE(blobs[0].truncated);
  EXPECT_FALSE(blobs[1].truncated);
  EXPECT_TRUE(blobs[2].truncated);
  EXPECT_EQ(blobs[1].channel, Channel::HV);
}

TEST(BlobExtractionTest, PixelsInRasterScanOrder) {
  auto m = emptyMask(6, 6);
  m(2, 2) = true;
  m(2, 3) = true;
  m(3, 1) = true;
  const auto blobs = extractBlobs(makeDetection(m), onesRaster(6, 6));

  ASSERT_EQ(blobs.size(), 1u);
  ASSERT_EQ(blobs[0].pixels.size(), 3u);
  EXPECT_EQ(blobs[0].pixels[0], (PixelIndex{2, 2}));
  EXPECT_EQ(blobs[0].pixels[1], (PixelIndex{2, 3}));
  EXPECT_EQ(blobs[0].pixels[2], (PixelIndex{3, 1}));
}

TEST(BlobExtractionTest, ShapeMismatchThrows) {
  const auto detection = makeDetection(emptyMask(5, 5));
  EXPECT_THROW(extractBlobs(detection, onesRaster(5, 6)),
               std::invalid_argument);
}

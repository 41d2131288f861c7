// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * blob_extraction.hpp
 *
 * Groups flagged pixels into 8-connected objects (cv::connectedComponents)
 * and traces their outlines along pixel edges (cv::findContours).
 */

#ifndef ICEAREA_DETECTION_BLOB_EXTRACTION_HPP
#define ICEAREA_DETECTION_BLOB_EXTRACTION_HPP

#include <Eigen/Core>
#include <vector>

#include "icearea/detection/cfar.hpp"
#include "icearea/geometry/polygon.hpp"
#include "icearea/raster.hpp"

namespace icearea {

struct PixelIndex {
  int row = 0;
  int col = 0;

  bool operator==(const PixelIndex& other) const {
    return row == other.row && col == other.col;
  }
};

/// Inclusive pixel bounding box.
struct PixelBounds {
  int min_row = 0;
  int min_col = 0;
  int max_row = -1;
  int max_col = -1;

  int height() const { return max_row - min_row + 1; }
  int width() const { return max_col - min_col + 1; }
};

/**
 * @brief One connected group of detected pixels.
 *
 * Ids start at 1 and follow raster-scan order of each blob's first pixel.
 * The outline runs along pixel edges in map coordinates, starts at the
 * top-left corner of the first pixel and has no repeated closing vertex.
 */
struct Blob {
  int id = 0;
  Channel channel = Channel::HH;
  std::vector<PixelIndex> pixels;  ///< Raster-scan order
  Polygon outline;
  PixelBounds bounds;
  int pixel_count = 0;
  double area_cfar = 0.0;   ///< pixel_count × pixel area
  double perimeter = 0.0;   ///< Outline length [map units]
  bool truncated = false;   ///< Touches the raster border
};

/// Component labels: 0 = background, 1..count in raster-scan order.
struct LabelImage {
  Eigen::MatrixXi labels;
  int count = 0;
};

/// 8-connected labelling, ids renumbered to raster-scan order.
LabelImage labelComponents(const MaskGrid& mask);

/**
 * @brief Trace the outer pixel-edge boundary of one component.
 *
 * Only the component's bounding box is rasterized, so the cost grows with
 * the blob, not with the scene.
 *
 * @param pixels  Pixels of one 8-connected component, raster-scan order
 * @param bounds  Their bounding box
 * @return Corner vertices in pixel coordinates (x = col, y = row),
 *         collinear points removed
 * @throws std::invalid_argument if the pixels are not one component
 */
std::vector<Eigen::Vector2i> traceOutline(const std::vector<PixelIndex>& pixels,
                                          const PixelBounds& bounds);

/**
 * @brief Connected objects of a detection mask.
 *
 * @throws std::invalid_argument if mask and raster shapes differ
 */
std::vector<Blob> extractBlobs(const DetectionMask& mask, const Raster& raster);

}  // namespace icearea

#endif  // ICEAREA_DETECTION_BLOB_EXTRACTION_HPP

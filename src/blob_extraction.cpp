// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * blob_extraction.cpp
 *
 * Connected components and pixel-edge outlines on top of OpenCV imgproc.
 */

#include "icearea/detection/blob_extraction.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

namespace icearea {

LabelImage labelComponents(const MaskGrid& mask) {
  const int rows = static_cast<int>(mask.rows());
  const int cols = static_cast<int>(mask.cols());

  LabelImage out;
  out.labels = Eigen::MatrixXi::Zero(rows, cols);
  if (rows == 0 || cols == 0) return out;

  cv::Mat1b binary(rows, cols);
  for (int r = 0; r < rows; ++r) {
    auto* row = binary.ptr<uchar>(r);
    for (int c = 0; c < cols; ++c) row[c] = mask(r, c) ? 1 : 0;
  }

  cv::Mat cv_labels;
  const int n = cv::connectedComponents(binary, cv_labels, 8, CV_32S);

  // Block-based scans do not number components by their first pixel
  std::vector<int> remap(static_cast<size_t>(n), 0);
  for (int r = 0; r < rows; ++r) {
    const int* row = cv_labels.ptr<int>(r);
    for (int c = 0; c < cols; ++c) {
      const int l = row[c];
      if (l == 0) continue;
      if (remap[l] == 0) remap[l] = ++out.count;
      out.labels(r, c) = remap[l];
    }
  }
  return out;
}

std::vector<Eigen::Vector2i> traceOutline(const std::vector<PixelIndex>& pixels,
                                          const PixelBounds& bounds) {
  if (pixels.empty()) return {};

  // Pixel (r, c) fills the 3x3 cells starting at (2r, 2c) of a doubled
  // grid: cell coordinates are twice the pixel-corner coordinates and
  // diagonal neighbours share one cell. One empty cell of padding.
  cv::Mat1b cells =
      cv::Mat1b::zeros(2 * bounds.height() + 3, 2 * bounds.width() + 3);
  for (const auto& p : pixels) {
    const int y = 2 * (p.row - bounds.min_row) + 1;
    const int x = 2 * (p.col - bounds.min_col) + 1;
    cells(cv::Rect(x, y, 3, 3)).setTo(cv::Scalar(1));
  }

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(cells, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
  if (contours.size() != 1) {
    throw std::invalid_argument("traceOutline: pixels form " +
                                std::to_string(contours.size()) +
                                " components, expected 1");
  }
  const auto& chain = contours.front();

  // The 8-connected border chain cuts concave corners diagonally; put the
  // skipped corner cell back so every step runs along a pixel edge
  std::vector<cv::Point> ring;
  ring.reserve(2 * chain.size());
  for (size_t i = 0; i < chain.size(); ++i) {
    const cv::Point& p = chain[i];
    const cv::Point& q = chain[(i + 1) % chain.size()];
    ring.push_back(p);
    if (p.x != q.x && p.y != q.y) {
      const cv::Point corner(q.x, p.y);
      ring.push_back(cells(corner) ? corner : cv::Point(p.x, q.y));
    }
  }

  std::vector<Eigen::Vector2i> corners;
  const size_t n = ring.size();
  for (size_t i = 0; i < n; ++i) {
    const cv::Point& prev = ring[(i + n - 1) % n];
    const cv::Point& cur = ring[i];
    const cv::Point& next = ring[(i + 1) % n];
    if (cur == next) continue;
    const cv::Point in = cur - prev;
    const cv::Point out = next - cur;
    if (in.cross(out) == 0 && in.dot(out) > 0) continue;  // straight run
    corners.emplace_back((cur.x - 1) / 2 + bounds.min_col,
                         (cur.y - 1) / 2 + bounds.min_row);
  }
  return corners;
}

std::vector<Blob> extractBlobs(const DetectionMask& mask, const Raster& raster) {
  if (mask.rows() != raster.rows() || mask.cols() != raster.cols()) {
    throw std::invalid_argument(
        "extractBlobs: mask " + std::to_string(mask.rows()) + "x" +
        std::to_string(mask.cols()) + " does not match raster " +
        std::to_string(raster.rows()) + "x" + std::to_string(raster.cols()));
  }

  const LabelImage components = labelComponents(mask.mask);
  const int rows = raster.rows();
  const int cols = raster.cols();
  const double pixel_area = raster.pixelArea();

  std::vector<Blob> blobs(components.count);
  for (int i = 0; i < components.count; ++i) {
    blobs[i].id = i + 1;
    blobs[i].channel = mask.channel;
    blobs[i].bounds = {rows, cols, -1, -1};
  }

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const int l = components.labels(r, c);
      if (l == 0) continue;
      Blob& blob = blobs[l - 1];
      blob.pixels.push_back({r, c});
      auto& b = blob.bounds;
      b.min_row = std::min(b.min_row, r);
      b.min_col = std::min(b.min_col, c);
      b.max_row = std::max(b.max_row, r);
      b.max_col = std::max(b.max_col, c);
    }
  }

  for (auto& blob : blobs) {
    blob.pixel_count = static_cast<int>(blob.pixels.size());
    blob.area_cfar = blob.pixel_count * pixel_area;
    blob.truncated = blob.bounds.min_row == 0 || blob.bounds.min_col == 0 ||
                     blob.bounds.max_row == rows - 1 ||
                     blob.bounds.max_col == cols - 1;

    const auto corners = traceOutline(blob.pixels, blob.bounds);
    blob.outline.vertices.reserve(corners.size());
    for (const auto& v : corners) {
      blob.outline.vertices.push_back(raster.cornerToMap(v.x(), v.y()));
    }
    blob.perimeter = perimeter(blob.outline);
  }

  spdlog::debug("[Blobs] {}: {} objects from {} flagged pixels",
                toString(mask.channel), blobs.size(), mask.flagged_pixels);
  return blobs;
}

}  // namespace icearea

// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "icearea/geometry/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace icearea {

namespace {

// OpenCV contour functions take float points: shift map coordinates to a
// local origin first so large easting/northing values keep their precision.
std::vector<cv::Point2f> toContour(const Polygon& polygon,
                                   const Eigen::Vector2d& origin) {
  std::vector<cv::Point2f> contour;
  contour.reserve(polygon.size());
  for (const auto& v : polygon.vertices) {
    contour.emplace_back(static_cast<float>(v.x() - origin.x()),
                         static_cast<float>(v.y() - origin.y()));
  }
  return contour;
}

cv::Point2f toLocal(const Eigen::Vector2d& p, const Eigen::Vector2d& origin) {
  return {static_cast<float>(p.x() - origin.x()),
          static_cast<float>(p.y() - origin.y())};
}

int orientation(const cv::Point2f& o, const cv::Point2f& a,
                const cv::Point2f& b) {
  const double v = static_cast<double>(a.x - o.x) * (b.y - o.y) -
                   static_cast<double>(a.y - o.y) * (b.x - o.x);
  return (v > 0.0) - (v < 0.0);
}

// Proper crossing of two segments (touching cases are caught by the
// point-in-contour tests)
bool segmentsCross(const cv::Point2f& p1, const cv::Point2f& p2,
                   const cv::Point2f& q1, const cv::Point2f& q2) {
  const int d1 = orientation(q1, q2, p1);
  const int d2 = orientation(q1, q2, p2);
  const int d3 = orientation(p1, p2, q1);
  const int d4 = orientation(p1, p2, q2);
  return d1 * d2 < 0 && d3 * d4 < 0;
}

bool anyVertexInside(const std::vector<cv::Point2f>& vertices,
                     const std::vector<cv::Point2f>& contour) {
  for (const auto& v : vertices) {
    if (cv::pointPolygonTest(contour, v, false) >= 0.0) return true;
  }
  return false;
}

bool contoursIntersect(const std::vector<cv::Point2f>& a,
                       const std::vector<cv::Point2f>& b) {
  if (anyVertexInside(a, b) || anyVertexInside(b, a)) return true;
  for (size_t i = 0; i < a.size(); ++i) {
    const auto& p1 = a[i];
    const auto& p2 = a[(i + 1) % a.size()];
    for (size_t j = 0; j < b.size(); ++j) {
      if (segmentsCross(p1, p2, b[j], b[(j + 1) % b.size()])) return true;
    }
  }
  return false;
}

}  // namespace

BoundingBox boundingBox(const Polygon& polygon) {
  BoundingBox box;
  if (polygon.empty()) return box;
  box.min = polygon.vertices.front();
  box.max = polygon.vertices.front();
  for (const auto& v : polygon.vertices) {
    box.min = box.min.cwiseMin(v);
    box.max = box.max.cwiseMax(v);
  }
  return box;
}

double area(const Polygon& polygon) {
  if (polygon.size() < 3) return 0.0;
  return cv::contourArea(toContour(polygon, polygon.vertices.front()));
}

double perimeter(const Polygon& polygon) {
  if (polygon.size() < 2) return 0.0;
  return cv::arcLength(toContour(polygon, polygon.vertices.front()), true);
}

double maxLength(const Polygon& polygon) {
  double max_sq = 0.0;
  const auto& v = polygon.vertices;
  for (size_t i = 0; i < v.size(); ++i) {
    for (size_t j = i + 1; j < v.size(); ++j) {
      max_sq = std::max(max_sq, (v[i] - v[j]).squaredNorm());
    }
  }
  return std::sqrt(max_sq);
}

bool contains(const Polygon& polygon, const Eigen::Vector2d& point) {
  if (polygon.size() < 3) return false;
  const auto& origin = polygon.vertices.front();
  return cv::pointPolygonTest(toContour(polygon, origin),
                              toLocal(point, origin), false) >= 0.0;
}

bool intersects(const Polygon& a, const Polygon& b) {
  if (a.empty() || b.empty()) return false;
  if (!boundingBox(a).intersects(boundingBox(b))) return false;

  const auto& origin = a.vertices.front();
  return contoursIntersect(toContour(a, origin), toContour(b, origin));
}

double distance(const Polygon& a, const Polygon& b) {
  if (a.empty() || b.empty()) return std::numeric_limits<double>::infinity();

  const auto& origin = a.vertices.front();
  const auto ca = toContour(a, origin);
  const auto cb = toContour(b, origin);
  if (contoursIntersect(ca, cb)) return 0.0;

  // Disjoint rings: the closest pair always involves a vertex of one ring
  double best = std::numeric_limits<double>::infinity();
  for (const auto& v : ca) {
    best = std::min(best, std::abs(cv::pointPolygonTest(cb, v, true)));
  }
  for (const auto& v : cb) {
    best = std::min(best, std::abs(cv::pointPolygonTest(ca, v, true)));
  }
  return best;
}

}  // namespace icearea

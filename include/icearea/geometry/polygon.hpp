// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * polygon.hpp
 *
 * Simple polygon in map coordinates and the planar operations used for
 * shape features, AOI filtering and channel merging. Measures are
 * evaluated with OpenCV contour functions in a local frame.
 */

#ifndef ICEAREA_GEOMETRY_POLYGON_HPP
#define ICEAREA_GEOMETRY_POLYGON_HPP

#include <Eigen/Core>
#include <vector>

namespace icearea {

/// Closed ring of vertices; the closing edge back to vertices[0] is implicit.
struct Polygon {
  std::vector<Eigen::Vector2d> vertices;

  bool empty() const { return vertices.empty(); }
  size_t size() const { return vertices.size(); }
};

/// Axis-aligned bounding box.
struct BoundingBox {
  Eigen::Vector2d min = Eigen::Vector2d::Zero();
  Eigen::Vector2d max = Eigen::Vector2d::Zero();

  bool intersects(const BoundingBox& other, double margin = 0.0) const {
    return min.x() <= other.max.x() + margin &&
           other.min.x() <= max.x() + margin &&
           min.y() <= other.max.y() + margin &&
           other.min.y() <= max.y() + margin;
  }
};

BoundingBox boundingBox(const Polygon& polygon);

/// Enclosed area (shoelace, orientation independent).
double area(const Polygon& polygon);

/// Length of the closed ring.
double perimeter(const Polygon& polygon);

/// Largest distance between any two vertices.
double maxLength(const Polygon& polygon);

/// True if the point lies inside the ring or on its boundary.
bool contains(const Polygon& polygon, const Eigen::Vector2d& point);

/// True if the rings cross or touch, or one contains the other.
bool intersects(const Polygon& a, const Polygon& b);

/// Minimum distance between two polygons (0 if they intersect).
double distance(const Polygon& a, const Polygon& b);

}  // namespace icearea

#endif  // ICEAREA_GEOMETRY_POLYGON_HPP

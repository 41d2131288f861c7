// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * Calibrated, geocoded backscatter raster for a single polarization channel.
 * Values are linear intensities; NaN marks nodata.
 */

#ifndef ICEAREA_RASTER_HPP
#define ICEAREA_RASTER_HPP

#include <Eigen/Core>
#include <array>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace icearea {

/// Polarization channel of a backscatter raster.
enum class Channel {
  HH,  ///< Co-polarized
  HV   ///< Cross-polarized
};

inline const char* toString(Channel channel) {
  return channel == Channel::HH ? "HH" : "HV";
}

/// Parse "hh"/"HH"/"hv"/"HV". Returns nullopt for anything else.
inline std::optional<Channel> parseChannel(const std::string& name) {
  if (name == "hh" || name == "HH") return Channel::HH;
  if (name == "hv" || name == "HV") return Channel::HV;
  return std::nullopt;
}

/// Boolean grid with the same (row, col) layout as a raster.
using MaskGrid = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

// ─── GeoTransform ───────────────────────────────────────────────────────────

/**
 * @brief Affine pixel-to-map transform in GDAL coefficient order.
 *
 *   x = origin_x + col * pixel_width + row * row_rotation
 *   y = origin_y + col * col_rotation + row * pixel_height
 *
 * (col, row) are continuous pixel-corner coordinates: pixel (r, c) spans
 * [c, c+1] x [r, r+1].
 */
struct GeoTransform {
  double origin_x = 0.0;
  double pixel_width = 1.0;
  double row_rotation = 0.0;
  double origin_y = 0.0;
  double col_rotation = 0.0;
  double pixel_height = 1.0;

  static GeoTransform fromGdal(const std::array<double, 6>& gt) {
    return {gt[0], gt[1], gt[2], gt[3], gt[4], gt[5]};
  }

  std::array<double, 6> toGdal() const {
    return {origin_x,     pixel_width,  row_rotation,
            origin_y,     col_rotation, pixel_height};
  }

  /// Map coordinates of a pixel-corner position.
  Eigen::Vector2d apply(double col, double row) const {
    return {origin_x + col * pixel_width + row * row_rotation,
            origin_y + col * col_rotation + row * pixel_height};
  }

  /// Map area covered by one pixel (absolute determinant).
  double pixelArea() const {
    return std::abs(pixel_width * pixel_height - row_rotation * col_rotation);
  }
};

// ─── Raster ─────────────────────────────────────────────────────────────────

/**
 * @brief Single-channel backscatter grid with nodata handling.
 *
 * A pixel is valid iff its value is finite, non-negative and not equal to
 * the nodata value. Rasters are immutable inputs to the detection pipeline.
 */
class Raster {
 public:
  Raster() = default;

  Raster(Channel channel, Eigen::MatrixXf values,
         const GeoTransform& transform = GeoTransform{}, float nodata = NAN)
      : channel_(channel),
        values_(std::move(values)),
        transform_(transform),
        nodata_(nodata) {}

  Channel channel() const noexcept { return channel_; }
  int rows() const noexcept { return static_cast<int>(values_.rows()); }
  int cols() const noexcept { return static_cast<int>(values_.cols()); }
  bool empty() const noexcept { return values_.size() == 0; }

  const Eigen::MatrixXf& values() const noexcept { return values_; }
  const GeoTransform& transform() const noexcept { return transform_; }
  float nodata() const noexcept { return nodata_; }

  float at(int row, int col) const { return values_(row, col); }

  bool contains(int row, int col) const {
    return row >= 0 && row < rows() && col >= 0 && col < cols();
  }

  bool isValid(int row, int col) const {
    const float v = values_(row, col);
    if (!std::isfinite(v) || v < 0.0f) return false;
    return std::isnan(nodata_) || v != nodata_;
  }

  /// Validity of every pixel.
  MaskGrid validMask() const {
    MaskGrid mask(rows(), cols());
    for (int c = 0; c < cols(); ++c) {
      for (int r = 0; r < rows(); ++r) {
        mask(r, c) = isValid(r, c);
      }
    }
    return mask;
  }

  /// True if at least one pixel is valid.
  bool hasValidData() const {
    for (int c = 0; c < cols(); ++c) {
      for (int r = 0; r < rows(); ++r) {
        if (isValid(r, c)) return true;
      }
    }
    return false;
  }

  /// Map area of one pixel [map units²].
  double pixelArea() const { return transform_.pixelArea(); }

  /// Map coordinates of the pixel-corner position (col, row).
  Eigen::Vector2d cornerToMap(double col, double row) const {
    return transform_.apply(col, row);
  }

  /// Map coordinates of the center of pixel (row, col).
  Eigen::Vector2d centerToMap(int row, int col) const {
    return transform_.apply(col + 0.5, row + 0.5);
  }

 private:
  Channel channel_ = Channel::HH;
  Eigen::MatrixXf values_;
  GeoTransform transform_;
  float nodata_ = NAN;
};

/// One raster per channel. All rasters of a scene share the same grid.
using RasterSet = std::map<Channel, Raster>;

}  // namespace icearea

#endif  // ICEAREA_RASTER_HPP
